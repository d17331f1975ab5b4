#pragma once

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tint {

/**
 * @brief A single SGR parameter.
 *
 * Most parameters are a plain decimal code. The extended underline variants carry a sub-parameter
 * that is rendered with a colon (`4:3`) and is treated as one atomic token when joining.
 */
struct sgr_param {
    std::uint8_t                code = 0;
    std::optional<std::uint8_t> sub{};

    bool operator==(const sgr_param&) const noexcept = default;
};

/**
 * @brief An ordered, fixed-capacity list of SGR parameters.
 *
 * The capacity covers every parameter that a single style (or a transition between two styles)
 * can produce, so building a list never allocates.
 */
class param_list {
public:
    static constexpr std::size_t capacity = 32;

private:
    std::array<sgr_param, capacity> _params{};
    std::size_t                     _size = 0;

public:
    constexpr param_list() = default;

    constexpr param_list(std::initializer_list<std::uint8_t> codes) {
        for (auto c : codes) {
            push(c);
        }
    }

    constexpr const sgr_param* begin() const noexcept { return _params.data(); }
    constexpr const sgr_param* end() const noexcept { return _params.data() + _size; }

    constexpr std::size_t size() const noexcept { return _size; }
    constexpr bool        empty() const noexcept { return _size == 0; }

    constexpr const sgr_param& operator[](std::size_t idx) const noexcept { return _params[idx]; }

    /// @throws std::length_error if the list is already at capacity
    constexpr void push(sgr_param p) {
        if (_size == capacity) {
            throw std::length_error("SGR parameter list is full");
        }
        _params[_size++] = p;
    }
    constexpr void push(std::uint8_t code) { push(sgr_param{code}); }
    constexpr void push(std::uint8_t code, std::uint8_t sub) { push(sgr_param{code, sub}); }

    constexpr void append(const param_list& other) {
        for (auto& p : other) {
            push(p);
        }
    }

    friend constexpr bool operator==(const param_list& lhs, const param_list& rhs) noexcept {
        if (lhs.size() != rhs.size()) {
            return false;
        }
        for (std::size_t i = 0; i < lhs.size(); ++i) {
            if (lhs[i] != rhs[i]) {
                return false;
            }
        }
        return true;
    }
};

inline constexpr std::string_view csi = "\x1b[";

/**
 * @brief Write the parameters joined by semicolons, e.g. `1;4:3;31`
 */
template <typename Out>
Out write_params(const param_list& params, Out out) {
    bool first = true;
    for (auto& p : params) {
        if (!first) {
            *out++ = ';';
        }
        first = false;
        out   = fmt::format_to(out, "{}", int(p.code));
        if (p.sub) {
            out = fmt::format_to(out, ":{}", int(*p.sub));
        }
    }
    return out;
}

/**
 * @brief Write the complete escape sequence for the given parameters.
 *
 * An empty parameter list writes nothing at all: a bare `ESC [ m` is a full reset on most
 * terminals, which is not what an empty style means.
 */
template <typename Out>
Out write_escape(const param_list& params, Out out) {
    if (params.empty()) {
        return out;
    }
    out    = std::copy(csi.begin(), csi.end(), out);
    out    = write_params(params, out);
    *out++ = 'm';
    return out;
}

std::string to_string(const param_list& params);

}  // namespace tint
