#pragma once

#include "./style.hpp"
#include "./styled.hpp"

#include <fmt/format.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace tint {

/**
 * @brief Accumulates text interleaved with style changes.
 *
 * The writer remembers the style that is currently in effect, and each style change is written as
 * the shortest sequence that moves the terminal from the current style to the new one.
 */
class text_writer {
    std::string _buf;
    std::size_t _vis_size = 0;

    style _style;

public:
    void write(std::string_view text) {
        _buf.append(text);
        _vis_size += text.size();
    }

    /**
     * @brief Write styled content. The previous style is restored afterwards.
     */
    template <formattable Content>
    void write(const styled<Content>& s) {
        auto prev = _style;
        put_style(s.style());
        write(std::string_view(fmt::format("{}", s.content())));
        put_style(prev);
    }

    void putc(char c) { write(std::string_view(&c, 1)); }

    void put_style(const style&);

    std::string take_string() noexcept {
        auto ret = std::move(_buf);
        _buf.clear();
        return ret;
    }

    std::string_view   string() const noexcept { return _buf; }
    auto               visual_size() const noexcept { return _vis_size; }
    const tint::style& current_style() const noexcept { return _style; }
};

}  // namespace tint
