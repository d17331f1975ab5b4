#pragma once

#include "./params.hpp"

#include <cstdint>
#include <utility>
#include <variant>

namespace tint {

/**
 * @brief The eight basic terminal colors, in palette order.
 */
enum class basic_color : std::uint8_t {
    black,
    red,
    green,
    yellow,
    blue,
    magenta,
    cyan,
    white,
};

/**
 * @brief One of the sixteen basic colors: a basic color, optionally in its bright variant.
 */
struct simple_color {
    basic_color base   = basic_color::black;
    bool        bright = false;

    constexpr simple_color brightened() const noexcept { return simple_color{base, true}; }

    bool operator==(const simple_color&) const noexcept = default;
};

constexpr simple_color bright(basic_color c) noexcept { return simple_color{c, true}; }

/**
 * @brief An index into the 256-color palette.
 */
struct indexed_color {
    std::uint8_t index = 0;

    bool operator==(const indexed_color&) const noexcept = default;
};

/**
 * @brief A 24-bit "true color"
 */
struct rgb_color {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;

    bool operator==(const rgb_color&) const noexcept = default;
};

/**
 * @brief The rendering plane that a color is applied to.
 */
enum class color_target : std::uint8_t {
    foreground,
    background,
    underline,
};

struct targeted_color;

/**
 * @brief Any color that the terminal can be asked to render.
 *
 * A color is always exactly one of a simple (16-color), indexed (256-color), or RGB color. Every
 * value is representable on the wire, so encoding a color cannot fail.
 */
class color {
public:
    using variant_type = std::variant<simple_color, indexed_color, rgb_color>;

private:
    variant_type _var;

public:
    constexpr color(basic_color c) noexcept
        : _var(simple_color{c}) {}
    constexpr color(simple_color c) noexcept
        : _var(c) {}
    constexpr color(indexed_color c) noexcept
        : _var(c) {}
    constexpr color(rgb_color c) noexcept
        : _var(c) {}

    static constexpr indexed_color indexed(std::uint8_t idx) noexcept {
        return indexed_color{idx};
    }
    static constexpr rgb_color rgb(std::uint8_t r, std::uint8_t g, std::uint8_t b) noexcept {
        return rgb_color{r, g, b};
    }

    template <typename T>
    constexpr bool is() const noexcept {
        return std::holds_alternative<T>(_var);
    }

    template <typename T>
    constexpr const T* get_if() const noexcept {
        return std::get_if<T>(&_var);
    }

    template <typename Func>
    constexpr decltype(auto) visit(Func&& fn) const {
        return std::visit(std::forward<Func>(fn), _var);
    }

    /**
     * @brief Obtain the SGR parameters that select this color on the given plane.
     *
     * Simple colors use the dedicated 30-37/40-47 (90-97/100-107 when bright) codes. Indexed and
     * RGB colors use the extended selector (38/48/58) followed by `5;n` or `2;r;g;b`. The
     * underline plane has no dedicated simple-color codes, so simple colors are sent there as
     * their palette index.
     */
    param_list parameters(color_target target) const noexcept;

    targeted_color for_target(color_target) const noexcept;
    targeted_color for_fg() const noexcept;
    targeted_color for_bg() const noexcept;
    targeted_color for_underline() const noexcept;

    bool operator==(const color&) const noexcept = default;
};

/**
 * @brief A color bound to a rendering plane
 */
struct targeted_color {
    tint::color  value;
    color_target target = color_target::foreground;

    bool operator==(const targeted_color&) const noexcept = default;
};

inline targeted_color color::for_target(color_target t) const noexcept {
    return targeted_color{*this, t};
}
inline targeted_color color::for_fg() const noexcept {
    return for_target(color_target::foreground);
}
inline targeted_color color::for_bg() const noexcept {
    return for_target(color_target::background);
}
inline targeted_color color::for_underline() const noexcept {
    return for_target(color_target::underline);
}

inline targeted_color fg(color c) noexcept { return c.for_fg(); }
inline targeted_color bg(color c) noexcept { return c.for_bg(); }
inline targeted_color underline_color(color c) noexcept { return c.for_underline(); }

}  // namespace tint
