#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace tint {

/**
 * @brief Whether rendered markup carries escape sequences.
 *
 * tint never inspects the output stream. Callers that know their output does not support
 * styling ask for `never` to get the plain text.
 */
enum class should_style {
    force,
    never,
};

/**
 * @brief Render a markup string to styled text.
 *
 * `.bold.red[text]` renders `text` in bold red on top of the enclosing style, and groups nest.
 * A backtick escapes the following character. Class names are the basic color names, `bg-<color>`,
 * `ul-<color>`, `br`, the effect names (plus `faint` and `strike`), the underline variants
 * (`underline`, `double-underline`, `curly-underline`, `dotted-underline`, `dashed-underline`,
 * `no-underline`), and `plain`.
 *
 * @throws invalid_markup (via Boost.LEAF) for an unknown class name, or for a class list that is
 * not followed by an opening square bracket.
 */
std::string stylize(std::string_view text, should_style = should_style::force);

namespace detail {
const std::string& cached_rendering(const char* ptr);
}

inline namespace literals {
inline namespace styled_literals {
/// Rendered once per literal and thread, always with styling
inline const std::string& operator""_styled(const char* str, std::size_t) {
    return detail::cached_rendering(str);
}

}  // namespace styled_literals
}  // namespace literals

}  // namespace tint
