#pragma once

#include "./style.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <string_view>

namespace tint {

/// The sequence that returns the terminal to its default rendition
inline constexpr std::string_view reset_sequence = "\x1b[0m";

/**
 * @brief The reset element.
 *
 * As a style element it is the empty style. Formatted on its own, it writes the reset sequence.
 */
struct reset_t {
    bool operator==(const reset_t&) const noexcept = default;
};

inline constexpr reset_t reset{};

inline style to_style(reset_t) noexcept { return style{}; }

}  // namespace tint

template <>
struct fmt::formatter<tint::reset_t> {
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(tint::reset_t, FormatContext& ctx) const {
        return std::copy(tint::reset_sequence.begin(), tint::reset_sequence.end(), ctx.out());
    }
};
