#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace tint {

/**
 * @brief Thrown by the markup renderer when given a string it cannot render.
 *
 * The exception is thrown with Boost.LEAF, loaded with `e_markup_string` and `e_markup_offset`,
 * and with `e_markup_class` and `e_did_you_mean` when an unknown class name was given.
 */
struct invalid_markup : std::runtime_error {
    using runtime_error::runtime_error;
};

/// The markup string being rendered
struct e_markup_string {
    std::string value;
};

/// Offset into the markup string where the problem was found
struct e_markup_offset {
    std::size_t value;
};

/// The offending style class name
struct e_markup_class {
    std::string value;
};

/// The known class name that is closest to the offending one
struct e_did_you_mean {
    std::optional<std::string> value;
};

}  // namespace tint
