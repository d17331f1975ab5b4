#pragma once

#include "./params.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>

namespace tint {

/**
 * @brief The independent on/off text effects.
 *
 * The declaration order is the order in which effects are serialized.
 */
enum class effect : std::uint8_t {
    bold,
    dim,
    italic,
    blink,
    reverse,
    hidden,
    strikethrough,
    overline,
};

inline constexpr std::array all_effects = {
    effect::bold,
    effect::dim,
    effect::italic,
    effect::blink,
    effect::reverse,
    effect::hidden,
    effect::strikethrough,
    effect::overline,
};

/// The SGR code that enables the given effect
constexpr std::uint8_t sgr_code(effect e) noexcept {
    switch (e) {
    case effect::bold:
        return 1;
    case effect::dim:
        return 2;
    case effect::italic:
        return 3;
    case effect::blink:
        return 5;
    case effect::reverse:
        return 7;
    case effect::hidden:
        return 8;
    case effect::strikethrough:
        return 9;
    case effect::overline:
        return 53;
    }
    return 0;
}

/**
 * @brief The SGR code that disables the given effect.
 *
 * Bold and dim share a single "normal intensity" code (22). Code 21 is never used to turn bold off.
 */
constexpr std::uint8_t sgr_off_code(effect e) noexcept {
    switch (e) {
    case effect::bold:
    case effect::dim:
        return 22;
    case effect::overline:
        return 55;
    default:
        return static_cast<std::uint8_t>(sgr_code(e) + 20);
    }
}

/**
 * @brief A set of effects. Presence only: adding an effect twice is the same as adding it once.
 */
class effect_set {
    std::uint16_t _bits = 0;

    static constexpr std::uint16_t _mask(effect e) noexcept {
        return static_cast<std::uint16_t>(1u << static_cast<unsigned>(e));
    }

public:
    constexpr effect_set() = default;

    constexpr effect_set(std::initializer_list<effect> effects) noexcept {
        for (auto e : effects) {
            _bits |= _mask(e);
        }
    }

    constexpr effect_set with(effect e) const noexcept {
        auto ret = *this;
        ret._bits |= _mask(e);
        return ret;
    }
    constexpr effect_set without(effect e) const noexcept {
        auto ret = *this;
        ret._bits &= static_cast<std::uint16_t>(~_mask(e));
        return ret;
    }
    constexpr effect_set set(effect e, bool on) const noexcept {
        return on ? with(e) : without(e);
    }

    constexpr bool contains(effect e) const noexcept { return (_bits & _mask(e)) != 0; }
    constexpr bool empty() const noexcept { return _bits == 0; }

    constexpr std::size_t size() const noexcept {
        std::size_t n = 0;
        for (auto e : all_effects) {
            n += contains(e) ? 1 : 0;
        }
        return n;
    }

    /// Call `fn` for each member, in declaration order
    template <typename Func>
    constexpr void for_each(Func&& fn) const {
        for (auto e : all_effects) {
            if (contains(e)) {
                fn(e);
            }
        }
    }

    param_list parameters() const noexcept;

    friend constexpr effect_set operator|(effect_set lhs, effect_set rhs) noexcept {
        lhs._bits |= rhs._bits;
        return lhs;
    }

    bool operator==(const effect_set&) const noexcept = default;
};

/**
 * @brief The underline variant. Variants are mutually exclusive.
 */
enum class underline_style : std::uint8_t {
    none,
    single,
    double_,
    curly,
    dotted,
    dashed,
};

inline constexpr std::array all_underline_styles = {
    underline_style::single,
    underline_style::double_,
    underline_style::curly,
    underline_style::dotted,
    underline_style::dashed,
};

/**
 * @brief The parameters for an underline variant: nothing, `4`, or `4:<n>`
 */
param_list parameters(underline_style) noexcept;

}  // namespace tint
