#pragma once

#include "./color.hpp"
#include "./effect.hpp"
#include "./fluent.hpp"
#include "./params.hpp"

#include <fmt/format.h>

#include <concepts>
#include <optional>
#include <string>

namespace tint {

class style;

/**
 * @brief A value that can be lifted into a (partial) style.
 *
 * Each element type provides a `to_style()` overload found by ADL: styles, effects, underline
 * variants, targeted colors, bare colors (applied to the foreground), and the reset element.
 */
template <typename T>
concept style_element = requires(const T& elem) {
    { to_style(elem) } -> std::same_as<style>;
};

/**
 * @brief The canonical style aggregate: up to one color per plane, a set of effects, and one
 * underline variant.
 *
 * A style is an immutable value. Combining styles produces a new style.
 */
class style : public fluent_styling<style> {
    std::optional<color> _fg;
    std::optional<color> _bg;
    std::optional<color> _underline_color;
    effect_set           _effects;
    underline_style      _underline = underline_style::none;

public:
    style() = default;

    std::optional<color> color_of(color_target target) const noexcept;
    effect_set           effects() const noexcept { return _effects; }
    bool                 has(effect e) const noexcept { return _effects.contains(e); }
    underline_style      underline_variant() const noexcept { return _underline; }

    /// `true` if this style has no attributes, and therefore renders as nothing at all
    bool empty() const noexcept { return *this == style{}; }

    /// Set or clear (with `nullopt`) the color on the given plane
    style with_color(color_target target, std::optional<color> c) const noexcept;
    style without(color_target target) const noexcept { return with_color(target, std::nullopt); }

    style with_effect(effect e, bool on = true) const noexcept;
    style without(effect e) const noexcept { return with_effect(e, false); }

    style with_underline(underline_style st) const noexcept;

    /**
     * @brief Merge the given element on top of this style.
     *
     * Effects are combined. For each color plane and for the underline variant, the element's
     * value replaces ours if it has one.
     */
    template <style_element E>
    style with(const E& elem) const noexcept {
        return merge(*this, to_style(elem));
    }

    /// Pair this style with some content to be rendered. Defined in <tint/styled.hpp>
    template <typename Content>
    auto applied_to(Content&& content) const;

    /**
     * @brief Obtain the SGR parameters for this style.
     *
     * Effects come first in declaration order, then the underline variant, then the foreground,
     * background and underline colors.
     */
    param_list parameters() const noexcept;

    /// The escape sequence for this style. Empty if the style is empty.
    std::string to_string() const;

    bool operator==(const style&) const noexcept = default;
};

/**
 * @brief Right-biased merge. Associative, with the empty style as the identity.
 */
style merge(const style& lhs, const style& rhs) noexcept;

inline style to_style(const style& s) noexcept { return s; }
style        to_style(effect e) noexcept;
style        to_style(underline_style st) noexcept;
style        to_style(const targeted_color& tc) noexcept;
/// A bare color is taken to be a foreground color
style to_style(const color& c) noexcept;

template <style_element Left, style_element Right>
style operator|(const Left& lhs, const Right& rhs) noexcept {
    return merge(to_style(lhs), to_style(rhs));
}

template <style_element E>
std::string to_string(const E& elem) {
    return to_style(elem).to_string();
}

}  // namespace tint

template <>
struct fmt::formatter<tint::style> {
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const tint::style& s, FormatContext& ctx) const {
        return tint::write_escape(s.parameters(), ctx.out());
    }
};
