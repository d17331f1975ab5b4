#pragma once

#include "./color.hpp"
#include "./effect.hpp"

namespace tint {

/**
 * @brief Chainable styling methods shared by every type that carries a style.
 *
 * `Derived` provides `with_effect(effect, bool)`, `with_underline(underline_style)` and
 * `with_color(color_target, std::optional<color>)`. Each method returns a new value; nothing is
 * modified in place.
 */
template <typename Derived>
class fluent_styling {
    constexpr const Derived& _self() const noexcept { return static_cast<const Derived&>(*this); }

public:
    Derived bold() const noexcept { return _self().with_effect(effect::bold, true); }
    Derived dim() const noexcept { return _self().with_effect(effect::dim, true); }
    Derived italic() const noexcept { return _self().with_effect(effect::italic, true); }
    Derived blink() const noexcept { return _self().with_effect(effect::blink, true); }
    Derived reverse() const noexcept { return _self().with_effect(effect::reverse, true); }
    Derived hidden() const noexcept { return _self().with_effect(effect::hidden, true); }
    Derived strikethrough() const noexcept {
        return _self().with_effect(effect::strikethrough, true);
    }
    Derived overline() const noexcept { return _self().with_effect(effect::overline, true); }

    Derived underline() const noexcept { return _self().with_underline(underline_style::single); }
    Derived double_underline() const noexcept {
        return _self().with_underline(underline_style::double_);
    }
    Derived curly_underline() const noexcept {
        return _self().with_underline(underline_style::curly);
    }
    Derived dotted_underline() const noexcept {
        return _self().with_underline(underline_style::dotted);
    }
    Derived dashed_underline() const noexcept {
        return _self().with_underline(underline_style::dashed);
    }
    Derived no_underline() const noexcept { return _self().with_underline(underline_style::none); }

    Derived fg(color c) const noexcept { return _self().with_color(color_target::foreground, c); }
    Derived bg(color c) const noexcept { return _self().with_color(color_target::background, c); }
    Derived underline_color(color c) const noexcept {
        return _self().with_color(color_target::underline, c);
    }

    bool operator==(const fluent_styling&) const noexcept = default;
};

}  // namespace tint
