#include "./style.hpp"

using namespace tint;

std::optional<color> style::color_of(color_target target) const noexcept {
    switch (target) {
    case color_target::foreground:
        return _fg;
    case color_target::background:
        return _bg;
    case color_target::underline:
        return _underline_color;
    }
    return std::nullopt;
}

style style::with_color(color_target target, std::optional<color> c) const noexcept {
    auto ret = *this;
    switch (target) {
    case color_target::foreground:
        ret._fg = c;
        break;
    case color_target::background:
        ret._bg = c;
        break;
    case color_target::underline:
        ret._underline_color = c;
        break;
    }
    return ret;
}

style style::with_effect(effect e, bool on) const noexcept {
    auto ret     = *this;
    ret._effects = _effects.set(e, on);
    return ret;
}

style style::with_underline(underline_style st) const noexcept {
    auto ret       = *this;
    ret._underline = st;
    return ret;
}

param_list style::parameters() const noexcept {
    param_list ret = _effects.parameters();
    ret.append(tint::parameters(_underline));
    if (_fg) {
        ret.append(_fg->parameters(color_target::foreground));
    }
    if (_bg) {
        ret.append(_bg->parameters(color_target::background));
    }
    if (_underline_color) {
        ret.append(_underline_color->parameters(color_target::underline));
    }
    return ret;
}

std::string style::to_string() const { return tint::to_string(parameters()); }

style tint::merge(const style& lhs, const style& rhs) noexcept {
    auto ret = lhs;
    for (auto target :
         {color_target::foreground, color_target::background, color_target::underline}) {
        if (auto c = rhs.color_of(target)) {
            ret = ret.with_color(target, c);
        }
    }
    rhs.effects().for_each([&](effect e) { ret = ret.with_effect(e); });
    if (rhs.underline_variant() != underline_style::none) {
        ret = ret.with_underline(rhs.underline_variant());
    }
    return ret;
}

style tint::to_style(effect e) noexcept { return style{}.with_effect(e); }

style tint::to_style(underline_style st) noexcept { return style{}.with_underline(st); }

style tint::to_style(const targeted_color& tc) noexcept {
    return style{}.with_color(tc.target, tc.value);
}

style tint::to_style(const color& c) noexcept { return to_style(c.for_fg()); }
