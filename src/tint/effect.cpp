#include "./effect.hpp"

using namespace tint;

param_list effect_set::parameters() const noexcept {
    param_list ret;
    for_each([&](effect e) { ret.push(sgr_code(e)); });
    return ret;
}

param_list tint::parameters(underline_style st) noexcept {
    param_list ret;
    switch (st) {
    case underline_style::none:
        break;
    case underline_style::single:
        ret.push(4);
        break;
    case underline_style::double_:
        ret.push(4, 2);
        break;
    case underline_style::curly:
        ret.push(4, 3);
        break;
    case underline_style::dotted:
        ret.push(4, 4);
        break;
    case underline_style::dashed:
        ret.push(4, 5);
        break;
    }
    return ret;
}
