#include "./writer.hpp"

#include <iterator>

using namespace tint;

namespace {

std::uint8_t default_color_code(color_target target) {
    switch (target) {
    case color_target::foreground:
        return 39;
    case color_target::background:
        return 49;
    case color_target::underline:
        return 59;
    }
    return 39;
}

std::size_t rendered_size(const param_list& params) { return tint::to_string(params).size(); }

}  // namespace

void text_writer::put_style(const style& new_style) {
    auto& prev_style = _style;
    if (new_style == prev_style) {
        // No changes necessary
        return;
    }

    param_list reset_then_enable = {0};
    reset_then_enable.append(new_style.parameters());
    param_list set_toggles;

    auto turned_off = [&](effect e) { return prev_style.has(e) && !new_style.has(e); };
    auto turned_on  = [&](effect e) { return !prev_style.has(e) && new_style.has(e); };

    if (turned_off(effect::bold) || turned_off(effect::dim)) {
        // Bold and dim are cleared together. Re-enable the one that stays.
        set_toggles.push(sgr_off_code(effect::bold));
        for (auto e : {effect::bold, effect::dim}) {
            if (new_style.has(e)) {
                set_toggles.push(sgr_code(e));
            }
        }
    } else {
        for (auto e : {effect::bold, effect::dim}) {
            if (turned_on(e)) {
                set_toggles.push(sgr_code(e));
            }
        }
    }

    for (auto e : all_effects) {
        if (e == effect::bold || e == effect::dim) {
            continue;
        }
        if (turned_on(e)) {
            set_toggles.push(sgr_code(e));
        } else if (turned_off(e)) {
            set_toggles.push(sgr_off_code(e));
        }
    }

    if (new_style.underline_variant() != prev_style.underline_variant()) {
        if (new_style.underline_variant() == underline_style::none) {
            set_toggles.push(24);
        } else {
            set_toggles.append(parameters(new_style.underline_variant()));
        }
    }

    for (auto target :
         {color_target::foreground, color_target::background, color_target::underline}) {
        auto new_color = new_style.color_of(target);
        if (new_color == prev_style.color_of(target)) {
            continue;
        }
        if (new_color) {
            set_toggles.append(new_color->parameters(target));
        } else {
            set_toggles.push(default_color_code(target));
        }
    }

    if (rendered_size(set_toggles) > rendered_size(reset_then_enable)) {
        write_escape(reset_then_enable, std::back_inserter(_buf));
    } else {
        write_escape(set_toggles, std::back_inserter(_buf));
    }

    _style = new_style;
}
