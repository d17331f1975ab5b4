#include "./color.hpp"

using namespace tint;

namespace {

std::uint8_t extended_selector(color_target target) noexcept {
    switch (target) {
    case color_target::foreground:
        return 38;
    case color_target::background:
        return 48;
    case color_target::underline:
        return 58;
    }
    return 38;
}

struct color_encoder {
    color_target target;

    param_list operator()(simple_color c) const noexcept {
        auto offset = static_cast<std::uint8_t>(c.base);
        switch (target) {
        case color_target::foreground:
            return {static_cast<std::uint8_t>((c.bright ? 90 : 30) + offset)};
        case color_target::background:
            return {static_cast<std::uint8_t>((c.bright ? 100 : 40) + offset)};
        case color_target::underline:
            break;
        }
        return (*this)(indexed_color{static_cast<std::uint8_t>(offset + (c.bright ? 8 : 0))});
    }

    param_list operator()(indexed_color c) const noexcept {
        return {extended_selector(target), 5, c.index};
    }

    param_list operator()(rgb_color c) const noexcept {
        return {extended_selector(target), 2, c.r, c.g, c.b};
    }
};

}  // namespace

param_list color::parameters(color_target target) const noexcept {
    return visit(color_encoder{target});
}
