#pragma once

#include "./fluent.hpp"
#include "./reset.hpp"
#include "./style.hpp"

#include <fmt/format.h>

#include <string>
#include <type_traits>
#include <utility>

namespace tint {

template <typename T>
concept formattable = requires(const T item) {
    fmt::format("{}", item);
};

/**
 * @brief Some content paired with the style it should be displayed in.
 *
 * Nothing is rendered until the value is formatted. The content is never inspected: it is
 * formatted with {fmt} between the style's escape sequence and a reset. If the style is empty,
 * only the content is written.
 */
template <typename Content>
class styled : public fluent_styling<styled<Content>> {
    Content     _content;
    tint::style _style;

public:
    explicit styled(Content content, tint::style st = {})
        : _content(std::move(content))
        , _style(st) {}

    const Content&     content() const noexcept { return _content; }
    const tint::style& style() const noexcept { return _style; }

    styled with_style(tint::style st) const { return styled(_content, st); }

    template <typename Other>
    styled<std::decay_t<Other>> with_content(Other&& other) const {
        return styled<std::decay_t<Other>>(std::forward<Other>(other), _style);
    }

    styled with_color(color_target target, std::optional<color> c) const {
        return with_style(_style.with_color(target, c));
    }
    styled with_effect(effect e, bool on = true) const {
        return with_style(_style.with_effect(e, on));
    }
    styled with_underline(underline_style st) const {
        return with_style(_style.with_underline(st));
    }

    template <style_element E>
    styled with(const E& elem) const {
        return with_style(_style.with(elem));
    }

    bool operator==(const styled&) const = default;
};

template <typename Content>
auto style::applied_to(Content&& content) const {
    return styled<std::decay_t<Content>>(std::forward<Content>(content), *this);
}

/**
 * @brief Apply any style element to the given content
 */
template <style_element E, typename Content>
auto applied_to(const E& elem, Content&& content) {
    return to_style(elem).applied_to(std::forward<Content>(content));
}

template <formattable Content>
std::string to_string(const styled<Content>& s) {
    return fmt::format("{}", s);
}

}  // namespace tint

template <typename Content>
struct fmt::formatter<tint::styled<Content>> {
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const tint::styled<Content>& s, FormatContext& ctx) const {
        auto out = ctx.out();
        if (s.style().empty()) {
            return fmt::format_to(out, "{}", s.content());
        }
        out = fmt::format_to(out, "{}", s.style());
        out = fmt::format_to(out, "{}", s.content());
        return fmt::format_to(out, "{}", tint::reset);
    }
};
