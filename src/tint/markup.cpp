#include "./markup.hpp"

#include "./config.hpp"
#include "./error.hpp"
#include "./style.hpp"
#include "./writer.hpp"

#include <tint/util/dym.hpp>
#include <tint/util/log.hpp>

#include <boost/leaf/exception.hpp>
#include <magic_enum.hpp>
#include <neo/assert.hpp>
#include <neo/utility.hpp>

#include <array>
#include <cctype>
#include <map>
#include <utility>
#include <vector>

using namespace tint;

namespace {

constexpr std::array underline_classes = {
    std::pair{std::string_view("underline"), underline_style::single},
    std::pair{std::string_view("double-underline"), underline_style::double_},
    std::pair{std::string_view("curly-underline"), underline_style::curly},
    std::pair{std::string_view("dotted-underline"), underline_style::dotted},
    std::pair{std::string_view("dashed-underline"), underline_style::dashed},
    std::pair{std::string_view("no-underline"), underline_style::none},
};

constexpr std::array effect_aliases = {
    std::pair{std::string_view("faint"), effect::dim},
    std::pair{std::string_view("strike"), effect::strikethrough},
};

constexpr std::string_view bg_prefix = "bg-";
constexpr std::string_view ul_prefix = "ul-";

const std::vector<std::string>& known_classes() {
    static const auto names = [] {
        std::vector<std::string> ret = {"br", "plain"};
        for (auto name : magic_enum::enum_names<basic_color>()) {
            ret.emplace_back(name);
            ret.push_back(std::string(bg_prefix) + std::string(name));
            ret.push_back(std::string(ul_prefix) + std::string(name));
        }
        for (auto name : magic_enum::enum_names<effect>()) {
            ret.emplace_back(name);
        }
        for (auto& [name, _] : effect_aliases) {
            ret.emplace_back(name);
        }
        for (auto& [name, _] : underline_classes) {
            ret.emplace_back(name);
        }
        return ret;
    }();
    return names;
}

struct text_styler {
    std::string_view input;
    should_style     should;
    text_writer      out{};

    std::string_view::iterator s_iter = input.cbegin(), s_place = s_iter, s_stop = input.cend();

    bool do_style = (should == should_style::force);
    bool strict   = config::strict_markup();

    std::vector<style> _style_stack = {style{}};

    std::string_view slice(std::string_view::iterator it,
                           std::string_view::iterator st) const noexcept {
        return input.substr(it - input.cbegin(), st - it);
    }
    std::string_view pending() const noexcept { return slice(s_place, s_iter); }
    std::size_t      offset() const noexcept { return std::size_t(s_iter - input.cbegin()); }

    std::string render() {
        while (s_iter != s_stop) {
            if (*s_iter == '`') {
                out.write(pending());
                ++s_iter;
                if (s_iter == s_stop) {
                    tint_log(warn, "Markup string ends with an incomplete escape sequence");
                    s_place = s_iter;
                    break;
                }
                out.putc(*s_iter);
                ++s_iter;
                s_place = s_iter;
            } else if (*s_iter == '.') {
                out.write(pending());
                s_place = s_iter;
                ++s_iter;
                if (s_iter == s_stop || !std::isalpha(static_cast<unsigned char>(*s_iter))) {
                    // Just keep going
                    continue;
                }
                s_place = s_iter;
                _push_style();
            } else if (*s_iter == ']' && _style_stack.size() > 1) {
                out.write(pending());
                s_place = ++s_iter;
                _pop_style();
            } else {
                // Just keep scanning
                ++s_iter;
            }
        }
        out.write(pending());
        if (_style_stack.size() > 1) {
            tint_log(warn,
                     "Markup string has {} unclosed style group(s). Resetting the style.",
                     _style_stack.size() - 1);
            _style_stack.resize(1);
            _put_style(_style_stack.back());
        }
        return out.take_string();
    }

    [[noreturn]] void _throw_invalid(std::string message) const {
        throw boost::leaf::exception(invalid_markup(std::move(message)),
                                     e_markup_string{std::string(input)},
                                     e_markup_offset{offset()});
    }

    void _put_style(const style& st) {
        if (do_style) {
            out.put_style(st);
        }
    }

    void _push_style() {
        _read_style();
        if (s_iter == s_stop || *s_iter != '[') {
            _throw_invalid("Style classes must be followed by an opening square bracket");
        }
        _put_style(_style_stack.back());
        s_place = ++s_iter;
    }

    void _read_style() {
        auto& st     = _style_stack.emplace_back(_style_stack.back());
        bool  bright = false;
        while (s_iter != s_stop) {
            if (*s_iter == neo::oper::any_of('[', '.')) {
                auto cls = pending();
                _apply_class(st, bright, cls);
                if (*s_iter == '[') {
                    break;
                }
                s_place = ++s_iter;
                continue;
            }
            ++s_iter;
        }
        if (bright) {
            st = _brightened(st);
        }
    }

    static style _brightened(style st) noexcept {
        for (auto target : {color_target::foreground, color_target::background}) {
            auto c = st.color_of(target);
            if (!c) {
                continue;
            }
            if (auto simple = c->get_if<simple_color>()) {
                st = st.with_color(target, simple->brightened());
            }
        }
        return st;
    }

    void _apply_class(style& st, bool& bright, std::string_view cls) const {
        if (auto c = magic_enum::enum_cast<basic_color>(cls)) {
            st = st.fg(*c);
            return;
        }
        if (cls.starts_with(bg_prefix)) {
            if (auto c = magic_enum::enum_cast<basic_color>(cls.substr(bg_prefix.size()))) {
                st = st.bg(*c);
                return;
            }
        }
        if (cls.starts_with(ul_prefix)) {
            if (auto c = magic_enum::enum_cast<basic_color>(cls.substr(ul_prefix.size()))) {
                st = st.underline_color(*c);
                return;
            }
        }
        if (cls == "br") {
            bright = true;
            return;
        }
        if (cls == "plain") {
            st = style{};
            return;
        }
        if (auto e = magic_enum::enum_cast<effect>(cls)) {
            st = st.with_effect(*e);
            return;
        }
        for (auto& [name, e] : effect_aliases) {
            if (cls == name) {
                st = st.with_effect(e);
                return;
            }
        }
        for (auto& [name, variant] : underline_classes) {
            if (cls == name) {
                st = st.with_underline(variant);
                return;
            }
        }
        _unknown_class(cls);
    }

    void _unknown_class(std::string_view cls) const {
        auto dym = did_you_mean(cls, known_classes());
        if (strict) {
            throw boost::leaf::exception(invalid_markup("Invalid style class in markup string"),
                                         e_markup_string{std::string(input)},
                                         e_markup_offset{offset()},
                                         e_markup_class{std::string(cls)},
                                         e_did_you_mean{dym});
        }
        tint_log(warn, "Ignoring unknown style class '{}' in markup string", cls);
        if (dym) {
            tint_log(warn, "  (Did you mean '{}'?)", *dym);
        }
    }

    void _pop_style() {
        neo_assert(invariant,
                   _style_stack.size() > 1,
                   "Unbalanced style: Extra closing square brackets",
                   input);
        _style_stack.pop_back();
        _put_style(_style_stack.back());
    }
};

}  // namespace

std::string tint::stylize(std::string_view str, tint::should_style should) {
    neo_assertion_breadcrumbs("Rendering markup string", str);
    return text_styler{str, should}.render();
}

const std::string& detail::cached_rendering(const char* ptr) {
    thread_local std::map<const char*, std::string> cache;
    auto                                            found = cache.find(ptr);
    if (found == cache.end()) {
        found = cache.emplace(ptr, stylize(ptr, should_style::force)).first;
    }
    return found->second;
}
