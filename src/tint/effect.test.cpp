#include <tint/effect.hpp>

#include <catch2/catch.hpp>

#include <cstdint>
#include <vector>

using namespace tint;

TEST_CASE("Effect codes") {
    CHECK(sgr_code(effect::bold) == 1);
    CHECK(sgr_code(effect::dim) == 2);
    CHECK(sgr_code(effect::italic) == 3);
    CHECK(sgr_code(effect::blink) == 5);
    CHECK(sgr_code(effect::reverse) == 7);
    CHECK(sgr_code(effect::hidden) == 8);
    CHECK(sgr_code(effect::strikethrough) == 9);
    CHECK(sgr_code(effect::overline) == 53);

    CHECK(sgr_off_code(effect::bold) == 22);
    CHECK(sgr_off_code(effect::dim) == 22);
    CHECK(sgr_off_code(effect::italic) == 23);
    CHECK(sgr_off_code(effect::strikethrough) == 29);
    CHECK(sgr_off_code(effect::overline) == 55);
}

TEST_CASE("Effect sets") {
    effect_set set;
    CHECK(set.empty());
    CHECK(set.size() == 0);
    CHECK(set.parameters().empty());

    set = set.with(effect::strikethrough).with(effect::bold).with(effect::bold);
    CHECK(set.size() == 2);
    CHECK(set.contains(effect::bold));
    CHECK(set.contains(effect::strikethrough));
    CHECK_FALSE(set.contains(effect::italic));
    // Declaration order, not insertion order
    CHECK(set.parameters() == param_list{1, 9});

    CHECK(set.without(effect::bold) == effect_set{effect::strikethrough});
    CHECK(set.without(effect::italic) == set);
    CHECK(set.set(effect::italic, true)
          == effect_set{effect::bold, effect::italic, effect::strikethrough});
    CHECK(set.set(effect::bold, false) == effect_set{effect::strikethrough});

    auto all = effect_set{effect::hidden, effect::blink} | effect_set{effect::dim, effect::reverse};
    CHECK(all.parameters() == param_list{2, 5, 7, 8});

    std::vector<effect> seen;
    all.for_each([&](effect e) { seen.push_back(e); });
    CHECK(seen == std::vector{effect::dim, effect::blink, effect::reverse, effect::hidden});

    auto over = effect_set{effect::overline, effect::bold};
    CHECK(over.parameters() == param_list{1, 53});
}

TEST_CASE("Underline variants") {
    CHECK(parameters(underline_style::none).empty());
    CHECK(parameters(underline_style::single) == param_list{4});

    auto check_colon_form = [](underline_style st, std::uint8_t sub) {
        auto params = parameters(st);
        REQUIRE(params.size() == 1);
        CHECK(params[0].code == 4);
        CHECK(params[0].sub == sub);
    };
    check_colon_form(underline_style::double_, 2);
    check_colon_form(underline_style::curly, 3);
    check_colon_form(underline_style::dotted, 4);
    check_colon_form(underline_style::dashed, 5);

    CHECK(to_string(parameters(underline_style::curly)) == "\x1b[4:3m");
    CHECK(to_string(parameters(underline_style::dashed)) == "\x1b[4:5m");
}
