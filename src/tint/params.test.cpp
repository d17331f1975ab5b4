#include <tint/params.hpp>

#include <catch2/catch.hpp>

#include <cstddef>
#include <iterator>
#include <stdexcept>
#include <string>

TEST_CASE("Join parameters") {
    tint::param_list params;
    CHECK(params.empty());
    CHECK(tint::to_string(params) == "");

    params.push(1);
    CHECK(tint::to_string(params) == "\x1b[1m");

    params.push(4, 3);
    params.push(38);
    params.push(5);
    params.push(255);
    CHECK(params.size() == 5);
    CHECK(tint::to_string(params) == "\x1b[1;4:3;38;5;255m");

    std::string joined;
    tint::write_params(params, std::back_inserter(joined));
    CHECK(joined == "1;4:3;38;5;255");
}

TEST_CASE("Compare parameter lists") {
    tint::param_list a = {1, 31};
    tint::param_list b;
    b.push(1);
    b.push(31);
    CHECK(a == b);

    b.push(4, 2);
    CHECK_FALSE(a == b);

    tint::param_list c = {1, 31, 4};
    CHECK_FALSE(c == b);

    a.append(tint::param_list{4});
    CHECK(a == c);
}

TEST_CASE("A parameter list does not grow past its capacity") {
    tint::param_list params;
    for (std::size_t i = 0; i < tint::param_list::capacity; ++i) {
        params.push(1);
    }
    CHECK(params.size() == tint::param_list::capacity);
    CHECK_THROWS_AS(params.push(2), std::length_error);
    CHECK_THROWS_AS(params.push(4, 3), std::length_error);
    CHECK_THROWS_AS(params.append(tint::param_list{31}), std::length_error);
    CHECK(params.size() == tint::param_list::capacity);
    CHECK(params[tint::param_list::capacity - 1] == tint::sgr_param{1});

    // Appending an empty list is always fine
    CHECK_NOTHROW(params.append(tint::param_list{}));
}
