#include "photnorm/TextUtils.hpp"

#include <catch2/catch.hpp>
#include <cmath>
#include <limits>

using namespace photnorm;

TEST_CASE("split_delimited_honours_quotes_and_trims") {
    auto f = split_delimited(R"(2430000.5, "Smith, J.", 'B' ,12.3)", ',');
    REQUIRE(f.size() == 4);
    REQUIRE(f[0] == "2430000.5");
    REQUIRE(f[1] == "Smith, J.");
    REQUIRE(f[2] == "'B'");
    REQUIRE(f[3] == "12.3");
}

TEST_CASE("split_delimited_keeps_empty_trailing_field") {
    auto f = split_delimited("a,b,", ',');
    REQUIRE(f.size() == 3);
    REQUIRE(f[2].empty());
}

TEST_CASE("split_on_blank_runs_needs_two_blanks") {
    auto f = split_on_blank_runs("  2444000.5  1980 Jul 1  12.5  null  B  IAUC 3500  ");
    REQUIRE(f.size() == 6);
    REQUIRE(f[1] == "1980 Jul 1");
    REQUIRE(f[5] == "IAUC 3500");
}

TEST_CASE("parse_double_is_strict") {
    double v = -1.0;
    REQUIRE(parse_double(" 12.5 ", v));
    REQUIRE(v == 12.5);
    REQUIRE(parse_double("+3e2", v));
    REQUIRE(v == 300.0);

    v = -1.0;
    REQUIRE_FALSE(parse_double("bad", v));
    REQUIRE_FALSE(parse_double("12.5x", v));
    REQUIRE_FALSE(parse_double("", v));
    REQUIRE(v == -1.0);
}

TEST_CASE("format_double_round_trips") {
    for (double x : {2430000.5, 12.3, 0.1, -999.0, 1.0 / 3.0}) {
        double back = 0.0;
        REQUIRE(parse_double(format_double(x), back));
        REQUIRE(back == x);
    }
    REQUIRE(format_double(25.0) == "25");
}

TEST_CASE("strip_quotes_removes_nested_quotes") {
    REQUIRE(strip_quotes(" 'blue' ") == "blue");
    REQUIRE(strip_quotes("\"'V'\"") == "V");
    REQUIRE(strip_quotes("B") == "B");
}
