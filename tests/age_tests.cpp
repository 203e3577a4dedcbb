#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <cleanmarkers/age.hpp>

using namespace cleanmarkers;
using std::chrono::seconds;

TEST_CASE("Age units") {
    REQUIRE(parse_age("45s") == seconds(45));
    REQUIRE(parse_age("30m") == seconds(1800));
    REQUIRE(parse_age("2h") == seconds(7200));
    REQUIRE(parse_age("1d") == seconds(86400));
    REQUIRE(parse_age("1w") == seconds(604800));
}

TEST_CASE("Age accepts fractions and upper case") {
    REQUIRE(parse_age("1.5h") == seconds(5400));
    REQUIRE(parse_age("0.5m") == seconds(30));
    REQUIRE(parse_age("2H") == seconds(7200));
    REQUIRE(parse_age("0s") == seconds(0));
}

TEST_CASE("Malformed ages are rejected") {
    REQUIRE_FALSE(parse_age(""));
    REQUIRE_FALSE(parse_age("h"));
    REQUIRE_FALSE(parse_age("10"));
    REQUIRE_FALSE(parse_age("10x"));
    REQUIRE_FALSE(parse_age("-1h"));
    REQUIRE_FALSE(parse_age("1.h"));
    REQUIRE_FALSE(parse_age(".5h"));
    REQUIRE_FALSE(parse_age("1 h"));
    REQUIRE_FALSE(parse_age("1hh"));
    REQUIRE_FALSE(parse_age("1e3s"));
}

TEST_CASE("Ages beyond the file clock range are rejected") {
    REQUIRE(parse_age("100000d") == seconds(8640000000));
    REQUIRE_FALSE(parse_age("1000000d"));
    REQUIRE_FALSE(parse_age("20000w"));
    REQUIRE_FALSE(parse_age("99999999999999999999w"));
    REQUIRE_FALSE(parse_age("999999999999999999999999999999s"));
}

TEST_CASE("format_age picks the largest exact unit") {
    REQUIRE(format_age(seconds(7200)) == "2h");
    REQUIRE(format_age(seconds(90)) == "90s");
    REQUIRE(format_age(seconds(1209600)) == "2w");
    REQUIRE(format_age(seconds(0)) == "0s");
}
