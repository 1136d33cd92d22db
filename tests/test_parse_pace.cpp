#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <pacecalc/parse.hpp>

using Catch::Approx;
using namespace pacecalc;

TEST_CASE("parse_pace") {
  SECTION("minutes:seconds") {
    REQUIRE(parse_pace("4:30").value() == 4.5);
    REQUIRE(parse_pace("5:00").value() == 5.0);
    REQUIRE(parse_pace(" 3:45 ").value() == Approx(3.75));
  }

  SECTION("bare minutes") {
    REQUIRE(parse_pace("5.5").value() == Approx(5.5));
    REQUIRE(parse_pace("6").value() == Approx(6.0));
  }

  SECTION("malformed input fails with InvalidPace") {
    for (const char* bad : {"abc", "1:2:3", "4:", "-4:30", "", "4:3x", "0x4:0x1E", "0x5", "1.797e308:1e308"}) {
      auto r = parse_pace(bad);
      REQUIRE_FALSE(r.ok());
      REQUIRE(r.error().kind == ErrorKind::InvalidPace);
    }
    REQUIRE(describe(parse_pace("abc").error()) == "'abc' is not a valid input for pace");
  }
}
