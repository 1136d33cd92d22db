#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <limits>

#include <pacecalc/format.hpp>
#include <pacecalc/parse.hpp>

using Catch::Approx;
using namespace pacecalc;

TEST_CASE("format_minutes layout") {
  SECTION("under an hour is M:SS even with hours enabled") {
    REQUIRE(format_minutes(45.0, true) == "45:00");
    REQUIRE(format_minutes(4.5, false) == "4:30");
    REQUIRE(format_minutes(0.0, true) == "0:00");
  }

  SECTION("hours") {
    REQUIRE(format_minutes(90.0, true) == "1:30:00");
    REQUIRE(format_minutes(90.75, true) == "1:30:45");
    REQUIRE(format_minutes(189.8775, true) == "3:09:53");
  }

  SECTION("hours disabled keeps counting minutes") {
    REQUIRE(format_minutes(90.0, false) == "90:00");
  }
}

TEST_CASE("format_minutes rounds to the nearest second") {
  SECTION("round up without a :60 carry bug") {
    REQUIRE(format_minutes(4.999, false) == "5:00");
    REQUIRE(format_minutes(59.999, false) == "60:00");
    REQUIRE(format_minutes(59.999, true) == "1:00:00");
    REQUIRE(format_minutes(119.9999, true) == "2:00:00");
  }

  SECTION("round down") {
    REQUIRE(format_minutes(4.505, false) == "4:30"); // 270.3 s
  }
}

TEST_CASE("format_minutes invalid values") {
  REQUIRE(format_minutes(-1.0, true) == "--");
  REQUIRE(format_minutes(std::numeric_limits<double>::quiet_NaN(), true) == "--");
  REQUIRE(format_minutes(std::numeric_limits<double>::infinity(), false) == "--");

  SECTION("values near the integer limit") {
    REQUIRE(format_minutes(1.5e17, true) == "--");
    REQUIRE(format_minutes(std::numeric_limits<double>::max(), false) == "--");
    REQUIRE(format_minutes(1.0e15, false) == "1000000000000000:00");
  }
}

TEST_CASE("format_minutes output parses back within one second") {
  for (double v : {0.5, 4.5, 22.345, 59.2, 123.456, 189.8775, 600.01}) {
    auto back = parse_time(format_minutes(v, true));
    REQUIRE(back.ok());
    REQUIRE(std::fabs(*back - v) <= 1.0 / 60.0);
  }
}
