#include <catch2/catch_test_macros.hpp>
#include <string>

#include <pacecalc/insight.hpp>

using namespace pacecalc;

TEST_CASE("classify_performance thresholds") {
  REQUIRE(classify_performance(2.8) == PerformanceTier::Elite);
  REQUIRE(classify_performance(3.0) == PerformanceTier::Elite);
  REQUIRE(classify_performance(3.01) == PerformanceTier::Excellent);
  REQUIRE(classify_performance(4.0) == PerformanceTier::Excellent);
  REQUIRE(classify_performance(4.5) == PerformanceTier::Good);
  REQUIRE(classify_performance(5.0) == PerformanceTier::Good);
  REQUIRE(classify_performance(6.0) == PerformanceTier::Solid);
  REQUIRE(classify_performance(6.01) == PerformanceTier::Building);
  REQUIRE(classify_performance(9.0) == PerformanceTier::Building);
}

TEST_CASE("tier names and messages") {
  REQUIRE(std::string(tier_name(PerformanceTier::Elite)) == "elite");
  REQUIRE(std::string(tier_name(PerformanceTier::Building)) == "building");
  REQUIRE(std::string(tier_message(PerformanceTier::Good)).find("above average") != std::string::npos);
}

TEST_CASE("project_marathon") {
  SECTION("shorter runs get a projection") {
    auto t = project_marathon(4.5, 10.0);
    REQUIRE(t.has_value());
    REQUIRE(*t == "3:09:53");
  }

  SECTION("marathon or longer gets none") {
    REQUIRE_FALSE(project_marathon(4.5, 42.195).has_value());
    REQUIRE_FALSE(project_marathon(4.5, 50.0).has_value());
  }
}
