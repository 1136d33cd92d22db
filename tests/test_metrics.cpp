#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <pacecalc/metrics.hpp>
#include <pacecalc/units.hpp>

using Catch::Approx;
using namespace pacecalc;

TEST_CASE("compute_splits at 4:30 min/km") {
  const auto s = compute_splits(4.5);
  REQUIRE(s.size() == 5);
  REQUIRE(s[0] == std::make_pair(std::string("1km"), std::string("4:30")));
  REQUIRE(s[1] == std::make_pair(std::string("5km"), std::string("22:30")));
  REQUIRE(s[2] == std::make_pair(std::string("10km"), std::string("45:00")));
  REQUIRE(s[3] == std::make_pair(std::string("21.0975km"), std::string("1:34:56")));
  REQUIRE(s[4] == std::make_pair(std::string("42.195km"), std::string("3:09:53")));
}

TEST_CASE("compute_splits under 10km never shows hours") {
  const auto s = compute_splits(15.0); // 5km = 75 min
  REQUIRE(find_label(s, "5km").value() == "75:00");
  REQUIRE(find_label(s, "10km").value() == "2:30:00");
}

TEST_CASE("compute_projections skips the input distance") {
  SECTION("10km run") {
    const auto p = compute_projections(10.0, 4.5);
    REQUIRE(p.size() == 3);
    REQUIRE_FALSE(find_label(p, "10km").has_value());
    REQUIRE(p[0].first == "5km");
    REQUIRE(p[1].first == "21.0975km");
  }

  SECTION("marathon run") {
    const auto p = compute_projections(kMarathonKm, 4.5);
    REQUIRE(p.size() == 3);
    REQUIRE_FALSE(find_label(p, "42.195km").has_value());
  }

  SECTION("non-standard distance keeps all four") {
    const auto p = compute_projections(8.0, 4.5);
    REQUIRE(p.size() == 4);
  }
}

TEST_CASE("compute_training_zones at 4:00 min/km") {
  const auto z = compute_training_zones(4.0);
  REQUIRE(z.size() == 5);
  REQUIRE(z[0] == std::make_pair(std::string("Easy"), std::string("4:36 - 5:00")));
  REQUIRE(z[1] == std::make_pair(std::string("Threshold"), std::string("4:12 - 4:36")));
  REQUIRE(z[2] == std::make_pair(std::string("Tempo"), std::string("4:00 - 4:12")));
  REQUIRE(z[3] == std::make_pair(std::string("VO2 Max"), std::string("3:36 - 4:00")));
  REQUIRE(z[4] == std::make_pair(std::string("Speed"), std::string("3:12 - 3:36")));
}

TEST_CASE("compute_metrics") {
  SECTION("speed from pace") {
    const auto m = compute_metrics(10.0, 45.0, 4.5);
    REQUIRE(m.speed_kmh == Approx(13.3333).epsilon(1e-4));
    REQUIRE(m.splits.size() == 5);
    REQUIRE(m.projected_times.size() == 3);
    REQUIRE(m.training_zones.size() == 5);
  }

  SECTION("zero pace yields zero speed") {
    const auto m = compute_metrics(10.0, 0.0, 0.0);
    REQUIRE(m.speed_kmh == 0.0);
  }
}

TEST_CASE("find_label") {
  const LabeledTimes items = {{"a", "1"}, {"b", "2"}};
  REQUIRE(find_label(items, "b").value() == "2");
  REQUIRE_FALSE(find_label(items, "c").has_value());
}
