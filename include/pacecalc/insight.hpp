#pragma once
#include <optional>
#include <string>

namespace pacecalc {

enum class PerformanceTier : int {
  Elite = 0,  // pace <= 3:00 min/km
  Excellent,  // <= 4:00
  Good,       // <= 5:00
  Solid,      // <= 6:00
  Building,
};

PerformanceTier classify_performance(double pace_min_per_km);

const char* tier_name(PerformanceTier t);
const char* tier_message(PerformanceTier t);

// Marathon time at this pace ("H:MM:SS"), only for runs shorter than a marathon.
std::optional<std::string> project_marathon(double pace_min_per_km, double current_distance_km);

} // namespace pacecalc
