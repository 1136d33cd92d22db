#include <pacecalc/insight.hpp>
#include <pacecalc/format.hpp>
#include <pacecalc/units.hpp>

namespace pacecalc {

PerformanceTier classify_performance(double pace_min_per_km) {
  if (pace_min_per_km <= 3.0) return PerformanceTier::Elite;
  if (pace_min_per_km <= 4.0) return PerformanceTier::Excellent;
  if (pace_min_per_km <= 5.0) return PerformanceTier::Good;
  if (pace_min_per_km <= 6.0) return PerformanceTier::Solid;
  return PerformanceTier::Building;
}

const char* tier_name(PerformanceTier t) {
  switch (t) {
    case PerformanceTier::Elite:     return "elite";
    case PerformanceTier::Excellent: return "excellent";
    case PerformanceTier::Good:      return "good";
    case PerformanceTier::Solid:     return "solid";
    case PerformanceTier::Building:  return "building";
    default: return "unknown";
  }
}

const char* tier_message(PerformanceTier t) {
  switch (t) {
    case PerformanceTier::Elite:
      return "Elite level performance! You're in the top tier of runners.";
    case PerformanceTier::Excellent:
      return "Excellent performance! You're a very strong runner.";
    case PerformanceTier::Good:
      return "Good performance! You're above average.";
    case PerformanceTier::Solid:
      return "Solid performance! Focus on consistency and gradual improvement.";
    case PerformanceTier::Building:
      return "Building foundation! Every run makes you stronger.";
    default:
      return "";
  }
}

std::optional<std::string> project_marathon(double pace_min_per_km, double current_distance_km) {
  if (current_distance_km >= kMarathonKm) return std::nullopt;
  return format_minutes(kMarathonKm * pace_min_per_km, true);
}

} // namespace pacecalc
