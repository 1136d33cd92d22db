#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <pacecalc/error.hpp>

namespace pacecalc {

// Display-ordered (label, value) pairs.
using LabeledTimes = std::vector<std::pair<std::string, std::string>>;

struct RunningMetrics {
  double distance_km = 0.0;
  double time_minutes = 0.0;
  double pace_min_per_km = 0.0;
  double speed_kmh = 0.0;
  LabeledTimes splits;          // 1km .. 42.195km
  LabeledTimes projected_times; // standard races other than the input distance
  LabeledTimes training_zones;  // zone name -> "M:SS - M:SS"
};

// Raw caller strings; exactly two must be present. Empty strings count as absent.
struct RunInputs {
  std::optional<std::string> distance;
  std::optional<std::string> time;
  std::optional<std::string> pace;
};

// Parses the two given values and derives the third plus all insights.
// Errors: InvalidArguments (not exactly two inputs, or a derived value
// overflows), InvalidDistance, InvalidTime, InvalidPace, DivisionByZero
// (zero distance or pace).
Result<RunningMetrics> derive(const RunInputs& in);

// Builds the record from established numbers (no validation).
RunningMetrics compute_metrics(double distance_km, double time_minutes, double pace_min_per_km);

LabeledTimes compute_splits(double pace_min_per_km);
LabeledTimes compute_projections(double distance_km, double pace_min_per_km);
LabeledTimes compute_training_zones(double threshold_pace);

std::optional<std::string> find_label(const LabeledTimes& items, const std::string& label);

} // namespace pacecalc
