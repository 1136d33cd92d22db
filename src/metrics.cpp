#include <pacecalc/metrics.hpp>
#include <algorithm>
#include <cmath>
#include <pacecalc/format.hpp>
#include <pacecalc/parse.hpp>
#include <pacecalc/units.hpp>

namespace pacecalc {

static inline bool present(const std::optional<std::string>& v) {
  return v.has_value() && !v->empty();
}

LabeledTimes compute_splits(double pace_min_per_km) {
  LabeledTimes out;
  out.reserve(split_checkpoints().size());
  for (const auto& cp : split_checkpoints()) {
    out.emplace_back(cp.label, format_minutes(cp.km * pace_min_per_km, cp.km >= 10.0));
  }
  return out;
}

LabeledTimes compute_projections(double distance_km, double pace_min_per_km) {
  LabeledTimes out;
  for (const auto& cp : projection_checkpoints()) {
    // exact comparison against the fixed checkpoint literals
    if (cp.km == distance_km) continue;
    out.emplace_back(cp.label, format_minutes(cp.km * pace_min_per_km, cp.km >= 10.0));
  }
  return out;
}

LabeledTimes compute_training_zones(double threshold_pace) {
  LabeledTimes out;
  out.reserve(training_zones().size());
  for (const auto& z : training_zones()) {
    out.emplace_back(z.name, format_minutes(threshold_pace * z.min_mult, false) + " - " +
                             format_minutes(threshold_pace * z.max_mult, false));
  }
  return out;
}

RunningMetrics compute_metrics(double distance_km, double time_minutes, double pace_min_per_km) {
  RunningMetrics m;
  m.distance_km = distance_km;
  m.time_minutes = time_minutes;
  m.pace_min_per_km = pace_min_per_km;
  m.speed_kmh = pace_min_per_km > 0.0 ? 60.0 / pace_min_per_km : 0.0;
  m.splits = compute_splits(pace_min_per_km);
  m.projected_times = compute_projections(distance_km, pace_min_per_km);
  m.training_zones = compute_training_zones(pace_min_per_km);
  return m;
}

std::optional<std::string> find_label(const LabeledTimes& items, const std::string& label) {
  auto it = std::find_if(items.begin(), items.end(),
                         [&](const auto& kv){ return kv.first == label; });
  if (it == items.end()) return std::nullopt;
  return it->second;
}

Result<RunningMetrics> derive(const RunInputs& in) {
  const bool has_d = present(in.distance);
  const bool has_t = present(in.time);
  const bool has_p = present(in.pace);
  const int given = int(has_d) + int(has_t) + int(has_p);
  if (given != 2) {
    return make_error(ErrorKind::InvalidArguments, {},
                      "exactly two of distance, time, and pace must be provided");
  }

  double dist_km = 0.0, time_min = 0.0, pace_min = 0.0;

  if (has_d) {
    const auto d = parse_distance(*in.distance);
    if (!d) return d.error();
    if (*d == 0.0) return make_error(ErrorKind::DivisionByZero, *in.distance, "distance must be greater than zero");
    dist_km = *d;
  }
  if (has_t) {
    const auto t = parse_time(*in.time);
    if (!t) return t.error();
    time_min = *t;
  }
  if (has_p) {
    const auto p = parse_pace(*in.pace);
    if (!p) return p.error();
    if (*p == 0.0) return make_error(ErrorKind::DivisionByZero, *in.pace, "pace must be greater than zero");
    pace_min = *p;
  }

  if (!has_p)      pace_min = time_min / dist_km;
  else if (!has_t) time_min = dist_km * pace_min;
  else             dist_km  = time_min / pace_min;

  RunningMetrics m = compute_metrics(dist_km, time_min, pace_min);
  if (!std::isfinite(m.distance_km) || !std::isfinite(m.time_minutes) ||
      !std::isfinite(m.pace_min_per_km) || !std::isfinite(m.speed_kmh)) {
    return make_error(ErrorKind::InvalidArguments, {},
                      "derived values are out of range for the given inputs");
  }
  return m;
}

} // namespace pacecalc
