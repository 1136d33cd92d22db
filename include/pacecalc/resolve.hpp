#pragma once
#include <string>
#include <pacecalc/error.hpp>
#include <pacecalc/metrics.hpp>

namespace pacecalc {

// Best-effort heuristic, not a parser: true when `s` reads like a time
// ("1:30:00", "1h30m", "90m"). Distance presets ("marathon", "5k", "400m")
// and bare numbers are never times.
bool looks_like_time(const std::string& s);

// Assigns roles for "<first> in <second>" (distance in time) and
// "<first> at <second>" (distance or time at pace).
// Unknown preposition fails with InvalidArguments.
Result<RunInputs> resolve_inputs(const std::string& first,
                                 const std::string& preposition,
                                 const std::string& second);

} // namespace pacecalc
