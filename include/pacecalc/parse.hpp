#pragma once
#include <string>
#include <pacecalc/error.hpp>

namespace pacecalc {

// Distance expression -> kilometers.
// Accepts presets ("marathon", "hm", "5k", "400m", ...), a number with a unit
// suffix ("10km", "3.1mi", "2m" = two marathons, "8k") or a bare number of kilometers.
// Case-insensitive. Fails with ErrorKind::InvalidDistance.
Result<double> parse_distance(const std::string& s);

// Time expression -> minutes.
// Accepts "1h30m20s" style, "M:SS" / "H:MM:SS" and bare minutes ("42.5").
// Fails with ErrorKind::InvalidTime.
Result<double> parse_time(const std::string& s);

// Pace expression -> minutes per km. Accepts "M:SS" and bare minutes ("5.5").
// Fails with ErrorKind::InvalidPace.
Result<double> parse_pace(const std::string& s);

// Shared helpers (also used by the resolver).
std::string trim(std::string s);
std::string lower(std::string s);

} // namespace pacecalc
