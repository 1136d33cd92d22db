#include <pacecalc/parse.hpp>
#include <pacecalc/units.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <optional>
#include <regex>
#include <stdexcept>
#include <vector>

namespace pacecalc {

std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

static bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Whole-string, finite, non-negative number. nullopt otherwise.
static std::optional<double> to_quantity(const std::string& raw) {
  const std::string s = trim(raw);
  if (s.empty()) return std::nullopt;
  // std::stod also takes hex floats ("0x1p3"); only decimal notation is valid here
  if (s.find_first_of("xX") != std::string::npos) return std::nullopt;
  double v = 0.0;
  try {
    size_t idx = 0;
    v = std::stod(s, &idx);
    if (idx != s.size()) return std::nullopt;
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
  if (!std::isfinite(v) || v < 0.0) return std::nullopt;
  return v;
}

// Combined values (unit products, h/m/s sums) can overflow even when every part is finite.
static Result<double> finite_or_error(double v, ErrorKind kind, const std::string& input) {
  if (!std::isfinite(v)) return make_error(kind, input);
  return v;
}

static std::vector<std::string> split_on(const std::string& s, char sep) {
  std::vector<std::string> parts;
  std::string cur;
  for (char c : s) {
    if (c == sep) { parts.push_back(cur); cur.clear(); }
    else { cur.push_back(c); }
  }
  parts.push_back(cur);
  return parts;
}

Result<double> parse_distance(const std::string& s) {
  const std::string raw = trim(s);
  const std::string d = lower(raw);

  if (auto km = preset_km(d); km.has_value()) {
    return *km;
  }

  for (const auto& unit : suffix_units_by_length()) {
    if (!ends_with(d, unit.token)) continue;
    const auto value = to_quantity(d.substr(0, d.size() - unit.token.size()));
    if (!value.has_value()) return make_error(ErrorKind::InvalidDistance, raw);
    return finite_or_error(*value * unit.km, ErrorKind::InvalidDistance, raw);
  }

  if (auto km = to_quantity(d); km.has_value()) {
    return *km;
  }
  return make_error(ErrorKind::InvalidDistance, raw);
}

static Result<double> parse_time_with_letters(const std::string& t) {
  static const std::regex pattern(
      R"(^(?:(\d+(?:\.\d+)?)h)?(?:(\d+(?:\.\d+)?)m)?(?:(\d+)s)?$)");
  std::smatch m;
  if (!std::regex_match(t, m, pattern)) {
    return make_error(ErrorKind::InvalidTime, t);
  }

  double parts[3] = {0.0, 0.0, 0.0}; // hours, minutes, seconds
  for (int i = 0; i < 3; ++i) {
    if (!m[i + 1].matched) continue;
    const auto v = to_quantity(m[i + 1].str());
    if (!v.has_value()) return make_error(ErrorKind::InvalidTime, t);
    parts[i] = *v;
  }
  return finite_or_error(parts[0] * 60.0 + parts[1] + parts[2] / 60.0, ErrorKind::InvalidTime, t);
}

static Result<double> parse_time_with_colons(const std::string& t) {
  const auto parts = split_on(t, ':');
  if (parts.size() != 2 && parts.size() != 3) {
    return make_error(ErrorKind::InvalidTime, t);
  }

  std::vector<double> values;
  values.reserve(parts.size());
  for (const auto& p : parts) {
    const auto v = to_quantity(p);
    if (!v.has_value()) return make_error(ErrorKind::InvalidTime, t);
    values.push_back(*v);
  }

  const double minutes = values.size() == 2
      ? values[0] + values[1] / 60.0
      : values[0] * 60.0 + values[1] + values[2] / 60.0;
  return finite_or_error(minutes, ErrorKind::InvalidTime, t);
}

Result<double> parse_time(const std::string& s) {
  const std::string t = trim(s);

  if (t.find_first_of("hms") != std::string::npos) {
    return parse_time_with_letters(t);
  }
  if (t.find(':') != std::string::npos) {
    return parse_time_with_colons(t);
  }
  if (auto minutes = to_quantity(t); minutes.has_value()) {
    return *minutes;
  }
  return make_error(ErrorKind::InvalidTime, t);
}

Result<double> parse_pace(const std::string& s) {
  const std::string p = trim(s);

  if (p.find(':') != std::string::npos) {
    const auto parts = split_on(p, ':');
    if (parts.size() == 2) {
      const auto mins = to_quantity(parts[0]);
      const auto secs = to_quantity(parts[1]);
      if (mins.has_value() && secs.has_value()) {
        return finite_or_error(*mins + *secs / 60.0, ErrorKind::InvalidPace, p);
      }
    }
    return make_error(ErrorKind::InvalidPace, p);
  }

  if (auto minutes = to_quantity(p); minutes.has_value()) {
    return *minutes;
  }
  return make_error(ErrorKind::InvalidPace, p);
}

} // namespace pacecalc
