#include <pacecalc/format.hpp>
#include <cmath>
#include <cstdio>

namespace pacecalc {

std::string format_minutes(double minutes, bool use_hours) {
  if (minutes < 0.0 || !std::isfinite(minutes)) return "--";
  // stays clear of LLONG_MAX (~9.22e18) after rounding
  if (minutes * 60.0 >= 9.0e18) return "--";

  const long long total = std::llround(minutes * 60.0);
  char buf[48];
  if (!use_hours || total < 3600) {
    std::snprintf(buf, sizeof(buf), "%lld:%02lld", total / 60, total % 60);
  } else {
    std::snprintf(buf, sizeof(buf), "%lld:%02lld:%02lld",
                  total / 3600, (total % 3600) / 60, total % 60);
  }
  return buf;
}

} // namespace pacecalc
