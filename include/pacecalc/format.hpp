#pragma once
#include <string>

namespace pacecalc {

// Minutes -> "M:SS", or "H:MM:SS" when use_hours is set and the value reaches
// one hour. Seconds are rounded to the nearest whole second and the layout is
// picked after rounding, so 59.999 min never prints as "59:60".
// Negative or non-finite input yields "--".
std::string format_minutes(double minutes, bool use_hours);

} // namespace pacecalc
