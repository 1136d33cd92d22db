#include <pacecalc/resolve.hpp>
#include <pacecalc/parse.hpp>
#include <pacecalc/units.hpp>

namespace pacecalc {

bool looks_like_time(const std::string& s) {
  const std::string v = lower(trim(s));
  if (preset_km(v).has_value()) return false;
  return v.find_first_of("hms:") != std::string::npos;
}

Result<RunInputs> resolve_inputs(const std::string& first,
                                 const std::string& preposition,
                                 const std::string& second) {
  const std::string prep = lower(trim(preposition));
  RunInputs in;
  if (prep == "in") {
    in.distance = first;
    in.time = second;
  } else if (prep == "at") {
    if (looks_like_time(first)) in.time = first;
    else in.distance = first;
    in.pace = second;
  } else {
    return make_error(ErrorKind::InvalidArguments, preposition,
                      "preposition must be 'in' or 'at', got '" + preposition + "'");
  }
  return in;
}

} // namespace pacecalc
