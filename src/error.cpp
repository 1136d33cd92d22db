#include <pacecalc/error.hpp>

namespace pacecalc {

const char* error_kind_name(ErrorKind k) {
  switch (k) {
    case ErrorKind::InvalidDistance:  return "distance";
    case ErrorKind::InvalidTime:      return "time";
    case ErrorKind::InvalidPace:      return "pace";
    case ErrorKind::InvalidArguments: return "arguments";
    case ErrorKind::DivisionByZero:   return "division";
    default: return "unknown";
  }
}

std::string describe(const Error& e) {
  switch (e.kind) {
    case ErrorKind::InvalidDistance:
    case ErrorKind::InvalidTime:
    case ErrorKind::InvalidPace:
      return "'" + e.input + "' is not a valid input for " + error_kind_name(e.kind);
    case ErrorKind::InvalidArguments:
      return e.detail.empty() ? std::string("invalid arguments") : e.detail;
    case ErrorKind::DivisionByZero:
      if (e.detail.empty()) return "division by zero";
      return e.detail + (e.input.empty() ? std::string() : " ('" + e.input + "')");
    default:
      return "unknown error";
  }
}

} // namespace pacecalc
