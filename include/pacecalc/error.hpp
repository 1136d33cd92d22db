#pragma once
#include <optional>
#include <string>
#include <utility>

namespace pacecalc {

enum class ErrorKind : int {
  InvalidDistance = 0,
  InvalidTime,
  InvalidPace,
  InvalidArguments,
  DivisionByZero,
};

struct Error {
  ErrorKind kind = ErrorKind::InvalidArguments;
  std::string input;   // offending raw string (empty when not applicable)
  std::string detail;  // extra context for InvalidArguments / DivisionByZero
};

// "distance", "time", "pace", "arguments", "division"
const char* error_kind_name(ErrorKind k);

// Human-readable message, e.g. "'abc' is not a valid input for distance".
std::string describe(const Error& e);

inline Error make_error(ErrorKind k, std::string input, std::string detail = {}) {
  return Error{k, std::move(input), std::move(detail)};
}

// Value-or-error return used across the core. Check ok() before value().
template <class T>
class Result {
public:
  Result(T value) : value_(std::move(value)) {}
  Result(Error error) : error_(std::move(error)) {}

  bool ok() const { return value_.has_value(); }
  explicit operator bool() const { return ok(); }

  const T& value() const { return *value_; }
  const T& operator*() const { return *value_; }
  const T* operator->() const { return &*value_; }

  const Error& error() const { return error_; }

private:
  std::optional<T> value_;
  Error error_{};
};

} // namespace pacecalc
