#pragma once
#include <ostream>
#include <utility>
#include <fmt/color.h>
#include <fmt/format.h>

namespace pacecalc {

// Diagnostic sink for the CLI. Passed explicitly; the core never logs.
class Logger {
public:
  Logger(std::ostream& sink, bool verbose, fmt::text_style error_style = {})
    : sink_(sink), verbose_(verbose), error_style_(error_style) {}

  bool verbose() const { return verbose_; }

  template <typename... Args>
  void debug(fmt::format_string<Args...> f, Args&&... args) const {
    if (!verbose_) return;
    sink_ << "[debug] " << fmt::format(f, std::forward<Args>(args)...) << '\n';
  }

  template <typename... Args>
  void error(fmt::format_string<Args...> f, Args&&... args) const {
    const std::string msg = fmt::format(f, std::forward<Args>(args)...);
    sink_ << fmt::format(error_style_, "{}", msg) << '\n';
  }

private:
  std::ostream& sink_;
  bool verbose_;
  fmt::text_style error_style_;
};

} // namespace pacecalc
