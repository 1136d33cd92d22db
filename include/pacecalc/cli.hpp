#pragma once
#include <ostream>
#include <string>
#include <vector>
#include <fmt/color.h>
#include <pacecalc/error.hpp>
#include <pacecalc/metrics.hpp>

namespace pacecalc {

enum ExitCode : int {
  kExitOk = 0,
  kExitFailure = 1, // parse or computation error
  kExitUsage = 2,   // malformed command line
};

struct CliOptions {
  std::string first;
  std::string preposition; // "in" | "at"
  std::string second;
  bool color = true;
  bool verbose = false;
  bool show_help = false;
};

// Text styles used by the renderer. Default-constructed styles emit no escapes.
struct Palette {
  fmt::text_style title;
  fmt::text_style success;
  fmt::text_style info;
  fmt::text_style warning;
  fmt::text_style error;
  fmt::text_style highlight;
};

Palette make_palette(bool color);

// `args` excludes the program name.
// Accepts: <first> <in|at> <second> [--no-color] [--verbose|-v] [--help|-h]
Result<CliOptions> parse_cli_args(const std::vector<std::string>& args);

std::string usage_text(const std::string& prog);

std::string render_banner(const Palette& pal);
std::string render_report(const RunningMetrics& m, const Palette& pal);

// Full CLI flow; returns the process exit code.
int run_cli(const std::string& prog,
            const std::vector<std::string>& args,
            std::ostream& out,
            std::ostream& err);

} // namespace pacecalc
