#include <pacecalc/cli.hpp>
#include <fmt/format.h>
#include <pacecalc/format.hpp>
#include <pacecalc/insight.hpp>
#include <pacecalc/log.hpp>
#include <pacecalc/resolve.hpp>

namespace pacecalc {

Palette make_palette(bool color) {
  if (!color) return Palette{};
  Palette p;
  p.title     = fmt::fg(fmt::terminal_color::cyan) | fmt::emphasis::bold;
  p.success   = fmt::fg(fmt::terminal_color::green) | fmt::emphasis::bold;
  p.info      = fmt::fg(fmt::terminal_color::blue);
  p.warning   = fmt::fg(fmt::terminal_color::yellow);
  p.error     = fmt::fg(fmt::terminal_color::red) | fmt::emphasis::bold;
  p.highlight = fmt::fg(fmt::terminal_color::magenta) | fmt::emphasis::bold;
  return p;
}

Result<CliOptions> parse_cli_args(const std::vector<std::string>& args) {
  CliOptions opt;
  std::vector<std::string> positionals;
  bool only_positionals = false;

  for (const auto& a : args) {
    if (only_positionals || a.empty() || a[0] != '-' || a == "-") {
      positionals.push_back(a);
    } else if (a == "--") {
      only_positionals = true;
    } else if (a == "--no-color") {
      opt.color = false;
    } else if (a == "--verbose" || a == "-v") {
      opt.verbose = true;
    } else if (a == "--help" || a == "-h") {
      opt.show_help = true;
    } else {
      return make_error(ErrorKind::InvalidArguments, a, "unrecognized option '" + a + "'");
    }
  }

  if (opt.show_help) return opt;

  if (positionals.size() != 3) {
    return make_error(ErrorKind::InvalidArguments, {},
                      fmt::format("expected 3 positional arguments, got {}", positionals.size()));
  }
  opt.first = positionals[0];
  opt.preposition = positionals[1];
  opt.second = positionals[2];
  if (opt.preposition != "in" && opt.preposition != "at") {
    return make_error(ErrorKind::InvalidArguments, opt.preposition,
                      "argument preposition: invalid choice '" + opt.preposition +
                      "' (choose from 'in', 'at')");
  }
  return opt;
}

std::string usage_text(const std::string& prog) {
  return fmt::format(
      "usage: {0} [-h] [--no-color] [--verbose] first_value {{in,at}} second_value\n"
      "\n"
      "Pace Calculator - calculate pace, time, and distance from any two of them\n"
      "\n"
      "positional arguments:\n"
      "  first_value   First value (distance, time, or pace)\n"
      "  {{in,at}}       Preposition: 'in' for time, 'at' for pace\n"
      "  second_value  Second value (distance, time, or pace)\n"
      "\n"
      "options:\n"
      "  -h, --help     show this help message and exit\n"
      "  --no-color     Disable colored output\n"
      "  -v, --verbose  Print diagnostics to stderr\n"
      "\n"
      "Examples:\n"
      "  {0} 10km in 45:00      # pace for 10km in 45 minutes\n"
      "  {0} marathon at 4:30   # time for a marathon at 4:30 min/km\n"
      "  {0} 1:30:00 at 5:00    # distance for 1:30:00 at 5:00 min/km\n"
      "\n"
      "Distance formats: 5km, 10k, 21.0975km, marathon, half-marathon, hm, 1mi, 400m\n"
      "Time formats: 45:00, 1:30:00, 1h30m, 90m\n"
      "Pace formats: 4:30, 5.5 (minutes per kilometer)\n",
      prog);
}

std::string render_banner(const Palette& pal) {
  return fmt::format(pal.title,
      "+===============================================================+\n"
      "|                        PACE CALCULATOR                        |\n"
      "+===============================================================+") + "\n";
}

static std::string rule() { return std::string(50, '='); }

std::string render_report(const RunningMetrics& m, const Palette& pal) {
  std::string out;
  auto line = [&](const std::string& s){ out += s; out += '\n'; };

  line("");
  line(fmt::format(pal.success, "CALCULATION RESULTS"));
  line(rule());

  line("");
  line(fmt::format(pal.highlight, "MAIN METRICS:"));
  line("  Distance: " + fmt::format(pal.info, "{:.3f} km", m.distance_km));
  line("  Time:     " + fmt::format(pal.info, "{}", format_minutes(m.time_minutes, true)));
  line("  Pace:     " + fmt::format(pal.info, "{} min/km", format_minutes(m.pace_min_per_km, false)));
  line("  Speed:    " + fmt::format(pal.info, "{:.1f} km/h", m.speed_kmh));

  line("");
  line(fmt::format(pal.highlight, "SPLITS:"));
  for (const auto& [label, t] : m.splits) {
    line(fmt::format("  {:>6}: ", label) + fmt::format(pal.info, "{}", t));
  }

  if (!m.projected_times.empty()) {
    line("");
    line(fmt::format(pal.highlight, "PROJECTED TIMES:"));
    for (const auto& [label, t] : m.projected_times) {
      line(fmt::format("  {:>6}: ", label) + fmt::format(pal.info, "{}", t));
    }
  }

  line("");
  line(fmt::format(pal.highlight, "TRAINING ZONES (based on current pace):"));
  for (const auto& [zone, range] : m.training_zones) {
    line(fmt::format("  {:>10}: ", zone) + fmt::format(pal.info, "{} min/km", range));
  }

  line("");
  line(fmt::format(pal.highlight, "PERFORMANCE INSIGHTS:"));
  const auto tier = classify_performance(m.pace_min_per_km);
  const fmt::text_style& tier_style =
      (tier == PerformanceTier::Elite || tier == PerformanceTier::Excellent) ? pal.success
      : (tier == PerformanceTier::Solid) ? pal.warning
      : pal.info;
  line("  " + fmt::format(tier_style, "{}", tier_message(tier)));
  if (auto marathon = project_marathon(m.pace_min_per_km, m.distance_km); marathon.has_value()) {
    line("  " + fmt::format(pal.highlight, "At this pace, you'd complete a marathon in: {}", *marathon));
  }

  line("");
  line(rule());
  return out;
}

int run_cli(const std::string& prog,
            const std::vector<std::string>& args,
            std::ostream& out,
            std::ostream& err) {
  const auto opts = parse_cli_args(args);
  if (!opts) {
    Logger log(err, false);
    log.error("{}: error: {}", prog, describe(opts.error()));
    err << usage_text(prog);
    return kExitUsage;
  }
  if (opts->show_help) {
    out << usage_text(prog);
    return kExitOk;
  }

  const Palette pal = make_palette(opts->color);
  const Logger log(err, opts->verbose, pal.error);

  const auto inputs = resolve_inputs(opts->first, opts->preposition, opts->second);
  if (!inputs) {
    log.error("Error: {}", describe(inputs.error()));
    return kExitUsage;
  }
  log.debug("distance='{}' time='{}' pace='{}'",
            inputs->distance.value_or(""), inputs->time.value_or(""), inputs->pace.value_or(""));

  out << render_banner(pal);

  const auto metrics = derive(*inputs);
  if (!metrics) {
    const Error& e = metrics.error();
    const bool input_error = e.kind == ErrorKind::InvalidDistance ||
                             e.kind == ErrorKind::InvalidTime ||
                             e.kind == ErrorKind::InvalidPace;
    log.error("{}: {}", input_error ? "Input Error" : "Error", describe(e));
    return kExitFailure;
  }
  log.debug("distance_km={} time_minutes={} pace_min_per_km={}",
            metrics->distance_km, metrics->time_minutes, metrics->pace_min_per_km);

  out << render_report(*metrics, pal);
  return kExitOk;
}

} // namespace pacecalc
