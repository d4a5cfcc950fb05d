// Print per-team regression metrics for a match CSV export.
//
//   opr_csv matches.csv [--lambda X | --strategy band|continuous|svd]
//                       [--parallel] [--log debug|info|warn|error|off]
#include "opr_core/lambda.hpp"
#include "opr_core/log.hpp"
#include "opr_core/match_csv.hpp"
#include "opr_core/performance.hpp"

#include <cstdlib>
#include <exception>
#include <optional>
#include <string>

#include <fmt/format.h>

namespace {

void usage() {
  fmt::print(stderr,
             "usage: opr_csv <matches.csv> [--lambda X | --strategy "
             "band|continuous|svd] [--parallel] [--log LEVEL]\n");
}

double rating(const opr_core::MetricResult &r, opr_core::TeamId t) {
  auto it = r.ratings.find(t);
  return it == r.ratings.end() ? 0.0 : it->second;
}

} // namespace

int main(int argc, char **argv) {
  std::string path;
  std::optional<double> fixed_lambda;
  opr_core::RegularizationConfig cfg;
  bool parallel = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    auto next = [&]() -> std::string {
      if (i + 1 >= argc) {
        usage();
        std::exit(2);
      }
      return argv[++i];
    };
    try {
      if (arg == "--lambda") {
        fixed_lambda = std::stod(next());
      } else if (arg == "--strategy") {
        cfg.strategy = opr_core::parse_strategy(next());
      } else if (arg == "--parallel") {
        parallel = true;
      } else if (arg == "--log") {
        opr_core::set_log_level(opr_core::parse_log_level(next()));
      } else if (arg == "-h" || arg == "--help") {
        usage();
        return 0;
      } else if (path.empty()) {
        path = arg;
      } else {
        usage();
        return 2;
      }
    } catch (const std::exception &e) {
      fmt::print(stderr, "opr_csv: {}: {}\n", arg, e.what());
      return 2;
    }
  }
  if (path.empty()) {
    usage();
    return 2;
  }

  opr_core::MatchSet set;
  try {
    set = opr_core::read_matches_csv(path);
  } catch (const std::exception &e) {
    opr_core::log_error("{}: {}", path, e.what());
    return 1;
  }

  opr_core::LambdaChoice choice;
  if (fixed_lambda) {
    choice.lambda = *fixed_lambda;
  } else {
    choice = opr_core::choose_lambda_for_event(set.matches, set.teams, cfg);
  }
  fmt::print("{} matches, {} teams, lambda={}{}\n", set.matches.size(),
             set.teams.size(), choice.lambda,
             choice.ill_conditioned ? " (ill-conditioned)" : "");

  const opr_core::Calculator calc(set.matches, set.teams, choice.lambda);
  opr_core::MetricTable table;
  try {
    table = calc.calculate_all(parallel);
  } catch (const std::exception &e) {
    opr_core::log_error("{}", e.what());
    return 1;
  }
  for (const auto *r : {&table.opr, &table.npopr, &table.ccwm, &table.dpr,
                        &table.npdpr}) {
    if (r->status == opr_core::MetricStatus::singular_system) {
      fmt::print("note: singular system, rerun with --lambda > 0\n");
      break;
    }
  }

  fmt::print("{:>6} | {:>7} | {:>7} | {:>7} | {:>7} | {:>7} | {:>7}\n", "Team",
             "OPR", "npOPR", "CCWM", "DPR", "npDPR", "npAVG");
  fmt::print("{}\n", std::string(70, '-'));
  for (const auto t : set.teams) {
    fmt::print("{:>6} | {:>7.2f} | {:>7.2f} | {:>7.2f} | {:>7.2f} | {:>7.2f} | "
               "{:>7.2f}\n",
               t, rating(table.opr, t), rating(table.npopr, t),
               rating(table.ccwm, t), rating(table.dpr, t),
               rating(table.npdpr, t),
               opr_core::Calculator::calculate_npavg(set.matches, t));
  }
  return 0;
}
