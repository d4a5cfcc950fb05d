#include "opr_core/performance.hpp"

#include <future>
#include <utility>

#include "opr_core/log.hpp"
#include "opr_core/matrix.hpp"

namespace opr_core {

const char *status_name(MetricStatus status) {
  switch (status) {
  case MetricStatus::ok:
    return "ok";
  case MetricStatus::insufficient_data:
    return "insufficient_data";
  case MetricStatus::singular_system:
    return "singular_system";
  }
  return "?";
}

Calculator::Calculator(std::vector<Match> matches_, std::vector<TeamId> teams_,
                       double lambda_)
    : matches(std::move(matches_)), teams(std::move(teams_)), lambda(lambda_) {}

MetricResult Calculator::calculate(Metric metric) const {
  MetricResult res;
  if (matches.empty()) {
    res.status = MetricStatus::insufficient_data;
    return res;
  }

  const DesignSystem sys =
      build_design_matrix(matches, teams, score_fn_for(metric));
  if (sys.active_teams.empty()) {
    res.status = MetricStatus::insufficient_data;
    return res;
  }

  const SolveResult sol =
      lambda == 0.0 ? solve_least_squares(sys.a, sys.b)
                    : solve_least_squares_regularized(sys.a, sys.b, lambda);
  if (!sol.ok()) {
    log_warn("{}: singular system ({} matches, {} teams, lambda={})",
             metric_name(metric), matches.size(), sys.active_teams.size(),
             lambda);
    res.status = MetricStatus::singular_system;
    return res;
  }

  for (std::size_t i = 0; i < sys.active_teams.size(); ++i)
    res.ratings[sys.active_teams[i]] = sol.x(static_cast<Eigen::Index>(i));
  return res;
}

MetricTable Calculator::calculate_all(bool parallel) const {
  MetricTable table;
  if (!parallel) {
    table.opr = calculate(Metric::opr);
    table.npopr = calculate(Metric::npopr);
    table.dpr = calculate(Metric::dpr);
    table.npdpr = calculate(Metric::npdpr);
    table.ccwm = calculate(Metric::ccwm);
    return table;
  }

  // Each task builds and solves its own system; *this is only read.
  auto run = [this](Metric m) {
    return std::async(std::launch::async, [this, m] { return calculate(m); });
  };
  auto opr = run(Metric::opr);
  auto npopr = run(Metric::npopr);
  auto dpr = run(Metric::dpr);
  auto npdpr = run(Metric::npdpr);
  auto ccwm = run(Metric::ccwm);
  table.opr = opr.get();
  table.npopr = npopr.get();
  table.dpr = dpr.get();
  table.npdpr = npdpr.get();
  table.ccwm = ccwm.get();
  return table;
}

double Calculator::calculate_npavg(const std::vector<Match> &matches,
                                   TeamId team) {
  double total = 0.0;
  int count = 0;
  for (const auto &m : matches) {
    for (const TeamId t : m.red_teams) {
      if (t == team) {
        total += m.np_score(true);
        ++count;
      }
    }
    for (const TeamId t : m.blue_teams) {
      if (t == team) {
        total += m.np_score(false);
        ++count;
      }
    }
  }
  if (count == 0)
    return 0.0;
  return total / count;
}

} // namespace opr_core
