#include "opr_core/rollup.hpp"

#include <algorithm>
#include <map>

#include "opr_core/log.hpp"

namespace opr_core {

namespace {

double rating_or_zero(const MetricResult &res, TeamId team) {
  auto it = res.ratings.find(team);
  return it == res.ratings.end() ? 0.0 : it->second;
}

} // namespace

EventRatings evaluate_event(const std::vector<Match> &matches,
                            const RegularizationConfig &cfg,
                            const std::string &event_code) {
  EventRatings ev;
  ev.event_code = event_code;
  if (matches.empty())
    return ev;

  const std::vector<TeamId> teams = teams_in(matches);
  ev.lambda = choose_lambda_for_event(matches, teams, cfg);
  log_info("processing event {}: matches={} teams={} lambda={} ({})",
           event_code.empty() ? "-" : event_code, matches.size(), teams.size(),
           ev.lambda.lambda, strategy_name(cfg.strategy));

  const Calculator calc(matches, teams, ev.lambda.lambda);
  ev.metrics = calc.calculate_all();

  ev.teams.reserve(teams.size());
  for (const TeamId t : teams) {
    TeamPerformance tp;
    tp.team = t;
    tp.opr = rating_or_zero(ev.metrics.opr, t);
    tp.npopr = rating_or_zero(ev.metrics.npopr, t);
    tp.ccwm = rating_or_zero(ev.metrics.ccwm, t);
    tp.dpr = rating_or_zero(ev.metrics.dpr, t);
    tp.npdpr = rating_or_zero(ev.metrics.npdpr, t);
    tp.npavg = Calculator::calculate_npavg(matches, t);
    tp.matches = appearances(matches, t);
    ev.teams.push_back(tp);
  }
  return ev;
}

std::vector<TeamPerformance> combine_events(
    const std::vector<EventRatings> &events) {
  std::map<TeamId, TeamPerformance> acc;
  for (const auto &ev : events) {
    for (const auto &tp : ev.teams) {
      TeamPerformance &sum = acc[tp.team];
      sum.team = tp.team;
      const double w = static_cast<double>(tp.matches);
      sum.opr += tp.opr * w;
      sum.npopr += tp.npopr * w;
      sum.ccwm += tp.ccwm * w;
      sum.dpr += tp.dpr * w;
      sum.npdpr += tp.npdpr * w;
      sum.npavg += tp.npavg * w;
      sum.matches += tp.matches;
    }
  }

  std::vector<TeamPerformance> out;
  out.reserve(acc.size());
  for (auto &kv : acc) {
    TeamPerformance tp = kv.second;
    if (tp.matches > 0) {
      const double total = static_cast<double>(tp.matches);
      tp.opr /= total;
      tp.npopr /= total;
      tp.ccwm /= total;
      tp.dpr /= total;
      tp.npdpr /= total;
      tp.npavg /= total;
    }
    out.push_back(tp);
  }
  std::stable_sort(out.begin(), out.end(),
                   [](const TeamPerformance &a, const TeamPerformance &b) {
                     return a.opr > b.opr;
                   });
  return out;
}

} // namespace opr_core
