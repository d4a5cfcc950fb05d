#pragma once

#include <string>
#include <vector>

#include "opr_core/lambda.hpp"
#include "opr_core/match.hpp"
#include "opr_core/performance.hpp"

namespace opr_core {

// Metrics for one team at one event (or combined over several).
struct TeamPerformance {
  TeamId team{0};
  double opr{0.0};
  double npopr{0.0};
  double ccwm{0.0};
  double dpr{0.0};
  double npdpr{0.0};
  double npavg{0.0};
  int matches{0};
};

struct EventRatings {
  std::string event_code;
  LambdaChoice lambda;
  MetricTable metrics;
  std::vector<TeamPerformance> teams; // sorted by team id
};

// Derives the event's teams from its matches, picks lambda with cfg and
// computes every metric. A metric the solver could not produce reads as 0
// in `teams`; the status stays available in `metrics`.
EventRatings evaluate_event(const std::vector<Match> &matches,
                            const RegularizationConfig &cfg = {},
                            const std::string &event_code = {});

// Match-weighted average of each team's per-event metrics, sorted by OPR
// descending.
std::vector<TeamPerformance> combine_events(
    const std::vector<EventRatings> &events);

} // namespace opr_core
