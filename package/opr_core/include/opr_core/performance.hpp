#pragma once

#include <map>
#include <vector>

#include "opr_core/design_matrix.hpp"
#include "opr_core/match.hpp"

namespace opr_core {

enum class MetricStatus {
  ok,
  insufficient_data, // no matches or no participating teams
  singular_system,   // normal equations could not be solved
};

const char *status_name(MetricStatus status);

struct MetricResult {
  std::map<TeamId, double> ratings; // participating teams only
  MetricStatus status{MetricStatus::ok};

  bool ok() const { return status == MetricStatus::ok; }
};

struct MetricTable {
  MetricResult opr;
  MetricResult npopr;
  MetricResult dpr;
  MetricResult npdpr;
  MetricResult ccwm;
};

// Caller-held inputs for one event. lambda == 0 solves ordinary least
// squares; any other value applies ridge regularization.
struct Calculator {
  std::vector<Match> matches;
  std::vector<TeamId> teams;
  double lambda{0.0};

  Calculator() = default;
  Calculator(std::vector<Match> matches_, std::vector<TeamId> teams_,
             double lambda_ = 0.0);

  MetricResult calculate(Metric metric) const;

  MetricResult calculate_opr() const { return calculate(Metric::opr); }
  MetricResult calculate_npopr() const { return calculate(Metric::npopr); }
  MetricResult calculate_dpr() const { return calculate(Metric::dpr); }
  MetricResult calculate_npdpr() const { return calculate(Metric::npdpr); }
  MetricResult calculate_ccwm() const { return calculate(Metric::ccwm); }

  // All five regression metrics; parallel runs each on its own task.
  MetricTable calculate_all(bool parallel = false) const;

  // Mean non-penalty alliance score over the team's appearances, 0 if none.
  static double calculate_npavg(const std::vector<Match> &matches, TeamId team);
};

} // namespace opr_core
