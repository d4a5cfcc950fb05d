#pragma once

#include <functional>
#include <vector>

#include <Eigen/Dense>

#include "opr_core/match.hpp"

namespace opr_core {

enum class Metric { opr, npopr, dpr, npdpr, ccwm };

const char *metric_name(Metric metric);

// Target value for one alliance row; red == false selects the blue alliance.
using ScoreFn = std::function<double(const Match &, bool red)>;

ScoreFn score_fn_for(Metric metric);

struct DesignSystem {
  Eigen::MatrixXd a;                // 2 * matches x active_teams, 0/1
  Eigen::VectorXd b;                // 2 * matches
  std::vector<TeamId> active_teams; // column order
};

// Rows 2i and 2i+1 hold the red and blue alliances of matches[i]. Columns are
// the teams of `teams` that play at least one match, in the caller's order.
// Alliance members outside that set are dropped from the row.
DesignSystem build_design_matrix(const std::vector<Match> &matches,
                                 const std::vector<TeamId> &teams,
                                 const ScoreFn &score_fn);

// Participation rows only (b is all zero); used to size regularization for
// a whole event independent of the metric.
DesignSystem build_participation_matrix(const std::vector<Match> &matches,
                                        const std::vector<TeamId> &teams);

} // namespace opr_core
