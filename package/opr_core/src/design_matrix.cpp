#include "opr_core/design_matrix.hpp"

#include <unordered_map>
#include <unordered_set>

namespace opr_core {

const char *metric_name(Metric metric) {
  switch (metric) {
  case Metric::opr:
    return "OPR";
  case Metric::npopr:
    return "NpOPR";
  case Metric::dpr:
    return "DPR";
  case Metric::npdpr:
    return "NpDPR";
  case Metric::ccwm:
    return "CCWM";
  }
  return "?";
}

ScoreFn score_fn_for(Metric metric) {
  switch (metric) {
  case Metric::opr:
    return [](const Match &m, bool red) { return m.score(red); };
  case Metric::npopr:
    return [](const Match &m, bool red) { return m.np_score(red); };
  case Metric::dpr:
    // What the opposing alliance scored.
    return [](const Match &m, bool red) { return m.score(!red); };
  case Metric::npdpr:
    return [](const Match &m, bool red) { return m.np_score(!red); };
  case Metric::ccwm:
    return [](const Match &m, bool red) { return m.score(red) - m.score(!red); };
  }
  return [](const Match &, bool) { return 0.0; };
}

DesignSystem build_design_matrix(const std::vector<Match> &matches,
                                 const std::vector<TeamId> &teams,
                                 const ScoreFn &score_fn) {
  std::unordered_set<TeamId> playing;
  for (const auto &m : matches) {
    playing.insert(m.red_teams.begin(), m.red_teams.end());
    playing.insert(m.blue_teams.begin(), m.blue_teams.end());
  }

  DesignSystem sys;
  std::unordered_map<TeamId, Eigen::Index> column;
  for (const TeamId t : teams) {
    if (playing.count(t) == 0 || column.count(t) != 0)
      continue;
    column[t] = static_cast<Eigen::Index>(sys.active_teams.size());
    sys.active_teams.push_back(t);
  }

  const Eigen::Index rows = 2 * static_cast<Eigen::Index>(matches.size());
  const Eigen::Index cols = static_cast<Eigen::Index>(sys.active_teams.size());
  sys.a = Eigen::MatrixXd::Zero(rows, cols);
  sys.b = Eigen::VectorXd::Zero(rows);

  Eigen::Index row = 0;
  for (const auto &m : matches) {
    for (const bool red : {true, false}) {
      const auto &alliance = red ? m.red_teams : m.blue_teams;
      for (const TeamId t : alliance) {
        auto it = column.find(t);
        if (it != column.end())
          sys.a(row, it->second) = 1.0;
      }
      if (score_fn)
        sys.b(row) = score_fn(m, red);
      ++row;
    }
  }
  return sys;
}

DesignSystem build_participation_matrix(const std::vector<Match> &matches,
                                        const std::vector<TeamId> &teams) {
  return build_design_matrix(matches, teams, ScoreFn{});
}

} // namespace opr_core
