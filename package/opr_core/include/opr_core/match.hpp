#pragma once

#include <cstdint>
#include <vector>

namespace opr_core {

using TeamId = std::int64_t;

// One match between a red and a blue alliance. red_penalties is the foul
// figure reported with red's own score (FoulPointsCommitted) and is part of
// red_score, so red_score - red_penalties is red's non-penalty output; blue
// mirrors it. Throws std::invalid_argument if a team is listed twice on one
// alliance or on both alliances.
struct Match {
  std::vector<TeamId> red_teams;
  std::vector<TeamId> blue_teams;
  double red_score{0.0};
  double blue_score{0.0};
  double red_penalties{0.0};
  double blue_penalties{0.0};

  Match() = default;
  Match(std::vector<TeamId> red_teams_, std::vector<TeamId> blue_teams_,
        double red_score_, double blue_score_, double red_penalties_ = 0.0,
        double blue_penalties_ = 0.0);

  bool has_team(TeamId team) const;
  bool is_red(TeamId team) const;
  bool is_blue(TeamId team) const;

  // Score and non-penalty score for one side.
  double score(bool red) const { return red ? red_score : blue_score; }
  double np_score(bool red) const {
    return red ? red_score - red_penalties : blue_score - blue_penalties;
  }
};

// Sorted distinct team ids appearing on either alliance of any match.
std::vector<TeamId> teams_in(const std::vector<Match> &matches);

// Number of matches in which team appears on either alliance.
int appearances(const std::vector<Match> &matches, TeamId team);

} // namespace opr_core
