#pragma once

#include <istream>
#include <string>
#include <vector>

#include "opr_core/match.hpp"

namespace opr_core {

struct MatchSet {
  std::vector<Match> matches;
  std::vector<TeamId> teams; // sorted, distinct
};

// Columns after a header row:
//   red1,red2,blue1,blue2,red_score,blue_score,red_penalties,blue_penalties
// Blank lines are skipped. Throws std::runtime_error naming the offending
// line, std::invalid_argument if a team sits on both alliances.
MatchSet parse_matches_csv(std::istream &in);
MatchSet read_matches_csv(const std::string &path);

} // namespace opr_core
