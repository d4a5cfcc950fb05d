#include "opr_core/match.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace opr_core {

Match::Match(std::vector<TeamId> red_teams_, std::vector<TeamId> blue_teams_,
             double red_score_, double blue_score_, double red_penalties_,
             double blue_penalties_)
    : red_teams(std::move(red_teams_)), blue_teams(std::move(blue_teams_)),
      red_score(red_score_), blue_score(blue_score_),
      red_penalties(red_penalties_), blue_penalties(blue_penalties_) {
  for (const auto *alliance : {&red_teams, &blue_teams}) {
    for (auto it = alliance->begin(); it != alliance->end(); ++it) {
      if (std::find(std::next(it), alliance->end(), *it) != alliance->end()) {
        throw std::invalid_argument(fmt::format(
            "Match: team {} is listed twice on one alliance", *it));
      }
    }
  }
  for (const TeamId t : red_teams) {
    if (std::find(blue_teams.begin(), blue_teams.end(), t) != blue_teams.end()) {
      throw std::invalid_argument(
          fmt::format("Match: team {} is on both alliances", t));
    }
  }
}

bool Match::is_red(TeamId team) const {
  return std::find(red_teams.begin(), red_teams.end(), team) != red_teams.end();
}

bool Match::is_blue(TeamId team) const {
  return std::find(blue_teams.begin(), blue_teams.end(), team) !=
         blue_teams.end();
}

bool Match::has_team(TeamId team) const { return is_red(team) || is_blue(team); }

std::vector<TeamId> teams_in(const std::vector<Match> &matches) {
  std::vector<TeamId> out;
  for (const auto &m : matches) {
    out.insert(out.end(), m.red_teams.begin(), m.red_teams.end());
    out.insert(out.end(), m.blue_teams.begin(), m.blue_teams.end());
  }
  std::sort(out.begin(), out.end());
  out.erase(std::unique(out.begin(), out.end()), out.end());
  return out;
}

int appearances(const std::vector<Match> &matches, TeamId team) {
  int count = 0;
  for (const auto &m : matches) {
    if (m.has_team(team))
      ++count;
  }
  return count;
}

} // namespace opr_core
