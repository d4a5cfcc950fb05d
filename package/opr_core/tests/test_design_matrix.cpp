#include <catch2/catch.hpp>

#include <vector>

#include "opr_core/design_matrix.hpp"

using namespace opr_core;

namespace {

std::vector<Match> three_matches() {
  return {
      Match({1, 2}, {3, 4}, 100, 80, 10, 5),
      Match({5, 6}, {1, 3}, 60, 90, 0, 15),
      Match({2, 4}, {5, 6}, 70, 70, 0, 0),
  };
}

} // namespace

TEST_CASE("Design matrix: two rows per match, one column per playing team",
          "[design]") {
  const auto matches = three_matches();
  const std::vector<TeamId> teams{6, 5, 99, 4, 3, 2, 1};

  const DesignSystem sys =
      build_design_matrix(matches, teams, score_fn_for(Metric::opr));
  REQUIRE(sys.a.rows() == 6);
  REQUIRE(sys.a.cols() == 6);
  REQUIRE(sys.b.size() == 6);
  // Caller order kept, non-playing team 99 has no column.
  REQUIRE(sys.active_teams == std::vector<TeamId>{6, 5, 4, 3, 2, 1});

  for (Eigen::Index r = 0; r < sys.a.rows(); ++r) {
    for (Eigen::Index c = 0; c < sys.a.cols(); ++c) {
      const double v = sys.a(r, c);
      REQUIRE((v == 0.0 || v == 1.0));
    }
  }

  // Row 0: red of match 0 = {1, 2}; columns 5 and 4.
  REQUIRE(sys.a.row(0).sum() == 2.0);
  REQUIRE(sys.a(0, 5) == 1.0);
  REQUIRE(sys.a(0, 4) == 1.0);
  // Row 3: blue of match 1 = {1, 3}.
  REQUIRE(sys.a(3, 5) == 1.0);
  REQUIRE(sys.a(3, 3) == 1.0);

  REQUIRE(sys.b(0) == 100.0);
  REQUIRE(sys.b(1) == 80.0);
  REQUIRE(sys.b(2) == 60.0);
  REQUIRE(sys.b(3) == 90.0);
}

TEST_CASE("Design matrix: CCWM targets cancel within a match", "[design]") {
  const std::vector<Match> matches{Match({1, 2}, {3, 4}, 100, 80)};
  const DesignSystem sys = build_design_matrix(matches, {1, 2, 3, 4},
                                               score_fn_for(Metric::ccwm));
  REQUIRE(sys.b(0) == 20.0);
  REQUIRE(sys.b(1) == -20.0);
  REQUIRE(sys.b(0) + sys.b(1) == 0.0);
}

TEST_CASE("Design matrix: metric targets", "[design]") {
  const Match m({1, 2}, {3, 4}, 100, 80, 10, 5);

  REQUIRE(score_fn_for(Metric::opr)(m, true) == 100.0);
  REQUIRE(score_fn_for(Metric::opr)(m, false) == 80.0);
  REQUIRE(score_fn_for(Metric::npopr)(m, true) == 90.0);
  REQUIRE(score_fn_for(Metric::npopr)(m, false) == 75.0);
  REQUIRE(score_fn_for(Metric::dpr)(m, true) == 80.0);
  REQUIRE(score_fn_for(Metric::dpr)(m, false) == 100.0);
  REQUIRE(score_fn_for(Metric::npdpr)(m, true) == 75.0);
  REQUIRE(score_fn_for(Metric::npdpr)(m, false) == 90.0);
  REQUIRE(score_fn_for(Metric::ccwm)(m, false) == -20.0);
}

TEST_CASE("Design matrix: unknown alliance members are dropped", "[design]") {
  const std::vector<Match> matches{Match({1, 2}, {3, 4}, 50, 40)};
  const DesignSystem sys =
      build_design_matrix(matches, {1, 2, 3}, score_fn_for(Metric::opr));
  REQUIRE(sys.a.cols() == 3);
  REQUIRE(sys.a.row(1).sum() == 1.0);
  REQUIRE(sys.a(1, 2) == 1.0);
  REQUIRE(sys.b(1) == 40.0);
}

TEST_CASE("Design matrix: duplicate team ids own a single column",
          "[design]") {
  const std::vector<Match> matches{Match({1, 2}, {3, 4}, 50, 40)};
  const DesignSystem sys = build_design_matrix(matches, {1, 2, 2, 3, 4, 1},
                                               score_fn_for(Metric::opr));
  REQUIRE(sys.active_teams == std::vector<TeamId>{1, 2, 3, 4});
  REQUIRE(sys.a.cols() == 4);
}

TEST_CASE("Design matrix: participation matrix has zero targets",
          "[design]") {
  const auto matches = three_matches();
  const DesignSystem sys =
      build_participation_matrix(matches, teams_in(matches));
  REQUIRE(sys.a.rows() == 6);
  REQUIRE(sys.a.cols() == 6);
  REQUIRE(sys.b.isZero());
}

TEST_CASE("Match: a team plays at most once per match", "[match]") {
  REQUIRE_THROWS_AS(Match({1, 2}, {2, 3}, 10, 10), std::invalid_argument);
  REQUIRE_THROWS_AS(Match({1, 1}, {2, 3}, 10, 10), std::invalid_argument);
  REQUIRE_THROWS_AS(Match({1, 4}, {3, 3}, 10, 10), std::invalid_argument);

  const Match m({1, 2}, {3, 4}, 10, 20, 1, 2);
  REQUIRE(m.is_red(2));
  REQUIRE(m.is_blue(4));
  REQUIRE_FALSE(m.has_team(5));
  REQUIRE(m.np_score(true) == 9.0);
  REQUIRE(m.np_score(false) == 18.0);
}

TEST_CASE("Match: team derivation and appearance counts", "[match]") {
  const auto matches = three_matches();
  REQUIRE(teams_in(matches) == std::vector<TeamId>{1, 2, 3, 4, 5, 6});
  REQUIRE(appearances(matches, 1) == 2);
  REQUIRE(appearances(matches, 4) == 2);
  REQUIRE(appearances(matches, 42) == 0);
  REQUIRE(teams_in({}).empty());
}
