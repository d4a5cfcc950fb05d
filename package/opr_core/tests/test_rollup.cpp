#include <catch2/catch.hpp>

#include <vector>

#include "opr_core/rollup.hpp"

using namespace opr_core;

namespace {

TeamPerformance perf(TeamId team, double opr, int matches) {
  TeamPerformance tp;
  tp.team = team;
  tp.opr = opr;
  tp.npavg = opr * 2.0;
  tp.matches = matches;
  return tp;
}

} // namespace

TEST_CASE("Rollup: evaluate a single event", "[rollup]") {
  const std::vector<Match> matches{
      Match({1, 2}, {3, 4}, 30, 70),
      Match({1, 3}, {2, 4}, 40, 60),
      Match({1, 4}, {2, 3}, 50, 50),
  };

  const EventRatings ev = evaluate_event(matches, {}, "USTXCMP");
  REQUIRE(ev.event_code == "USTXCMP");
  // Three matches fall in the lowest band.
  REQUIRE(ev.lambda.lambda == 0.1);
  REQUIRE(ev.metrics.opr.ok());
  REQUIRE(ev.teams.size() == 4);

  REQUIRE(ev.teams[0].team == 1);
  REQUIRE(ev.teams[0].matches == 3);
  REQUIRE(ev.teams[0].npavg == Approx(40.0));
  REQUIRE(ev.teams[3].team == 4);
  REQUIRE(ev.teams[3].matches == 3);
  REQUIRE(ev.teams[0].opr == Approx(ev.metrics.opr.ratings.at(1)));
  // Ridge keeps the ordering of the exact fit.
  REQUIRE(ev.teams[0].opr < ev.teams[3].opr);
}

TEST_CASE("Rollup: empty event", "[rollup]") {
  const EventRatings ev = evaluate_event({});
  REQUIRE(ev.teams.empty());
  REQUIRE(ev.metrics.opr.ratings.empty());
}

TEST_CASE("Rollup: events are weighted by matches played", "[rollup]") {
  EventRatings a;
  a.teams = {perf(1, 10.0, 2), perf(2, 15.0, 3)};
  EventRatings b;
  b.teams = {perf(1, 40.0, 1)};

  const auto combined = combine_events({a, b});
  REQUIRE(combined.size() == 2);

  // Sorted by OPR, highest first.
  REQUIRE(combined[0].team == 1);
  REQUIRE(combined[0].opr == Approx(20.0));
  REQUIRE(combined[0].npavg == Approx(40.0));
  REQUIRE(combined[0].matches == 3);

  REQUIRE(combined[1].team == 2);
  REQUIRE(combined[1].opr == Approx(15.0));
  REQUIRE(combined[1].matches == 3);
}

TEST_CASE("Rollup: a team with no matches keeps zero metrics", "[rollup]") {
  EventRatings a;
  a.teams = {perf(5, 12.0, 0)};
  const auto combined = combine_events({a});
  REQUIRE(combined.size() == 1);
  REQUIRE(combined[0].matches == 0);
  REQUIRE(combined[0].opr == 0.0);
}
