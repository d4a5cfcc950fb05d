#include "opr_core/design_matrix.hpp"
#include "opr_core/lambda.hpp"
#include "opr_core/log.hpp"
#include "opr_core/match.hpp"
#include "opr_core/match_csv.hpp"
#include "opr_core/matrix.hpp"
#include "opr_core/performance.hpp"
#include "opr_core/rollup.hpp"
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <nanobind/nanobind.h>
#include <nanobind/eigen/dense.h>
#include <nanobind/stl/map.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

namespace nb = nanobind;
using namespace nb::literals;

NB_MODULE(opr_core, m) {
  m.doc() = "Alliance match regression: OPR, DPR, CCWM and friends.";

  nb::enum_<opr_core::LogLevel>(m, "LogLevel")
      .value("debug", opr_core::LogLevel::debug)
      .value("info", opr_core::LogLevel::info)
      .value("warn", opr_core::LogLevel::warn)
      .value("error", opr_core::LogLevel::error)
      .value("off", opr_core::LogLevel::off);
  m.def("set_log_level", &opr_core::set_log_level, "level"_a);
  m.def("log_level", &opr_core::log_level);

  // Match
  nb::class_<opr_core::Match>(m, "Match")
      .def(nb::init<>())
      .def(nb::init<std::vector<opr_core::TeamId>,
                    std::vector<opr_core::TeamId>, double, double, double,
                    double>(),
           "red_teams"_a, "blue_teams"_a, "red_score"_a, "blue_score"_a,
           "red_penalties"_a = 0.0, "blue_penalties"_a = 0.0)
      .def_ro("red_teams", &opr_core::Match::red_teams)
      .def_ro("blue_teams", &opr_core::Match::blue_teams)
      .def_ro("red_score", &opr_core::Match::red_score)
      .def_ro("blue_score", &opr_core::Match::blue_score)
      .def_ro("red_penalties", &opr_core::Match::red_penalties)
      .def_ro("blue_penalties", &opr_core::Match::blue_penalties)
      .def("has_team", &opr_core::Match::has_team)
      .def("__repr__", [](const opr_core::Match &mt) {
        return fmt::format("Match(red={} {}, blue={} {})",
                           fmt::join(mt.red_teams, "/"), mt.red_score,
                           fmt::join(mt.blue_teams, "/"), mt.blue_score);
      });
  m.def("teams_in", &opr_core::teams_in, "matches"_a);

  // Linear algebra kernel
  nb::enum_<opr_core::SolveStatus>(m, "SolveStatus")
      .value("ok", opr_core::SolveStatus::ok)
      .value("singular", opr_core::SolveStatus::singular);
  nb::class_<opr_core::SolveResult>(m, "SolveResult")
      .def(nb::init<>())
      .def_rw("x", &opr_core::SolveResult::x)
      .def_rw("status", &opr_core::SolveResult::status)
      .def("ok", &opr_core::SolveResult::ok);
  m.def("transpose", &opr_core::transpose, "m"_a);
  m.def("multiply", &opr_core::multiply, "a"_a, "b"_a);
  m.def("gaussian_eliminate", &opr_core::gaussian_eliminate, "a"_a, "b"_a);
  m.def("solve_least_squares", &opr_core::solve_least_squares, "a"_a, "b"_a);
  m.def("solve_least_squares_regularized",
        &opr_core::solve_least_squares_regularized, "a"_a, "b"_a, "lam"_a);
  m.def("singular_values", &opr_core::singular_values, "m"_a);
  m.def("condition_number", &opr_core::condition_number, "m"_a);

  // Design matrix
  nb::enum_<opr_core::Metric>(m, "Metric")
      .value("opr", opr_core::Metric::opr)
      .value("npopr", opr_core::Metric::npopr)
      .value("dpr", opr_core::Metric::dpr)
      .value("npdpr", opr_core::Metric::npdpr)
      .value("ccwm", opr_core::Metric::ccwm);
  nb::class_<opr_core::DesignSystem>(m, "DesignSystem")
      .def_ro("a", &opr_core::DesignSystem::a)
      .def_ro("b", &opr_core::DesignSystem::b)
      .def_ro("active_teams", &opr_core::DesignSystem::active_teams);
  m.def(
      "build_design_matrix",
      [](const std::vector<opr_core::Match> &matches,
         const std::vector<opr_core::TeamId> &teams, opr_core::Metric metric) {
        return opr_core::build_design_matrix(matches, teams,
                                             opr_core::score_fn_for(metric));
      },
      "matches"_a, "teams"_a, "metric"_a);

  // Regularization
  nb::enum_<opr_core::LambdaStrategy>(m, "LambdaStrategy")
      .value("fixed_band", opr_core::LambdaStrategy::fixed_band)
      .value("continuous_heuristic",
             opr_core::LambdaStrategy::continuous_heuristic)
      .value("auto_tuned_svd", opr_core::LambdaStrategy::auto_tuned_svd);
  nb::class_<opr_core::RegularizationConfig>(m, "RegularizationConfig")
      .def(nb::init<>())
      .def_rw("strategy", &opr_core::RegularizationConfig::strategy)
      .def_rw("min_lambda", &opr_core::RegularizationConfig::min_lambda)
      .def_rw("max_heuristic_lambda",
              &opr_core::RegularizationConfig::max_heuristic_lambda)
      .def_rw("target_condition",
              &opr_core::RegularizationConfig::target_condition)
      .def_rw("max_lambda", &opr_core::RegularizationConfig::max_lambda)
      .def_rw("max_iterations",
              &opr_core::RegularizationConfig::max_iterations);
  nb::class_<opr_core::LambdaChoice>(m, "LambdaChoice")
      .def(nb::init<>())
      .def_rw("lam", &opr_core::LambdaChoice::lambda)
      .def_rw("condition", &opr_core::LambdaChoice::condition)
      .def_rw("iterations", &opr_core::LambdaChoice::iterations)
      .def_rw("ill_conditioned", &opr_core::LambdaChoice::ill_conditioned)
      .def("__repr__", [](const opr_core::LambdaChoice &c) {
        return fmt::format("LambdaChoice(lam={}, condition={:.3g}, "
                           "iterations={}, ill_conditioned={})",
                           c.lambda, c.condition, c.iterations,
                           c.ill_conditioned);
      });
  m.def("band_lambda", &opr_core::band_lambda, "match_count"_a);
  m.def(
      "choose_lambda",
      [](const std::vector<opr_core::Match> &matches,
         const std::vector<opr_core::TeamId> &teams,
         const opr_core::RegularizationConfig &cfg) {
        return opr_core::choose_lambda_for_event(matches, teams, cfg);
      },
      "matches"_a, "teams"_a, "config"_a = opr_core::RegularizationConfig{});

  // Calculator
  nb::enum_<opr_core::MetricStatus>(m, "MetricStatus")
      .value("ok", opr_core::MetricStatus::ok)
      .value("insufficient_data", opr_core::MetricStatus::insufficient_data)
      .value("singular_system", opr_core::MetricStatus::singular_system);
  nb::class_<opr_core::MetricResult>(m, "MetricResult")
      .def(nb::init<>())
      .def_rw("ratings", &opr_core::MetricResult::ratings)
      .def_rw("status", &opr_core::MetricResult::status)
      .def("ok", &opr_core::MetricResult::ok)
      .def("__repr__", [](const opr_core::MetricResult &r) {
        return fmt::format("MetricResult(status={}, teams={})",
                           opr_core::status_name(r.status), r.ratings.size());
      });
  nb::class_<opr_core::MetricTable>(m, "MetricTable")
      .def_ro("opr", &opr_core::MetricTable::opr)
      .def_ro("npopr", &opr_core::MetricTable::npopr)
      .def_ro("dpr", &opr_core::MetricTable::dpr)
      .def_ro("npdpr", &opr_core::MetricTable::npdpr)
      .def_ro("ccwm", &opr_core::MetricTable::ccwm);
  nb::class_<opr_core::Calculator>(m, "Calculator")
      .def(nb::init<>())
      .def(nb::init<std::vector<opr_core::Match>, std::vector<opr_core::TeamId>,
                    double>(),
           "matches"_a, "teams"_a, "lam"_a = 0.0)
      .def_rw("matches", &opr_core::Calculator::matches)
      .def_rw("teams", &opr_core::Calculator::teams)
      .def_rw("lam", &opr_core::Calculator::lambda)
      .def("calculate", &opr_core::Calculator::calculate, "metric"_a)
      .def("calculate_opr", &opr_core::Calculator::calculate_opr)
      .def("calculate_npopr", &opr_core::Calculator::calculate_npopr)
      .def("calculate_dpr", &opr_core::Calculator::calculate_dpr)
      .def("calculate_npdpr", &opr_core::Calculator::calculate_npdpr)
      .def("calculate_ccwm", &opr_core::Calculator::calculate_ccwm)
      .def("calculate_all", &opr_core::Calculator::calculate_all,
           "parallel"_a = false, nb::call_guard<nb::gil_scoped_release>())
      .def_static("calculate_npavg", &opr_core::Calculator::calculate_npavg,
                  "matches"_a, "team"_a);

  // Event roll-up
  nb::class_<opr_core::TeamPerformance>(m, "TeamPerformance")
      .def(nb::init<>())
      .def_rw("team", &opr_core::TeamPerformance::team)
      .def_rw("opr", &opr_core::TeamPerformance::opr)
      .def_rw("npopr", &opr_core::TeamPerformance::npopr)
      .def_rw("ccwm", &opr_core::TeamPerformance::ccwm)
      .def_rw("dpr", &opr_core::TeamPerformance::dpr)
      .def_rw("npdpr", &opr_core::TeamPerformance::npdpr)
      .def_rw("npavg", &opr_core::TeamPerformance::npavg)
      .def_rw("matches", &opr_core::TeamPerformance::matches)
      .def("__repr__", [](const opr_core::TeamPerformance &t) {
        return fmt::format("TeamPerformance(team={}, opr={:.2f}, ccwm={:.2f}, "
                           "dpr={:.2f}, matches={})",
                           t.team, t.opr, t.ccwm, t.dpr, t.matches);
      });
  nb::class_<opr_core::EventRatings>(m, "EventRatings")
      .def(nb::init<>())
      .def_rw("event_code", &opr_core::EventRatings::event_code)
      .def_rw("lam", &opr_core::EventRatings::lambda)
      .def_rw("metrics", &opr_core::EventRatings::metrics)
      .def_rw("teams", &opr_core::EventRatings::teams);
  m.def("evaluate_event", &opr_core::evaluate_event, "matches"_a,
        "config"_a = opr_core::RegularizationConfig{}, "event_code"_a = "");
  m.def("combine_events", &opr_core::combine_events, "events"_a);

  // CSV
  nb::class_<opr_core::MatchSet>(m, "MatchSet")
      .def_ro("matches", &opr_core::MatchSet::matches)
      .def_ro("teams", &opr_core::MatchSet::teams);
  m.def("read_matches_csv", &opr_core::read_matches_csv, "path"_a);
}
