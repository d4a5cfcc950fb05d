#include <catch2/catch.hpp>

#include <stdexcept>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "opr_core/lambda.hpp"
#include "opr_core/log.hpp"

using namespace opr_core;

TEST_CASE("Lambda: banded heuristic", "[lambda]") {
  REQUIRE(band_lambda(0) == 0.1);
  REQUIRE(band_lambda(19) == 0.1);
  REQUIRE(band_lambda(20) == 0.01);
  REQUIRE(band_lambda(60) == 0.01);
  REQUIRE(band_lambda(61) == 0.001);
  REQUIRE(band_lambda(500) == 0.001);
}

TEST_CASE("Lambda: continuous heuristic is clamped", "[lambda]") {
  REQUIRE(continuous_lambda(25) == Approx(0.1));
  REQUIRE(continuous_lambda(100) == Approx(0.05));
  REQUIRE(continuous_lambda(1) == Approx(0.3));
  REQUIRE(continuous_lambda(0) == Approx(0.3));
  REQUIRE(continuous_lambda(1000000) == Approx(0.001));
}

TEST_CASE("Lambda: policy dispatches on strategy", "[lambda]") {
  RegularizationConfig cfg;
  REQUIRE(RegularizationPolicy(cfg).choose_lambda(30).lambda == 0.01);

  cfg.strategy = LambdaStrategy::continuous_heuristic;
  REQUIRE(RegularizationPolicy(cfg).choose_lambda(25).lambda == Approx(0.1));

  // No design matrix: svd falls back to the continuous value.
  cfg.strategy = LambdaStrategy::auto_tuned_svd;
  const LambdaChoice c = RegularizationPolicy(cfg).choose_lambda(25);
  REQUIRE(c.lambda == Approx(0.1));
  REQUIRE_FALSE(c.ill_conditioned);
}

TEST_CASE("Lambda: strategy names", "[lambda]") {
  REQUIRE(parse_strategy("band") == LambdaStrategy::fixed_band);
  REQUIRE(parse_strategy("continuous") ==
          LambdaStrategy::continuous_heuristic);
  REQUIRE(parse_strategy("svd") == LambdaStrategy::auto_tuned_svd);
  REQUIRE(std::string(strategy_name(LambdaStrategy::auto_tuned_svd)) == "svd");
  REQUIRE_THROWS_AS(parse_strategy("ridge"), std::invalid_argument);
}

TEST_CASE("Lambda: well conditioned design keeps the starting value",
          "[lambda][svd]") {
  const Eigen::MatrixXd a = Eigen::MatrixXd::Identity(4, 4);
  const LambdaChoice c = tune_lambda(a, RegularizationConfig{}, 4);
  REQUIRE(c.lambda == Approx(0.25));
  REQUIRE(c.condition == Approx(1.0));
  REQUIRE(c.iterations == 1);
  REQUIRE_FALSE(c.ill_conditioned);
}

TEST_CASE("Lambda: tuning doubles until the target is met", "[lambda][svd]") {
  // A^T A = diag(1, 0), so cond = (1 + lambda) / lambda.
  Eigen::MatrixXd a = Eigen::MatrixXd::Zero(2, 2);
  a(0, 0) = 1.0;

  RegularizationConfig cfg;
  cfg.target_condition = 1.5;
  const LambdaChoice c = tune_lambda(a, cfg, 1);
  // 0.3 -> 0.6 -> 1.2 -> 2.4
  REQUIRE(c.lambda == Approx(2.4));
  REQUIRE(c.iterations == 4);
  REQUIRE(c.condition == Approx(3.4 / 2.4));
  REQUIRE_FALSE(c.ill_conditioned);
}

TEST_CASE("Lambda: tuning stops at max_lambda and flags the result",
          "[lambda][svd]") {
  set_log_level(LogLevel::off);
  Eigen::MatrixXd a = Eigen::MatrixXd::Zero(2, 2);
  a(0, 0) = 1.0;

  RegularizationConfig cfg;
  cfg.target_condition = 1.05;
  const LambdaChoice c = tune_lambda(a, cfg, 1);
  // 0.3 0.6 1.2 2.4 4.8 9.6 10
  REQUIRE(c.lambda == Approx(10.0));
  REQUIRE(c.iterations == 7);
  REQUIRE(c.condition == Approx(1.1));
  REQUIRE(c.ill_conditioned);

  cfg.max_iterations = 2;
  const LambdaChoice short_run = tune_lambda(a, cfg, 1);
  REQUIRE(short_run.iterations == 2);
  REQUIRE(short_run.lambda == Approx(1.2));
  REQUIRE(short_run.ill_conditioned);
  set_log_level(LogLevel::warn);
}

TEST_CASE("Lambda: event helper builds the participation matrix",
          "[lambda][svd]") {
  const std::vector<Match> matches{Match({1, 2}, {3, 4}, 50, 40)};
  RegularizationConfig cfg;
  cfg.strategy = LambdaStrategy::auto_tuned_svd;

  // Eigenvalues of A^T A are {2, 2, 0, 0}: cond = (2 + l) / l at l = 0.3.
  const LambdaChoice c = choose_lambda_for_event(matches, {1, 2, 3, 4}, cfg);
  REQUIRE(c.lambda == Approx(0.3));
  REQUIRE(c.condition == Approx(2.3 / 0.3));
  REQUIRE_FALSE(c.ill_conditioned);

  cfg.strategy = LambdaStrategy::fixed_band;
  REQUIRE(choose_lambda_for_event(matches, {1, 2, 3, 4}, cfg).lambda == 0.1);
}
