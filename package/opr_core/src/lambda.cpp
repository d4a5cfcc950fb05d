#include "opr_core/lambda.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <fmt/format.h>

#include "opr_core/design_matrix.hpp"
#include "opr_core/log.hpp"
#include "opr_core/matrix.hpp"

namespace opr_core {

const char *strategy_name(LambdaStrategy strategy) {
  switch (strategy) {
  case LambdaStrategy::fixed_band:
    return "band";
  case LambdaStrategy::continuous_heuristic:
    return "continuous";
  case LambdaStrategy::auto_tuned_svd:
    return "svd";
  }
  return "?";
}

LambdaStrategy parse_strategy(const std::string &name) {
  if (name == "band")
    return LambdaStrategy::fixed_band;
  if (name == "continuous")
    return LambdaStrategy::continuous_heuristic;
  if (name == "svd")
    return LambdaStrategy::auto_tuned_svd;
  throw std::invalid_argument(
      fmt::format("unknown lambda strategy '{}' (band|continuous|svd)", name));
}

double band_lambda(int match_count) {
  if (match_count < 20)
    return 0.1;
  if (match_count <= 60)
    return 0.01;
  return 0.001;
}

double continuous_lambda(int match_count, const RegularizationConfig &cfg) {
  if (match_count <= 0)
    return cfg.max_heuristic_lambda;
  const double lambda = 0.5 / std::sqrt(static_cast<double>(match_count));
  return std::clamp(lambda, cfg.min_lambda, cfg.max_heuristic_lambda);
}

LambdaChoice tune_lambda(const Eigen::MatrixXd &a,
                         const RegularizationConfig &cfg, int match_count) {
  if (match_count < 0)
    match_count = static_cast<int>(a.rows() / 2);

  LambdaChoice choice;
  choice.lambda = continuous_lambda(match_count, cfg);
  if (a.cols() == 0)
    return choice;

  const Eigen::MatrixXd ata = multiply(transpose(a), a);
  bool reached = false;
  double measured_at = -1.0;
  for (int it = 0; it < cfg.max_iterations; ++it) {
    Eigen::MatrixXd m = ata;
    add_regularization(m, choice.lambda);
    choice.condition = condition_number(m);
    measured_at = choice.lambda;
    choice.iterations = it + 1;
    if (choice.condition <= cfg.target_condition) {
      reached = true;
      break;
    }
    if (choice.lambda >= cfg.max_lambda)
      break;
    choice.lambda = std::min(choice.lambda * 2.0, cfg.max_lambda);
  }

  if (!reached && choice.lambda != measured_at) {
    // The last doubling is not yet measured.
    Eigen::MatrixXd m = ata;
    add_regularization(m, choice.lambda);
    choice.condition = condition_number(m);
    reached = choice.condition <= cfg.target_condition;
  }
  choice.ill_conditioned = !reached;
  if (choice.ill_conditioned) {
    log_warn("lambda tuning stopped at lambda={} with condition {:.3g} "
             "(target {:.3g}) after {} iterations",
             choice.lambda, choice.condition, cfg.target_condition,
             choice.iterations);
  }
  return choice;
}

LambdaChoice RegularizationPolicy::choose_lambda(
    int match_count, const Eigen::MatrixXd *design) const {
  LambdaChoice choice;
  switch (cfg_.strategy) {
  case LambdaStrategy::fixed_band:
    choice.lambda = band_lambda(match_count);
    break;
  case LambdaStrategy::continuous_heuristic:
    choice.lambda = continuous_lambda(match_count, cfg_);
    break;
  case LambdaStrategy::auto_tuned_svd:
    if (design == nullptr) {
      log_debug("svd lambda requested without a design matrix; using the "
                "continuous heuristic");
      choice.lambda = continuous_lambda(match_count, cfg_);
    } else {
      choice = tune_lambda(*design, cfg_, match_count);
    }
    break;
  }
  return choice;
}

LambdaChoice choose_lambda_for_event(const std::vector<Match> &matches,
                                     const std::vector<TeamId> &teams,
                                     const RegularizationConfig &cfg) {
  const RegularizationPolicy policy(cfg);
  const int n = static_cast<int>(matches.size());
  if (cfg.strategy != LambdaStrategy::auto_tuned_svd)
    return policy.choose_lambda(n);
  const DesignSystem sys = build_participation_matrix(matches, teams);
  return policy.choose_lambda(n, &sys.a);
}

} // namespace opr_core
