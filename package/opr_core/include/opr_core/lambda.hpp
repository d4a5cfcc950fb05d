#pragma once

#include <string>
#include <vector>

#include <Eigen/Dense>

#include "opr_core/match.hpp"

namespace opr_core {

enum class LambdaStrategy {
  fixed_band,           // step function of match count
  continuous_heuristic, // 0.5 / sqrt(match count), clamped
  auto_tuned_svd,       // grow lambda until cond(A^T A + lambda I) is acceptable
};

const char *strategy_name(LambdaStrategy strategy);
// Accepts "band", "continuous" or "svd"; throws std::invalid_argument.
LambdaStrategy parse_strategy(const std::string &name);

struct RegularizationConfig {
  LambdaStrategy strategy{LambdaStrategy::fixed_band};
  double min_lambda{0.001};
  double max_heuristic_lambda{0.3};
  double target_condition{1e7};
  double max_lambda{10.0};
  int max_iterations{10};
};

struct LambdaChoice {
  double lambda{0.0};
  // cond(A^T A + lambda I) at the returned lambda; 0 when not computed.
  double condition{0.0};
  int iterations{0};
  // Auto-tuning gave up before reaching target_condition.
  bool ill_conditioned{false};
};

double band_lambda(int match_count);
double continuous_lambda(int match_count, const RegularizationConfig &cfg = {});

// Auto-tune against the design matrix a (rows = alliance equations).
LambdaChoice tune_lambda(const Eigen::MatrixXd &a,
                         const RegularizationConfig &cfg = {},
                         int match_count = -1);

class RegularizationPolicy {
public:
  RegularizationPolicy() = default;
  explicit RegularizationPolicy(RegularizationConfig cfg) : cfg_(cfg) {}

  // design may be null; auto_tuned_svd then falls back to the continuous
  // heuristic.
  LambdaChoice choose_lambda(int match_count,
                             const Eigen::MatrixXd *design = nullptr) const;

  const RegularizationConfig &config() const { return cfg_; }

private:
  RegularizationConfig cfg_{};
};

// Builds the event participation matrix when the strategy needs it.
LambdaChoice choose_lambda_for_event(const std::vector<Match> &matches,
                                     const std::vector<TeamId> &teams,
                                     const RegularizationConfig &cfg = {});

} // namespace opr_core
