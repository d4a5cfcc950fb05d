#pragma once

#include <Eigen/Dense>

namespace opr_core {

// Pivots with magnitude below this are treated as zero.
constexpr double kPivotEpsilon = 1e-14;

enum class SolveStatus { ok, singular };

struct SolveResult {
  Eigen::VectorXd x;  // empty unless status == ok
  SolveStatus status{SolveStatus::singular};

  bool ok() const { return status == SolveStatus::ok; }
};

Eigen::MatrixXd transpose(const Eigen::MatrixXd &m);

// Throws std::invalid_argument when a.cols() != b.rows().
Eigen::MatrixXd multiply(const Eigen::MatrixXd &a, const Eigen::MatrixXd &b);

/**
 * Solve a x = b by Gauss-Jordan elimination with partial pivoting.
 *
 * At each column the row with the largest magnitude entry is swapped into the
 * pivot position. If that entry is below kPivotEpsilon the system is reported
 * singular and no division takes place. Operates on its own copies.
 * Throws std::invalid_argument for a non-square a or mismatched b.
 */
SolveResult gaussian_eliminate(Eigen::MatrixXd a, Eigen::VectorXd b);

// Least squares through the normal equations a^T a x = a^T b.
SolveResult solve_least_squares(const Eigen::MatrixXd &a,
                                const Eigen::VectorXd &b);

// Ridge least squares: (a^T a + lambda I) x = a^T b, lambda >= 0.
SolveResult solve_least_squares_regularized(const Eigen::MatrixXd &a,
                                            const Eigen::VectorXd &b,
                                            double lambda);

// m += lambda I on the leading diagonal.
void add_regularization(Eigen::MatrixXd &m, double lambda);

// Singular values in decreasing order.
Eigen::VectorXd singular_values(const Eigen::MatrixXd &m);

// sigma_max / sigma_min; +inf for an empty or singular matrix.
double condition_number(const Eigen::MatrixXd &m);

} // namespace opr_core
