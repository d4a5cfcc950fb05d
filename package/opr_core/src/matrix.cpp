#include "opr_core/matrix.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace opr_core {

namespace {

void check_rows(const Eigen::MatrixXd &a, const Eigen::VectorXd &b) {
  if (a.rows() != b.size()) {
    throw std::invalid_argument(
        fmt::format("least squares: {} equations but {} targets", a.rows(),
                    b.size()));
  }
}

SolveResult finish(SolveResult res) {
  if (res.ok() && !res.x.allFinite()) {
    res.x.resize(0);
    res.status = SolveStatus::singular;
  }
  return res;
}

} // namespace

Eigen::MatrixXd transpose(const Eigen::MatrixXd &m) { return m.transpose(); }

Eigen::MatrixXd multiply(const Eigen::MatrixXd &a, const Eigen::MatrixXd &b) {
  if (a.cols() != b.rows()) {
    throw std::invalid_argument(fmt::format(
        "multiply: {}x{} times {}x{}", a.rows(), a.cols(), b.rows(), b.cols()));
  }
  return a * b;
}

SolveResult gaussian_eliminate(Eigen::MatrixXd a, Eigen::VectorXd b) {
  const Eigen::Index n = b.size();
  if (a.rows() != n || a.cols() != n) {
    throw std::invalid_argument(fmt::format(
        "gaussian_eliminate: {}x{} system with {} targets", a.rows(), a.cols(),
        n));
  }

  SolveResult res;
  for (Eigen::Index i = 0; i < n; ++i) {
    Eigen::Index max_row = i;
    for (Eigen::Index k = i + 1; k < n; ++k) {
      if (std::abs(a(k, i)) > std::abs(a(max_row, i)))
        max_row = k;
    }
    if (max_row != i) {
      a.row(i).swap(a.row(max_row));
      std::swap(b(i), b(max_row));
    }

    const double pivot = a(i, i);
    if (!(std::abs(pivot) >= kPivotEpsilon))
      return res; // singular

    a.row(i).tail(n - i) /= pivot;
    b(i) /= pivot;

    for (Eigen::Index k = 0; k < n; ++k) {
      if (k == i)
        continue;
      const double factor = a(k, i);
      if (factor == 0.0)
        continue;
      a.row(k).tail(n - i) -= factor * a.row(i).tail(n - i);
      b(k) -= factor * b(i);
    }
  }

  res.x = std::move(b);
  res.status = SolveStatus::ok;
  return finish(std::move(res));
}

SolveResult solve_least_squares(const Eigen::MatrixXd &a,
                                const Eigen::VectorXd &b) {
  check_rows(a, b);
  const Eigen::MatrixXd at = transpose(a);
  Eigen::MatrixXd ata = multiply(at, a);
  Eigen::VectorXd atb = at * b;
  return gaussian_eliminate(std::move(ata), std::move(atb));
}

void add_regularization(Eigen::MatrixXd &m, double lambda) {
  const Eigen::Index n = std::min(m.rows(), m.cols());
  for (Eigen::Index i = 0; i < n; ++i)
    m(i, i) += lambda;
}

SolveResult solve_least_squares_regularized(const Eigen::MatrixXd &a,
                                            const Eigen::VectorXd &b,
                                            double lambda) {
  if (!std::isfinite(lambda) || lambda < 0.0) {
    throw std::invalid_argument(
        fmt::format("regularized least squares: invalid lambda {}", lambda));
  }
  check_rows(a, b);
  const Eigen::MatrixXd at = transpose(a);
  Eigen::MatrixXd ata = multiply(at, a);
  add_regularization(ata, lambda);
  Eigen::VectorXd atb = at * b;
  return gaussian_eliminate(std::move(ata), std::move(atb));
}

Eigen::VectorXd singular_values(const Eigen::MatrixXd &m) {
  if (m.size() == 0)
    return {};
  Eigen::JacobiSVD<Eigen::MatrixXd> svd(m);
  return svd.singularValues();
}

double condition_number(const Eigen::MatrixXd &m) {
  const Eigen::VectorXd sv = singular_values(m);
  if (sv.size() == 0)
    return std::numeric_limits<double>::infinity();
  // Values below the usual rank threshold count as zero.
  const double smin = sv(sv.size() - 1);
  const double tol = sv(0) * std::numeric_limits<double>::epsilon() *
                     static_cast<double>(std::max(m.rows(), m.cols()));
  if (!(smin > tol))
    return std::numeric_limits<double>::infinity();
  return sv(0) / smin;
}

} // namespace opr_core
