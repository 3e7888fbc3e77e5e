/**
 * @file logistic.h
 * @brief Logistic Regression via IRLS
 */
#ifndef DAGSTAT_LOGISTIC_H
#define DAGSTAT_LOGISTIC_H

#include <Eigen/Dense>

namespace dagstat {

struct LogisticResult {
  Eigen::VectorXd coef;
  double intercept = 0.0;
  int iterations = 0;
  bool converged = false;
  double deviance = 0.0;
};

/**
 * @brief Binary logistic regression fitted by iteratively reweighted
 * least squares.
 *
 * Each iteration solves the weighted normal equations with
 * WeightedSolver, so a collinear design falls back to QR instead of
 * failing. X may have zero columns (intercept-only model).
 */
class LogisticRegression {
public:
  int max_iter = 50;
  double tol = 1e-8;
  bool fit_intercept = true;

  // @throws std::runtime_error if the iteration produces non-finite values
  LogisticResult fit(const Eigen::MatrixXd &X, const Eigen::VectorXd &y) const;

  Eigen::VectorXd predict_prob(const Eigen::MatrixXd &X,
                               const LogisticResult &result) const;
};

} // namespace dagstat

#endif // DAGSTAT_LOGISTIC_H
