/**
 * @file logistic.cpp
 * @brief Logistic Regression via IRLS
 */
#include "logistic.h"
#include "solver.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace dagstat {

namespace {

double sigmoid(double eta) {
  if (eta >= 0) {
    return 1.0 / (1.0 + std::exp(-eta));
  }
  double ez = std::exp(eta);
  return ez / (1.0 + ez);
}

Eigen::MatrixXd with_intercept(const Eigen::MatrixXd &X, bool fit_intercept) {
  if (!fit_intercept) return X;
  Eigen::MatrixXd X_aug(X.rows(), X.cols() + 1);
  X_aug.col(0).setOnes();
  X_aug.rightCols(X.cols()) = X;
  return X_aug;
}

} // namespace

LogisticResult LogisticRegression::fit(const Eigen::MatrixXd &X,
                                       const Eigen::VectorXd &y) const {
  const int n = X.rows();
  if (y.size() != n) {
    throw std::invalid_argument("Dimension mismatch: X.rows() != y.size()");
  }

  Eigen::MatrixXd X_aug = with_intercept(X, fit_intercept);
  Eigen::VectorXd beta = Eigen::VectorXd::Zero(X_aug.cols());

  // AUTO falls back to QR if X^T W X is singular (e.g. collinearity)
  WeightedSolver solver(SolverStrategy::AUTO);

  LogisticResult result;
  for (int iter = 0; iter < max_iter; ++iter) {
    Eigen::VectorXd eta = X_aug * beta;
    Eigen::VectorXd p(n);
    for (int i = 0; i < n; ++i) {
      p(i) = std::max(1e-10, std::min(1.0 - 1e-10, sigmoid(eta(i))));
    }

    Eigen::VectorXd w = p.array() * (1.0 - p.array());
    Eigen::VectorXd z = (eta.array() + (y - p).array() / w.array()).matrix();

    // Weights change every iteration: rebuild and force re-decomposition
    WeightedDesignMatrix wdm(X_aug, w);
    solver.reset();
    Eigen::VectorXd beta_new = solver.solve(wdm, z);

    if (!beta_new.allFinite()) {
      throw std::runtime_error("IRLS produced non-finite coefficients");
    }

    result.iterations = iter + 1;
    double step = (beta_new - beta).norm();
    beta = beta_new;
    if (step < tol) {
      result.converged = true;
      break;
    }
  }

  if (!result.converged) {
    spdlog::warn("[logit] IRLS did not converge in {} iterations", max_iter);
  }

  if (fit_intercept) {
    result.intercept = beta(0);
    result.coef = beta.tail(X.cols());
  } else {
    result.intercept = 0.0;
    result.coef = beta;
  }

  Eigen::VectorXd probs = predict_prob(X, result);
  double ll = 0.0;
  for (int i = 0; i < n; ++i) {
    double pi = std::max(1e-15, std::min(1.0 - 1e-15, probs(i)));
    ll += y(i) * std::log(pi) + (1.0 - y(i)) * std::log(1.0 - pi);
  }
  result.deviance = -2.0 * ll;

  return result;
}

Eigen::VectorXd LogisticRegression::predict_prob(const Eigen::MatrixXd &X,
                                                 const LogisticResult &result) const {
  Eigen::VectorXd eta = X * result.coef;
  if (fit_intercept) {
    eta.array() += result.intercept;
  }

  Eigen::VectorXd probs(eta.size());
  for (int i = 0; i < eta.size(); ++i) {
    probs(i) = sigmoid(eta(i));
  }
  return probs;
}

} // namespace dagstat
