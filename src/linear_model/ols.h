#pragma once
#include <Eigen/Dense>

namespace dagstat {

// Ordinary least squares fit with classical inference
struct OLSResult {
    Eigen::VectorXd coef;           // excludes intercept
    double intercept;
    Eigen::VectorXd std_errors;     // includes intercept at index 0 when fitted
    Eigen::VectorXd t_values;
    Eigen::VectorXd p_values;
    Eigen::MatrixXd conf_int;       // shape: (n_params, 2) - [lower, upper]
    Eigen::VectorXd residuals;
    Eigen::VectorXd fitted_values;
    double r_squared;
    double adj_r_squared;
    double residual_std_error;
    double rss;
    Eigen::MatrixXd vcov;
    int n_obs;
    int n_params;
    int df_resid;

    // Full parameter vector, intercept first when fitted
    Eigen::VectorXd params() const;
};

/**
 * @brief OLS via WeightedSolver with unit weights
 *
 * Standard errors use sigma^2 (X'X)^-1 with sigma^2 = RSS / (n - p).
 * p-values and confidence intervals use Student t with n - p df.
 *
 * @throws std::invalid_argument on dimension mismatch or n <= p
 * @throws std::runtime_error if the design is rank deficient
 */
OLSResult fit_ols_full(
    const Eigen::MatrixXd& X,
    const Eigen::VectorXd& y,
    bool fit_intercept = true,
    double conf_level = 0.95
);

} // namespace dagstat
