#include "ols.h"
#include "solver.h"
#include "../stats/distributions.h"
#include <Eigen/Dense>
#include <stdexcept>
#include <string>
#include <cmath>
#include <algorithm>
#include <limits>

namespace dagstat {

Eigen::VectorXd OLSResult::params() const {
    if (n_params == coef.size()) return coef;
    Eigen::VectorXd beta(n_params);
    beta(0) = intercept;
    beta.tail(coef.size()) = coef;
    return beta;
}

OLSResult fit_ols_full(
    const Eigen::MatrixXd& X,
    const Eigen::VectorXd& y,
    bool fit_intercept,
    double conf_level
) {
    OLSResult result;
    int n = X.rows();
    int p = X.cols();
    if (y.size() != n) {
        throw std::invalid_argument("Dimension mismatch: X.rows() != y.size()");
    }
    if (!X.allFinite() || !y.allFinite()) {
        throw std::invalid_argument("OLS input contains NaN or infinite values");
    }
    result.n_obs = n;

    // Build design matrix with intercept
    Eigen::MatrixXd X_design;
    if (fit_intercept) {
        X_design.resize(n, p + 1);
        X_design.col(0) = Eigen::VectorXd::Ones(n);
        X_design.rightCols(p) = X;
    } else {
        X_design = X;
    }
    result.n_params = X_design.cols();
    result.df_resid = n - result.n_params;
    if (result.df_resid <= 0) {
        throw std::invalid_argument(
            "Size error: " + std::to_string(n) + " observations for " +
            std::to_string(result.n_params) + " parameters");
    }

    // Unit weights
    Eigen::VectorXd weights = Eigen::VectorXd::Ones(n);
    WeightedDesignMatrix wdm(X_design, weights);
    WeightedSolver solver(SolverStrategy::AUTO);

    Eigen::VectorXd beta = solver.solve(wdm, y);
    if (solver.rank() < result.n_params) {
        throw std::runtime_error("Design matrix is rank deficient (collinear regressors)");
    }

    if (fit_intercept) {
        result.intercept = beta(0);
        result.coef = beta.tail(p);
    } else {
        result.intercept = 0.0;
        result.coef = beta;
    }

    result.fitted_values = X_design * beta;
    result.residuals = y - result.fitted_values;

    double sse = result.residuals.squaredNorm();
    double sst = (y.array() - y.mean()).square().sum();
    result.rss = sse;

    if (sst > 1e-12) {
        result.r_squared = 1.0 - (sse / sst);
        result.adj_r_squared = 1.0 - (1.0 - result.r_squared) * (n - 1) / result.df_resid;
    } else {
        result.r_squared = (sse < 1e-12) ? 1.0 : 0.0;
        result.adj_r_squared = result.r_squared;
    }

    double sigma2 = sse / result.df_resid;
    result.residual_std_error = std::sqrt(sigma2);
    result.vcov = sigma2 * solver.variance_covariance();

    const int k = result.n_params;
    const double t_crit = stats::t_quantile(1.0 - (1.0 - conf_level) / 2.0, result.df_resid);
    result.std_errors.resize(k);
    result.t_values.resize(k);
    result.p_values.resize(k);
    result.conf_int.resize(k, 2);
    for (int j = 0; j < k; ++j) {
        double se = std::sqrt(std::max(result.vcov(j, j), 0.0));
        result.std_errors(j) = se;
        if (!std::isfinite(se)) {
            result.t_values(j) = std::numeric_limits<double>::quiet_NaN();
            result.p_values(j) = std::numeric_limits<double>::quiet_NaN();
        } else if (se > 1e-300) {
            result.t_values(j) = beta(j) / se;
            result.p_values(j) = stats::t_two_sided_pvalue(result.t_values(j), result.df_resid);
        } else {
            result.t_values(j) = 0.0;
            result.p_values(j) = 1.0;
        }
        result.conf_int(j, 0) = beta(j) - t_crit * se;
        result.conf_int(j, 1) = beta(j) + t_crit * se;
    }

    return result;
}

} // namespace dagstat
