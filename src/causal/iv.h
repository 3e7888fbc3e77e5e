#ifndef DAGSTAT_IV_H
#define DAGSTAT_IV_H

#include <Eigen/Dense>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include "../linear_model/solver.h"
#include "../stats/distributions.h"

namespace dagstat {

// =============================================================================
// Result Structures
// =============================================================================

struct IVResult {
    // Coefficient order: [intercept (if fitted), X_endog..., X_exog...]
    Eigen::VectorXd coef;
    Eigen::VectorXd std_errors;
    Eigen::VectorXd t_values;
    Eigen::VectorXd p_values;
    Eigen::MatrixXd conf_int;

    double residual_std_error;
    int n_obs;
    int n_endog;
    int n_exog;
    int df_resid;

    Eigen::MatrixXd vcov;
    Eigen::VectorXd residuals;
};

// =============================================================================
// Two-Stage Least Squares
// =============================================================================

/**
 * @brief 2SLS with exogenous controls
 *
 * Stage 1: X_endog on Z_aug = [1, Z, X_exog]
 * Stage 2: Y on [1, X_endog_hat, X_exog]
 *
 * Residuals and sigma^2 use the ORIGINAL X_endog; the covariance is
 * sigma^2 (X_hat' X_hat)^-1.
 */
class TwoStageLeastSquares {
public:
    bool fit_intercept = true;
    double conf_level = 0.95;

    IVResult fit(
        const Eigen::VectorXd& Y,
        const Eigen::MatrixXd& X_endog,
        const Eigen::MatrixXd& X_exog,
        const Eigen::MatrixXd& Z
    ) const {
        int n = Y.size();
        int k1 = X_endog.cols();
        int k2 = X_exog.cols();
        int m = Z.cols();

        if (X_endog.rows() != n || X_exog.rows() != n || Z.rows() != n) {
            throw std::invalid_argument("Y, X_endog, X_exog and Z must have the same number of rows");
        }
        if (!Y.allFinite() || !X_endog.allFinite() || !X_exog.allFinite() || !Z.allFinite()) {
            throw std::invalid_argument("2SLS input contains NaN or infinite values");
        }
        if (m < k1) {
            throw std::invalid_argument(
                "Underidentified: need at least as many instruments as endogenous variables");
        }

        IVResult result;
        result.n_obs = n;
        result.n_endog = k1;
        result.n_exog = k2;

        Eigen::MatrixXd Z_aug = stack_columns(Z, X_exog, n);

        // =====================================================================
        // STAGE 1: Regress X_endog on Z_aug
        // =====================================================================
        Eigen::VectorXd weights = Eigen::VectorXd::Ones(n);
        WeightedDesignMatrix wdm1(Z_aug, weights);
        WeightedSolver solver1(SolverStrategy::AUTO);

        Eigen::MatrixXd X_endog_hat(n, k1);
        for (int i = 0; i < k1; ++i) {
            Eigen::VectorXd pi;
            try {
                pi = solver1.solve(wdm1, X_endog.col(i));
            } catch (const std::exception& e) {
                throw std::runtime_error("First stage estimation failed for variable " +
                                         std::to_string(i) + ": " + e.what());
            }
            X_endog_hat.col(i) = Z_aug * pi;
        }

        // =====================================================================
        // STAGE 2: Regress Y on [1, X_endog_hat, X_exog]
        // =====================================================================
        Eigen::MatrixXd X_hat = stack_columns(X_endog_hat, X_exog, n);
        WeightedDesignMatrix wdm2(X_hat, weights);
        WeightedSolver solver2(SolverStrategy::AUTO);

        try {
            result.coef = solver2.solve(wdm2, Y);
        } catch (const std::exception& e) {
            throw std::runtime_error("Second stage estimation failed: " + std::string(e.what()));
        }
        if (solver2.rank() < X_hat.cols()) {
            throw std::runtime_error("Second stage design is rank deficient");
        }

        // =====================================================================
        // Residuals & Variance: MUST USE ORIGINAL X
        // =====================================================================
        Eigen::MatrixXd X_orig = stack_columns(X_endog, X_exog, n);
        result.residuals = Y - X_orig * result.coef;

        int p = result.coef.size();
        result.df_resid = n - p;
        if (result.df_resid <= 0) {
            throw std::invalid_argument("Not enough observations for 2SLS");
        }
        double sigma2 = result.residuals.squaredNorm() / result.df_resid;
        result.residual_std_error = std::sqrt(sigma2);
        result.vcov = sigma2 * solver2.variance_covariance();

        compute_inference(result);
        return result;
    }

    /**
     * @brief Partial F of the excluded instruments in the first stage
     *
     * F = ((RSS_r - RSS_u) / m) / (RSS_u / (n - k_u)), where the restricted
     * model drops Z and keeps [1, X_exog]. Averaged over endogenous columns.
     */
    double first_stage_partial_f(
        const Eigen::MatrixXd& X_endog,
        const Eigen::MatrixXd& Z,
        const Eigen::MatrixXd& X_exog
    ) const {
        int n = X_endog.rows();
        int m = Z.cols();
        Eigen::MatrixXd Z_aug = stack_columns(Z, X_exog, n);
        Eigen::MatrixXd X_restricted = stack_columns(Eigen::MatrixXd(n, 0), X_exog, n);
        int df_u = n - Z_aug.cols();
        if (df_u <= 0 || m == 0) {
            throw std::invalid_argument("Not enough observations for first-stage F test");
        }

        double total_f = 0.0;
        for (int i = 0; i < X_endog.cols(); ++i) {
            Eigen::VectorXd x_i = X_endog.col(i);
            double rss_u = residual_ss(Z_aug, x_i);
            double rss_r = X_restricted.cols() > 0
                ? residual_ss(X_restricted, x_i)
                : x_i.squaredNorm();
            total_f += ((rss_r - rss_u) / m) / (rss_u / df_u);
        }
        return total_f / X_endog.cols();
    }

private:
    // [1 (if fitted), A, B]
    Eigen::MatrixXd stack_columns(
        const Eigen::MatrixXd& A,
        const Eigen::MatrixXd& B,
        int n
    ) const {
        int p = A.cols() + B.cols() + (fit_intercept ? 1 : 0);
        Eigen::MatrixXd X(n, p);
        int col = 0;
        if (fit_intercept) X.col(col++).setOnes();
        if (A.cols() > 0) X.middleCols(col, A.cols()) = A;
        col += A.cols();
        if (B.cols() > 0) X.middleCols(col, B.cols()) = B;
        return X;
    }

    static double residual_ss(const Eigen::MatrixXd& X, const Eigen::VectorXd& y) {
        Eigen::VectorXd w = Eigen::VectorXd::Ones(X.rows());
        WeightedDesignMatrix wdm(X, w);
        WeightedSolver solver(SolverStrategy::AUTO);
        Eigen::VectorXd beta = solver.solve(wdm, y);
        return (y - X * beta).squaredNorm();
    }

    void compute_inference(IVResult& result) const {
        int p = result.coef.size();
        int df = result.df_resid;
        result.std_errors.resize(p);
        result.t_values.resize(p);
        result.p_values.resize(p);
        result.conf_int.resize(p, 2);
        double t_crit = stats::t_quantile(1.0 - (1.0 - conf_level) / 2.0, df);
        for (int j = 0; j < p; ++j) {
            result.std_errors(j) = std::sqrt(std::max(result.vcov(j, j), 0.0));
            if (!std::isfinite(result.std_errors(j))) {
                result.t_values(j) = std::numeric_limits<double>::quiet_NaN();
                result.p_values(j) = std::numeric_limits<double>::quiet_NaN();
            } else if (result.std_errors(j) > 1e-12) {
                result.t_values(j) = result.coef(j) / result.std_errors(j);
                result.p_values(j) = stats::t_two_sided_pvalue(result.t_values(j), df);
            } else {
                result.t_values(j) = 0;
                result.p_values(j) = 1;
            }
            result.conf_int(j, 0) = result.coef(j) - t_crit * result.std_errors(j);
            result.conf_int(j, 1) = result.coef(j) + t_crit * result.std_errors(j);
        }
    }
};

} // namespace dagstat

#endif // DAGSTAT_IV_H
