/**
 * @file fitting.h
 * @brief DagStat v1.0 - Fitting routines keyed by variable name
 *
 * Thin layer between the estimators and the numeric core: pulls columns
 * out of a Dataset, runs OLS / 2SLS / logit / matching, and reports
 * coefficients by column name.
 *
 * Inference is classical: sigma^2 (X'X)^-1 covariance, Student t
 * p-values and intervals with n - p degrees of freedom. 2SLS residuals
 * use the original (not fitted) regressors.
 */
#ifndef DAGSTAT_FITTING_H
#define DAGSTAT_FITTING_H

#include <Eigen/Dense>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "../core/dataset.h"

namespace dagstat {
namespace fitting {

// Name of the constant term in every RegressionStatistics
extern const char* const kIntercept;

/**
 * @brief Per-coefficient estimates of one regression
 *
 * Lookup by an unknown name throws std::out_of_range.
 */
class RegressionStatistics {
public:
    RegressionStatistics(
        std::vector<std::string> names,
        Eigen::VectorXd coef,
        Eigen::VectorXd std_errors,
        Eigen::VectorXd p_values,
        Eigen::MatrixXd conf_int,
        int n_obs,
        int df_resid
    );

    double coefficient(const std::string& name) const;
    double std_err(const std::string& name) const;
    double pvalue(const std::string& name) const;
    std::pair<double, double> conf_int(const std::string& name) const;

    bool has(const std::string& name) const { return index_.count(name) > 0; }
    const std::vector<std::string>& names() const { return names_; }
    int n_obs() const { return n_obs_; }
    int df_resid() const { return df_resid_; }

private:
    size_t position(const std::string& name) const;

    std::vector<std::string> names_;
    std::unordered_map<std::string, size_t> index_;
    Eigen::VectorXd coef_;
    Eigen::VectorXd std_errors_;
    Eigen::VectorXd p_values_;
    Eigen::MatrixXd conf_int_;
    int n_obs_;
    int df_resid_;
};

/**
 * @brief outcome ~ 1 + regressors
 *
 * @throws std::out_of_range if a column is missing
 * @throws std::invalid_argument if n <= p
 * @throws std::runtime_error on a rank-deficient design
 */
RegressionStatistics ols(
    const Dataset& data,
    const std::string& outcome,
    const std::vector<std::string>& regressors,
    double conf_level = 0.95
);

/**
 * @brief P(treatment = 1 | controls) from a logistic model
 *
 * Empty controls give the intercept-only model.
 */
Eigen::VectorXd logit(
    const Dataset& data,
    const std::string& treatment,
    const std::vector<std::string>& controls
);

/**
 * @brief ATT from 1-nearest-neighbour matching on the given scores, with
 * replacement
 */
double nearest_neighbor_att(
    const Dataset& data,
    const std::string& outcome,
    const std::string& treatment,
    const Eigen::VectorXd& scores
);

/**
 * @brief 2SLS of outcome on treatment, instrumented by [instrument] +
 * controls, with controls as exogenous regressors
 *
 * Coefficients are named Intercept, treatment, controls...
 */
RegressionStatistics two_stage_least_squares(
    const Dataset& data,
    const std::string& outcome,
    const std::string& treatment,
    const std::string& instrument,
    const std::vector<std::string>& controls,
    double conf_level = 0.95
);

/**
 * @brief Partial F-statistic of the instrument in treatment ~ 1 +
 * instrument + controls
 */
double first_stage_f_test(
    const Dataset& data,
    const std::string& treatment,
    const std::string& instrument,
    const std::vector<std::string>& controls
);

} // namespace fitting
} // namespace dagstat

#endif // DAGSTAT_FITTING_H
