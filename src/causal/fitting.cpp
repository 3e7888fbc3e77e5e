#include "fitting.h"
#include "iv.h"
#include "psm.h"
#include "../linear_model/ols.h"

#include <stdexcept>

#include <spdlog/spdlog.h>

namespace dagstat {
namespace fitting {

const char* const kIntercept = "Intercept";

// ===== RegressionStatistics =====

RegressionStatistics::RegressionStatistics(
    std::vector<std::string> names,
    Eigen::VectorXd coef,
    Eigen::VectorXd std_errors,
    Eigen::VectorXd p_values,
    Eigen::MatrixXd conf_int,
    int n_obs,
    int df_resid
) : names_(std::move(names)),
    coef_(std::move(coef)),
    std_errors_(std::move(std_errors)),
    p_values_(std::move(p_values)),
    conf_int_(std::move(conf_int)),
    n_obs_(n_obs),
    df_resid_(df_resid) {
    const Eigen::Index k = static_cast<Eigen::Index>(names_.size());
    if (coef_.size() != k || std_errors_.size() != k || p_values_.size() != k ||
        conf_int_.rows() != k || conf_int_.cols() != 2) {
        throw std::invalid_argument("RegressionStatistics: inconsistent dimensions");
    }
    for (size_t i = 0; i < names_.size(); ++i) {
        index_[names_[i]] = i;
    }
}

size_t RegressionStatistics::position(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        throw std::out_of_range("No coefficient named '" + name + "'");
    }
    return it->second;
}

double RegressionStatistics::coefficient(const std::string& name) const {
    return coef_(position(name));
}

double RegressionStatistics::std_err(const std::string& name) const {
    return std_errors_(position(name));
}

double RegressionStatistics::pvalue(const std::string& name) const {
    return p_values_(position(name));
}

std::pair<double, double> RegressionStatistics::conf_int(const std::string& name) const {
    size_t j = position(name);
    return {conf_int_(j, 0), conf_int_(j, 1)};
}

// ===== OLS =====

RegressionStatistics ols(
    const Dataset& data,
    const std::string& outcome,
    const std::vector<std::string>& regressors,
    double conf_level
) {
    Eigen::MatrixXd X = data.matrix(regressors);
    const Eigen::VectorXd& y = data.column(outcome);

    OLSResult fit = fit_ols_full(X, y, true, conf_level);

    std::vector<std::string> names;
    names.reserve(regressors.size() + 1);
    names.push_back(kIntercept);
    names.insert(names.end(), regressors.begin(), regressors.end());

    return RegressionStatistics(
        std::move(names), fit.params(), fit.std_errors, fit.p_values,
        fit.conf_int, fit.n_obs, fit.df_resid);
}

// ===== Propensity / matching =====

Eigen::VectorXd logit(
    const Dataset& data,
    const std::string& treatment,
    const std::vector<std::string>& controls
) {
    PropensityScoreMatcher matcher;
    PropensityScoreResult ps = matcher.estimate_propensity(data.column(treatment), data.matrix(controls));
    spdlog::debug("[psm] {} treated, {} control, common support [{:.4f}, {:.4f}]",
                  ps.n_treated, ps.n_control, ps.overlap_min, ps.overlap_max);
    return ps.scores;
}

double nearest_neighbor_att(
    const Dataset& data,
    const std::string& outcome,
    const std::string& treatment,
    const Eigen::VectorXd& scores
) {
    PropensityScoreMatcher matcher;
    return matcher.match(data.column(outcome), data.column(treatment), scores).att;
}

// ===== 2SLS =====

RegressionStatistics two_stage_least_squares(
    const Dataset& data,
    const std::string& outcome,
    const std::string& treatment,
    const std::string& instrument,
    const std::vector<std::string>& controls,
    double conf_level
) {
    TwoStageLeastSquares tsls;
    tsls.conf_level = conf_level;

    IVResult fit = tsls.fit(
        data.column(outcome),
        data.matrix({treatment}),
        data.matrix(controls),
        data.matrix({instrument}));

    std::vector<std::string> names;
    names.reserve(controls.size() + 2);
    names.push_back(kIntercept);
    names.push_back(treatment);
    names.insert(names.end(), controls.begin(), controls.end());

    return RegressionStatistics(
        std::move(names), fit.coef, fit.std_errors, fit.p_values,
        fit.conf_int, fit.n_obs, fit.df_resid);
}

double first_stage_f_test(
    const Dataset& data,
    const std::string& treatment,
    const std::string& instrument,
    const std::vector<std::string>& controls
) {
    TwoStageLeastSquares tsls;
    return tsls.first_stage_partial_f(
        data.matrix({treatment}),
        data.matrix({instrument}),
        data.matrix(controls));
}

} // namespace fitting
} // namespace dagstat
