#include "observational.h"
#include "preconditions.h"
#include "../fitting.h"
#include "../identification.h"

namespace dagstat {

// ===== Result =====

std::vector<Assumption> OLSEstimate::assumptions() const {
    return {
        {"No unobserved confounding: every common cause of treatment and outcome "
         "is declared in the graph and measured", false},
        {"Linearity: the outcome is linear in treatment and controls", true},
        {"Exogeneity: regression errors are uncorrelated with treatment given controls", false},
        {"Stable Unit Treatment Value Assumption (SUTVA)", false},
    };
}

RefutationReport OLSEstimate::refute(const Dataset& data) const {
    const std::string T = treatment_;
    const std::string Y = outcome_;
    const std::vector<std::string> base = controls();
    const double level = conf_level_;

    std::vector<std::string> used{T, Y};
    used.insert(used.end(), base.begin(), base.end());
    const Dataset complete = preconditions::complete_cases(data, used);

    auto refit = [&](const Dataset& d, const std::string& extra) {
        std::vector<std::string> regressors{T};
        regressors.insert(regressors.end(), base.begin(), base.end());
        regressors.push_back(extra);
        return fitting::ols(d, Y, regressors, level).coefficient(T);
    };

    std::vector<RefutationCheck> checks;
    checks.push_back(refutation::random_common_cause(complete, refit, effect_, std_err_));
    return RefutationReport("OLS Refutation Report: " + T + " -> " + Y, std::move(checks));
}

// ===== Estimator =====

ObservationalOLS::ObservationalOLS(const graph::CausalGraph& g, std::string treatment, std::string outcome)
    : graph_(g), treatment_(std::move(treatment)), outcome_(std::move(outcome)) {
    preconditions::require_node(graph_, {"Treatment", treatment_});
    preconditions::require_node(graph_, {"Outcome", outcome_});
    preconditions::require_distinct({{"Treatment", treatment_}, {"Outcome", outcome_}});
}

OLSEstimate ObservationalOLS::fit(const Dataset& data) const {
    preconditions::require_column(data, {"Treatment", treatment_});
    preconditions::require_column(data, {"Outcome", outcome_});

    AdjustmentSet adj = identify(graph_, treatment_, outcome_, data.column_set());
    if (!adj.identified()) {
        throw preconditions::missing_confounders(treatment_, outcome_, adj.missing);
    }

    std::vector<std::string> regressors{treatment_};
    for (const auto& c : adj.controls()) regressors.push_back(c);

    std::vector<std::string> used = regressors;
    used.push_back(outcome_);
    const Dataset complete = preconditions::complete_cases(data, used);

    fitting::RegressionStatistics adjusted = fitting::ols(complete, outcome_, regressors, conf_level);
    fitting::RegressionStatistics unadjusted = fitting::ols(complete, outcome_, {treatment_}, conf_level);

    OLSEstimate result(treatment_, outcome_, adj.observed, conf_level);
    result.effect_ = adjusted.coefficient(treatment_);
    result.unadjusted_effect_ = unadjusted.coefficient(treatment_);
    result.std_err_ = adjusted.std_err(treatment_);
    result.conf_int_ = adjusted.conf_int(treatment_);
    result.pvalue_ = adjusted.pvalue(treatment_);
    return result;
}

} // namespace dagstat
