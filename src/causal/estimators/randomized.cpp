#include "randomized.h"
#include "preconditions.h"
#include "../fitting.h"

namespace dagstat {

// ===== Result =====

std::vector<Assumption> RCTEstimate::assumptions() const {
    return {
        {"Random assignment of treatment", false},
        {"Excludability: assignment affects outcome only through treatment received", false},
        {"Stable Unit Treatment Value Assumption (SUTVA)", false},
    };
}

RefutationReport RCTEstimate::refute(const Dataset& data) const {
    const std::string T = treatment_;
    const std::string Y = outcome_;
    const double level = conf_level_;
    const Dataset complete = preconditions::complete_cases(data, {T, Y});

    auto refit = [&](const Dataset& d, const std::string& extra) {
        return fitting::ols(d, Y, {T, extra}, level).coefficient(T);
    };

    std::vector<RefutationCheck> checks;
    checks.push_back(refutation::random_common_cause(complete, refit, effect_, std_err_));
    return RefutationReport("RCT Refutation Report: " + T + " -> " + Y, std::move(checks));
}

// ===== Estimator =====

RandomizedTrial::RandomizedTrial(const graph::CausalGraph& g, std::string treatment, std::string outcome)
    : treatment_(std::move(treatment)), outcome_(std::move(outcome)) {
    preconditions::require_node(g, {"Treatment", treatment_});
    preconditions::require_node(g, {"Outcome", outcome_});
    preconditions::require_distinct({{"Treatment", treatment_}, {"Outcome", outcome_}});

    std::set<std::string> parents = g.parents(treatment_);
    if (!parents.empty()) {
        std::string list;
        for (const auto& p : parents) {
            if (!list.empty()) list += ", ";
            list += "'" + p + "'";
        }
        throw ValidationError(
            "Treatment '" + treatment_ + "' has causes in the graph (" + list + "). "
            "A randomized trial requires the treatment to be assigned at random; "
            "use an observational estimator instead.");
    }
}

RCTEstimate RandomizedTrial::fit(const Dataset& data) const {
    preconditions::require_column(data, {"Treatment", treatment_});
    preconditions::require_column(data, {"Outcome", outcome_});

    const Dataset complete = preconditions::complete_cases(data, {treatment_, outcome_});
    fitting::RegressionStatistics stats = fitting::ols(complete, outcome_, {treatment_}, conf_level);

    RCTEstimate result(treatment_, outcome_, conf_level);
    result.effect_ = stats.coefficient(treatment_);
    result.unadjusted_effect_ = result.effect_;
    result.std_err_ = stats.std_err(treatment_);
    result.conf_int_ = stats.conf_int(treatment_);
    result.pvalue_ = stats.pvalue(treatment_);
    return result;
}

} // namespace dagstat
