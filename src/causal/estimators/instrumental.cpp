#include "instrumental.h"
#include "preconditions.h"
#include "../fitting.h"
#include "../identification.h"
#include "../instrument_validation.h"

#include <algorithm>

#include <spdlog/fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace dagstat {

// ===== Result =====

std::vector<Assumption> IVEstimate::assumptions() const {
    return {
        {"Relevance: the instrument strongly affects treatment", true},
        {"Exclusion restriction: instrument only affects outcome through treatment", false},
        {"Independence: instrument is uncorrelated with unobserved confounders", false},
        {"Monotonicity: instrument affects treatment in same direction for everyone", false},
    };
}

RefutationReport IVEstimate::refute(const Dataset& data) const {
    const std::string T = treatment_;
    const std::string Y = outcome_;
    const std::string Z = instrument_;
    const std::vector<std::string> base = controls();
    const double level = conf_level_;

    std::vector<std::string> used{T, Y, Z};
    used.insert(used.end(), base.begin(), base.end());
    const Dataset complete = preconditions::complete_cases(data, used);

    auto refit = [&](const Dataset& d, const std::string& extra) {
        std::vector<std::string> ctrl = base;
        ctrl.push_back(extra);
        std::sort(ctrl.begin(), ctrl.end());
        return fitting::two_stage_least_squares(d, Y, T, Z, ctrl, level).coefficient(T);
    };

    std::vector<RefutationCheck> checks;
    checks.push_back(refutation::first_stage_f(complete, T, Z, base));
    checks.push_back(refutation::random_common_cause(complete, refit, effect_, std_err_));
    return RefutationReport(
        "IV Refutation Report: " + T + " -> " + Y + " (instrument: " + Z + ")", std::move(checks));
}

// ===== Estimator =====

InstrumentalVariables::InstrumentalVariables(
    const graph::CausalGraph& g, std::string treatment, std::string outcome, std::string instrument)
    : graph_(g),
      treatment_(std::move(treatment)),
      outcome_(std::move(outcome)),
      instrument_(std::move(instrument)) {
    preconditions::require_node(graph_, {"Treatment", treatment_});
    preconditions::require_node(graph_, {"Outcome", outcome_});
    preconditions::require_node(graph_, {"Instrument", instrument_});
    preconditions::require_distinct({{"Treatment", treatment_},
                                     {"Outcome", outcome_},
                                     {"Instrument", instrument_}});
    validate_instrument(graph_, treatment_, outcome_, instrument_);
}

IVEstimate InstrumentalVariables::fit(const Dataset& data) const {
    preconditions::require_column(data, {"Treatment", treatment_});
    preconditions::require_column(data, {"Outcome", outcome_});
    preconditions::require_column(data, {"Instrument", instrument_});

    AdjustmentSet adj = identify(graph_, treatment_, outcome_, data.column_set(), {instrument_});
    if (!adj.identified()) {
        spdlog::info("[iv] unmeasured confounders of {} -> {} handled by instrument {}: {}",
                     treatment_, outcome_, instrument_, adj.missing);
    }
    std::vector<std::string> controls = adj.controls();

    std::vector<std::string> used{treatment_, outcome_, instrument_};
    used.insert(used.end(), controls.begin(), controls.end());
    const Dataset complete = preconditions::complete_cases(data, used);

    fitting::RegressionStatistics tsls = fitting::two_stage_least_squares(
        complete, outcome_, treatment_, instrument_, controls, conf_level);
    fitting::RegressionStatistics naive = fitting::ols(complete, outcome_, {treatment_}, conf_level);

    IVEstimate result(treatment_, outcome_, instrument_, adj.observed, conf_level);
    result.effect_ = tsls.coefficient(treatment_);
    result.unadjusted_effect_ = naive.coefficient(treatment_);
    result.std_err_ = tsls.std_err(treatment_);
    result.conf_int_ = tsls.conf_int(treatment_);
    result.pvalue_ = tsls.pvalue(treatment_);
    return result;
}

} // namespace dagstat
