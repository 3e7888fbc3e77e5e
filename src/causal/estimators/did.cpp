#include "did.h"
#include "preconditions.h"
#include "../fitting.h"

#include <stdexcept>

namespace dagstat {

namespace {

// Interaction coefficient of outcome ~ G + T + G:T (+ extra)
fitting::RegressionStatistics fit_interaction(
    const Dataset& data,
    const std::string& group,
    const std::string& time,
    const std::string& outcome,
    const std::string& extra,
    double conf_level,
    std::string& interaction
) {
    interaction = data.unique_column_name(group + ":" + time);
    Eigen::VectorXd gt = data.column(group).cwiseProduct(data.column(time));
    Dataset design = data.with_column(interaction, gt);

    std::vector<std::string> regressors{group, time, interaction};
    if (!extra.empty()) regressors.push_back(extra);
    return fitting::ols(design, outcome, regressors, conf_level);
}

double post_period_difference(const Eigen::VectorXd& y, const Eigen::VectorXd& g,
                              const Eigen::VectorXd& t) {
    double sum1 = 0, sum0 = 0;
    int n1 = 0, n0 = 0;
    for (int i = 0; i < y.size(); ++i) {
        if (t(i) <= 0.5) continue;
        if (g(i) > 0.5) {
            sum1 += y(i);
            n1++;
        } else {
            sum0 += y(i);
            n0++;
        }
    }
    if (n1 == 0 || n0 == 0) {
        throw std::runtime_error("Post period must contain both groups");
    }
    return sum1 / n1 - sum0 / n0;
}

} // namespace

// ===== Result =====

std::vector<Assumption> DiDEstimate::assumptions() const {
    return {
        {"Parallel trends: treated and control groups would have followed "
         "the same trend absent treatment", false},
        {"No anticipation: treatment does not affect outcomes before it begins", false},
        {"Stable group composition: group membership does not change due to treatment", false},
        {"Stable Unit Treatment Value Assumption (SUTVA)", false},
    };
}

RefutationReport DiDEstimate::refute(const Dataset& data) const {
    const std::string G = treatment_;
    const std::string T = time_;
    const std::string Y = outcome_;
    const double level = conf_level_;
    const Dataset complete = preconditions::complete_cases(data, {G, T, Y});

    auto placebo_refit = [&](const Dataset& d) {
        std::string interaction;
        return fit_interaction(d, G, T, Y, "", level, interaction).coefficient(interaction);
    };
    auto rcc_refit = [&](const Dataset& d, const std::string& extra) {
        std::string interaction;
        return fit_interaction(d, G, T, Y, extra, level, interaction).coefficient(interaction);
    };

    std::vector<RefutationCheck> checks;
    checks.push_back(refutation::placebo(refutation::kPlaceboGroup, complete, G,
                                         refutation::kPlaceboGroupSeed, placebo_refit, std_err_));
    checks.push_back(refutation::placebo(refutation::kPlaceboTime, complete, T,
                                         refutation::kPlaceboTimeSeed, placebo_refit, std_err_));
    checks.push_back(refutation::random_common_cause(complete, rcc_refit, effect_, std_err_));
    return RefutationReport("DiD Refutation Report: " + G + " x " + T + " -> " + Y,
                            std::move(checks));
}

// ===== Estimator =====

DifferenceInDifferences::DifferenceInDifferences(
    const graph::CausalGraph& g, std::string group, std::string time, std::string outcome)
    : group_(std::move(group)), time_(std::move(time)), outcome_(std::move(outcome)) {
    preconditions::require_node(g, {"Group", group_});
    preconditions::require_node(g, {"Time", time_});
    preconditions::require_node(g, {"Outcome", outcome_});
    preconditions::require_distinct({{"Group", group_}, {"Time", time_}, {"Outcome", outcome_}});
}

DiDEstimate DifferenceInDifferences::fit(const Dataset& data) const {
    preconditions::require_column(data, {"Group", group_});
    preconditions::require_column(data, {"Time", time_});
    preconditions::require_column(data, {"Outcome", outcome_});
    const Dataset complete = preconditions::complete_cases(data, {group_, time_, outcome_});
    preconditions::require_binary(complete, {"Group", group_});
    preconditions::require_binary(complete, {"Time", time_});

    std::string interaction;
    fitting::RegressionStatistics stats =
        fit_interaction(complete, group_, time_, outcome_, "", conf_level, interaction);

    DiDEstimate result(group_, time_, outcome_, conf_level);
    result.effect_ = stats.coefficient(interaction);
    result.unadjusted_effect_ = post_period_difference(
        complete.column(outcome_), complete.column(group_), complete.column(time_));
    result.std_err_ = stats.std_err(interaction);
    result.conf_int_ = stats.conf_int(interaction);
    result.pvalue_ = stats.pvalue(interaction);
    return result;
}

} // namespace dagstat
