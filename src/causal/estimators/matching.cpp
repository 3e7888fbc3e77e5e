#include "matching.h"
#include "preconditions.h"
#include "../fitting.h"
#include "../identification.h"
#include "../../stats/distributions.h"
#include "../../stats/resampling.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace dagstat {

namespace {

// Score model and matching on one sample
double matched_att(
    const Dataset& data,
    const std::string& treatment,
    const std::string& outcome,
    const std::vector<std::string>& controls
) {
    Eigen::VectorXd scores = fitting::logit(data, treatment, controls);
    return fitting::nearest_neighbor_att(data, outcome, treatment, scores);
}

// mean(Y | T = 1) - mean(Y | T = 0)
double difference_in_means(const Eigen::VectorXd& y, const Eigen::VectorXd& t) {
    double sum1 = 0, sum0 = 0;
    int n1 = 0, n0 = 0;
    for (int i = 0; i < y.size(); ++i) {
        if (t(i) > 0.5) {
            sum1 += y(i);
            n1++;
        } else {
            sum0 += y(i);
            n0++;
        }
    }
    return sum1 / n1 - sum0 / n0;
}

} // namespace

// ===== Result =====

std::vector<Assumption> MatchingEstimate::assumptions() const {
    return {
        {"Conditional independence: no unobserved confounders given matched variables", false},
        {"Common support: overlap exists in characteristics between groups", true},
        {"Correct specification of the matching variables", false},
        {"Stable Unit Treatment Value Assumption (SUTVA)", false},
    };
}

RefutationReport MatchingEstimate::refute(const Dataset& data) const {
    const std::string T = treatment_;
    const std::string Y = outcome_;
    const std::vector<std::string> base = controls();

    std::vector<std::string> used{T, Y};
    used.insert(used.end(), base.begin(), base.end());
    const Dataset complete = preconditions::complete_cases(data, used);

    auto placebo_refit = [&](const Dataset& d) {
        return matched_att(d, T, Y, base);
    };
    auto rcc_refit = [&](const Dataset& d, const std::string& extra) {
        std::vector<std::string> ctrl = base;
        ctrl.push_back(extra);
        std::sort(ctrl.begin(), ctrl.end());
        return matched_att(d, T, Y, ctrl);
    };

    std::vector<RefutationCheck> checks;
    checks.push_back(refutation::placebo(refutation::kPlaceboTreatment, complete, T,
                                         refutation::kPlaceboTreatmentSeed,
                                         placebo_refit, std_err_));
    checks.push_back(refutation::random_common_cause(complete, rcc_refit, effect_, std_err_));
    return RefutationReport("PSM Refutation Report: " + T + " -> " + Y, std::move(checks));
}

// ===== Estimator =====

PropensityScoreMatching::PropensityScoreMatching(
    const graph::CausalGraph& g, std::string treatment, std::string outcome)
    : graph_(g), treatment_(std::move(treatment)), outcome_(std::move(outcome)) {
    preconditions::require_node(graph_, {"Treatment", treatment_});
    preconditions::require_node(graph_, {"Outcome", outcome_});
    preconditions::require_distinct({{"Treatment", treatment_}, {"Outcome", outcome_}});
}

MatchingEstimate PropensityScoreMatching::fit(const Dataset& data) const {
    preconditions::require_column(data, {"Treatment", treatment_});
    preconditions::require_column(data, {"Outcome", outcome_});
    AdjustmentSet adj = identify(graph_, treatment_, outcome_, data.column_set());
    if (!adj.identified()) {
        throw preconditions::missing_confounders(treatment_, outcome_, adj.missing);
    }
    const std::vector<std::string> controls = adj.controls();

    std::vector<std::string> used{treatment_, outcome_};
    used.insert(used.end(), controls.begin(), controls.end());
    const Dataset complete = preconditions::complete_cases(data, used);
    preconditions::require_binary(complete, {"Treatment", treatment_});

    MatchingEstimate result(treatment_, outcome_, adj.observed);
    result.unadjusted_effect_ =
        difference_in_means(complete.column(outcome_), complete.column(treatment_));
    result.effect_ = matched_att(complete, treatment_, outcome_, controls);

    // Only the columns the procedure reads are copied per replicate
    Dataset slim;
    slim.add_column(treatment_, complete.column(treatment_));
    slim.add_column(outcome_, complete.column(outcome_));
    for (const auto& c : controls) slim.add_column(c, complete.column(c));

    Resampler resampler;
    resampler.seed = seed;
    resampler.parallel = parallel;
    resampler.n_jobs = n_jobs;

    const std::string& T = treatment_;
    const std::string& Y = outcome_;
    BootstrapDistribution boot = resampler.bootstrap_indices(
        slim.rows(),
        [&](const std::vector<int>& idx) {
            return matched_att(slim.take_rows(idx), T, Y, controls);
        },
        n_bootstrap);

    if (boot.values.size() < 2) {
        throw std::runtime_error(
            "Bootstrap failed: only " + std::to_string(boot.values.size()) + " of " +
            std::to_string(n_bootstrap) + " replicates produced an estimate");
    }

    result.bootstrap_effects_ = boot.values;
    result.n_bootstrap_failures_ = boot.n_failed;
    result.std_err_ = Resampler::sample_sd(boot.values);

    double tail = (1.0 - conf_level) / 2.0 * 100.0;
    result.conf_int_ = {Resampler::percentile(boot.values, tail),
                        Resampler::percentile(boot.values, 100.0 - tail)};

    if (result.std_err_ > 0) {
        double z = std::abs(result.effect_) / result.std_err_;
        result.pvalue_ = 2.0 * stats::normal_cdf(-z);
    } else {
        result.pvalue_ = (result.effect_ == 0.0) ? 1.0 : 0.0;
    }

    spdlog::debug("[psm] ATT = {:.4f}, bootstrap SE = {:.4f} ({} replicates, {} failed)",
                  result.effect_, result.std_err_, boot.values.size(), boot.n_failed);
    return result;
}

} // namespace dagstat
