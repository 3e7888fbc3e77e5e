/**
 * @file matching.h
 * @brief DagStat v1.0 - Propensity score matching with graph-derived covariates
 *
 * Estimand: ATT (average treatment effect on the treated).
 *
 * Propensity model: logit of treatment on sorted(adjustment set), or the
 * intercept-only model when the graph declares no confounders.
 * Matching: 1-to-1 nearest neighbour on the score, with replacement.
 * Inference: bootstrap of the whole procedure (score model and matching).
 *
 * Bootstrap replicates run in parallel under OpenMP. Each replicate draws
 * from its own pre-generated seed, so the result depends only on `seed`.
 */
#ifndef DAGSTAT_MATCHING_H
#define DAGSTAT_MATCHING_H

#include <Eigen/Dense>
#include <string>

#include "estimate.h"
#include "../../graph/causal_graph.h"

namespace dagstat {

class MatchingEstimate : public CausalEstimate {
public:
    std::string method() const override { return "Propensity score matching"; }
    std::vector<Assumption> assumptions() const override;

    // Checks: placebo treatment, random common cause
    RefutationReport refute(const Dataset& data) const override;

    // ATT of every successful bootstrap replicate
    const Eigen::VectorXd& bootstrap_effects() const { return bootstrap_effects_; }
    int n_bootstrap_failures() const { return n_bootstrap_failures_; }

private:
    friend class PropensityScoreMatching;
    MatchingEstimate(std::string treatment, std::string outcome, std::set<std::string> adjustment_set)
        : CausalEstimate(std::move(treatment), std::move(outcome), std::move(adjustment_set)) {}

    Eigen::VectorXd bootstrap_effects_;
    int n_bootstrap_failures_ = 0;
};

class PropensityScoreMatching {
public:
    double conf_level = 0.95;       // percentile interval width
    int n_bootstrap = 500;
    unsigned int seed = 42;
    bool parallel = true;
    int n_jobs = -1;                // -1 means use all available cores

    /**
     * @throws ValidationError if treatment or outcome is not a graph node,
     *         or if they coincide
     */
    PropensityScoreMatching(const graph::CausalGraph& g, std::string treatment, std::string outcome);

    /**
     * @throws ValidationError if a role column is missing, or the treatment
     *         is not 0/1 with both levels present
     * @throws IdentificationError if declared confounders are unmeasured
     * @throws std::runtime_error if fewer than two bootstrap replicates succeed
     */
    MatchingEstimate fit(const Dataset& data) const;

    const std::string& treatment() const { return treatment_; }
    const std::string& outcome() const { return outcome_; }

private:
    const graph::CausalGraph& graph_;
    std::string treatment_;
    std::string outcome_;
};

} // namespace dagstat

#endif // DAGSTAT_MATCHING_H
