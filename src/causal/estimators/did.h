/**
 * @file did.h
 * @brief DagStat v1.0 - 2x2 Difference-in-Differences
 *
 * Y = b0 + b1 G + b2 T + d (G x T) + e
 *
 * d is the effect of treatment on the treated group in the post period.
 * Identification comes from parallel trends, not from the backdoor
 * criterion, so the graph is only used to validate roles and the
 * adjustment set is always empty.
 */
#ifndef DAGSTAT_DID_H
#define DAGSTAT_DID_H

#include <string>

#include "estimate.h"
#include "../../graph/causal_graph.h"

namespace dagstat {

class DiDEstimate : public CausalEstimate {
public:
    std::string method() const override { return "Difference-in-Differences"; }
    std::vector<Assumption> assumptions() const override;

    // Checks: placebo group, placebo time, random common cause
    RefutationReport refute(const Dataset& data) const override;

    const std::string& group() const { return treatment_; }
    const std::string& time() const { return time_; }

    // mean(Y | G=1, T=1) - mean(Y | G=0, T=1), ignoring pre-period trends
    double naive_diff() const { return unadjusted_effect_; }

private:
    friend class DifferenceInDifferences;
    DiDEstimate(std::string group, std::string time, std::string outcome, double conf_level)
        : CausalEstimate(std::move(group), std::move(outcome), {}),
          time_(std::move(time)),
          conf_level_(conf_level) {}

    std::string time_;
    double conf_level_;
};

class DifferenceInDifferences {
public:
    double conf_level = 0.95;

    /**
     * @throws ValidationError if a role is not a graph node or the roles
     *         are not distinct
     */
    DifferenceInDifferences(const graph::CausalGraph& g, std::string group,
                            std::string time, std::string outcome);

    /**
     * @throws ValidationError if a role column is missing, or group / time
     *         is not 0/1 with both levels present
     * @throws std::runtime_error if the regression cannot be fitted
     */
    DiDEstimate fit(const Dataset& data) const;

    const std::string& group() const { return group_; }
    const std::string& time() const { return time_; }
    const std::string& outcome() const { return outcome_; }

private:
    std::string group_;
    std::string time_;
    std::string outcome_;
};

} // namespace dagstat

#endif // DAGSTAT_DID_H
