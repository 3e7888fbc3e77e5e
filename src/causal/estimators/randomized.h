/**
 * @file randomized.h
 * @brief DagStat v1.0 - Randomized controlled trial
 *
 * Random assignment means the treatment has no causes in the graph, so
 * there is nothing to adjust for: effect = OLS slope of outcome on
 * treatment. Treatment may be binary or continuous.
 */
#ifndef DAGSTAT_RANDOMIZED_H
#define DAGSTAT_RANDOMIZED_H

#include <string>

#include "estimate.h"
#include "../../graph/causal_graph.h"

namespace dagstat {

class RCTEstimate : public CausalEstimate {
public:
    std::string method() const override { return "RCT"; }
    std::vector<Assumption> assumptions() const override;

    // Checks: random common cause
    RefutationReport refute(const Dataset& data) const override;

private:
    friend class RandomizedTrial;
    RCTEstimate(std::string treatment, std::string outcome, double conf_level)
        : CausalEstimate(std::move(treatment), std::move(outcome), {}),
          conf_level_(conf_level) {}

    double conf_level_;
};

class RandomizedTrial {
public:
    double conf_level = 0.95;

    /**
     * @throws ValidationError if a role is not a graph node, the roles
     *         coincide, or the treatment has parents in the graph
     */
    RandomizedTrial(const graph::CausalGraph& g, std::string treatment, std::string outcome);

    /**
     * @throws ValidationError if a role column is missing
     * @throws std::runtime_error if the regression cannot be fitted
     */
    RCTEstimate fit(const Dataset& data) const;

    const std::string& treatment() const { return treatment_; }
    const std::string& outcome() const { return outcome_; }

private:
    std::string treatment_;
    std::string outcome_;
};

} // namespace dagstat

#endif // DAGSTAT_RANDOMIZED_H
