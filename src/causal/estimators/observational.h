/**
 * @file observational.h
 * @brief DagStat v1.0 - Observational OLS with backdoor adjustment
 *
 * 1. Identify the adjustment set from the graph (backdoor criterion).
 * 2. Refuse to fit if a declared confounder is not in the dataset.
 * 3. OLS of outcome on treatment + sorted(adjustment set).
 * 4. OLS of outcome on treatment alone, to expose the confounding bias.
 *
 * Confounders absent from the graph are invisible here and will bias the
 * estimate.
 */
#ifndef DAGSTAT_OBSERVATIONAL_H
#define DAGSTAT_OBSERVATIONAL_H

#include <string>

#include "estimate.h"
#include "../../graph/causal_graph.h"

namespace dagstat {

class OLSEstimate : public CausalEstimate {
public:
    std::string method() const override { return "OLS"; }
    std::vector<Assumption> assumptions() const override;

    // Checks: random common cause
    RefutationReport refute(const Dataset& data) const override;

private:
    friend class ObservationalOLS;
    OLSEstimate(std::string treatment, std::string outcome,
                std::set<std::string> adjustment_set, double conf_level)
        : CausalEstimate(std::move(treatment), std::move(outcome), std::move(adjustment_set)),
          conf_level_(conf_level) {}

    double conf_level_;
};

class ObservationalOLS {
public:
    double conf_level = 0.95;

    /**
     * @throws ValidationError if treatment or outcome is not a graph node,
     *         or if they coincide
     */
    ObservationalOLS(const graph::CausalGraph& g, std::string treatment, std::string outcome);

    /**
     * @throws ValidationError if a role column is missing
     * @throws IdentificationError if declared confounders are unmeasured
     * @throws std::runtime_error if the regression cannot be fitted
     */
    OLSEstimate fit(const Dataset& data) const;

    const std::string& treatment() const { return treatment_; }
    const std::string& outcome() const { return outcome_; }

private:
    const graph::CausalGraph& graph_;
    std::string treatment_;
    std::string outcome_;
};

} // namespace dagstat

#endif // DAGSTAT_OBSERVATIONAL_H
