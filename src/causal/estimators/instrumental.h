/**
 * @file instrumental.h
 * @brief DagStat v1.0 - Instrumental variables (2SLS) with graph checks
 *
 * The instrument is checked against the graph at construction (relevance
 * and exclusion restriction). Declared confounders that the dataset lacks
 * are tolerated: that is the situation IV exists for. Measured ones enter
 * both stages as exogenous controls.
 */
#ifndef DAGSTAT_INSTRUMENTAL_H
#define DAGSTAT_INSTRUMENTAL_H

#include <string>

#include "estimate.h"
#include "../../graph/causal_graph.h"

namespace dagstat {

class IVEstimate : public CausalEstimate {
public:
    std::string method() const override { return "IV (2SLS)"; }
    std::vector<Assumption> assumptions() const override;

    // Checks: first-stage F-statistic, random common cause
    RefutationReport refute(const Dataset& data) const override;

    const std::string& instrument() const { return instrument_; }

private:
    friend class InstrumentalVariables;
    IVEstimate(std::string treatment, std::string outcome, std::string instrument,
               std::set<std::string> adjustment_set, double conf_level)
        : CausalEstimate(std::move(treatment), std::move(outcome), std::move(adjustment_set)),
          instrument_(std::move(instrument)),
          conf_level_(conf_level) {}

    std::string instrument_;
    double conf_level_;
};

class InstrumentalVariables {
public:
    double conf_level = 0.95;

    /**
     * @throws ValidationError if a role is not a graph node, roles are not
     *         distinct, the instrument does not cause the treatment, or the
     *         instrument reaches the outcome bypassing the treatment
     */
    InstrumentalVariables(const graph::CausalGraph& g, std::string treatment,
                          std::string outcome, std::string instrument);

    /**
     * @throws ValidationError if a role column is missing
     * @throws std::runtime_error if 2SLS cannot be fitted
     */
    IVEstimate fit(const Dataset& data) const;

    const std::string& treatment() const { return treatment_; }
    const std::string& outcome() const { return outcome_; }
    const std::string& instrument() const { return instrument_; }

private:
    const graph::CausalGraph& graph_;
    std::string treatment_;
    std::string outcome_;
    std::string instrument_;
};

} // namespace dagstat

#endif // DAGSTAT_INSTRUMENTAL_H
