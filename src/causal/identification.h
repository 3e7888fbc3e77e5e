/**
 * @file identification.h
 * @brief DagStat v1.0 - Backdoor identification
 *
 * Adjustment set:
 *   confounders = (ancestors(T) ∩ ancestors(Y)) \ descendants(T)
 *
 * Descendants of the treatment are never controlled for, so mediators and
 * colliders downstream of T stay out of the set. The confounders are then
 * split by whether the dataset measures them.
 */
#ifndef DAGSTAT_IDENTIFICATION_H
#define DAGSTAT_IDENTIFICATION_H

#include <set>
#include <string>
#include <vector>

#include "../graph/causal_graph.h"

namespace dagstat {

struct AdjustmentSet {
    std::set<std::string> observed;   // confounders with a dataset column
    std::set<std::string> missing;    // declared confounders without one

    bool identified() const { return missing.empty(); }

    // Observed confounders in name order, for use as regression controls
    std::vector<std::string> controls() const {
        return std::vector<std::string>(observed.begin(), observed.end());
    }
};

/**
 * @brief Backdoor adjustment set for treatment -> outcome
 *
 * @param available_columns Names measured in the dataset
 * @param excluded Nodes dropped from the confounder set (the instrument)
 * @throws ValidationError if treatment or outcome is not a graph node, or
 *         if they are the same node
 */
AdjustmentSet identify(
    const graph::CausalGraph& g,
    const std::string& treatment,
    const std::string& outcome,
    const std::set<std::string>& available_columns,
    const std::set<std::string>& excluded = {}
);

} // namespace dagstat

#endif // DAGSTAT_IDENTIFICATION_H
