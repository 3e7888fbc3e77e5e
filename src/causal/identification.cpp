#include "identification.h"
#include "../core/errors.h"

#include <algorithm>
#include <iterator>

#include <spdlog/fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace dagstat {

AdjustmentSet identify(
    const graph::CausalGraph& g,
    const std::string& treatment,
    const std::string& outcome,
    const std::set<std::string>& available_columns,
    const std::set<std::string>& excluded
) {
    if (!g.has_node(treatment)) {
        throw ValidationError("Treatment '" + treatment + "' is not a node of the causal graph");
    }
    if (!g.has_node(outcome)) {
        throw ValidationError("Outcome '" + outcome + "' is not a node of the causal graph");
    }
    if (treatment == outcome) {
        throw ValidationError("Treatment and outcome must differ, got '" + treatment + "' twice");
    }

    std::set<std::string> anc_t = g.ancestors(treatment);
    std::set<std::string> anc_y = g.ancestors(outcome);
    std::set<std::string> desc_t = g.descendants(treatment);

    std::set<std::string> common;
    std::set_intersection(anc_t.begin(), anc_t.end(), anc_y.begin(), anc_y.end(),
                          std::inserter(common, common.begin()));

    AdjustmentSet result;
    for (const auto& node : common) {
        if (desc_t.count(node) || excluded.count(node)) continue;
        if (available_columns.count(node)) {
            result.observed.insert(node);
        } else {
            result.missing.insert(node);
        }
    }

    spdlog::debug("[identify] {} -> {}: observed {} missing {}",
                  treatment, outcome, result.observed, result.missing);
    return result;
}

} // namespace dagstat
