/**
 * @file preconditions.h
 * @brief DagStat v1.0 - Shared input checks for the estimators
 */
#ifndef DAGSTAT_PRECONDITIONS_H
#define DAGSTAT_PRECONDITIONS_H

#include <set>
#include <string>
#include <utility>
#include <vector>

#include "../../core/dataset.h"
#include "../../core/errors.h"
#include "../../graph/causal_graph.h"

namespace dagstat {
namespace preconditions {

// (role label, variable name), e.g. {"Treatment", "education"}
using Role = std::pair<std::string, std::string>;

// @throws ValidationError listing the known nodes if the role is not a node
void require_node(const graph::CausalGraph& g, const Role& role);

// @throws ValidationError naming the first two roles that share a variable
void require_distinct(const std::vector<Role>& roles);

// @throws ValidationError "<Role> column '<name>' not found in dataset"
void require_column(const Dataset& data, const Role& role);

/**
 * @brief Column holds only 0 and 1, and both occur
 *
 * @throws ValidationError otherwise
 */
void require_binary(const Dataset& data, const Role& role);

/**
 * @brief Drop rows with a NaN or infinite value in any of `columns`
 *
 * @throws ValidationError if no row is complete
 */
Dataset complete_cases(const Dataset& data, const std::vector<std::string>& columns);

// Error for declared confounders that the dataset does not measure
IdentificationError missing_confounders(
    const std::string& treatment,
    const std::string& outcome,
    const std::set<std::string>& missing
);

} // namespace preconditions
} // namespace dagstat

#endif // DAGSTAT_PRECONDITIONS_H
