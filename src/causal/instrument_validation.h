/**
 * @file instrument_validation.h
 * @brief DagStat v1.0 - Structural instrument checks
 *
 * An instrument Z for T -> Y must satisfy, in the declared graph:
 *   - Relevance: Z is an ancestor of T
 *   - Exclusion: every directed path from Z to Y passes through T
 *
 * Independence from unobserved confounders cannot be read off a graph that
 * omits them, so it is left to the user.
 */
#ifndef DAGSTAT_INSTRUMENT_VALIDATION_H
#define DAGSTAT_INSTRUMENT_VALIDATION_H

#include <string>

#include "../graph/causal_graph.h"

namespace dagstat {

/**
 * @throws ValidationError if Z, T, Y are not distinct graph nodes, if T is
 *         not a descendant of Z, or if Y is reachable from Z without
 *         passing through T
 */
void validate_instrument(
    const graph::CausalGraph& g,
    const std::string& treatment,
    const std::string& outcome,
    const std::string& instrument
);

} // namespace dagstat

#endif // DAGSTAT_INSTRUMENT_VALIDATION_H
