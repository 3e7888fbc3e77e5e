#include "instrument_validation.h"
#include "../core/errors.h"

#include <spdlog/spdlog.h>

namespace dagstat {

void validate_instrument(
    const graph::CausalGraph& g,
    const std::string& treatment,
    const std::string& outcome,
    const std::string& instrument
) {
    for (const std::string* n : {&treatment, &outcome, &instrument}) {
        if (!g.has_node(*n)) {
            throw ValidationError("'" + *n + "' is not a node of the causal graph");
        }
    }
    if (instrument == treatment || instrument == outcome || treatment == outcome) {
        throw ValidationError("Instrument, treatment and outcome must be distinct variables");
    }

    if (!g.descendants(instrument).count(treatment)) {
        throw ValidationError(
            "Instrument '" + instrument + "' does not cause treatment '" + treatment +
            "'. Relevance requires a directed path " + instrument + " -> ... -> " + treatment + ".");
    }

    if (g.descendants_avoiding(instrument, treatment).count(outcome)) {
        throw ValidationError(
            "Exclusion restriction violated: instrument '" + instrument +
            "' reaches outcome '" + outcome + "' without passing through treatment '" +
            treatment + "'.");
    }

    spdlog::debug("[instrument] {} is a structurally valid instrument for {} -> {}",
                  instrument, treatment, outcome);
}

} // namespace dagstat
