/**
 * @file refutation.h
 * @brief DagStat v1.0 - Post-fit refutation checks
 *
 * Perturb-and-compare protocol: each check modifies the data in a way that
 * should leave a valid estimate unchanged (random common cause) or drive it
 * to zero (placebo), re-runs the same fitting, and compares against one
 * standard error of the original estimate.
 *
 * Check names are stable and part of the public interface:
 *   "Random common cause", "Placebo treatment", "Placebo group",
 *   "Placebo time", "First-stage F-statistic".
 *
 * A failed check is data, never an exception.
 */
#ifndef DAGSTAT_REFUTATION_H
#define DAGSTAT_REFUTATION_H

#include <functional>
#include <string>
#include <vector>

#include "../core/dataset.h"

namespace dagstat {

// Modelling assumption required for a causal reading of an estimate
struct Assumption {
    std::string description;
    bool testable;
};

struct RefutationCheck {
    std::string name;
    bool passed;
    std::string detail;
};

class RefutationReport {
public:
    RefutationReport(std::string title, std::vector<RefutationCheck> checks)
        : title_(std::move(title)), checks_(std::move(checks)) {}

    const std::string& title() const { return title_; }
    const std::vector<RefutationCheck>& checks() const { return checks_; }

    // True iff every check passed
    bool passed() const;
    std::vector<RefutationCheck> failed_checks() const;

private:
    std::string title_;
    std::vector<RefutationCheck> checks_;
};

namespace refutation {

// ===== Seeds and thresholds =====

constexpr unsigned int kRandomCommonCauseSeed = 54321;
constexpr unsigned int kPlaceboTreatmentSeed = 99999;
constexpr unsigned int kPlaceboGroupSeed = 99999;
constexpr unsigned int kPlaceboTimeSeed = 22222;
constexpr double kFirstStageFThreshold = 10.0;

extern const char* const kRandomCommonCause;
extern const char* const kPlaceboTreatment;
extern const char* const kPlaceboGroup;
extern const char* const kPlaceboTime;
extern const char* const kFirstStageF;

// Re-runs the estimator on `data` with `extra_control` as an additional
// control and returns the new point estimate
using ControlRefit = std::function<double(const Dataset& data, const std::string& extra_control)>;

// Re-runs the estimator on perturbed data and returns the point estimate
using Refit = std::function<double(const Dataset& data)>;

/**
 * @brief Add a standard-normal noise column and re-fit
 *
 * The column is named "_rcc", prefixed with '_' until it does not clash.
 * Passes iff |new - original| <= original_se.
 */
RefutationCheck random_common_cause(
    const Dataset& data,
    const ControlRefit& refit,
    double original_effect,
    double original_se
);

/**
 * @brief Permute one column and re-fit
 *
 * Passes iff |placebo estimate| <= original_se.
 */
RefutationCheck placebo(
    const std::string& name,
    const Dataset& data,
    const std::string& column,
    unsigned int seed,
    const Refit& refit,
    double original_se
);

/**
 * @brief Partial F of the instrument in treatment ~ instrument + controls
 *
 * Passes iff F >= threshold.
 */
RefutationCheck first_stage_f(
    const Dataset& data,
    const std::string& treatment,
    const std::string& instrument,
    const std::vector<std::string>& controls,
    double threshold = kFirstStageFThreshold
);

} // namespace refutation
} // namespace dagstat

#endif // DAGSTAT_REFUTATION_H
