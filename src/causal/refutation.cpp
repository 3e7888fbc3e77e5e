#include "refutation.h"
#include "fitting.h"
#include "../stats/resampling.h"

#include <cmath>
#include <exception>
#include <random>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace dagstat {

// ===== RefutationReport =====

bool RefutationReport::passed() const {
    for (const auto& c : checks_) {
        if (!c.passed) return false;
    }
    return true;
}

std::vector<RefutationCheck> RefutationReport::failed_checks() const {
    std::vector<RefutationCheck> failed;
    for (const auto& c : checks_) {
        if (!c.passed) failed.push_back(c);
    }
    return failed;
}

namespace refutation {

const char* const kRandomCommonCause = "Random common cause";
const char* const kPlaceboTreatment = "Placebo treatment";
const char* const kPlaceboGroup = "Placebo group";
const char* const kPlaceboTime = "Placebo time";
const char* const kFirstStageF = "First-stage F-statistic";

namespace {

RefutationCheck logged(RefutationCheck check) {
    spdlog::info("[refute] {}: {} ({})", check.name, check.passed ? "PASS" : "FAIL", check.detail);
    return check;
}

} // namespace

// ===== Random common cause =====

RefutationCheck random_common_cause(
    const Dataset& data,
    const ControlRefit& refit,
    double original_effect,
    double original_se
) {
    std::mt19937 gen(kRandomCommonCauseSeed);
    std::normal_distribution<double> normal(0.0, 1.0);
    Eigen::VectorXd noise(data.rows());
    for (int i = 0; i < data.rows(); ++i) noise(i) = normal(gen);

    const std::string col = data.unique_column_name("_rcc");
    Dataset augmented = data.with_column(col, noise);

    double new_effect;
    try {
        new_effect = refit(augmented, col);
    } catch (const std::exception& e) {
        return logged({kRandomCommonCause, false,
                       fmt::format("Re-fit failed after adding a random covariate: {}", e.what())});
    }

    double shift = std::abs(new_effect - original_effect);
    bool passed = shift <= original_se;
    std::string detail = fmt::format("estimate shifted by {:.4f} ({} 1 SE = {:.4f})",
                                     shift, passed ? "<=" : ">", original_se);
    if (!passed) {
        detail += ". Adding a random common cause destabilised the estimate.";
    }
    return logged({kRandomCommonCause, passed, detail});
}

// ===== Placebo =====

RefutationCheck placebo(
    const std::string& name,
    const Dataset& data,
    const std::string& column,
    unsigned int seed,
    const Refit& refit,
    double original_se
) {
    Resampler resampler;
    resampler.seed = seed;
    Dataset augmented = data.with_column(column, resampler.permute(data.column(column)));

    double placebo_effect;
    try {
        placebo_effect = refit(augmented);
    } catch (const std::exception& e) {
        return logged({name, false,
                       fmt::format("Re-fit failed on permuted '{}': {}", column, e.what())});
    }

    bool passed = std::abs(placebo_effect) <= original_se;
    std::string detail = fmt::format("placebo estimate = {:.4f} ({} 1 SE = {:.4f})",
                                     placebo_effect, passed ? "<=" : ">", original_se);
    if (passed) {
        detail += fmt::format(". Permuting '{}' yields a near-zero effect, as expected.", column);
    } else {
        detail += fmt::format(". Randomly permuted '{}' produced a large effect; the original "
                              "result may be spurious.", column);
    }
    return logged({name, passed, detail});
}

// ===== First stage =====

RefutationCheck first_stage_f(
    const Dataset& data,
    const std::string& treatment,
    const std::string& instrument,
    const std::vector<std::string>& controls,
    double threshold
) {
    double f_stat;
    try {
        f_stat = fitting::first_stage_f_test(data, treatment, instrument, controls);
    } catch (const std::exception& e) {
        return logged({kFirstStageF, false,
                       fmt::format("First-stage regression failed: {}", e.what())});
    }

    bool passed = f_stat >= threshold;
    std::string detail = fmt::format("F = {:.2f} (threshold: F >= {:.0f})", f_stat, threshold);
    if (!passed) {
        spdlog::warn("[refute] weak first stage for instrument {}: F = {:.2f}", instrument, f_stat);
        detail += ". Weak instrument detected: the instrument explains little variation in "
                  "treatment, so IV estimates may be badly biased.";
    }
    return logged({kFirstStageF, passed, detail});
}

} // namespace refutation
} // namespace dagstat
