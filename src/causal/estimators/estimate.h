/**
 * @file estimate.h
 * @brief DagStat v1.0 - Common interface of fitted causal estimates
 *
 * Every estimator family returns a subclass of CausalEstimate. Results are
 * immutable values: they copy the role names and the adjustment set and
 * never reference the estimator or the graph that produced them.
 */
#ifndef DAGSTAT_ESTIMATE_H
#define DAGSTAT_ESTIMATE_H

#include <set>
#include <string>
#include <utility>
#include <vector>

#include "../../core/dataset.h"
#include "../refutation.h"

namespace dagstat {

class CausalEstimate {
public:
    virtual ~CausalEstimate() = default;

    // Short method label, e.g. "OLS", "IV (2SLS)"
    virtual std::string method() const = 0;

    // Modelling assumptions, fixed per method family
    virtual std::vector<Assumption> assumptions() const = 0;

    // Run this family's refutation checks against `data`. Rows with missing
    // values in the columns the method uses are dropped first; ValidationError
    // if none remain
    virtual RefutationReport refute(const Dataset& data) const = 0;

    double effect() const { return effect_; }

    // Estimate without adjustment, to show the confounding bias
    double unadjusted_effect() const { return unadjusted_effect_; }

    double std_err() const { return std_err_; }
    std::pair<double, double> conf_int() const { return conf_int_; }
    double pvalue() const { return pvalue_; }

    // Observed confounders controlled for
    const std::set<std::string>& adjustment_set() const { return adjustment_set_; }

    const std::string& treatment() const { return treatment_; }
    const std::string& outcome() const { return outcome_; }

protected:
    CausalEstimate(std::string treatment, std::string outcome, std::set<std::string> adjustment_set)
        : treatment_(std::move(treatment)),
          outcome_(std::move(outcome)),
          adjustment_set_(std::move(adjustment_set)) {}

    std::vector<std::string> controls() const {
        return std::vector<std::string>(adjustment_set_.begin(), adjustment_set_.end());
    }

    std::string treatment_;
    std::string outcome_;
    std::set<std::string> adjustment_set_;

    double effect_ = 0.0;
    double unadjusted_effect_ = 0.0;
    double std_err_ = 0.0;
    std::pair<double, double> conf_int_{0.0, 0.0};
    double pvalue_ = 1.0;
};

} // namespace dagstat

#endif // DAGSTAT_ESTIMATE_H
