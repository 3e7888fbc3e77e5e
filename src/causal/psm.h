/**
 * @file psm.h
 * @brief DagStat - Propensity Score Matching
 *
 * Implements:
 *   - Propensity score estimation (logistic regression via IRLS)
 *   - 1-nearest-neighbour matching on the score, with replacement:
 *     O(n log n) via sorted binary search; ties go to the first control
 *     in row order
 *   - ATT from matched pairs
 *   - Common support bounds
 *
 * Theory:
 * -------
 * Propensity Score: e(X) = P(D=1|X)
 *
 * Under unconfoundedness (Y(0), Y(1) ⊥ D | X):
 *   ATT = E[Y(1) - Y(0) | D=1]
 *
 * Reference:
 *   - Rosenbaum, P.R. & Rubin, D.B. (1983). The Central Role of the Propensity Score
 *   - Abadie, A. & Imbens, G.W. (2006). Large Sample Properties of Matching Estimators
 */
#ifndef DAGSTAT_PSM_H
#define DAGSTAT_PSM_H

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>

#include "../linear_model/logistic.h"

namespace dagstat {

// =============================================================================
// Result Structures
// =============================================================================

struct PropensityScoreResult {
    Eigen::VectorXd scores;         // Predicted propensity scores
    Eigen::VectorXd coef;           // Logistic regression coefficients
    double intercept;
    bool converged;
    int n_treated;
    int n_control;
    double overlap_min;             // Min common support
    double overlap_max;             // Max common support
};

struct MatchingResult {
    double att;                     // Average Treatment effect on Treated
    std::vector<int> matches;       // For each treated (in row order), matched control row
    std::vector<int> treated_idx;
    int n_matched_control;          // Distinct controls used
};

// =============================================================================
// Sorted Index for 1D Matching (O(log n) per query)
// =============================================================================

/**
 * @brief Sorted index for 1D nearest neighbour search
 *
 * Propensity scores are 1-dimensional, so a sorted array with binary
 * search beats any general-purpose ANN structure.
 * Build: O(n log n), Query: O(log n).
 */
class SortedIndex1D {
public:
    void build(const Eigen::VectorXd& values, const std::vector<int>& indices) {
        sorted_.clear();
        sorted_.reserve(indices.size());
        for (int idx : indices) {
            sorted_.push_back({values(idx), idx});
        }
        std::sort(sorted_.begin(), sorted_.end());
    }

    /**
     * @brief Nearest entry to the query value
     *
     * Equal distances resolve to the lowest original index, i.e. the first
     * candidate in row order, whether the tie is between equal values or
     * between values on either side of the query.
     *
     * @return (distance, original index)
     */
    std::pair<double, int> nearest(double query) const {
        if (sorted_.empty()) {
            throw std::invalid_argument("Nearest neighbour query on an empty index");
        }
        // First element not less than the query; it also starts its run of equal values
        auto right = std::lower_bound(sorted_.begin(), sorted_.end(),
                                      std::make_pair(query, std::numeric_limits<int>::min()));

        std::pair<double, int> best{std::numeric_limits<double>::infinity(),
                                    std::numeric_limits<int>::max()};
        if (right != sorted_.end()) {
            best = {std::abs(right->first - query), right->second};
        }
        if (right != sorted_.begin()) {
            double value = std::prev(right)->first;
            auto run = std::lower_bound(sorted_.begin(), right,
                                        std::make_pair(value, std::numeric_limits<int>::min()));
            best = std::min(best, std::make_pair(std::abs(value - query), run->second));
        }
        return best;
    }

    int size() const { return static_cast<int>(sorted_.size()); }

private:
    std::vector<std::pair<double, int>> sorted_;  // (value, original_index)
};

// =============================================================================
// Propensity Score Matching
// =============================================================================

/**
 * @brief 1-NN propensity score matching with replacement
 *
 * D must be coded 0/1 with both levels present; callers validate this.
 */
class PropensityScoreMatcher {
public:
    int max_iter = 50;              // IRLS iterations for the propensity model

    /**
     * @brief Estimate propensity scores
     *
     * X may have zero columns, giving the intercept-only model where every
     * unit gets the treated share as its score.
     */
    PropensityScoreResult estimate_propensity(
        const Eigen::VectorXd& D,
        const Eigen::MatrixXd& X
    ) const {
        int n = D.size();
        if (X.rows() != n) {
            throw std::invalid_argument("Dimension mismatch: X.rows() != D.size()");
        }

        LogisticRegression logit;
        logit.max_iter = max_iter;
        LogisticResult fit = logit.fit(X, D);

        PropensityScoreResult result;
        result.coef = fit.coef;
        result.intercept = fit.intercept;
        result.converged = fit.converged;
        result.scores = logit.predict_prob(X, fit);

        result.n_treated = 0;
        result.n_control = 0;
        double min_t = 1, max_t = 0, min_c = 1, max_c = 0;
        for (int i = 0; i < n; ++i) {
            if (D(i) > 0.5) {
                result.n_treated++;
                min_t = std::min(min_t, result.scores(i));
                max_t = std::max(max_t, result.scores(i));
            } else {
                result.n_control++;
                min_c = std::min(min_c, result.scores(i));
                max_c = std::max(max_c, result.scores(i));
            }
        }
        result.overlap_min = std::max(min_t, min_c);
        result.overlap_max = std::min(max_t, max_c);

        return result;
    }

    /**
     * @brief Match each treated unit to its nearest control and estimate ATT
     *
     * ATT = mean over treated of (Y_i - Y_match(i)).
     */
    MatchingResult match(
        const Eigen::VectorXd& Y,
        const Eigen::VectorXd& D,
        const Eigen::VectorXd& scores
    ) const {
        int n = Y.size();
        if (D.size() != n || scores.size() != n) {
            throw std::invalid_argument("Y, D and scores must have the same length");
        }

        MatchingResult result;
        std::vector<int> control_idx;
        for (int i = 0; i < n; ++i) {
            if (D(i) > 0.5) result.treated_idx.push_back(i);
            else control_idx.push_back(i);
        }
        if (result.treated_idx.empty() || control_idx.empty()) {
            throw std::invalid_argument("Matching requires both treated and control units");
        }

        SortedIndex1D control_index;
        control_index.build(scores, control_idx);

        int n_t = static_cast<int>(result.treated_idx.size());
        result.matches.resize(n_t);
        double sum_diff = 0.0;
        for (int t = 0; t < n_t; ++t) {
            int i = result.treated_idx[t];
            int j = control_index.nearest(scores(i)).second;
            result.matches[t] = j;
            sum_diff += Y(i) - Y(j);
        }
        result.att = sum_diff / n_t;

        std::vector<int> used = result.matches;
        std::sort(used.begin(), used.end());
        result.n_matched_control =
            static_cast<int>(std::unique(used.begin(), used.end()) - used.begin());

        return result;
    }
};

} // namespace dagstat

#endif // DAGSTAT_PSM_H
