/**
 * @file resampling.h
 * @brief DagStat - Resampling Methods
 *
 * Implements:
 *   - Row-index bootstrap of an arbitrary scalar statistic
 *   - Seeded label permutation
 *   - Percentile and dispersion summaries of a bootstrap distribution
 *
 * Features:
 *   - Parallel execution via OpenMP
 *   - Reproducible: per-replicate seeds are drawn from one master generator
 *     before the parallel region, so results do not depend on thread count
 */

#ifndef DAGSTAT_RESAMPLING_H
#define DAGSTAT_RESAMPLING_H

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <exception>
#include <random>
#include <stdexcept>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

// Optional OpenMP support
#ifdef _OPENMP
#include <omp.h>
#endif

namespace dagstat {

struct BootstrapDistribution {
    Eigen::VectorXd values;     // successful replicates, in replicate order
    int n_requested = 0;
    int n_failed = 0;
};

class Resampler {
public:
    unsigned int seed = 42;
    bool parallel = true;
    int n_jobs = -1;  // -1 means use all available cores

    Resampler() {}

    // =========================================================================
    // Bootstrap
    // =========================================================================

    /**
     * @brief I.I.D. bootstrap over row indices
     *
     * @param n Number of rows in the original data
     * @param func Takes a vector of n row indices drawn with replacement and
     *             returns the statistic. A replicate whose func throws
     *             std::exception is skipped and counted in n_failed.
     * @param n_reps Number of bootstrap repetitions
     */
    template <typename Func>
    BootstrapDistribution bootstrap_indices(int n, Func func, int n_reps = 1000) const {
        if (n <= 0) throw std::invalid_argument("Bootstrap requires at least one row");
        if (n_reps <= 0) throw std::invalid_argument("n_reps must be positive");

        // Prepare seeds for parallel execution
        std::vector<unsigned int> seeds(n_reps);
        std::mt19937 master_gen(seed);
        for (int i = 0; i < n_reps; ++i) seeds[i] = master_gen();

        std::vector<double> slots(n_reps, 0.0);
        std::vector<char> ok(n_reps, 0);

        int n_threads = determine_threads();
        (void)n_threads;

#ifdef _OPENMP
        #pragma omp parallel for num_threads(n_threads) if(parallel) schedule(dynamic)
#endif
        for (int b = 0; b < n_reps; ++b) {
            std::mt19937 gen(seeds[b]);
            std::uniform_int_distribution<int> dist(0, n - 1);
            std::vector<int> idx(n);
            for (int i = 0; i < n; ++i) idx[i] = dist(gen);

            // Exceptions must not leave the parallel region
            try {
                double stat = func(idx);
                if (std::isfinite(stat)) {
                    slots[b] = stat;
                    ok[b] = 1;
                }
            } catch (const std::exception& e) {
                spdlog::debug("[bootstrap] replicate {} failed: {}", b, e.what());
            }
        }

        BootstrapDistribution result;
        result.n_requested = n_reps;
        int n_ok = static_cast<int>(std::count(ok.begin(), ok.end(), 1));
        result.values.resize(n_ok);
        int k = 0;
        for (int b = 0; b < n_reps; ++b) {
            if (ok[b]) result.values(k++) = slots[b];
        }
        result.n_failed = n_reps - n_ok;
        if (result.n_failed > 0) {
            spdlog::warn("[bootstrap] skipped {} of {} replicates", result.n_failed, n_reps);
        }
        return result;
    }

    // =========================================================================
    // Permutation
    // =========================================================================

    /**
     * @brief Random permutation of a column, reproducible from seed
     */
    Eigen::VectorXd permute(const Eigen::VectorXd& values) const {
        std::vector<double> v(values.data(), values.data() + values.size());
        std::mt19937 gen(seed);
        std::shuffle(v.begin(), v.end(), gen);
        return Eigen::Map<Eigen::VectorXd>(v.data(), static_cast<Eigen::Index>(v.size()));
    }

    // =========================================================================
    // Utilities
    // =========================================================================

    /**
     * @brief q-th percentile (0..100) with linear interpolation between
     * closest ranks
     */
    static double percentile(const Eigen::VectorXd& values, double q) {
        int B = values.size();
        if (B == 0) throw std::invalid_argument("percentile of an empty distribution");
        std::vector<double> sorted(values.data(), values.data() + B);
        std::sort(sorted.begin(), sorted.end());

        double pos = (q / 100.0) * (B - 1);
        int lo = static_cast<int>(std::floor(pos));
        int hi = std::min(lo + 1, B - 1);
        double frac = pos - lo;
        return sorted[lo] + frac * (sorted[hi] - sorted[lo]);
    }

    // Sample standard deviation (n - 1 denominator)
    static double sample_sd(const Eigen::VectorXd& values) {
        int B = values.size();
        if (B < 2) throw std::invalid_argument("sample_sd requires at least two values");
        double mean = values.mean();
        return std::sqrt((values.array() - mean).square().sum() / (B - 1));
    }

private:
    int determine_threads() const {
        if (!parallel) return 1;
        if (n_jobs > 0) return n_jobs;
        int hw = static_cast<int>(std::thread::hardware_concurrency());
        return hw > 0 ? hw : 1;
    }
};

} // namespace dagstat

#endif // DAGSTAT_RESAMPLING_H
