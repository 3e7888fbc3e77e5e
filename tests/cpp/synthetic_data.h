// Seeded data generators shared by the estimator tests
#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <limits>
#include <random>
#include <string>
#include <vector>

#include "core/dataset.h"
#include "graph/causal_graph.h"

namespace synthetic {

inline Eigen::VectorXd normal(int n, std::mt19937& gen, double sd = 1.0) {
    std::normal_distribution<double> dist(0.0, sd);
    Eigen::VectorXd v(n);
    for (int i = 0; i < n; ++i) v(i) = dist(gen);
    return v;
}

// Copy with one cell set to NaN
inline dagstat::Dataset with_missing(const dagstat::Dataset& d, const std::string& column, int row) {
    Eigen::VectorXd v = d.column(column);
    v(row) = std::numeric_limits<double>::quiet_NaN();
    return d.with_column(column, v);
}

// Copy without the given row
inline dagstat::Dataset without_row(const dagstat::Dataset& d, int row) {
    std::vector<int> keep;
    for (int i = 0; i < d.rows(); ++i) {
        if (i != row) keep.push_back(i);
    }
    return d.take_rows(keep);
}

// ability -> education -> income, ability -> income; true effect 2
inline dagstat::Dataset confounded(int n, unsigned int seed, bool with_ability = true) {
    std::mt19937 gen(seed);
    Eigen::VectorXd ability = normal(n, gen);
    Eigen::VectorXd education = 0.5 * ability + normal(n, gen);
    Eigen::VectorXd income = 2.0 * education + 0.8 * ability + normal(n, gen);

    dagstat::Dataset d;
    if (with_ability) d.add_column("ability", ability);
    d.add_column("education", education);
    d.add_column("income", income);
    return d;
}

inline dagstat::graph::CausalGraph confounded_graph() {
    dagstat::graph::CausalGraph g;
    g.assume("ability").causes("education", "income");
    g.assume("education").causes("income");
    return g;
}

// proximity -> education -> income with latent ability; true effect 2
inline dagstat::Dataset instrumented(int n, unsigned int seed, double strength) {
    std::mt19937 gen(seed);
    Eigen::VectorXd ability = normal(n, gen);
    Eigen::VectorXd proximity = normal(n, gen);
    Eigen::VectorXd education = strength * proximity + 0.5 * ability + normal(n, gen);
    Eigen::VectorXd income = 2.0 * education + 0.8 * ability + normal(n, gen);

    dagstat::Dataset d;
    d.add_column("proximity", proximity);
    d.add_column("education", education);
    d.add_column("income", income);
    return d;
}

inline dagstat::graph::CausalGraph instrumented_graph() {
    dagstat::graph::CausalGraph g;
    g.assume("proximity").causes("education");
    g.assume("ability").causes("education", "income");
    g.assume("education").causes("income");
    return g;
}

// Binary treatment assigned above the median of a noisy ability index
inline dagstat::Dataset binary_treatment(int n, unsigned int seed) {
    std::mt19937 gen(seed);
    Eigen::VectorXd ability = normal(n, gen);
    Eigen::VectorXd latent = 0.5 * ability + normal(n, gen, 0.5);

    std::vector<double> sorted(latent.data(), latent.data() + n);
    std::nth_element(sorted.begin(), sorted.begin() + n / 2, sorted.end());
    double median = sorted[n / 2];

    Eigen::VectorXd education(n);
    for (int i = 0; i < n; ++i) education(i) = latent(i) > median ? 1.0 : 0.0;
    Eigen::VectorXd income = 2.0 * education + 0.8 * ability + normal(n, gen);

    dagstat::Dataset d;
    d.add_column("ability", ability);
    d.add_column("education", education);
    d.add_column("income", income);
    return d;
}

// 2x2 panel: outcome = 2 + 1.5 g + 3 t + effect * g t + noise
inline dagstat::Dataset two_by_two(int n, unsigned int seed, double effect = 3.0) {
    std::mt19937 gen(seed);
    std::bernoulli_distribution coin(0.5);
    Eigen::VectorXd g(n), t(n);
    for (int i = 0; i < n; ++i) {
        g(i) = coin(gen) ? 1.0 : 0.0;
        t(i) = coin(gen) ? 1.0 : 0.0;
    }
    Eigen::VectorXd noise = normal(n, gen);
    Eigen::VectorXd y = (2.0 + 1.5 * g.array() + 3.0 * t.array() +
                         effect * g.array() * t.array()).matrix() + noise;

    dagstat::Dataset d;
    d.add_column("group", g);
    d.add_column("time", t);
    d.add_column("outcome", y);
    return d;
}

inline dagstat::graph::CausalGraph two_by_two_graph() {
    dagstat::graph::CausalGraph g;
    g.assume("group").causes("outcome");
    g.assume("time").causes("outcome");
    return g;
}

// Randomized binary treatment; true effect 2
inline dagstat::Dataset randomized(int n, unsigned int seed) {
    std::mt19937 gen(seed);
    std::bernoulli_distribution coin(0.5);
    Eigen::VectorXd t(n);
    for (int i = 0; i < n; ++i) t(i) = coin(gen) ? 1.0 : 0.0;
    Eigen::VectorXd y = (1.0 + 2.0 * t.array()).matrix() + normal(n, gen);

    dagstat::Dataset d;
    d.add_column("treatment", t);
    d.add_column("outcome", y);
    return d;
}

} // namespace synthetic
