#include "causal/fitting.h"
#include "causal/psm.h"
#include "synthetic_data.h"
#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>

using namespace dagstat;

void test_ols_by_name() {
    std::cout << "Testing OLS keyed by column name..." << std::endl;
    std::mt19937 gen(7);
    const int n = 500;
    Eigen::VectorXd x1 = synthetic::normal(n, gen);
    Eigen::VectorXd x2 = synthetic::normal(n, gen);
    Eigen::VectorXd y = (1.0 + 2.0 * x1.array() - x2.array()).matrix() + synthetic::normal(n, gen, 0.1);

    Dataset d;
    d.add_column("x1", x1).add_column("x2", x2).add_column("y", y);

    fitting::RegressionStatistics res = fitting::ols(d, "y", {"x1", "x2"});
    assert(res.names().size() == 3);
    assert(res.names()[0] == fitting::kIntercept);
    assert(std::abs(res.coefficient("Intercept") - 1.0) < 0.05);
    assert(std::abs(res.coefficient("x1") - 2.0) < 0.05);
    assert(std::abs(res.coefficient("x2") + 1.0) < 0.05);
    assert(res.std_err("x1") > 0);
    assert(res.pvalue("x1") < 1e-6);
    auto ci = res.conf_int("x1");
    assert(ci.first < res.coefficient("x1") && res.coefficient("x1") < ci.second);
    assert(res.n_obs() == n);
    assert(res.df_resid() == n - 3);
    assert(res.has("x2") && !res.has("x3"));

    bool threw = false;
    try {
        res.coefficient("x3");
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        fitting::ols(d, "y", {"nope"});
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] OLS" << std::endl;
}

void test_two_stage_least_squares() {
    std::cout << "Testing 2SLS..." << std::endl;
    Dataset d = synthetic::instrumented(5000, 123, 0.5);

    fitting::RegressionStatistics iv = fitting::two_stage_least_squares(
        d, "income", "education", "proximity", {});
    assert(iv.names().size() == 2);
    assert(iv.names()[1] == "education");
    assert(std::abs(iv.coefficient("education") - 2.0) < 0.2);

    // Naive OLS is biased upward by the latent ability
    fitting::RegressionStatistics naive = fitting::ols(d, "income", {"education"});
    assert(naive.coefficient("education") > iv.coefficient("education"));
    assert(iv.std_err("education") > naive.std_err("education"));
    std::cout << "[PASS] 2SLS" << std::endl;
}

void test_first_stage_f() {
    std::cout << "Testing first-stage F..." << std::endl;
    Dataset strong = synthetic::instrumented(5000, 123, 0.5);
    Dataset weak = synthetic::instrumented(5000, 123, 0.01);
    double f_strong = fitting::first_stage_f_test(strong, "education", "proximity", {});
    double f_weak = fitting::first_stage_f_test(weak, "education", "proximity", {});
    std::cout << "F strong = " << f_strong << ", F weak = " << f_weak << std::endl;
    assert(f_strong > 100.0);
    assert(f_weak < 10.0);
    std::cout << "[PASS] First-stage F" << std::endl;
}

void test_logit() {
    std::cout << "Testing propensity model..." << std::endl;
    Dataset d = synthetic::binary_treatment(1000, 42);
    Eigen::VectorXd p = fitting::logit(d, "education", {"ability"});
    assert(p.size() == 1000);
    assert(p.minCoeff() > 0.0 && p.maxCoeff() < 1.0);
    // Score equations with an intercept: fitted shares sum to the treated count
    assert(std::abs(p.sum() - d.column("education").sum()) < 1e-4);

    // Higher ability means a higher propensity
    const Eigen::VectorXd& a = d.column("ability");
    Eigen::Index lo, hi;
    a.minCoeff(&lo);
    a.maxCoeff(&hi);
    assert(p(hi) > p(lo));

    double att = fitting::nearest_neighbor_att(d, "income", "education", p);
    assert(std::abs(att - 2.0) < 0.5);
    std::cout << "[PASS] Logit" << std::endl;
}

void test_matcher() {
    std::cout << "Testing nearest-neighbour matcher..." << std::endl;
    Eigen::VectorXd y(6), d(6), s(6);
    y << 10, 12, 1, 2, 3, 5;
    d << 1, 1, 0, 0, 0, 0;
    s << 0.5, 0.875, 0.75, 0.25, 0.8125, 0.8125;

    PropensityScoreMatcher matcher;
    MatchingResult m = matcher.match(y, d, s);
    // 0.5 is equidistant from 0.75 (row 2) and 0.25 (row 3): first row wins
    assert(m.matches[0] == 2);
    // Rows 4 and 5 share the nearest score: first row wins
    assert(m.matches[1] == 4);
    assert(std::abs(m.att - ((10 - 1) + (12 - 3)) / 2.0) < 1e-12);
    assert(m.n_matched_control == 2);
    assert(m.treated_idx == (std::vector<int>{0, 1}));

    bool threw = false;
    try {
        matcher.match(y, Eigen::VectorXd::Zero(6), s);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    PropensityScoreResult ps = matcher.estimate_propensity(d, Eigen::MatrixXd(6, 0));
    assert(ps.n_treated == 2 && ps.n_control == 4);
    assert(std::abs(ps.scores(0) - 1.0 / 3.0) < 1e-8);
    assert(std::abs(ps.overlap_min - ps.overlap_max) < 1e-8);
    std::cout << "[PASS] Matcher" << std::endl;
}

int main() {
    std::cout << "--- Fitting Test ---" << std::endl;
    test_ols_by_name();
    test_two_stage_least_squares();
    test_first_stage_f();
    test_logit();
    test_matcher();
    std::cout << "Fitting Test Passed!" << std::endl;
    return 0;
}
