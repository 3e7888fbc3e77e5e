#include <iostream>
#include <cassert>
#include <cmath>
#include <limits>
#include <Eigen/Dense>
#include "linear_model/solver.h"
#include "linear_model/ols.h"
#include "linear_model/logistic.h"
#include "stats/distributions.h"

using namespace dagstat;
using namespace Eigen;

void test_simple_ols() {
    std::cout << "Testing Simple OLS (Weights = 1)..." << std::endl;
    MatrixXd X(4, 2);
    X << 1, 1,
         1, 2,
         1, 3,
         1, 4;
    VectorXd y(4);
    y << 6, 5, 7, 10;

    VectorXd w = VectorXd::Ones(4);
    WeightedDesignMatrix wdm(X, w);
    WeightedSolver solver(SolverStrategy::CHOLESKY);

    VectorXd beta = solver.solve(wdm, y);
    VectorXd beta_true = (X.transpose() * X).inverse() * X.transpose() * y;
    std::cout << "Beta: " << beta.transpose() << "  True: " << beta_true.transpose() << std::endl;
    assert((beta - beta_true).norm() < 1e-10);
    std::cout << "[PASS] Coefficients match." << std::endl;
}

void test_weighted() {
    std::cout << "\nTesting Weighted OLS..." << std::endl;
    MatrixXd X(3, 2);
    X << 1, 1,
         1, 2,
         1, 3;
    VectorXd y(3);
    y << 1, 2, 4;
    VectorXd w(3);
    w << 0.1, 0.5, 10.0;

    WeightedDesignMatrix wdm(X, w);
    WeightedSolver solver(SolverStrategy::AUTO);
    VectorXd beta = solver.solve(wdm, y);

    MatrixXd W = w.asDiagonal();
    VectorXd beta_true = (X.transpose() * W * X).inverse() * X.transpose() * W * y;
    assert((beta - beta_true).norm() < 1e-10);
    std::cout << "[PASS] Weighted coefficients match." << std::endl;
}

void test_collinear_fallback() {
    std::cout << "\nTesting collinear design (QR fallback)..." << std::endl;
    MatrixXd X(4, 3);
    X << 1, 1, 2,
         1, 2, 4,
         1, 3, 6,
         1, 4, 8;
    VectorXd y(4);
    y << 1, 2, 3, 4;

    VectorXd w = VectorXd::Ones(4);
    WeightedDesignMatrix wdm(X, w);
    WeightedSolver solver(SolverStrategy::AUTO);
    VectorXd beta = solver.solve(wdm, y);
    std::cout << "Strategy: " << solver.current_strategy_name() << std::endl;
    assert(solver.current_strategy_name() == "QR (Fallback)");
    assert(solver.rank() == 2);
    assert((X * beta - y).norm() < 1e-8);

    bool threw = false;
    try {
        fit_ols_full(X.rightCols(2), y);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Collinear design handled." << std::endl;
}

void test_ols_inference() {
    std::cout << "\nTesting OLS inference..." << std::endl;
    MatrixXd X(6, 1);
    X << 1, 2, 3, 4, 5, 6;
    VectorXd y(6);
    y << 1.1, 1.9, 3.2, 3.8, 5.1, 6.0;

    OLSResult res = fit_ols_full(X, y);
    assert(res.n_params == 2);
    assert(res.df_resid == 4);
    assert(std::abs(res.coef(0) - 0.991429) < 1e-5);
    assert(res.conf_int(1, 0) < res.coef(0) && res.coef(0) < res.conf_int(1, 1));
    assert(res.p_values(1) < 1e-4);
    // Interval half-width is t_{0.975, 4} * se
    double half = 0.5 * (res.conf_int(1, 1) - res.conf_int(1, 0));
    assert(std::abs(half - 2.776445 * res.std_errors(1)) < 1e-4);

    // Missing values are an input error, never a NaN result
    VectorXd y_nan = y;
    y_nan(4) = std::numeric_limits<double>::quiet_NaN();
    bool threw = false;
    try {
        fit_ols_full(X, y_nan);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] OLS inference." << std::endl;
}

void test_logistic() {
    std::cout << "\nTesting logistic IRLS..." << std::endl;
    // Intercept only: fitted probability equals the sample share
    VectorXd y(8);
    y << 1, 0, 0, 1, 1, 0, 1, 1;
    MatrixXd X(8, 0);
    LogisticRegression logit;
    LogisticResult res = logit.fit(X, y);
    assert(res.converged);
    VectorXd p = logit.predict_prob(X, res);
    assert(std::abs(p(0) - 0.625) < 1e-8);
    assert(std::abs(p(7) - 0.625) < 1e-8);
    std::cout << "[PASS] Logistic." << std::endl;
}

void test_distributions() {
    std::cout << "\nTesting distribution functions..." << std::endl;
    assert(std::abs(stats::normal_cdf(1.959964) - 0.975) < 1e-6);
    assert(std::abs(stats::normal_quantile(0.975) - 1.959964) < 1e-5);
    assert(std::abs(stats::t_quantile(0.975, 10) - 2.228139) < 1e-5);
    assert(std::abs(stats::t_cdf(2.228139, 10) - 0.975) < 1e-6);
    assert(std::abs(stats::f_cdf(4.964603, 1, 10) - 0.95) < 1e-5);
    std::cout << "[PASS] Distributions." << std::endl;
}

int main() {
    test_simple_ols();
    test_weighted();
    test_collinear_fallback();
    test_ols_inference();
    test_logistic();
    test_distributions();
    std::cout << "Solver Test Passed!" << std::endl;
    return 0;
}
