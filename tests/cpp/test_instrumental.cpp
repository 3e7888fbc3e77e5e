#include "causal/estimators/instrumental.h"
#include "core/errors.h"
#include "synthetic_data.h"
#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

using namespace dagstat;

void test_strong_instrument() {
    std::cout << "Testing 2SLS with a strong instrument..." << std::endl;
    graph::CausalGraph g = synthetic::instrumented_graph();
    Dataset d = synthetic::instrumented(5000, 42, 0.5);

    InstrumentalVariables iv(g, "education", "income", "proximity");
    IVEstimate res = iv.fit(d);
    std::cout << "IV: " << res.effect() << "  Naive: " << res.unadjusted_effect() << std::endl;

    assert(res.method() == "IV (2SLS)");
    assert(res.instrument() == "proximity");
    assert(std::abs(res.effect() - 2.0) < 0.2);
    assert(res.unadjusted_effect() > res.effect());
    assert(res.adjustment_set().empty());
    assert(!res.adjustment_set().count("proximity"));
    assert(res.std_err() > 0);
    assert(res.conf_int().first < res.effect() && res.effect() < res.conf_int().second);
    std::cout << "[PASS] Strong instrument" << std::endl;
}

void test_observed_confounder_as_control() {
    std::cout << "Testing observed confounder used as exogenous control..." << std::endl;
    graph::CausalGraph g = synthetic::instrumented_graph();
    g.assume("region").causes("education", "income");

    std::mt19937 gen(11);
    const int n = 5000;
    Eigen::VectorXd ability = synthetic::normal(n, gen);
    Eigen::VectorXd region = synthetic::normal(n, gen);
    Eigen::VectorXd proximity = synthetic::normal(n, gen);
    Eigen::VectorXd education = 0.5 * proximity + 0.5 * ability + 0.7 * region + synthetic::normal(n, gen);
    Eigen::VectorXd income = 2.0 * education + 0.8 * ability + 1.5 * region + synthetic::normal(n, gen);

    Dataset d;
    d.add_column("proximity", proximity).add_column("region", region);
    d.add_column("education", education).add_column("income", income);

    IVEstimate res = InstrumentalVariables(g, "education", "income", "proximity").fit(d);
    assert(res.adjustment_set() == (std::set<std::string>{"region"}));
    assert(std::abs(res.effect() - 2.0) < 0.2);
    std::cout << "[PASS] Observed confounder" << std::endl;
}

void test_invalid_instruments() {
    std::cout << "Testing invalid instrument construction..." << std::endl;
    graph::CausalGraph g = synthetic::instrumented_graph();
    g.assume("proximity").causes("income");

    bool threw = false;
    try {
        InstrumentalVariables iv(g, "education", "income", "proximity");
    } catch (const ValidationError& e) {
        threw = true;
        assert(std::string(e.what()).find("Exclusion restriction") != std::string::npos);
    }
    assert(threw);

    graph::CausalGraph h = synthetic::instrumented_graph();
    h.assume("weather").causes("income");
    threw = false;
    try {
        InstrumentalVariables iv(h, "education", "income", "weather");
    } catch (const ValidationError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        InstrumentalVariables iv(h, "education", "income", "education");
    } catch (const ValidationError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Invalid instruments" << std::endl;
}

void test_missing_instrument_column() {
    std::cout << "Testing missing instrument column..." << std::endl;
    graph::CausalGraph g = synthetic::instrumented_graph();
    Dataset full = synthetic::instrumented(200, 5, 0.5);
    Dataset d;
    d.add_column("education", full.column("education"));
    d.add_column("income", full.column("income"));

    bool threw = false;
    try {
        InstrumentalVariables(g, "education", "income", "proximity").fit(d);
    } catch (const ValidationError& e) {
        threw = true;
        assert(std::string(e.what()).find("Instrument column 'proximity'") != std::string::npos);
    }
    assert(threw);
    std::cout << "[PASS] Missing instrument column" << std::endl;
}

void test_missing_values() {
    std::cout << "Testing rows with missing values..." << std::endl;
    graph::CausalGraph g = synthetic::instrumented_graph();
    Dataset d = synthetic::instrumented(1000, 13, 0.5);
    Dataset holes = synthetic::with_missing(d, "proximity", 2);
    Dataset dropped = synthetic::without_row(d, 2);

    InstrumentalVariables iv(g, "education", "income", "proximity");
    IVEstimate res = iv.fit(holes);
    assert(res.effect() == iv.fit(dropped).effect());
    assert(std::isfinite(res.std_err()));
    RefutationReport report = res.refute(holes);
    assert(report.checks()[0].detail.find("nan") == std::string::npos);
    std::cout << "[PASS] Missing values" << std::endl;
}

int main() {
    std::cout << "--- Instrumental Variables Test ---" << std::endl;
    test_strong_instrument();
    test_observed_confounder_as_control();
    test_invalid_instruments();
    test_missing_instrument_column();
    test_missing_values();
    std::cout << "Instrumental Variables Test Passed!" << std::endl;
    return 0;
}
