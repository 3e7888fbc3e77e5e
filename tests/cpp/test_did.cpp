#include "causal/estimators/did.h"
#include "causal/estimators/preconditions.h"
#include "core/errors.h"
#include "synthetic_data.h"
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <string>

using namespace dagstat;

void test_interaction_estimate() {
    std::cout << "Testing 2x2 difference-in-differences..." << std::endl;
    graph::CausalGraph g = synthetic::two_by_two_graph();
    Dataset d = synthetic::two_by_two(1000, 42);

    DiDEstimate res = DifferenceInDifferences(g, "group", "time", "outcome").fit(d);
    std::cout << "DiD: " << res.effect() << "  Naive: " << res.naive_diff() << std::endl;

    assert(res.method() == "Difference-in-Differences");
    assert(res.group() == "group" && res.time() == "time");
    assert(res.treatment() == "group");
    assert(std::abs(res.effect() - 3.0) < 0.3);
    // Post-period gap includes the baseline group difference of 1.5
    assert(std::abs(res.naive_diff() - 4.5) < 0.3);
    assert(res.naive_diff() == res.unadjusted_effect());
    assert(res.std_err() > 0);
    assert(res.conf_int().first < res.effect() && res.effect() < res.conf_int().second);
    std::cout << "[PASS] Interaction estimate" << std::endl;
}

void test_column_name_collision() {
    std::cout << "Testing interaction column collision..." << std::endl;
    graph::CausalGraph g = synthetic::two_by_two_graph();
    Dataset d = synthetic::two_by_two(400, 3);
    // A pre-existing column with the default interaction name must not be overwritten
    Dataset clash = d.with_column("group:time", Eigen::VectorXd::Zero(400));

    DiDEstimate a = DifferenceInDifferences(g, "group", "time", "outcome").fit(d);
    DiDEstimate b = DifferenceInDifferences(g, "group", "time", "outcome").fit(clash);
    assert(std::abs(a.effect() - b.effect()) < 1e-10);
    std::cout << "[PASS] Collision" << std::endl;
}

void test_non_binary_roles() {
    std::cout << "Testing non-binary group and time..." << std::endl;
    graph::CausalGraph g = synthetic::two_by_two_graph();
    Dataset d = synthetic::two_by_two(200, 1);

    Eigen::VectorXd years = d.column("time") * 2020.0;
    bool threw = false;
    try {
        DifferenceInDifferences(g, "group", "time", "outcome").fit(d.with_column("time", years));
    } catch (const ValidationError& e) {
        threw = true;
        assert(std::string(e.what()).find("Time") != std::string::npos);
    }
    assert(threw);

    threw = false;
    try {
        DifferenceInDifferences(g, "group", "time", "outcome")
            .fit(d.with_column("group", Eigen::VectorXd::Zero(200)));
    } catch (const ValidationError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Non-binary roles" << std::endl;
}

void test_roles_distinct() {
    std::cout << "Testing role checks..." << std::endl;
    graph::CausalGraph g = synthetic::two_by_two_graph();
    bool threw = false;
    try {
        DifferenceInDifferences did(g, "group", "group", "outcome");
    } catch (const ValidationError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        DifferenceInDifferences did(g, "group", "period", "outcome");
    } catch (const ValidationError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Roles" << std::endl;
}

void test_missing_values() {
    std::cout << "Testing missing group / time values..." << std::endl;
    graph::CausalGraph g = synthetic::two_by_two_graph();
    Dataset d = synthetic::two_by_two(400, 6);
    Dataset holes = synthetic::with_missing(synthetic::with_missing(d, "group", 5), "time", 9);
    Dataset dropped = synthetic::without_row(synthetic::without_row(d, 9), 5);

    DifferenceInDifferences did(g, "group", "time", "outcome");
    DiDEstimate res = did.fit(holes);
    DiDEstimate ref = did.fit(dropped);
    assert(res.effect() == ref.effect());
    assert(res.naive_diff() == ref.naive_diff());
    assert(res.refute(holes).checks().size() == 3);

    // A NaN never passes the binary check
    bool threw = false;
    try {
        preconditions::require_binary(holes, {"Group", "group"});
    } catch (const ValidationError& e) {
        threw = true;
        assert(std::string(e.what()).find("non-finite") != std::string::npos);
    }
    assert(threw);

    // Nothing left after dropping
    Eigen::VectorXd all_nan = Eigen::VectorXd::Constant(400, std::numeric_limits<double>::quiet_NaN());
    threw = false;
    try {
        did.fit(d.with_column("outcome", all_nan));
    } catch (const ValidationError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Missing values" << std::endl;
}

int main() {
    std::cout << "--- Difference-in-Differences Test ---" << std::endl;
    test_interaction_estimate();
    test_column_name_collision();
    test_non_binary_roles();
    test_roles_distinct();
    test_missing_values();
    std::cout << "Difference-in-Differences Test Passed!" << std::endl;
    return 0;
}
