#include "causal/instrument_validation.h"
#include "core/errors.h"
#include <cassert>
#include <iostream>
#include <string>

using dagstat::graph::CausalGraph;

// Returns the ValidationError message, or "" if validation passed
static std::string validation_message(const CausalGraph& g, const std::string& t,
                                      const std::string& y, const std::string& z) {
    try {
        dagstat::validate_instrument(g, t, y, z);
    } catch (const dagstat::ValidationError& e) {
        return e.what();
    }
    return "";
}

void test_valid_instrument() {
    std::cout << "Testing valid instrument..." << std::endl;
    CausalGraph g;
    g.assume("Z").causes("T");
    g.assume("U").causes("T", "Y");
    g.assume("T").causes("Y");
    assert(validation_message(g, "T", "Y", "Z").empty());

    // Indirect relevance through an intermediate node is enough
    CausalGraph h;
    h.assume("Z").causes("W");
    h.assume("W").causes("T");
    h.assume("T").causes("Y");
    assert(validation_message(h, "T", "Y", "Z").empty());
    std::cout << "[PASS] Valid instrument" << std::endl;
}

void test_relevance_failure() {
    std::cout << "Testing relevance failure..." << std::endl;
    CausalGraph g;
    g.assume("T").causes("Y");
    g.assume("Z").causes("Y");
    std::string msg = validation_message(g, "T", "Y", "Z");
    assert(!msg.empty());
    assert(msg.find("does not cause") != std::string::npos);
    std::cout << "[PASS] Relevance" << std::endl;
}

void test_exclusion_failure() {
    std::cout << "Testing exclusion restriction..." << std::endl;
    CausalGraph g;
    g.assume("Z").causes("T", "Y");
    g.assume("T").causes("Y");
    std::string msg = validation_message(g, "T", "Y", "Z");
    assert(msg.find("Exclusion restriction") != std::string::npos);

    // A back door through another variable also violates exclusion
    CausalGraph h;
    h.assume("Z").causes("T", "W");
    h.assume("W").causes("Y");
    h.assume("T").causes("Y");
    assert(validation_message(h, "T", "Y", "Z").find("Exclusion restriction") != std::string::npos);
    std::cout << "[PASS] Exclusion" << std::endl;
}

void test_roles() {
    std::cout << "Testing role checks..." << std::endl;
    CausalGraph g;
    g.assume("Z").causes("T");
    g.assume("T").causes("Y");
    assert(!validation_message(g, "T", "Y", "T").empty());
    assert(!validation_message(g, "T", "Y", "missing").empty());
    std::cout << "[PASS] Roles" << std::endl;
}

int main() {
    std::cout << "--- Instrument Validation Test ---" << std::endl;
    test_valid_instrument();
    test_relevance_failure();
    test_exclusion_failure();
    test_roles();
    std::cout << "Instrument Validation Test Passed!" << std::endl;
    return 0;
}
