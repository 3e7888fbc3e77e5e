#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/stl.h>

#include "../core/dataset.h"
#include "../core/errors.h"
#include "../graph/causal_graph.h"
#include "../causal/identification.h"
#include "../causal/refutation.h"
#include "../causal/estimators/did.h"
#include "../causal/estimators/instrumental.h"
#include "../causal/estimators/matching.h"
#include "../causal/estimators/observational.h"
#include "../causal/estimators/randomized.h"

namespace py = pybind11;

// --- Module Definition ---

PYBIND11_MODULE(dagstat_core, m) {
    m.doc() = "DagStat Core C++ Module (v1.0)";

    // =========================================================================
    // Errors
    // =========================================================================

    py::register_exception<dagstat::GraphError>(m, "GraphError", PyExc_ValueError);
    py::register_exception<dagstat::ValidationError>(m, "ValidationError", PyExc_ValueError);
    py::register_exception<dagstat::IdentificationError>(m, "IdentificationError", PyExc_RuntimeError);

    // =========================================================================
    // Causal graph
    // =========================================================================

    py::class_<dagstat::graph::NodeAssertion>(m, "NodeAssertion")
        .def_property_readonly("subject", &dagstat::graph::NodeAssertion::subject)
        .def("causes", [](dagstat::graph::NodeAssertion& self, py::args effects) -> dagstat::graph::NodeAssertion& {
                 std::vector<std::string> names;
                 for (auto e : effects) names.push_back(e.cast<std::string>());
                 return self.causes(names);
             }, py::return_value_policy::reference_internal);

    py::class_<dagstat::graph::CausalGraph>(m, "CausalGraph")
        .def(py::init<>())
        .def("assert_edge", &dagstat::graph::CausalGraph::assert_edge,
             py::arg("cause"), py::arg("effect"), py::return_value_policy::reference_internal)
        .def("assume", &dagstat::graph::CausalGraph::assume, py::arg("node"), py::keep_alive<0, 1>())
        .def_property_readonly("nodes", &dagstat::graph::CausalGraph::nodes)
        .def_property_readonly("edges", [](const dagstat::graph::CausalGraph& g) {
                 std::vector<std::pair<std::string, std::string>> out;
                 for (const auto& e : g.edges()) out.emplace_back(e.cause, e.effect);
                 return out;
             })
        .def("has_node", &dagstat::graph::CausalGraph::has_node)
        .def("has_edge", &dagstat::graph::CausalGraph::has_edge)
        .def("parents", &dagstat::graph::CausalGraph::parents)
        .def("children", &dagstat::graph::CausalGraph::children)
        .def("ancestors", &dagstat::graph::CausalGraph::ancestors)
        .def("descendants", &dagstat::graph::CausalGraph::descendants)
        .def("topological_order", &dagstat::graph::CausalGraph::topological_order)
        .def("__len__", &dagstat::graph::CausalGraph::size);

    // =========================================================================
    // Dataset
    // =========================================================================

    py::class_<dagstat::Dataset>(m, "Dataset")
        .def(py::init<>())
        .def(py::init([](const py::dict& columns) {
                 dagstat::Dataset d;
                 for (auto item : columns) {
                     d.add_column(item.first.cast<std::string>(), item.second.cast<Eigen::VectorXd>());
                 }
                 return d;
             }), py::arg("columns"))
        .def("add_column", &dagstat::Dataset::add_column, py::arg("name"), py::arg("values"),
             py::return_value_policy::reference_internal)
        .def("column", &dagstat::Dataset::column, py::arg("name"))
        .def("has_column", &dagstat::Dataset::has_column)
        .def_property_readonly("column_names", &dagstat::Dataset::column_names)
        .def_property_readonly("rows", &dagstat::Dataset::rows);

    // =========================================================================
    // Identification
    // =========================================================================

    py::class_<dagstat::AdjustmentSet>(m, "AdjustmentSet")
        .def_readonly("observed", &dagstat::AdjustmentSet::observed)
        .def_readonly("missing", &dagstat::AdjustmentSet::missing)
        .def("identified", &dagstat::AdjustmentSet::identified);

    m.def("identify", &dagstat::identify,
          py::arg("graph"), py::arg("treatment"), py::arg("outcome"),
          py::arg("available_columns"), py::arg("excluded") = std::set<std::string>{});

    // =========================================================================
    // Refutation
    // =========================================================================

    py::class_<dagstat::Assumption>(m, "Assumption")
        .def_readonly("description", &dagstat::Assumption::description)
        .def_readonly("testable", &dagstat::Assumption::testable);

    py::class_<dagstat::RefutationCheck>(m, "RefutationCheck")
        .def_readonly("name", &dagstat::RefutationCheck::name)
        .def_readonly("passed", &dagstat::RefutationCheck::passed)
        .def_readonly("detail", &dagstat::RefutationCheck::detail);

    py::class_<dagstat::RefutationReport>(m, "RefutationReport")
        .def_property_readonly("title", &dagstat::RefutationReport::title)
        .def_property_readonly("checks", &dagstat::RefutationReport::checks)
        .def_property_readonly("passed", &dagstat::RefutationReport::passed)
        .def_property_readonly("failed_checks", &dagstat::RefutationReport::failed_checks);

    // =========================================================================
    // Estimates
    // =========================================================================

    py::class_<dagstat::CausalEstimate>(m, "CausalEstimate")
        .def_property_readonly("method", &dagstat::CausalEstimate::method)
        .def_property_readonly("effect", &dagstat::CausalEstimate::effect)
        .def_property_readonly("unadjusted_effect", &dagstat::CausalEstimate::unadjusted_effect)
        .def_property_readonly("std_err", &dagstat::CausalEstimate::std_err)
        .def_property_readonly("conf_int", &dagstat::CausalEstimate::conf_int)
        .def_property_readonly("pvalue", &dagstat::CausalEstimate::pvalue)
        .def_property_readonly("adjustment_set", &dagstat::CausalEstimate::adjustment_set)
        .def_property_readonly("assumptions", &dagstat::CausalEstimate::assumptions)
        .def_property_readonly("treatment", &dagstat::CausalEstimate::treatment)
        .def_property_readonly("outcome", &dagstat::CausalEstimate::outcome)
        .def("refute", &dagstat::CausalEstimate::refute, py::arg("data"));

    py::class_<dagstat::OLSEstimate, dagstat::CausalEstimate>(m, "OLSEstimate");
    py::class_<dagstat::RCTEstimate, dagstat::CausalEstimate>(m, "RCTEstimate");
    py::class_<dagstat::IVEstimate, dagstat::CausalEstimate>(m, "IVEstimate")
        .def_property_readonly("instrument", &dagstat::IVEstimate::instrument);
    py::class_<dagstat::MatchingEstimate, dagstat::CausalEstimate>(m, "MatchingEstimate")
        .def_property_readonly("bootstrap_effects", &dagstat::MatchingEstimate::bootstrap_effects)
        .def_property_readonly("n_bootstrap_failures", &dagstat::MatchingEstimate::n_bootstrap_failures);
    py::class_<dagstat::DiDEstimate, dagstat::CausalEstimate>(m, "DiDEstimate")
        .def_property_readonly("time", &dagstat::DiDEstimate::time)
        .def_property_readonly("naive_diff", &dagstat::DiDEstimate::naive_diff);

    // =========================================================================
    // Estimators (each keeps its graph alive)
    // =========================================================================

    py::class_<dagstat::ObservationalOLS>(m, "ObservationalOLS")
        .def(py::init<const dagstat::graph::CausalGraph&, std::string, std::string>(),
             py::arg("graph"), py::arg("treatment"), py::arg("outcome"), py::keep_alive<1, 2>())
        .def_readwrite("conf_level", &dagstat::ObservationalOLS::conf_level)
        .def("fit", &dagstat::ObservationalOLS::fit, py::arg("data"));

    py::class_<dagstat::InstrumentalVariables>(m, "InstrumentalVariables")
        .def(py::init<const dagstat::graph::CausalGraph&, std::string, std::string, std::string>(),
             py::arg("graph"), py::arg("treatment"), py::arg("outcome"), py::arg("instrument"),
             py::keep_alive<1, 2>())
        .def_readwrite("conf_level", &dagstat::InstrumentalVariables::conf_level)
        .def("fit", &dagstat::InstrumentalVariables::fit, py::arg("data"));

    py::class_<dagstat::PropensityScoreMatching>(m, "PropensityScoreMatching")
        .def(py::init<const dagstat::graph::CausalGraph&, std::string, std::string>(),
             py::arg("graph"), py::arg("treatment"), py::arg("outcome"), py::keep_alive<1, 2>())
        .def_readwrite("conf_level", &dagstat::PropensityScoreMatching::conf_level)
        .def_readwrite("n_bootstrap", &dagstat::PropensityScoreMatching::n_bootstrap)
        .def_readwrite("seed", &dagstat::PropensityScoreMatching::seed)
        .def_readwrite("parallel", &dagstat::PropensityScoreMatching::parallel)
        .def_readwrite("n_jobs", &dagstat::PropensityScoreMatching::n_jobs)
        .def("fit", &dagstat::PropensityScoreMatching::fit, py::arg("data"),
             py::call_guard<py::gil_scoped_release>());

    py::class_<dagstat::RandomizedTrial>(m, "RandomizedTrial")
        .def(py::init<const dagstat::graph::CausalGraph&, std::string, std::string>(),
             py::arg("graph"), py::arg("treatment"), py::arg("outcome"))
        .def_readwrite("conf_level", &dagstat::RandomizedTrial::conf_level)
        .def("fit", &dagstat::RandomizedTrial::fit, py::arg("data"));

    py::class_<dagstat::DifferenceInDifferences>(m, "DifferenceInDifferences")
        .def(py::init<const dagstat::graph::CausalGraph&, std::string, std::string, std::string>(),
             py::arg("graph"), py::arg("group"), py::arg("time"), py::arg("outcome"))
        .def_readwrite("conf_level", &dagstat::DifferenceInDifferences::conf_level)
        .def("fit", &dagstat::DifferenceInDifferences::fit, py::arg("data"));
}
