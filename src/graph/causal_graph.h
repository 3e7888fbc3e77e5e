/**
 * @file causal_graph.h
 * @brief DagStat v1.0 - Causal Graph
 *
 * Directed acyclic graph of causal assumptions over named variables.
 * An edge (A, B) asserts "A has a direct causal effect on B".
 *
 * Invariants:
 * -----------
 *   - Edges are unique and never self-loops.
 *   - The edge relation is acyclic at every observable point. Each new edge
 *     is appended, the graph is re-checked with Kahn's algorithm, and the
 *     edge is rolled back if a cycle appeared.
 *   - Nodes are derived: the node set is exactly the names appearing in
 *     some edge.
 *
 * Latent (unmeasured) variables are declared like any other node. Whether a
 * node is observed is decided later, against a dataset's columns.
 *
 * Usage:
 * ------
 *   CausalGraph g;
 *   g.assume("ability").causes("education", "income");
 *   g.assume("education").causes("income");
 */
#ifndef DAGSTAT_CAUSAL_GRAPH_H
#define DAGSTAT_CAUSAL_GRAPH_H

#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace dagstat {
namespace graph {

struct Edge {
    std::string cause;
    std::string effect;

    bool operator==(const Edge& other) const {
        return cause == other.cause && effect == other.effect;
    }
};

class CausalGraph;

/**
 * @brief Chaining handle returned by CausalGraph::assume()
 *
 * Holds a reference to the graph and the subject node. Only meant to live
 * for the duration of one chained expression.
 */
class NodeAssertion {
public:
    NodeAssertion(CausalGraph& graph, std::string subject)
        : graph_(graph), subject_(std::move(subject)) {}

    // Assert subject -> effect for each argument, in order
    template <typename... Names>
    NodeAssertion& causes(const std::string& effect, const Names&... more);

    NodeAssertion& causes(const std::vector<std::string>& effects);

    const std::string& subject() const { return subject_; }

private:
    NodeAssertion& causes_one(const std::string& effect);

    CausalGraph& graph_;
    std::string subject_;
};

class CausalGraph {
public:
    CausalGraph() = default;

    /**
     * @brief Assert cause -> effect
     *
     * @throws GraphError on self-loop, duplicate edge, or if the edge would
     *         close a cycle. The graph is unchanged after a rejection.
     */
    CausalGraph& assert_edge(const std::string& cause, const std::string& effect);

    NodeAssertion assume(const std::string& node) { return NodeAssertion(*this, node); }

    std::set<std::string> nodes() const;
    const std::vector<Edge>& edges() const { return edges_; }

    bool has_node(const std::string& node) const { return incident_.count(node) > 0; }
    bool has_edge(const std::string& cause, const std::string& effect) const;
    bool empty() const { return edges_.empty(); }
    size_t size() const { return edges_.size(); }

    // Direct neighbours. Throw std::out_of_range for unknown nodes.
    std::set<std::string> parents(const std::string& node) const;
    std::set<std::string> children(const std::string& node) const;

    // Transitive closure, excluding the node itself
    std::set<std::string> ancestors(const std::string& node) const;
    std::set<std::string> descendants(const std::string& node) const;

    /**
     * @brief Descendants of start along paths that never enter blocked
     *
     * Any path is cut the moment it would step onto `blocked`, so neither
     * `blocked` nor anything reachable only through it is returned.
     */
    std::set<std::string> descendants_avoiding(
        const std::string& start,
        const std::string& blocked
    ) const;

    // Kahn ordering of all nodes (ties broken by name)
    std::vector<std::string> topological_order() const;

private:
    bool has_cycle() const;
    void index_edge(const Edge& e);
    void unindex_edge(const Edge& e);
    void require_node(const std::string& node) const;

    std::set<std::string> reach(
        const std::string& start,
        const std::map<std::string, std::vector<std::string>>& adjacency,
        const std::string* blocked
    ) const;

    std::vector<Edge> edges_;

    // Adjacency index, kept in sync with edges_
    std::map<std::string, std::vector<std::string>> out_;
    std::map<std::string, std::vector<std::string>> in_;
    std::map<std::string, int> incident_;   // edges touching each node
};

template <typename... Names>
NodeAssertion& NodeAssertion::causes(const std::string& effect, const Names&... more) {
    causes_one(effect);
    if constexpr (sizeof...(more) > 0) {
        return causes(more...);
    }
    return *this;
}

} // namespace graph
} // namespace dagstat

#endif // DAGSTAT_CAUSAL_GRAPH_H
