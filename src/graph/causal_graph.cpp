#include "causal_graph.h"
#include "../core/errors.h"

#include <algorithm>
#include <functional>
#include <queue>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace dagstat {
namespace graph {

// =============================================================================
// NodeAssertion
// =============================================================================

NodeAssertion& NodeAssertion::causes_one(const std::string& effect) {
    graph_.assert_edge(subject_, effect);
    return *this;
}

NodeAssertion& NodeAssertion::causes(const std::vector<std::string>& effects) {
    for (const auto& effect : effects) {
        causes_one(effect);
    }
    return *this;
}

// =============================================================================
// Mutation
// =============================================================================

CausalGraph& CausalGraph::assert_edge(const std::string& cause, const std::string& effect) {
    if (cause == effect) {
        throw GraphError("Self-loops are not allowed: '" + cause + "'");
    }
    if (has_edge(cause, effect)) {
        throw GraphError("'" + cause + "' -> '" + effect + "' already asserted");
    }

    Edge e{cause, effect};
    edges_.push_back(e);
    index_edge(e);

    if (has_cycle()) {
        unindex_edge(e);
        edges_.pop_back();
        throw GraphError(
            "Asserting '" + cause + "' -> '" + effect + "' would create a cycle. "
            "Causal graphs must be acyclic (DAGs).");
    }

    spdlog::debug("[graph] asserted {} -> {}", cause, effect);
    return *this;
}

void CausalGraph::index_edge(const Edge& e) {
    out_[e.cause].push_back(e.effect);
    in_[e.effect].push_back(e.cause);
    ++incident_[e.cause];
    ++incident_[e.effect];
}

void CausalGraph::unindex_edge(const Edge& e) {
    auto drop = [](std::map<std::string, std::vector<std::string>>& adj,
                   const std::string& key, const std::string& value) {
        auto& list = adj[key];
        list.erase(std::remove(list.begin(), list.end(), value), list.end());
        if (list.empty()) adj.erase(key);
    };
    drop(out_, e.cause, e.effect);
    drop(in_, e.effect, e.cause);

    for (const std::string* n : {&e.cause, &e.effect}) {
        auto it = incident_.find(*n);
        if (it != incident_.end() && --(it->second) == 0) incident_.erase(it);
    }
}

// =============================================================================
// Queries
// =============================================================================

std::set<std::string> CausalGraph::nodes() const {
    std::set<std::string> result;
    for (const auto& kv : incident_) result.insert(kv.first);
    return result;
}

bool CausalGraph::has_edge(const std::string& cause, const std::string& effect) const {
    auto it = out_.find(cause);
    if (it == out_.end()) return false;
    return std::find(it->second.begin(), it->second.end(), effect) != it->second.end();
}

void CausalGraph::require_node(const std::string& node) const {
    if (!has_node(node)) {
        throw std::out_of_range("'" + node + "' is not a node in the causal graph");
    }
}

std::set<std::string> CausalGraph::parents(const std::string& node) const {
    require_node(node);
    auto it = in_.find(node);
    if (it == in_.end()) return {};
    return std::set<std::string>(it->second.begin(), it->second.end());
}

std::set<std::string> CausalGraph::children(const std::string& node) const {
    require_node(node);
    auto it = out_.find(node);
    if (it == out_.end()) return {};
    return std::set<std::string>(it->second.begin(), it->second.end());
}

std::set<std::string> CausalGraph::ancestors(const std::string& node) const {
    require_node(node);
    return reach(node, in_, nullptr);
}

std::set<std::string> CausalGraph::descendants(const std::string& node) const {
    require_node(node);
    return reach(node, out_, nullptr);
}

std::set<std::string> CausalGraph::descendants_avoiding(
    const std::string& start,
    const std::string& blocked
) const {
    require_node(start);
    return reach(start, out_, &blocked);
}

// Iterative DFS with a visited set. Never returns start itself.
std::set<std::string> CausalGraph::reach(
    const std::string& start,
    const std::map<std::string, std::vector<std::string>>& adjacency,
    const std::string* blocked
) const {
    std::set<std::string> visited;
    std::vector<std::string> stack;

    auto push_neighbours = [&](const std::string& n) {
        auto it = adjacency.find(n);
        if (it == adjacency.end()) return;
        for (const auto& next : it->second) {
            if (blocked && next == *blocked) continue;
            if (!visited.count(next)) stack.push_back(next);
        }
    };

    push_neighbours(start);
    while (!stack.empty()) {
        std::string current = stack.back();
        stack.pop_back();
        if (!visited.insert(current).second) continue;
        push_neighbours(current);
    }
    visited.erase(start);
    return visited;
}

// =============================================================================
// Acyclicity (Kahn)
// =============================================================================

std::vector<std::string> CausalGraph::topological_order() const {
    std::map<std::string, size_t> in_degree;
    for (const auto& kv : incident_) {
        auto it = in_.find(kv.first);
        in_degree[kv.first] = (it == in_.end()) ? 0 : it->second.size();
    }

    std::priority_queue<std::string, std::vector<std::string>, std::greater<std::string>> ready;
    for (const auto& kv : in_degree) {
        if (kv.second == 0) ready.push(kv.first);
    }

    std::vector<std::string> order;
    order.reserve(in_degree.size());
    while (!ready.empty()) {
        std::string node = ready.top();
        ready.pop();
        order.push_back(node);

        auto it = out_.find(node);
        if (it == out_.end()) continue;
        for (const auto& child : it->second) {
            if (--in_degree[child] == 0) ready.push(child);
        }
    }
    return order;
}

bool CausalGraph::has_cycle() const {
    // Nodes left unprocessed once the queue drains sit on a cycle
    return topological_order().size() != incident_.size();
}

} // namespace graph
} // namespace dagstat
