#pragma once
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>
#include "operation.hpp"

namespace graph {

struct Edge {
    std::size_t from;
    std::size_t to;

    bool operator==(const Edge& o) const { return from == o.from && to == o.to; }
};

/**
 * Directed graph over plain indices [0, n).
 * Edges keep insertion order (parallel edges and self-loops allowed).
 */
class Graph {
public:
    explicit Graph(std::size_t vertex_num) : vertex_edges_(vertex_num) {}

    void add_edge(std::size_t from, std::size_t to);

    std::size_t vertex_num() const { return vertex_edges_.size(); }
    const std::vector<Edge>& edges() const { return edges_; }

    // Depth-first sort: vertices are started from the highest index down and
    // the finish stack is reversed, so unconstrained vertices keep index order.
    // std::nullopt if the graph has a cycle.
    std::optional<std::vector<std::size_t>> toposort() const;
    bool is_acyclic() const { return toposort().has_value(); }

    // Vertices of one cycle in edge order, rotated to start at its lowest
    // index. Empty if the graph is acyclic.
    std::vector<std::size_t> find_cycle() const;

    // Approximate minimum feedback arc set (Eades, Lin & Smyth).
    // Returned edges are in insertion order; removing them leaves the graph acyclic.
    std::vector<Edge> greedy_feedback_arc_set() const;

private:
    enum class Visit { NotVisited, Visiting, Visited };
    bool visit(std::size_t index, std::vector<Visit>& visited, std::vector<std::size_t>& stack) const;
    bool find_back_edge(std::size_t index, std::vector<Visit>& visited, std::vector<std::size_t>& path,
                        std::vector<std::size_t>& cycle) const;

    std::vector<std::vector<std::size_t>> vertex_edges_;
    std::vector<Edge> edges_;
};

// items[i] = old items[order[i]]
template <class T>
void apply_permutation(std::vector<T>& items, const std::vector<std::size_t>& order) {
    std::vector<T> sorted;
    sorted.reserve(items.size());
    for (std::size_t idx : order) sorted.push_back(std::move(items[idx]));
    items = std::move(sorted);
}

} // namespace graph

// Edge p -> q: operation q references the model created by operation p.
// Only CreateModel operations are providers; references with no local
// provider are left out (external dependencies).
graph::Graph build_dependency_graph(const std::vector<Operation>& ops);

// Reorders ops in place. Must run after remove_cycles(); a residual cycle
// throws InvariantError.
void toposort_operations(std::vector<Operation>& ops);
