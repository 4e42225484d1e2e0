#include "opgraph.hpp"
#include <algorithm>
#include <map>
#include "lib.hpp"
#include "status.hpp"

namespace graph {

void Graph::add_edge(std::size_t from, std::size_t to) {
    if (from >= vertex_num() || to >= vertex_num()) {
        THROW_INVARIANT("edge %zu -> %zu outside graph of %zu vertices", from, to, vertex_num());
    }
    vertex_edges_[from].push_back(to);
    edges_.push_back(Edge{from, to});
}

std::optional<std::vector<std::size_t>> Graph::toposort() const {
    std::vector<Visit> visited(vertex_num(), Visit::NotVisited);
    std::vector<std::size_t> stack;
    stack.reserve(vertex_num());

    for (std::size_t i = vertex_num(); i-- > 0;) {
        if (!visit(i, visited, stack)) return std::nullopt;
    }
    std::reverse(stack.begin(), stack.end());
    return stack;
}

bool Graph::visit(std::size_t index, std::vector<Visit>& visited, std::vector<std::size_t>& stack) const {
    switch (visited[index]) {
        case Visit::Visited:    return true;
        case Visit::Visiting:   return false; // back edge
        case Visit::NotVisited: break;
    }
    visited[index] = Visit::Visiting;
    for (std::size_t next : vertex_edges_[index]) {
        if (!visit(next, visited, stack)) return false;
    }
    visited[index] = Visit::Visited;
    stack.push_back(index);
    return true;
}

std::vector<std::size_t> Graph::find_cycle() const {
    std::vector<Visit> visited(vertex_num(), Visit::NotVisited);
    std::vector<std::size_t> path, cycle;
    for (std::size_t i = 0; i < vertex_num() && cycle.empty(); ++i) {
        find_back_edge(i, visited, path, cycle);
    }
    if (!cycle.empty()) std::rotate(cycle.begin(), std::min_element(cycle.begin(), cycle.end()), cycle.end());
    return cycle;
}

bool Graph::find_back_edge(std::size_t index, std::vector<Visit>& visited, std::vector<std::size_t>& path,
                           std::vector<std::size_t>& cycle) const {
    switch (visited[index]) {
        case Visit::Visited:
            return false;
        case Visit::Visiting:
            // index is on the current path: the cycle is the path from it
            cycle.assign(std::find(path.begin(), path.end(), index), path.end());
            return true;
        case Visit::NotVisited:
            break;
    }
    visited[index] = Visit::Visiting;
    path.push_back(index);
    for (std::size_t next : vertex_edges_[index]) {
        if (find_back_edge(next, visited, path, cycle)) return true;
    }
    path.pop_back();
    visited[index] = Visit::Visited;
    return false;
}

std::vector<Edge> Graph::greedy_feedback_arc_set() const {
    const std::size_t n = vertex_num();
    std::vector<std::vector<std::size_t>> in_edges(n);
    std::vector<long> indeg(n, 0), outdeg(n, 0);
    for (const auto& e : edges_) {
        if (e.from == e.to) continue; // self-loops are always feedback arcs
        in_edges[e.to].push_back(e.from);
        ++outdeg[e.from];
        ++indeg[e.to];
    }

    std::vector<bool> alive(n, true);
    std::size_t remaining = n;
    const auto remove = [&](std::size_t v) {
        alive[v] = false;
        --remaining;
        for (std::size_t w : vertex_edges_[v]) {
            if (w != v && alive[w]) --indeg[w];
        }
        for (std::size_t u : in_edges[v]) {
            if (alive[u]) --outdeg[u];
        }
    };

    std::vector<std::size_t> head, tail; // tail is built back to front
    while (remaining > 0) {
        bool changed = true;
        while (changed) {
            changed = false;
            for (std::size_t v = 0; v < n; ++v) {
                if (alive[v] && outdeg[v] == 0) { tail.push_back(v); remove(v); changed = true; }
            }
        }
        changed = true;
        while (changed) {
            changed = false;
            for (std::size_t v = 0; v < n; ++v) {
                if (alive[v] && indeg[v] == 0) { head.push_back(v); remove(v); changed = true; }
            }
        }
        if (remaining == 0) break;

        // max(outdeg - indeg), lowest index wins ties
        std::size_t best = n;
        for (std::size_t v = 0; v < n; ++v) {
            if (!alive[v]) continue;
            if (best == n || outdeg[v] - indeg[v] > outdeg[best] - indeg[best]) best = v;
        }
        head.push_back(best);
        remove(best);
    }

    std::vector<std::size_t> position(n);
    std::size_t pos = 0;
    for (std::size_t v : head) position[v] = pos++;
    for (auto it = tail.rbegin(); it != tail.rend(); ++it) position[*it] = pos++;

    std::vector<Edge> arcs;
    for (const auto& e : edges_) {
        if (position[e.to] <= position[e.from]) arcs.push_back(e);
    }
    return arcs;
}

} // namespace graph

graph::Graph build_dependency_graph(const std::vector<Operation>& ops) {
    // model type -> index of the CreateModel operation providing it
    std::map<std::string, std::size_t> providers;
    for (std::size_t i = 0; i < ops.size(); ++i) {
        if (ops[i].kind == OpKind::CreateModel) providers[ops[i].type_identifier] = i;
    }

    // (referencing op index, referenced model type)
    std::vector<std::pair<std::size_t, std::string>> references;
    for (std::size_t i = 0; i < ops.size(); ++i) {
        const Operation& op = ops[i];
        switch (op.kind) {
            case OpKind::CreateModel:
                for (const auto& f : op.fields) {
                    if (f.foreign_key) references.emplace_back(i, f.foreign_key->model_type);
                }
                break;
            case OpKind::AddField:
                // the table must exist before a column is added to it
                references.emplace_back(i, op.type_identifier);
                if (op.field.foreign_key) references.emplace_back(i, op.field.foreign_key->model_type);
                break;
            case OpKind::RemoveField:
            case OpKind::RemoveModel:
                break;
        }
    }

    graph::Graph g(ops.size());
    for (const auto& [index, target] : references) {
        auto p = providers.find(target);
        if (p != providers.end()) g.add_edge(p->second, index);
    }
    return g;
}

void toposort_operations(std::vector<Operation>& ops) {
    graph::Graph g = build_dependency_graph(ops);
    auto sorted = g.toposort();
    if (!sorted) {
        THROW_INVARIANT("cycle left in the operation graph of %zu operations after cycle removal", ops.size());
    }
    graph::apply_permutation(ops, *sorted);
    status::debug("sequenced " + std::to_string(ops.size()) + " operations");
}
