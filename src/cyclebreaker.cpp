#include "cyclebreaker.hpp"
#include <algorithm>
#include "lib.hpp"
#include "opgraph.hpp"
#include "status.hpp"

namespace {

    // Strips from 'dependent' the foreign keys to the model created by
    // 'provider' and returns the AddField operations restoring them.
    std::vector<Operation> remove_dependency(Operation& dependent, const Operation& provider) {
        if (provider.kind != OpKind::CreateModel) {
            THROW_INVARIANT("%s provides no model and cannot start a cycle", describe(provider).c_str());
        }
        switch (dependent.kind) {
            case OpKind::CreateModel:
                break;
            case OpKind::AddField:
                // AddField has no dependents, it can never sit on a cycle
            case OpKind::RemoveField:
            case OpKind::RemoveModel:
                THROW_INVARIANT("%s should never be part of a cycle", describe(dependent).c_str());
        }

        status::debug("removing foreign keys from " + dependent.table_name + " to " + provider.table_name);

        std::vector<Operation> moved;
        std::vector<FieldDescriptor> retained;
        // current field list: an earlier arc may already have stripped some fields
        for (auto& f : dependent.fields) {
            if (f.references(provider.type_identifier)) {
                moved.push_back(Operation::add_field(dependent.table_name, dependent.type_identifier, f));
            } else {
                retained.push_back(std::move(f));
            }
        }
        dependent.fields = std::move(retained);
        return moved;
    }
}

std::size_t remove_cycles(std::vector<Operation>& ops) {
    graph::Graph g = build_dependency_graph(ops);
    std::vector<graph::Edge> arcs = g.greedy_feedback_arc_set();

    std::size_t moved = 0;
    for (const auto& arc : arcs) {
        // arc endpoints index the diffed operations; appended ones come after them
        const Operation provider = ops[arc.from];
        std::vector<Operation> to_add = remove_dependency(ops[arc.to], provider);
        moved += to_add.size();
        ops.insert(ops.end(), to_add.begin(), to_add.end());
    }
    if (!arcs.empty()) {
        status::debug("broke " + std::to_string(arcs.size()) + " foreign key cycle edge(s), moved "
                      + std::to_string(moved) + " field(s)");
    }
    return moved;
}
