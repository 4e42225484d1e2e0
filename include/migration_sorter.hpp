#pragma once
#include <algorithm>
#include <map>
#include <set>
#include <string>
#include <tuple>
#include <utility>
#include <vector>
#include "lib.hpp"
#include "opgraph.hpp"
#include "operation.hpp"

struct SortOptions {
    // Skip dependencies on groups absent from the collection (generation time
    // only sees the migrations of one group). Unknown targets inside a present
    // group are still errors.
    bool allow_external = false;
};

/**
 * Sorts migrations so every dependency comes before its dependents.
 *
 * T must provide group(), name(), dependencies() and operations()
 * (Migration does). Migrations are first ordered by (group, name), so the
 * result is reproducible when dependencies leave a choice.
 *
 * A table may be created again in its group once a RemoveModel dropped it.
 *
 * Throws MigrationError: DuplicateMigration, DuplicateModel,
 * InvalidDependency or CycleDetected (naming a migration on the cycle).
 * On error the input order is kept.
 */
template <class T>
void sort_migrations(std::vector<T>& migrations, const SortOptions& opts = {}) {
    using Key = std::pair<std::string, std::string>;
    using K = MigrationError::Kind;

    std::vector<T> sorted(migrations);
    std::stable_sort(sorted.begin(), sorted.end(), [](const T& a, const T& b) {
        return std::tie(a.group(), a.name()) < std::tie(b.group(), b.name());
    });

    std::map<Key, std::size_t> by_name;
    std::map<Key, std::vector<std::size_t>> by_model; // creators in (group, name) order
    std::map<Key, std::size_t> removals;
    std::set<std::string> groups;
    for (std::size_t i = 0; i < sorted.size(); ++i) {
        const T& m = sorted[i];
        groups.insert(m.group());
        if (!by_name.emplace(Key(m.group(), m.name()), i).second) {
            ErrorContext ctx{m.group(), m.name(), "", ""};
            throw MigrationError(K::DuplicateMigration,
                format_msg("Migration defined twice: %s::%s", m.group().c_str(), m.name().c_str()), ctx);
        }
        for (const auto& op : m.operations()) {
            switch (op.kind) {
                case OpKind::CreateModel: by_model[Key(m.group(), op.table_name)].push_back(i); break;
                case OpKind::RemoveModel: ++removals[Key(m.group(), op.table_name)]; break;
                case OpKind::AddField:
                case OpKind::RemoveField:
                    break;
            }
        }
    }
    // a table may be created again only after it was removed
    for (const auto& [key, creators] : by_model) {
        auto removed = removals.find(key);
        std::size_t allowed = 1 + (removed == removals.end() ? 0 : removed->second);
        if (creators.size() > allowed) {
            const T& m = sorted[creators[allowed]];
            ErrorContext ctx{m.group(), m.name(), key.second, ""};
            throw MigrationError(K::DuplicateModel,
                format_msg("Migration creating model defined twice: %s::%s",
                           key.first.c_str(), key.second.c_str()), ctx);
        }
    }

    graph::Graph g(sorted.size());
    for (std::size_t i = 0; i < sorted.size(); ++i) {
        const T& m = sorted[i];
        for (const auto& dep : m.dependencies()) {
            std::size_t provider = i;
            bool found = false;
            switch (dep.kind) {
                case DepKind::OnMigration: {
                    auto it = by_name.find(Key(dep.group_identifier, dep.target));
                    if (it != by_name.end()) { provider = it->second; found = true; }
                    break;
                }
                case DepKind::OnModel: {
                    auto it = by_model.find(Key(dep.group_identifier, dep.target));
                    if (it == by_model.end()) break;
                    // inside a group the latest creator named before the dependent,
                    // across groups the latest creator
                    const auto& creators = it->second;
                    provider = creators.front();
                    for (std::size_t c : creators) {
                        if (dep.group_identifier != m.group() || c < i) provider = c;
                    }
                    found = true;
                    break;
                }
            }
            if (!found) {
                if (opts.allow_external && !groups.count(dep.group_identifier)) continue;
                ErrorContext ctx{m.group(), m.name(), "", ""};
                if (dep.kind == DepKind::OnModel) ctx.table = dep.target;
                throw MigrationError(K::InvalidDependency,
                    format_msg("Dependency not found: %s (required by %s::%s)",
                               describe(dep).c_str(), m.group().c_str(), m.name().c_str()), ctx);
            }
            g.add_edge(provider, i);
        }
    }

    auto order = g.toposort();
    if (!order) {
        std::vector<std::size_t> cycle = g.find_cycle();
        std::string path;
        for (std::size_t v : cycle) path += sorted[v].group() + "::" + sorted[v].name() + " -> ";
        const T& first = sorted[cycle.front()];
        path += first.group() + "::" + first.name();
        ErrorContext ctx{first.group(), first.name(), "", ""};
        throw MigrationError(K::CycleDetected, "Cycle detected in migrations: " + path, ctx);
    }
    graph::apply_permutation(sorted, *order);
    migrations = std::move(sorted);
}
