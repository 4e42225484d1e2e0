#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "history.hpp"
#include "migration.hpp"
#include "model.hpp"

/**
 * Builds the next migration of a group:
 *
 * 1. SchemaDiff(current, history.of_group(group).latest_models())
 * 2. remove_cycles() on the raw operations
 * 3. toposort_operations()
 * 4. resolve_dependencies() against the group's previous migration
 *
 * Nothing is returned unless every step succeeded.
 */
class MigrationGenerator {
public:
    explicit MigrationGenerator(std::string group) : group_(std::move(group)) {}

    const std::string& group() const { return group_; }

    // std::nullopt when the models already match the history.
    // 'current' and 'history' may hold other groups; only this group's are used.
    std::optional<GeneratedMigration> generate(const std::vector<ModelDescriptor>& current,
                                               const MigrationHistory& history,
                                               std::chrono::system_clock::time_point now) const;

    // Steps 2 and 3 on an operation list.
    static std::vector<Operation> plan_operations(std::vector<Operation> ops);

private:
    std::string group_;
};
