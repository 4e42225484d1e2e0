#include "generator.hpp"
#include "cyclebreaker.hpp"
#include "dependencies.hpp"
#include "opgraph.hpp"
#include "schemadiff.hpp"
#include "status.hpp"

std::vector<Operation> MigrationGenerator::plan_operations(std::vector<Operation> ops) {
    remove_cycles(ops);
    toposort_operations(ops);
    return ops;
}

std::optional<GeneratedMigration> MigrationGenerator::generate(const std::vector<ModelDescriptor>& current,
                                                               const MigrationHistory& history,
                                                               std::chrono::system_clock::time_point now) const {
    std::vector<ModelDescriptor> models;
    for (const auto& m : current) {
        if (m.group_identifier == group_) models.push_back(m);
    }
    // snapshot, previous migration and numbering only come from this group
    MigrationHistory own = history.of_group(group_);
    std::vector<ModelDescriptor> snapshot = own.latest_models();

    status::debug("diffing " + std::to_string(models.size()) + " model(s) of group '" + group_ + "' against "
                  + std::to_string(snapshot.size()) + " snapshot model(s)");

    DiffResult diff = SchemaDiff(models, snapshot).diff();
    if (diff.operations.empty()) return std::nullopt;

    std::string name = own.next_migration_name(now);
    std::vector<Operation> ops = plan_operations(std::move(diff.operations));
    std::vector<Dependency> deps = resolve_dependencies(ops, own.previous());

    status::debug("migration " + group_ + "::" + name + ": " + std::to_string(ops.size()) + " operation(s), "
                  + std::to_string(deps.size()) + " dependencies");

    return GeneratedMigration(group_, name, std::move(deps), std::move(ops), std::move(diff.modified_models));
}
