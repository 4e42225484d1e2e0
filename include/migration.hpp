#pragma once
#include <string>
#include <vector>
#include "model.hpp"
#include "operation.hpp"

#define MIGRATION_PREFIX "m_"

/**
 * A finalized (or freshly generated) migration of one group.
 *  - models(): snapshot contribution, the descriptors embedded at generation time
 *  - operations(): already ordered, applied first to last
 */
class Migration {
public:
    Migration() = default;
    Migration(std::string group, std::string name,
              std::vector<Dependency> dependencies,
              std::vector<Operation> operations,
              std::vector<ModelDescriptor> models = {})
        : group_(std::move(group)), name_(std::move(name)),
          dependencies_(std::move(dependencies)), operations_(std::move(operations)),
          models_(std::move(models)) {}

    const std::string& group() const { return group_; }
    const std::string& name() const { return name_; }
    const std::vector<Dependency>& dependencies() const { return dependencies_; }
    const std::vector<Operation>& operations() const { return operations_; }
    const std::vector<ModelDescriptor>& models() const { return models_; }

private:
    std::string group_;
    std::string name_;
    std::vector<Dependency> dependencies_;
    std::vector<Operation> operations_;
    std::vector<ModelDescriptor> models_;
};

using GeneratedMigration = Migration;
