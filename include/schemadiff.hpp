#pragma once
#include <vector>
#include <string>
#include "model.hpp"
#include "operation.hpp"

struct DiffResult {
    std::vector<ModelDescriptor> modified_models; // embedded in the new migration snapshot
    std::vector<Operation> operations;            // unordered wrt dependencies
};

class SchemaDiff {
public:
    SchemaDiff(const std::vector<ModelDescriptor>& current, const std::vector<ModelDescriptor>& snapshot);

    // Compares current models with the last known snapshot.
    // Tables, then columns, are visited in lexicographic order so the
    // operation list only depends on the inputs.
    // Throws MigrationError(UnsupportedAlterField) when an existing column changed.
    DiffResult diff() const;

private:
    std::vector<Operation> alter_model(const ModelDescriptor& current, const ModelDescriptor& snapshot) const;

    const std::vector<ModelDescriptor>& current_;
    const std::vector<ModelDescriptor>& snapshot_;
};
