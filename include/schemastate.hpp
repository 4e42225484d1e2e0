#pragma once
#include <map>
#include <string>
#include <vector>
#include "model.hpp"
#include "operation.hpp"

/**
 * Abstract database schema: table -> columns keyed by name (column order
 * is not part of the state).
 * Applies operations forwards (migrate) or backwards (revert) without a
 * database. Throws MigrationError(InvalidState) when an operation does not
 * fit the current state.
 */
class SchemaState {
public:
    using Columns = std::map<std::string, FieldDescriptor>;

    SchemaState() = default;
    explicit SchemaState(const std::vector<ModelDescriptor>& models);

    void apply_forwards(const Operation& op);
    void apply_backwards(const Operation& op);

    // whole migration: forwards first to last, backwards last to first
    void apply_forwards(const std::vector<Operation>& ops);
    void apply_backwards(const std::vector<Operation>& ops);

    bool has_table(const std::string& table) const { return tables_.count(table) != 0; }
    const Columns& columns(const std::string& table) const;
    const std::map<std::string, Columns>& tables() const { return tables_; }

    bool operator==(const SchemaState& o) const { return tables_ == o.tables_; }
    bool operator!=(const SchemaState& o) const { return !(*this == o); }

private:
    void create_table(const std::string& table, const std::vector<FieldDescriptor>& fields);
    void drop_table(const std::string& table);
    void add_column(const std::string& table, const FieldDescriptor& field);
    void drop_column(const std::string& table, const std::string& column);

    std::map<std::string, Columns> tables_;
};
