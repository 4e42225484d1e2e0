#include "schemastate.hpp"
#include "lib.hpp"

namespace {
    MigrationError bad_state(const std::string& msg, const std::string& table, const std::string& column = "") {
        ErrorContext ctx;
        ctx.table = table;
        ctx.column = column;
        return MigrationError(MigrationError::Kind::InvalidState, msg, ctx);
    }
}

SchemaState::SchemaState(const std::vector<ModelDescriptor>& models) {
    for (const auto& m : models) create_table(m.table_name, m.fields);
}

const SchemaState::Columns& SchemaState::columns(const std::string& table) const {
    auto it = tables_.find(table);
    if (it == tables_.end()) throw bad_state("no such table: " + table, table);
    return it->second;
}

void SchemaState::create_table(const std::string& table, const std::vector<FieldDescriptor>& fields) {
    if (tables_.count(table)) throw bad_state("table already exists: " + table, table);
    Columns cols;
    for (const auto& f : fields) cols[f.column_name] = f;
    tables_[table] = std::move(cols);
}

void SchemaState::drop_table(const std::string& table) {
    if (tables_.erase(table) == 0) throw bad_state("no such table: " + table, table);
}

void SchemaState::add_column(const std::string& table, const FieldDescriptor& field) {
    auto it = tables_.find(table);
    if (it == tables_.end()) throw bad_state("no such table: " + table, table, field.column_name);
    if (!it->second.emplace(field.column_name, field).second) {
        throw bad_state("column already exists: " + table + "." + field.column_name, table, field.column_name);
    }
}

void SchemaState::drop_column(const std::string& table, const std::string& column) {
    auto it = tables_.find(table);
    if (it == tables_.end()) throw bad_state("no such table: " + table, table, column);
    if (it->second.erase(column) == 0) {
        throw bad_state("no such column: " + table + "." + column, table, column);
    }
}

void SchemaState::apply_forwards(const Operation& op) {
    switch (op.kind) {
        case OpKind::CreateModel: create_table(op.table_name, op.fields); break;
        case OpKind::AddField:    add_column(op.table_name, op.field); break;
        case OpKind::RemoveField: drop_column(op.table_name, op.field.column_name); break;
        case OpKind::RemoveModel: drop_table(op.table_name); break;
    }
}

void SchemaState::apply_backwards(const Operation& op) {
    switch (op.kind) {
        case OpKind::CreateModel: drop_table(op.table_name); break;
        case OpKind::AddField:    drop_column(op.table_name, op.field.column_name); break;
        case OpKind::RemoveField: add_column(op.table_name, op.field); break;
        case OpKind::RemoveModel: create_table(op.table_name, op.fields); break;
    }
}

void SchemaState::apply_forwards(const std::vector<Operation>& ops) {
    for (const auto& op : ops) apply_forwards(op);
}

void SchemaState::apply_backwards(const std::vector<Operation>& ops) {
    for (auto it = ops.rbegin(); it != ops.rend(); ++it) apply_backwards(*it);
}
