#include "ddl_visitor.hpp"
#include "status.hpp"

std::string DDLVisitor::forwards(const Operation& op) {
    std::string ddl;
    switch (op.kind) {
        case OpKind::CreateModel: ddl = create_table(op.table_name, op.fields); break;
        case OpKind::AddField:    ddl = add_column(op.table_name, op.field); break;
        case OpKind::RemoveField: ddl = drop_column(op.table_name, op.field.column_name); break;
        case OpKind::RemoveModel: ddl = drop_table(op.table_name); break;
    }
    status::debug("DDLVisitor::forwards(): " + ddl);
    return ddl;
}

std::string DDLVisitor::backwards(const Operation& op) {
    std::string ddl;
    switch (op.kind) {
        case OpKind::CreateModel: ddl = drop_table(op.table_name); break;
        case OpKind::AddField:    ddl = drop_column(op.table_name, op.field.column_name); break;
        case OpKind::RemoveField: ddl = add_column(op.table_name, op.field); break;
        case OpKind::RemoveModel: ddl = create_table(op.table_name, op.fields); break;
    }
    status::debug("DDLVisitor::backwards(): " + ddl);
    return ddl;
}

std::string DDLVisitor::forwards(const std::vector<Operation>& ops) {
    std::ostringstream ddl;
    for (const auto& op : ops) ddl << forwards(op) << "\n";
    return ddl.str();
}

std::string DDLVisitor::backwards(const std::vector<Operation>& ops) {
    std::ostringstream ddl;
    for (auto it = ops.rbegin(); it != ops.rend(); ++it) ddl << backwards(*it) << "\n";
    return ddl.str();
}

std::string DDLVisitor::column_def(const FieldDescriptor& f, bool inline_pk) {
    std::ostringstream col;
    col << f.column_name << " " << sql_type(f);
    if (f.is_primary_key && inline_pk) col << " PRIMARY KEY";
    else if (!f.is_nullable && !f.is_primary_key) col << " NOT NULL";
    if (f.is_unique && !f.is_primary_key) col << " UNIQUE";
    if (f.foreign_key) {
        col << " REFERENCES " << f.foreign_key->table_name << "(" << f.foreign_key->column_name << ")";
    }
    return col.str();
}

std::string DDLVisitor::create_table(const std::string& table, const std::vector<FieldDescriptor>& fields) {
    std::vector<std::string> pk_fields;
    for (const auto& f : fields) {
        if (f.is_primary_key) pk_fields.push_back(f.column_name);
    }
    // a single key column is declared inline, a composite key as a table constraint
    bool inline_pk = pk_fields.size() == 1;

    std::ostringstream ddl;
    ddl << "CREATE TABLE " << table << " (\n";
    size_t i = 0, n = fields.size();
    for (const auto& f : fields) {
        ddl << " " << column_def(f, inline_pk);
        if (++i < n || (!inline_pk && !pk_fields.empty())) ddl << ",\n";
        else ddl << "\n";
    }
    if (!inline_pk && !pk_fields.empty()) {
        ddl << " PRIMARY KEY (";
        for (size_t j = 0; j < pk_fields.size(); ++j) {
            ddl << pk_fields[j];
            if (j + 1 < pk_fields.size()) ddl << ", ";
        }
        ddl << ")\n";
    }
    ddl << ");";
    return ddl.str();
}

std::string DDLVisitor::drop_table(const std::string& table) {
    return "DROP TABLE " + table + ";";
}

std::string DDLVisitor::add_column(const std::string& table, const FieldDescriptor& f) {
    return "ALTER TABLE " + table + " ADD COLUMN " + column_def(f, true) + ";";
}

std::string DDLVisitor::drop_column(const std::string& table, const std::string& column) {
    return "ALTER TABLE " + table + " DROP COLUMN " + column + ";";
}

/* ---------- PostgreSQL ---------- */

std::string PgDDLVisitor::sql_type(const FieldDescriptor& f) {
    switch (f.type) {
        case ColumnType::String:   return "TEXT";
        case ColumnType::Integer:  return f.is_auto_generated ? "SERIAL" : "INTEGER";
        case ColumnType::Number:   return "NUMERIC";
        case ColumnType::Bool:     return "BOOLEAN";
        case ColumnType::Json:     return "JSON";
        case ColumnType::Date:     return "DATE";
        case ColumnType::Time:     return "TIME";
        case ColumnType::Dt_Time:  return "TIMESTAMP";
        case ColumnType::Tm_Stamp: return "TIMESTAMP WITH TIME ZONE";
        case ColumnType::Bin:      return "BYTEA";
    }
    return "TEXT";
}

/* ---------- SQLite ---------- */

std::string SqliteDDLVisitor::sql_type(const FieldDescriptor& f) {
    switch (f.type) {
        case ColumnType::String:   return "TEXT";
        case ColumnType::Integer:  return "INTEGER";
        case ColumnType::Number:   return "REAL";
        case ColumnType::Bool:     return "BOOLEAN";
        case ColumnType::Json:     return "TEXT";
        case ColumnType::Date:     return "DATE";
        case ColumnType::Time:     return "TIME";
        case ColumnType::Dt_Time:  return "TIMESTAMP";
        case ColumnType::Tm_Stamp: return "TEXT";
        case ColumnType::Bin:      return "BLOB";
    }
    return "TEXT";
}

std::string SqliteDDLVisitor::column_def(const FieldDescriptor& f, bool inline_pk) {
    // AUTOINCREMENT is only valid on an inline INTEGER PRIMARY KEY
    if (f.is_auto_generated && f.is_primary_key && inline_pk && f.type == ColumnType::Integer) {
        return f.column_name + " INTEGER PRIMARY KEY AUTOINCREMENT";
    }
    return DDLVisitor::column_def(f, inline_pk);
}
