#include "operation.hpp"

Operation Operation::create_model(const ModelDescriptor& model) {
    Operation op;
    op.kind = OpKind::CreateModel;
    op.table_name = model.table_name;
    op.type_identifier = model.type_identifier;
    op.fields = model.fields;
    return op;
}

Operation Operation::remove_model(const ModelDescriptor& model) {
    Operation op = create_model(model);
    op.kind = OpKind::RemoveModel;
    return op;
}

Operation Operation::add_field(const std::string& table, const std::string& type, const FieldDescriptor& f) {
    Operation op;
    op.kind = OpKind::AddField;
    op.table_name = table;
    op.type_identifier = type;
    op.field = f;
    return op;
}

Operation Operation::remove_field(const std::string& table, const std::string& type, const FieldDescriptor& f) {
    Operation op = add_field(table, type, f);
    op.kind = OpKind::RemoveField;
    return op;
}

bool Operation::operator==(const Operation& o) const {
    if (kind != o.kind || table_name != o.table_name || type_identifier != o.type_identifier) return false;
    switch (kind) {
        case OpKind::CreateModel:
        case OpKind::RemoveModel:
            return fields == o.fields;
        case OpKind::AddField:
        case OpKind::RemoveField:
            return field == o.field;
    }
    return false;
}

std::string op_name(OpKind kind) {
    switch (kind) {
        case OpKind::CreateModel: return "CreateModel";
        case OpKind::AddField:    return "AddField";
        case OpKind::RemoveField: return "RemoveField";
        case OpKind::RemoveModel: return "RemoveModel";
    }
    return "";
}

std::string describe(const Operation& op) {
    switch (op.kind) {
        case OpKind::CreateModel:
        case OpKind::RemoveModel:
            return op_name(op.kind) + "(" + op.table_name + ")";
        case OpKind::AddField:
        case OpKind::RemoveField:
            return op_name(op.kind) + "(" + op.table_name + "." + op.field.column_name + ")";
    }
    return "";
}

std::string describe(const Dependency& dep) {
    switch (dep.kind) {
        case DepKind::OnMigration: return "migration " + dep.group_identifier + "::" + dep.target;
        case DepKind::OnModel:     return "model " + dep.group_identifier + "::" + dep.target;
    }
    return "";
}
