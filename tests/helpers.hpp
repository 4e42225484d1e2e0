#pragma once
#include <string>
#include <vector>
#include "jsonhlp.hpp"
#include "migration.hpp"
#include "model.hpp"

// Helper: build models from a JSON array string
inline std::vector<ModelDescriptor> load_models(const std::string& js, const std::string& group = "app") {
    jdoc doc;
    std::string err;
    if (!jhlp::parse_str(js, doc, &err)) throw std::runtime_error(err);
    return models_from_json(doc, group);
}

inline ModelDescriptor load_model(const std::string& js, const std::string& group = "app") {
    jdoc doc;
    std::string err;
    if (!jhlp::parse_str(js, doc, &err)) throw std::runtime_error(err);
    return ModelDescriptor::from_json(doc, group);
}

inline FieldDescriptor id_field() {
    FieldDescriptor f;
    f.column_name = "id";
    f.type = ColumnType::Integer;
    f.is_primary_key = true;
    f.is_auto_generated = true;
    return f;
}

inline FieldDescriptor fk_field(const std::string& column, const std::string& target_type,
                                const std::string& target_table, const std::string& group = "app") {
    FieldDescriptor f;
    f.column_name = column;
    f.type = ColumnType::Integer;
    f.is_nullable = true;
    f.foreign_key = ForeignKeyTarget{target_type, group, target_table, "id"};
    return f;
}

// model "<Type>" on table "<table>" with an id and the given fields
inline ModelDescriptor make_model(const std::string& type, const std::string& table,
                                  std::vector<FieldDescriptor> extra = {}, const std::string& group = "app") {
    ModelDescriptor m;
    m.group_identifier = group;
    m.table_name = table;
    m.type_identifier = type;
    m.fields.push_back(id_field());
    for (auto& f : extra) m.fields.push_back(std::move(f));
    return m;
}

inline Migration make_migration(const std::string& group, const std::string& name,
                                std::vector<Dependency> deps = {},
                                std::vector<Operation> ops = {},
                                std::vector<ModelDescriptor> models = {}) {
    return Migration(group, name, std::move(deps), std::move(ops), std::move(models));
}
