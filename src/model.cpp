#include "model.hpp"
#include <algorithm>
#include <map>
#include "lib.hpp"

namespace {

    MigrationError bad_doc(const std::string& msg, const std::string& table = "", const std::string& column = "") {
        ErrorContext ctx;
        ctx.table = table;
        ctx.column = column;
        return MigrationError(MigrationError::Kind::InvalidDocument, msg, ctx);
    }

    std::optional<ForeignKeyTarget> read_foreign_key(const jval& prop, const std::string& owner, const std::string& column) {
        auto it = prop.FindMember(PROP_FOREIGN_KEY);
        if (it == prop.MemberEnd() || it->value.IsNull()) return std::nullopt;
        const jval& fk = it->value;
        if (!fk.IsObject() || !jhlp::has_string(fk, PROP_MODEL) || !jhlp::has_string(fk, PROP_TABLE)) {
            throw bad_doc(format_msg("%s.%s: foreignKey needs 'model' and 'table'", owner.c_str(), column.c_str()),
                          owner, column);
        }
        ForeignKeyTarget target;
        target.model_type  = jhlp::get<std::string>(fk, PROP_MODEL);
        target.table_name  = jhlp::get<std::string>(fk, PROP_TABLE);
        target.group       = jhlp::get<std::string>(fk, PROP_GROUP);
        target.column_name = jhlp::get<std::string>(fk, PROP_COLUMN, DEFAULT_FK_COLUMN);
        return target;
    }
}

ColumnType column_type(const std::string& type) {
    if (type == "string"   ) return ColumnType::String   ;
    if (type == "integer"  ) return ColumnType::Integer  ;
    if (type == "number"   ) return ColumnType::Number   ;
    if (type == "boolean"  ) return ColumnType::Bool     ;
    if (type == "date"     ) return ColumnType::Date     ;
    if (type == "time"     ) return ColumnType::Time     ;
    if (type == "datetime" ) return ColumnType::Dt_Time  ;
    if (type == "timestamp") return ColumnType::Tm_Stamp ;
    if (type == "binary"   ) return ColumnType::Bin      ;
    if (type == "json"     ) return ColumnType::Json     ;
    throw bad_doc("Invalid type name: " + type);
}

std::string column_type(ColumnType type) {
    switch (type) {
        case ColumnType::String  : return "string"   ;
        case ColumnType::Integer : return "integer"  ;
        case ColumnType::Number  : return "number"   ;
        case ColumnType::Bool    : return "boolean"  ;
        case ColumnType::Date    : return "date"     ;
        case ColumnType::Time    : return "time"     ;
        case ColumnType::Dt_Time : return "datetime" ;
        case ColumnType::Tm_Stamp: return "timestamp";
        case ColumnType::Bin     : return "binary"   ;
        case ColumnType::Json    : return "json"     ;
    }
    return "string";
}

const FieldDescriptor* ModelDescriptor::find_field(const std::string& column) const {
    for (const auto& f : fields) {
        if (f.column_name == column) return &f;
    }
    return nullptr;
}

bool ModelDescriptor::same_fields(const ModelDescriptor& other) const {
    if (fields.size() != other.fields.size()) return false;
    for (const auto& f : fields) {
        const FieldDescriptor* of = other.find_field(f.column_name);
        if (!of || *of != f) return false;
    }
    return true;
}

std::vector<FieldDescriptor> read_properties(const jval& j, const std::string& owner) {
    // local helper
    const auto isrequired = [&](const std::string& name) -> bool {
        auto reqs = j.FindMember(PROP_REQUIRED);
        if (reqs == j.MemberEnd() || !reqs->value.IsArray()) return false;
        for (const auto& el : reqs->value.GetArray()) {
            if (el.IsString() && name == el.GetString()) return true;
        }
        return false;
    };

    auto props = j.FindMember(PROP_PROPERTIES);
    if (props == j.MemberEnd() || !props->value.IsObject()) {
        throw bad_doc(owner + ": missing 'properties' object", owner);
    }

    std::vector<FieldDescriptor> fields;
    for (jit itprop = props->value.MemberBegin(); itprop != props->value.MemberEnd(); ++itprop) {
        FieldDescriptor field;
        field.column_name = itprop->name.GetString();
        const jval& prop = itprop->value;
        if (!prop.IsObject()) {
            throw bad_doc(owner + "." + field.column_name + ": property must be an object", owner, field.column_name);
        }
        for (const auto& seen : fields) {
            if (seen.column_name == field.column_name) {
                throw bad_doc(owner + ": duplicate column " + field.column_name, owner, field.column_name);
            }
        }
        field.type              = column_type(jhlp::get<std::string>(prop, PROP_TYPE, "string"));
        field.is_primary_key    = jhlp::get<bool>(prop, PROP_ID_PROP);
        field.is_auto_generated = jhlp::get<bool>(prop, PROP_AUTO);
        field.is_unique         = jhlp::get<bool>(prop, PROP_UNIQUE);
        field.is_nullable       = !isrequired(field.column_name);
        field.foreign_key       = read_foreign_key(prop, owner, field.column_name);
        fields.push_back(std::move(field));
    }
    return fields;
}

void write_properties(const std::vector<FieldDescriptor>& fields, jval& j, jdaloc& a) {
    jval props(json::kObjectType);
    jval required(json::kArrayType);
    for (const auto& f : fields) {
        jval prop(json::kObjectType);
        jhlp::set(prop, PROP_TYPE, column_type(f.type), a);
        if (f.is_primary_key)    jhlp::set(prop, PROP_ID_PROP, true, a);
        if (f.is_auto_generated) jhlp::set(prop, PROP_AUTO, true, a);
        if (f.is_unique)         jhlp::set(prop, PROP_UNIQUE, true, a);
        if (f.foreign_key) {
            jval fk(json::kObjectType);
            jhlp::set(fk, PROP_MODEL, f.foreign_key->model_type, a);
            jhlp::set(fk, PROP_GROUP, f.foreign_key->group, a);
            jhlp::set(fk, PROP_TABLE, f.foreign_key->table_name, a);
            jhlp::set(fk, PROP_COLUMN, f.foreign_key->column_name, a);
            jhlp::set_value(prop, PROP_FOREIGN_KEY, fk, a);
        }
        jhlp::set_value(props, f.column_name, prop, a);
        if (!f.is_nullable) required.PushBack(jval(f.column_name.c_str(), a).Move(), a);
    }
    jhlp::set_value(j, PROP_PROPERTIES, props, a);
    jhlp::set_value(j, PROP_REQUIRED, required, a);
}

ModelDescriptor ModelDescriptor::from_json(const jval& j, const std::string& default_group) {
    if (!j.IsObject()) throw bad_doc("model must be a JSON object");
    if (!jhlp::has_string(j, PROP_TABLE)) throw bad_doc("model without 'table'");

    ModelDescriptor model;
    model.table_name       = jhlp::get<std::string>(j, PROP_TABLE);
    model.type_identifier  = jhlp::get<std::string>(j, PROP_NAME, model.table_name);
    model.group_identifier = jhlp::get<std::string>(j, PROP_GROUP, default_group);
    model.fields           = read_properties(j, model.table_name);
    // foreign keys without a group point inside the model's own group
    for (auto& f : model.fields) {
        if (f.foreign_key && f.foreign_key->group.empty()) f.foreign_key->group = model.group_identifier;
    }
    return model;
}

jval ModelDescriptor::to_json(jdaloc& a) const {
    jval j(json::kObjectType);
    jhlp::set(j, PROP_NAME, type_identifier, a);
    jhlp::set(j, PROP_TABLE, table_name, a);
    jhlp::set(j, PROP_GROUP, group_identifier, a);
    write_properties(fields, j, a);
    return j;
}

std::vector<ModelDescriptor> models_from_json(const jval& j, const std::string& default_group) {
    const jval* list = &j;
    if (j.IsObject()) {
        auto it = j.FindMember("models");
        if (it == j.MemberEnd()) throw bad_doc("models document needs a 'models' array");
        list = &it->value;
    }
    if (!list->IsArray()) throw bad_doc("models must be a JSON array");

    std::vector<ModelDescriptor> models;
    std::map<std::string, bool> tables;
    for (const auto& m : list->GetArray()) {
        ModelDescriptor model = ModelDescriptor::from_json(m, default_group);
        if (tables.count(model.table_name)) {
            throw bad_doc("table declared twice: " + model.table_name, model.table_name);
        }
        tables[model.table_name] = true;
        models.push_back(std::move(model));
    }
    return models;
}
