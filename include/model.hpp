#pragma once
#include <string>
#include <vector>
#include <optional>
#include "jsonhlp.hpp"

/****************** LITERAL CONSTS */
#define PROP_NAME        "name"
#define PROP_TABLE       "table"
#define PROP_GROUP       "group"
#define PROP_PROPERTIES  "properties"
#define PROP_REQUIRED    "required"
#define PROP_TYPE        "type"
#define PROP_ID_PROP     "idprop"
#define PROP_AUTO        "auto"
#define PROP_UNIQUE      "unique"
#define PROP_FOREIGN_KEY "foreignKey"
#define PROP_MODEL       "model"
#define PROP_COLUMN      "column"

#define DEFAULT_FK_COLUMN "id"

enum class ColumnType { String, Integer, Number, Bool, Date, Time, Dt_Time, Tm_Stamp, Bin, Json };

ColumnType column_type(const std::string& type);
std::string column_type(ColumnType type);

// Target of a foreign key. model_type identifies the provider in the
// operation graph; group/table_name identify it across migrations.
struct ForeignKeyTarget {
    std::string model_type;
    std::string group;
    std::string table_name;
    std::string column_name = DEFAULT_FK_COLUMN;

    bool operator==(const ForeignKeyTarget& o) const {
        return model_type == o.model_type && group == o.group
            && table_name == o.table_name && column_name == o.column_name;
    }
    bool operator!=(const ForeignKeyTarget& o) const { return !(*this == o); }
};

struct FieldDescriptor {
    std::string column_name;
    ColumnType  type = ColumnType::String;
    bool        is_primary_key = false;
    bool        is_auto_generated = false;
    bool        is_nullable = false;
    bool        is_unique = false;
    std::optional<ForeignKeyTarget> foreign_key;

    bool references(const std::string& model_type) const {
        return foreign_key && foreign_key->model_type == model_type;
    }

    bool operator==(const FieldDescriptor& o) const {
        return column_name == o.column_name && type == o.type
            && is_primary_key == o.is_primary_key && is_auto_generated == o.is_auto_generated
            && is_nullable == o.is_nullable && is_unique == o.is_unique
            && foreign_key == o.foreign_key;
    }
    bool operator!=(const FieldDescriptor& o) const { return !(*this == o); }
};

/**
 * ModelDescriptor
 *  - One declared table: from current source or from a migration snapshot
 *  - Never mutated after construction; diffing builds new values
 *
 * Notes:
 *  - same_fields() is the "unchanged" test used by the differencer:
 *    field sets keyed by column name, declaration order ignored.
 */
class ModelDescriptor {
public:
    std::string group_identifier;
    std::string table_name;
    std::string type_identifier;
    std::vector<FieldDescriptor> fields;

    const FieldDescriptor* find_field(const std::string& column) const;
    bool same_fields(const ModelDescriptor& other) const;

    bool operator==(const ModelDescriptor& o) const {
        return group_identifier == o.group_identifier && table_name == o.table_name
            && type_identifier == o.type_identifier && fields == o.fields;
    }
    bool operator!=(const ModelDescriptor& o) const { return !(*this == o); }

    // { "name", "table", "group", "properties": {...}, "required": [...] }
    // group falls back to default_group when the document has none.
    static ModelDescriptor from_json(const jval& j, const std::string& default_group = "");
    jval to_json(jdaloc& a) const;
};

// "properties"/"required" codec shared by models and operations.
// Property order is field order; columns missing from "required" are nullable.
std::vector<FieldDescriptor> read_properties(const jval& j, const std::string& owner);
void write_properties(const std::vector<FieldDescriptor>& fields, jval& j, jdaloc& a);

// Reads a models document: an array of models or { "models": [...] }.
std::vector<ModelDescriptor> models_from_json(const jval& j, const std::string& default_group = "");
