#pragma once
#include <string>
#include <vector>
#include "model.hpp"

// Closed set of schema changes. Consumers switch over every kind without a
// default label so a new kind breaks the build (-Werror=switch).
enum class OpKind { CreateModel, AddField, RemoveField, RemoveModel };

/**
 * Operation
 *  - CreateModel / RemoveModel use 'fields' (RemoveModel keeps the snapshot
 *    fields so the table can be re-created backwards)
 *  - AddField / RemoveField use 'field'
 *  - each operation is reversible on its own
 */
struct Operation {
    OpKind kind = OpKind::CreateModel;
    std::string table_name;
    std::string type_identifier;
    std::vector<FieldDescriptor> fields;
    FieldDescriptor field;

    static Operation create_model(const ModelDescriptor& model);
    static Operation remove_model(const ModelDescriptor& model);
    static Operation add_field(const std::string& table, const std::string& type, const FieldDescriptor& f);
    static Operation remove_field(const std::string& table, const std::string& type, const FieldDescriptor& f);

    bool operator==(const Operation& o) const;
    bool operator!=(const Operation& o) const { return !(*this == o); }
};

std::string op_name(OpKind kind);
std::string describe(const Operation& op); // "AddField(child.parent)"

enum class DepKind { OnMigration, OnModel };

/**
 * Dependency of a whole migration:
 *  - OnMigration: apply after group::migration
 *  - OnModel: apply after whichever migration creates group::table
 */
struct Dependency {
    DepKind kind = DepKind::OnMigration;
    std::string group_identifier;
    std::string target; // migration identifier or table name, depending on kind

    static Dependency on_migration(const std::string& group, const std::string& migration) {
        return Dependency{DepKind::OnMigration, group, migration};
    }
    static Dependency on_model(const std::string& group, const std::string& table) {
        return Dependency{DepKind::OnModel, group, table};
    }

    bool operator==(const Dependency& o) const {
        return kind == o.kind && group_identifier == o.group_identifier && target == o.target;
    }
    bool operator!=(const Dependency& o) const { return !(*this == o); }
};

std::string describe(const Dependency& dep); // "migration blog::m_0001_initial"
