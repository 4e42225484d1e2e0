#include "schemadiff.hpp"
#include <map>
#include <set>
#include "lib.hpp"
#include "status.hpp"

SchemaDiff::SchemaDiff(const std::vector<ModelDescriptor>& current, const std::vector<ModelDescriptor>& snapshot)
    : current_(current), snapshot_(snapshot) {}

DiffResult SchemaDiff::diff() const {
    DiffResult out;

    // Ordered maps: iteration order is the sorted table name order
    std::map<std::string, const ModelDescriptor*> current_models, snapshot_models;
    std::set<std::string> all_tables;
    for (const auto& m : current_) {
        current_models[m.table_name] = &m;
        all_tables.insert(m.table_name);
    }
    for (const auto& m : snapshot_) {
        snapshot_models[m.table_name] = &m;
        all_tables.insert(m.table_name);
    }

    for (const auto& table : all_tables) {
        auto cur = current_models.find(table);
        auto snp = snapshot_models.find(table);
        bool in_current = cur != current_models.end();
        bool in_snapshot = snp != snapshot_models.end();

        if (in_current && !in_snapshot) {
            status::print(StatusType::Creating, "Model '" + table + "'");
            out.operations.push_back(Operation::create_model(*cur->second));
            out.modified_models.push_back(*cur->second);
            status::print(StatusType::Created, "Model '" + table + "'");
        } else if (in_current && in_snapshot) {
            if (cur->second->same_fields(*snp->second)) continue;
            out.modified_models.push_back(*cur->second);
            auto ops = alter_model(*cur->second, *snp->second);
            out.operations.insert(out.operations.end(), ops.begin(), ops.end());
        } else {
            status::print(StatusType::Removing, "Model '" + table + "'");
            out.operations.push_back(Operation::remove_model(*snp->second));
            status::print(StatusType::Removed, "Model '" + table + "'");
        }
    }
    return out;
}

std::vector<Operation> SchemaDiff::alter_model(const ModelDescriptor& current, const ModelDescriptor& snapshot) const {
    std::vector<Operation> ops;
    status::print(StatusType::Modifying, "Model '" + current.table_name + "'");

    std::set<std::string> all_columns;
    for (const auto& f : current.fields) all_columns.insert(f.column_name);
    for (const auto& f : snapshot.fields) all_columns.insert(f.column_name);

    for (const auto& column : all_columns) {
        const FieldDescriptor* cf = current.find_field(column);
        const FieldDescriptor* sf = snapshot.find_field(column);

        if (cf && !sf) {
            status::print(StatusType::Adding, "Field '" + column + "' to Model '" + current.table_name + "'");
            ops.push_back(Operation::add_field(current.table_name, current.type_identifier, *cf));
            status::print(StatusType::Added, "Field '" + column + "' to Model '" + current.table_name + "'");
        } else if (!cf && sf) {
            // snapshot descriptor: the backwards path re-creates exactly that column
            status::print(StatusType::Removing, "Field '" + column + "' from Model '" + snapshot.table_name + "'");
            ops.push_back(Operation::remove_field(snapshot.table_name, snapshot.type_identifier, *sf));
            status::print(StatusType::Removed, "Field '" + column + "' from Model '" + snapshot.table_name + "'");
        } else if (*cf != *sf) {
            ErrorContext ctx;
            ctx.group = current.group_identifier;
            ctx.table = current.table_name;
            ctx.column = column;
            throw MigrationError(MigrationError::Kind::UnsupportedAlterField,
                format_msg("Field '%s' of Model '%s' changed; altering existing fields is not supported",
                           column.c_str(), current.table_name.c_str()),
                ctx);
        }
    }

    status::print(StatusType::Modified, "Model '" + current.table_name + "'");
    return ops;
}
