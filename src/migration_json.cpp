#include "migration_json.hpp"
#include <algorithm>
#include <filesystem>
#include "lib.hpp"
#include "status.hpp"

namespace fs = std::filesystem;

namespace {

    MigrationError bad_doc(const std::string& msg, const std::string& migration = "", const std::string& table = "") {
        ErrorContext ctx;
        ctx.migration = migration;
        ctx.table = table;
        return MigrationError(MigrationError::Kind::InvalidDocument, msg, ctx);
    }

    const jval& member(const jval& j, const char* key, const std::string& where) {
        auto it = j.FindMember(key);
        if (it == j.MemberEnd()) throw bad_doc(where + ": missing '" + key + "'");
        return it->value;
    }

    std::string required_string(const jval& j, const char* key, const std::string& where) {
        if (!jhlp::has_string(j, key)) throw bad_doc(where + ": missing string '" + key + "'");
        return jhlp::get<std::string>(j, key);
    }

    OpKind op_kind(const std::string& name) {
        if (name == OP_CREATE_MODEL) return OpKind::CreateModel;
        if (name == OP_ADD_FIELD   ) return OpKind::AddField;
        if (name == OP_REMOVE_FIELD) return OpKind::RemoveField;
        if (name == OP_REMOVE_MODEL) return OpKind::RemoveModel;
        throw bad_doc("unknown operation: " + name);
    }

    std::string op_kind(OpKind kind) {
        switch (kind) {
            case OpKind::CreateModel: return OP_CREATE_MODEL;
            case OpKind::AddField:    return OP_ADD_FIELD;
            case OpKind::RemoveField: return OP_REMOVE_FIELD;
            case OpKind::RemoveModel: return OP_REMOVE_MODEL;
        }
        return OP_CREATE_MODEL;
    }
}

namespace mjson {

    jval operation_to_json(const Operation& op, jdaloc& a) {
        jval j(json::kObjectType);
        jhlp::set(j, PROP_OP, op_kind(op.kind), a);
        jhlp::set(j, PROP_TABLE, op.table_name, a);
        jhlp::set(j, PROP_MODEL, op.type_identifier, a);
        switch (op.kind) {
            case OpKind::CreateModel:
            case OpKind::RemoveModel:
                write_properties(op.fields, j, a);
                break;
            case OpKind::AddField:
            case OpKind::RemoveField:
                write_properties({op.field}, j, a);
                break;
        }
        return j;
    }

    Operation operation_from_json(const jval& j) {
        if (!j.IsObject()) throw bad_doc("operation must be a JSON object");
        Operation op;
        op.kind            = op_kind(required_string(j, PROP_OP, "operation"));
        op.table_name      = required_string(j, PROP_TABLE, "operation");
        op.type_identifier = jhlp::get<std::string>(j, PROP_MODEL, op.table_name);

        std::vector<FieldDescriptor> fields = read_properties(j, op.table_name);
        switch (op.kind) {
            case OpKind::CreateModel:
            case OpKind::RemoveModel:
                op.fields = std::move(fields);
                break;
            case OpKind::AddField:
            case OpKind::RemoveField:
                if (fields.size() != 1) {
                    throw bad_doc(op_name(op.kind) + "(" + op.table_name + "): expected exactly one property",
                                  "", op.table_name);
                }
                op.field = std::move(fields.front());
                break;
        }
        return op;
    }

    jval dependency_to_json(const Dependency& dep, jdaloc& a) {
        jval j(json::kObjectType);
        jval target(json::kObjectType);
        jhlp::set(target, PROP_GROUP, dep.group_identifier, a);
        switch (dep.kind) {
            case DepKind::OnMigration:
                jhlp::set(target, PROP_NAME, dep.target, a);
                jhlp::set_value(j, PROP_MIGRATION, target, a);
                break;
            case DepKind::OnModel:
                jhlp::set(target, PROP_TABLE, dep.target, a);
                jhlp::set_value(j, PROP_MODEL, target, a);
                break;
        }
        return j;
    }

    Dependency dependency_from_json(const jval& j) {
        if (!j.IsObject()) throw bad_doc("dependency must be a JSON object");
        auto it = j.FindMember(PROP_MIGRATION);
        if (it != j.MemberEnd() && it->value.IsObject()) {
            return Dependency::on_migration(required_string(it->value, PROP_GROUP, "dependency"),
                                            required_string(it->value, PROP_NAME, "dependency"));
        }
        it = j.FindMember(PROP_MODEL);
        if (it != j.MemberEnd() && it->value.IsObject()) {
            return Dependency::on_model(required_string(it->value, PROP_GROUP, "dependency"),
                                        required_string(it->value, PROP_TABLE, "dependency"));
        }
        throw bad_doc("dependency needs a 'migration' or 'model' object");
    }

    jval migration_to_json(const Migration& m, jdaloc& a) {
        jval j(json::kObjectType);
        jhlp::set(j, PROP_GROUP, m.group(), a);
        jhlp::set(j, PROP_NAME, m.name(), a);

        jval deps(json::kArrayType);
        for (const auto& d : m.dependencies()) deps.PushBack(dependency_to_json(d, a), a);
        jhlp::set_value(j, PROP_DEPENDENCIES, deps, a);

        jval ops(json::kArrayType);
        for (const auto& op : m.operations()) ops.PushBack(operation_to_json(op, a), a);
        jhlp::set_value(j, PROP_OPERATIONS, ops, a);

        jval models(json::kArrayType);
        for (const auto& model : m.models()) models.PushBack(model.to_json(a), a);
        jhlp::set_value(j, PROP_MODELS, models, a);
        return j;
    }

    Migration migration_from_json(const jval& j) {
        if (!j.IsObject()) throw bad_doc("migration must be a JSON object");
        std::string group = required_string(j, PROP_GROUP, "migration");
        std::string name  = required_string(j, PROP_NAME, "migration");
        std::string where = group + "::" + name;

        try {
            std::vector<Dependency> deps;
            const jval& jdeps = member(j, PROP_DEPENDENCIES, where);
            if (!jdeps.IsArray()) throw bad_doc(where + ": 'dependencies' must be an array");
            for (const auto& d : jdeps.GetArray()) deps.push_back(dependency_from_json(d));

            std::vector<Operation> ops;
            const jval& jops = member(j, PROP_OPERATIONS, where);
            if (!jops.IsArray()) throw bad_doc(where + ": 'operations' must be an array");
            for (const auto& o : jops.GetArray()) ops.push_back(operation_from_json(o));

            std::vector<ModelDescriptor> models;
            auto it = j.FindMember(PROP_MODELS);
            if (it != j.MemberEnd()) models = models_from_json(it->value, group);

            return Migration(group, name, std::move(deps), std::move(ops), std::move(models));
        } catch (const MigrationError& e) {
            // re-raise with the migration named
            ErrorContext ctx = e.context();
            ctx.group = group;
            ctx.migration = name;
            throw MigrationError(e.kind(), where + ": " + e.what(), ctx);
        }
    }

    std::string to_string(const Migration& m) {
        jdoc doc;
        jval j = migration_to_json(m, doc.GetAllocator());
        return jhlp::stringify(j, true);
    }

    Migration from_string(const std::string& text) {
        jdoc doc;
        std::string err;
        if (!jhlp::parse_str(text, doc, &err)) throw bad_doc(err);
        return migration_from_json(doc);
    }

    std::vector<ModelDescriptor> load_models_file(const std::string& path, const std::string& default_group) {
        jdoc doc;
        std::string err;
        if (!jhlp::parse_file(path, doc, &err)) throw bad_doc(err);
        return models_from_json(doc, default_group);
    }

    Migration load_migration_file(const std::string& path) {
        jdoc doc;
        std::string err;
        if (!jhlp::parse_file(path, doc, &err)) throw bad_doc(err);
        return migration_from_json(doc);
    }

    std::string save_migration_file(const std::string& dir, const Migration& m) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) THROW("unable to create directory %s: %s", dir.c_str(), ec.message().c_str());

        std::string path = (fs::path(dir) / (m.name() + MIGRATION_FILE_EXT)).string();
        jdoc doc;
        jval j = migration_to_json(m, doc.GetAllocator());
        if (!jhlp::write_file(path, j)) THROW("unable to write migration file %s", path.c_str());
        status::debug("wrote " + path);
        return path;
    }

    std::vector<Migration> load_migrations_dir(const std::string& dir) {
        std::vector<Migration> migrations;
        if (!fs::is_directory(dir)) return migrations;

        std::vector<fs::path> files;
        for (const auto& entry : fs::directory_iterator(dir)) {
            if (entry.is_regular_file() && entry.path().extension() == MIGRATION_FILE_EXT) files.push_back(entry.path());
        }
        std::sort(files.begin(), files.end());
        for (const auto& p : files) {
            status::debug("loading " + p.string());
            migrations.push_back(load_migration_file(p.string()));
        }
        return migrations;
    }

} // namespace mjson
