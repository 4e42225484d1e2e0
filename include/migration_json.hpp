#pragma once
#include <string>
#include <vector>
#include "jsonhlp.hpp"
#include "migration.hpp"

#define PROP_OP           "op"
#define PROP_MIGRATION    "migration"
#define PROP_DEPENDENCIES "dependencies"
#define PROP_OPERATIONS   "operations"
#define PROP_MODELS       "models"

#define OP_CREATE_MODEL "create_model"
#define OP_ADD_FIELD    "add_field"
#define OP_REMOVE_FIELD "remove_field"
#define OP_REMOVE_MODEL "remove_model"

#define MIGRATION_FILE_EXT ".json"

// Codec of migration documents. Every reader throws
// MigrationError(InvalidDocument) on malformed input.
namespace mjson {

    jval operation_to_json(const Operation& op, jdaloc& a);
    Operation operation_from_json(const jval& j);

    jval dependency_to_json(const Dependency& dep, jdaloc& a);
    Dependency dependency_from_json(const jval& j);

    jval migration_to_json(const Migration& m, jdaloc& a);
    Migration migration_from_json(const jval& j);

    std::string to_string(const Migration& m);
    Migration from_string(const std::string& text);

    std::vector<ModelDescriptor> load_models_file(const std::string& path, const std::string& default_group);

    Migration load_migration_file(const std::string& path);
    // writes <dir>/<name>.json and returns the path
    std::string save_migration_file(const std::string& dir, const Migration& m);

    // every *.json file of dir, in file name order; a missing dir is empty
    std::vector<Migration> load_migrations_dir(const std::string& dir);

} // namespace mjson
