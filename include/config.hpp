#pragma once
#include <string>

enum class Dialect { Postgres, Sqlite };

Dialect dialect(const std::string& name);
std::string dialect(Dialect d);

/**
 * Planner configuration file:
 *
 * {
 *   "group": "blog",
 *   "models": "models.json",
 *   "migrations_dir": "migrations",   // default "migrations"
 *   "dialect": "postgres",            // or "sqlite", default "postgres"
 *   "verbose": false
 * }
 *
 * Relative paths are resolved against the directory of the config file.
 */
struct PlannerConfig {
    std::string group;
    std::string models_path;
    std::string migrations_dir;
    Dialect dialect = Dialect::Postgres;
    bool verbose = false;

    // throws ConfigError
    static PlannerConfig from_file(const std::string& path);
    static PlannerConfig from_string(const std::string& text, const std::string& base_dir = ".");
};
