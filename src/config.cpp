#include "config.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include "lib.hpp"

namespace fs = std::filesystem;

namespace {

    std::string resolve(const std::string& base_dir, const std::string& p) {
        fs::path path(p);
        if (path.is_absolute()) return path.string();
        return (fs::path(base_dir) / path).lexically_normal().string();
    }

    std::string required_string(const nlohmann::json& j, const char* key) {
        auto it = j.find(key);
        if (it == j.end() || !it->is_string() || it->get<std::string>().empty()) {
            throw ConfigError(format_msg("config: '%s' must be a non-empty string", key));
        }
        return it->get<std::string>();
    }

    PlannerConfig from_json(const nlohmann::json& j, const std::string& base_dir) {
        if (!j.is_object()) throw ConfigError("config: document must be a JSON object");

        PlannerConfig cfg;
        cfg.group          = required_string(j, "group");
        cfg.models_path    = resolve(base_dir, required_string(j, "models"));
        cfg.migrations_dir = resolve(base_dir, j.value("migrations_dir", std::string("migrations")));
        cfg.dialect        = dialect(j.value("dialect", std::string("postgres")));
        cfg.verbose        = j.value("verbose", false);
        return cfg;
    }
}

Dialect dialect(const std::string& name) {
    if (name == "postgres" || name == "postgresql") return Dialect::Postgres;
    if (name == "sqlite"   || name == "sqlite3"   ) return Dialect::Sqlite;
    throw ConfigError("config: unknown dialect: " + name);
}

std::string dialect(Dialect d) {
    switch (d) {
        case Dialect::Postgres: return "postgres";
        case Dialect::Sqlite:   return "sqlite";
    }
    return "postgres";
}

PlannerConfig PlannerConfig::from_string(const std::string& text, const std::string& base_dir) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("config: ") + e.what());
    }
    try {
        return from_json(j, base_dir);
    } catch (const nlohmann::json::exception& e) {
        // wrong member types, e.g. "verbose": "yes"
        throw ConfigError(std::string("config: ") + e.what());
    }
}

PlannerConfig PlannerConfig::from_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw ConfigError("config: unable to open " + path);
    std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    std::string base_dir = fs::path(path).parent_path().string();
    return from_string(text, base_dir.empty() ? "." : base_dir);
}
