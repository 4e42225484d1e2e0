#include <chrono>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include "config.hpp"
#include "ddl_visitor.hpp"
#include "generator.hpp"
#include "history.hpp"
#include "lib.hpp"
#include "migration_json.hpp"
#include "migration_sorter.hpp"
#include "schemastate.hpp"
#include "status.hpp"

namespace {

    void usage() {
        std::cerr << "usage: schemaplan <config.json> make\n"
                  << "       schemaplan <config.json> list\n"
                  << "       schemaplan <config.json> sql <migration> [--backwards]\n"
                  << "       schemaplan <config.json> check" << std::endl;
    }

    std::unique_ptr<DDLVisitor> make_visitor(Dialect d) {
        switch (d) {
            case Dialect::Postgres: return std::make_unique<PgDDLVisitor>();
            case Dialect::Sqlite:   return std::make_unique<SqliteDDLVisitor>();
        }
        return std::make_unique<PgDDLVisitor>();
    }

    int cmd_make(const PlannerConfig& cfg, const MigrationHistory& history) {
        std::vector<ModelDescriptor> models = mjson::load_models_file(cfg.models_path, cfg.group);
        MigrationGenerator generator(cfg.group);
        auto migration = generator.generate(models, history, std::chrono::system_clock::now());
        if (!migration) {
            std::cout << "No changes in group '" << cfg.group << "'" << std::endl;
            return 0;
        }
        std::string path = mjson::save_migration_file(cfg.migrations_dir, *migration);
        std::cout << "[*] " << migration->group() << "::" << migration->name() << " -> " << path << std::endl;
        for (const auto& op : migration->operations()) std::cout << "    " << describe(op) << std::endl;
        for (const auto& dep : migration->dependencies()) std::cout << "    depends on " << describe(dep) << std::endl;
        return 0;
    }

    // every dependency must resolve inside the directory
    int cmd_list(std::vector<Migration> migrations) {
        sort_migrations(migrations);
        for (const auto& m : migrations) {
            std::cout << m.group() << "::" << m.name() << " (" << m.operations().size() << " operations)" << std::endl;
            for (const auto& dep : m.dependencies()) std::cout << "    depends on " << describe(dep) << std::endl;
        }
        return 0;
    }

    int cmd_sql(const PlannerConfig& cfg, const MigrationHistory& history, const std::string& name, bool backwards) {
        for (const auto& m : history.migrations()) {
            if (m.name() != name) continue;
            auto visitor = make_visitor(cfg.dialect);
            std::cout << (backwards ? visitor->backwards(m.operations()) : visitor->forwards(m.operations()));
            return 0;
        }
        std::cerr << "Migration not found: " << name << std::endl;
        return 1;
    }

    // Replays every migration forwards and compares with the recorded snapshot.
    int cmd_check(const MigrationHistory& history) {
        SchemaState replayed;
        for (const auto& m : history.migrations()) replayed.apply_forwards(m.operations());
        if (replayed != SchemaState(history.latest_models())) {
            std::cerr << "Migrations do not reproduce their model snapshots" << std::endl;
            return 1;
        }
        std::cout << "OK: " << history.migrations().size() << " migrations, "
                  << replayed.tables().size() << " tables" << std::endl;
        return 0;
    }
}

int main(int argc, char** argv) {
    if (argc < 3) {
        usage();
        return 2;
    }
    std::string command = argv[2];

    try {
        PlannerConfig cfg = PlannerConfig::from_file(argv[1]);
        status::set_verbose(cfg.verbose);
        std::vector<Migration> migrations = mjson::load_migrations_dir(cfg.migrations_dir);
        if (command == "list") return cmd_list(migrations);

        MigrationHistory history(std::move(migrations));

        if (command == "make") return cmd_make(cfg, history);
        if (command == "check") return cmd_check(history.of_group(cfg.group));
        if (command == "sql" && argc >= 4) {
            bool backwards = argc >= 5 && std::strcmp(argv[4], "--backwards") == 0;
            return cmd_sql(cfg, history, argv[3], backwards);
        }
        usage();
        return 2;
    } catch (const MigrationError& e) {
        std::cerr << "[" << kind_name(e.kind()) << "] " << e.what() << std::endl;
        return 1;
    } catch (const ConfigError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
