#include <catch2/catch.hpp>
#include <filesystem>
#include <fstream>
#include "helpers.hpp"
#include "migration_json.hpp"

namespace fs = std::filesystem;

namespace {
    Migration sample() {
        auto a = make_model("A", "a", {fk_field("user", "User", "user", "auth")});
        auto b = make_model("B", "b");
        return make_migration("app", "m_0002_auto_20240101_000000",
                              {Dependency::on_migration("app", "m_0001_initial"), Dependency::on_model("auth", "user")},
                              {Operation::create_model(a), Operation::add_field("a", "A", fk_field("b", "B", "b")),
                               Operation::remove_field("b", "B", fk_field("old", "A", "a")), Operation::remove_model(b)},
                              {a});
    }

    void require_same(const Migration& x, const Migration& y) {
        REQUIRE(x.group() == y.group());
        REQUIRE(x.name() == y.name());
        REQUIRE(x.dependencies() == y.dependencies());
        REQUIRE(x.operations() == y.operations());
        REQUIRE(x.models() == y.models());
    }

    MigrationError::Kind read_error(const std::string& js) {
        try {
            mjson::from_string(js);
        } catch (const MigrationError& e) {
            return e.kind();
        }
        FAIL("document accepted: " << js);
        return MigrationError::Kind::InvalidState;
    }
}

TEST_CASE("Migration document", "[json]") {
    Migration m = sample();
    require_same(mjson::from_string(mjson::to_string(m)), m);
}

TEST_CASE("Migration document layout", "[json]") {
    Migration m = mjson::from_string(R"({
      "group": "app",
      "name": "m_0001_initial",
      "dependencies": [ { "model": { "group": "auth", "table": "user" } } ],
      "operations": [
        { "op": "create_model", "table": "post", "model": "Post",
          "properties": {
            "id": { "type": "integer", "idprop": true, "auto": true },
            "author": { "type": "integer", "foreignKey": { "model": "User", "group": "auth", "table": "user" } }
          },
          "required": ["id"] },
        { "op": "add_field", "table": "post", "model": "Post",
          "properties": { "title": { "type": "string" } }, "required": ["title"] }
      ]
    })");

    REQUIRE(m.dependencies() == std::vector<Dependency>{Dependency::on_model("auth", "user")});
    REQUIRE(m.operations().size() == 2);
    REQUIRE(m.operations()[0].fields.size() == 2);
    REQUIRE(m.operations()[0].fields[1].foreign_key->group == "auth");
    REQUIRE(m.operations()[1].kind == OpKind::AddField);
    REQUIRE(m.operations()[1].field.column_name == "title");
    REQUIRE_FALSE(m.operations()[1].field.is_nullable);
    REQUIRE(m.models().empty());
}

TEST_CASE("Malformed migration documents", "[json]") {
    using K = MigrationError::Kind;
    REQUIRE(read_error("{") == K::InvalidDocument);
    REQUIRE(read_error("[]") == K::InvalidDocument);
    REQUIRE(read_error(R"({ "group": "app" })") == K::InvalidDocument);
    REQUIRE(read_error(R"({ "group": "app", "name": "m_0001_initial", "operations": [] })") == K::InvalidDocument);
    REQUIRE(read_error(R"({ "group": "app", "name": "m_0001_initial", "dependencies": [],
        "operations": [ { "op": "rename_model", "table": "a", "properties": {} } ] })") == K::InvalidDocument);
    REQUIRE(read_error(R"({ "group": "app", "name": "m_0001_initial", "dependencies": [],
        "operations": [ { "op": "add_field", "table": "a",
                          "properties": { "x": { "type": "string" }, "y": { "type": "string" } } } ] })")
            == K::InvalidDocument);
    REQUIRE(read_error(R"({ "group": "app", "name": "m_0001_initial", "dependencies": [ { "app": "x" } ],
        "operations": [] })") == K::InvalidDocument);
}

TEST_CASE("Errors name the migration", "[json]") {
    try {
        mjson::from_string(R"({ "group": "app", "name": "m_0003_x", "dependencies": [], "operations": [ 1 ] })");
        FAIL("document accepted");
    } catch (const MigrationError& e) {
        REQUIRE(e.context().group == "app");
        REQUIRE(e.context().migration == "m_0003_x");
    }
}

TEST_CASE("Migration files", "[json]") {
    const std::string dir = std::string(SCHEMAPLAN_TEST_TMP) + "/migrations";
    fs::remove_all(dir);

    REQUIRE(mjson::load_migrations_dir(dir).empty());

    Migration first = make_migration("app", "m_0001_initial", {}, {Operation::create_model(make_model("B", "b"))},
                                     {make_model("B", "b")});
    Migration second = sample();
    std::string path = mjson::save_migration_file(dir, second);
    REQUIRE(path == (fs::path(dir) / "m_0002_auto_20240101_000000.json").string());
    mjson::save_migration_file(dir, first);

    // not a migration
    { std::ofstream(dir + "/README.txt") << "notes"; }

    auto loaded = mjson::load_migrations_dir(dir);
    REQUIRE(loaded.size() == 2);
    require_same(loaded[0], first);
    require_same(loaded[1], second);
    require_same(mjson::load_migration_file(path), second);

    REQUIRE_THROWS_AS(mjson::load_migration_file(dir + "/missing.json"), MigrationError);
}
