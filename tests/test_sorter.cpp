#include <catch2/catch.hpp>
#include "helpers.hpp"
#include "migration_sorter.hpp"

namespace {
    std::vector<std::string> names(const std::vector<Migration>& migrations) {
        std::vector<std::string> out;
        for (const auto& m : migrations) out.push_back(m.group() + "::" + m.name());
        return out;
    }

    MigrationError::Kind sort_error(std::vector<Migration> migrations, const SortOptions& opts = {}) {
        try {
            sort_migrations(migrations, opts);
        } catch (const MigrationError& e) {
            return e.kind();
        }
        FAIL("migrations sorted without error");
        return MigrationError::Kind::InvalidState;
    }
}

TEST_CASE("Unrelated migrations sort by group and name", "[sorter]") {
    std::vector<Migration> migrations = {
        make_migration("shop", "m_0001_initial"),
        make_migration("auth", "m_0002_auto_20240101_000000"),
        make_migration("auth", "m_0001_initial"),
    };
    sort_migrations(migrations);
    REQUIRE(names(migrations) == std::vector<std::string>{
        "auth::m_0001_initial", "auth::m_0002_auto_20240101_000000", "shop::m_0001_initial"});
}

TEST_CASE("Dependencies come first", "[sorter]") {
    std::vector<Migration> migrations = {
        make_migration("auth", "m_0002_auto_20240101_000000",
                       {Dependency::on_migration("auth", "m_0001_initial"), Dependency::on_model("shop", "product")}),
        make_migration("auth", "m_0001_initial"),
        make_migration("shop", "m_0001_initial", {},
                       {Operation::create_model(make_model("Product", "product", {}, "shop"))}),
    };
    sort_migrations(migrations);
    REQUIRE(names(migrations) == std::vector<std::string>{
        "auth::m_0001_initial", "shop::m_0001_initial", "auth::m_0002_auto_20240101_000000"});
}

TEST_CASE("Sort errors", "[sorter]") {
    using K = MigrationError::Kind;

    SECTION("cycle") {
        REQUIRE(sort_error({
            make_migration("a", "m_0001_initial", {Dependency::on_migration("b", "m_0001_initial")}),
            make_migration("b", "m_0001_initial", {Dependency::on_migration("a", "m_0001_initial")}),
        }) == K::CycleDetected);
    }
    SECTION("cycle names a migration on it") {
        std::vector<Migration> migrations = {
            make_migration("c", "m_0001_initial"),
            make_migration("b", "m_0001_initial", {Dependency::on_migration("a", "m_0001_initial")}),
            make_migration("a", "m_0001_initial", {Dependency::on_migration("b", "m_0001_initial"),
                                                   Dependency::on_migration("c", "m_0001_initial")}),
        };
        try {
            sort_migrations(migrations);
            FAIL("cycle accepted");
        } catch (const MigrationError& e) {
            REQUIRE(e.kind() == K::CycleDetected);
            REQUIRE(e.context().group == "a");
            REQUIRE(e.context().migration == "m_0001_initial");
            REQUIRE(std::string(e.what()) ==
                    "Cycle detected in migrations: a::m_0001_initial -> b::m_0001_initial -> a::m_0001_initial");
        }
    }
    SECTION("duplicate migration") {
        REQUIRE(sort_error({make_migration("a", "m_0001_initial"), make_migration("a", "m_0001_initial")})
                == K::DuplicateMigration);
    }
    SECTION("duplicate model") {
        auto create = Operation::create_model(make_model("A", "a"));
        REQUIRE(sort_error({make_migration("a", "m_0001_initial", {}, {create}),
                            make_migration("a", "m_0002_auto_20240101_000000", {}, {create})})
                == K::DuplicateModel);
    }
    SECTION("unknown migration") {
        REQUIRE(sort_error({make_migration("a", "m_0002_auto_20240101_000000",
                                           {Dependency::on_migration("a", "m_0001_initial")})})
                == K::InvalidDependency);
    }
    SECTION("unknown model") {
        REQUIRE(sort_error({make_migration("a", "m_0001_initial", {Dependency::on_model("b", "user")})})
                == K::InvalidDependency);
    }
}

TEST_CASE("Table created again after removal", "[sorter]") {
    auto b = make_model("B", "b");
    std::vector<Migration> migrations = {
        make_migration("app", "m_0003_auto_20240103_000000",
                       {Dependency::on_migration("app", "m_0002_auto_20240102_000000")},
                       {Operation::create_model(b)}),
        make_migration("app", "m_0002_auto_20240102_000000",
                       {Dependency::on_migration("app", "m_0001_initial"), Dependency::on_model("app", "b")},
                       {Operation::remove_model(b)}),
        make_migration("app", "m_0001_initial", {}, {Operation::create_model(b)}),
        // after the re-creation
        make_migration("shop", "m_0001_initial", {Dependency::on_model("app", "b")}),
    };
    sort_migrations(migrations);
    REQUIRE(names(migrations) == std::vector<std::string>{
        "app::m_0001_initial", "app::m_0002_auto_20240102_000000",
        "app::m_0003_auto_20240103_000000", "shop::m_0001_initial"});

    // a third creator needs a second removal
    migrations.push_back(make_migration("app", "m_0004_auto_20240104_000000", {}, {Operation::create_model(b)}));
    try {
        sort_migrations(migrations);
        FAIL("third creator accepted");
    } catch (const MigrationError& e) {
        REQUIRE(e.kind() == MigrationError::Kind::DuplicateModel);
        REQUIRE(e.context().migration == "m_0004_auto_20240104_000000");
        REQUIRE(e.context().table == "b");
    }
}

TEST_CASE("External dependencies may be allowed", "[sorter]") {
    SortOptions opts;
    opts.allow_external = true;

    std::vector<Migration> migrations = {
        make_migration("a", "m_0002_auto_20240101_000000",
                       {Dependency::on_migration("a", "m_0001_initial"), Dependency::on_model("auth", "user")}),
        make_migration("a", "m_0001_initial", {Dependency::on_migration("auth", "m_0001_initial")}),
    };
    sort_migrations(migrations, opts);
    REQUIRE(names(migrations) == std::vector<std::string>{"a::m_0001_initial", "a::m_0002_auto_20240101_000000"});

    // the group is present, so its unknown targets are still errors
    REQUIRE(sort_error({make_migration("a", "m_0002_auto_20240101_000000",
                                       {Dependency::on_migration("a", "m_0001_initial")})},
                       opts) == MigrationError::Kind::InvalidDependency);
}

TEST_CASE("Failed sort keeps the input", "[sorter]") {
    std::vector<Migration> migrations = {
        make_migration("b", "m_0001_initial"),
        make_migration("a", "m_0001_initial", {Dependency::on_migration("c", "m_0001_initial")}),
    };
    REQUIRE_THROWS_AS(sort_migrations(migrations), MigrationError);
    REQUIRE(names(migrations) == std::vector<std::string>{"b::m_0001_initial", "a::m_0001_initial"});
}
