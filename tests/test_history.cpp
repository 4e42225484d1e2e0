#include <catch2/catch.hpp>
#include "helpers.hpp"
#include "history.hpp"

namespace {
    // 2024-03-05 14:07:09 UTC
    std::chrono::system_clock::time_point test_time() {
        return std::chrono::system_clock::from_time_t(1709647629);
    }
}

TEST_CASE("First migration is named initial", "[history]") {
    MigrationHistory history;
    REQUIRE(history.empty());
    REQUIRE(history.previous() == nullptr);
    REQUIRE(history.next_migration_name(test_time()) == "m_0001_initial");
}

TEST_CASE("Next migration number follows the last one", "[history]") {
    MigrationHistory history({
        make_migration("app", "m_0002_auto_20240101_000000", {Dependency::on_migration("app", "m_0001_initial")}),
        make_migration("app", "m_0001_initial"),
    });
    REQUIRE(history.previous()->name() == "m_0002_auto_20240101_000000");
    REQUIRE(history.next_migration_name(test_time()) == "m_0003_auto_20240305_140709");
}

TEST_CASE("Sequence numbers", "[history]") {
    REQUIRE(MigrationHistory::sequence_of("m_0001_initial") == 1);
    REQUIRE(MigrationHistory::sequence_of("m_0042_auto_20240101_000000") == 42);
    REQUIRE(MigrationHistory::sequence_of("m_7") == 7);

    for (const char* bad : {"initial", "m__x", "m_12a_auto", "m_xyz_auto", "m_99999999999_x"}) {
        try {
            MigrationHistory::sequence_of(bad);
            FAIL("parsed " << bad);
        } catch (const MigrationError& e) {
            REQUIRE(e.kind() == MigrationError::Kind::InvalidName);
            REQUIRE(e.context().migration == bad);
        }
    }
}

TEST_CASE("Unparsable last migration name", "[history]") {
    MigrationHistory history({make_migration("app", "m_first")});
    REQUIRE_THROWS_AS(history.next_migration_name(test_time()), MigrationError);
}

TEST_CASE("Latest models take the last snapshot of each table", "[history]") {
    auto a1 = make_model("A", "a");
    auto b1 = make_model("B", "b");
    auto a2 = make_model("A", "a", {fk_field("b", "B", "b")});

    MigrationHistory history({
        make_migration("app", "m_0002_auto_20240101_000000", {Dependency::on_migration("app", "m_0001_initial")},
                       {Operation::add_field("a", "A", a2.fields[1])}, {a2}),
        make_migration("app", "m_0001_initial", {},
                       {Operation::create_model(b1), Operation::create_model(a1)}, {b1, a1}),
    });

    auto latest = history.latest_models();
    REQUIRE(latest.size() == 2);
    REQUIRE(latest[0] == a2);
    REQUIRE(latest[1] == b1);
}

TEST_CASE("Removed tables leave the snapshot", "[history]") {
    auto a = make_model("A", "a");
    auto b = make_model("B", "b");

    MigrationHistory history({
        make_migration("app", "m_0001_initial", {}, {Operation::create_model(a), Operation::create_model(b)}, {a, b}),
        make_migration("app", "m_0002_auto_20240101_000000", {Dependency::on_migration("app", "m_0001_initial")},
                       {Operation::remove_model(b)}),
    });

    auto latest = history.latest_models();
    REQUIRE(latest.size() == 1);
    REQUIRE(latest[0] == a);
}

TEST_CASE("History tolerates dependencies on other groups", "[history]") {
    MigrationHistory history({
        make_migration("app", "m_0001_initial", {Dependency::on_model("auth", "user")}),
    });
    REQUIRE(history.migrations().size() == 1);
}
