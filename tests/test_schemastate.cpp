#include <catch2/catch.hpp>
#include "helpers.hpp"
#include "schemastate.hpp"

TEST_CASE("Operations apply forwards and backwards", "[state]") {
    auto a = make_model("A", "a", {fk_field("b", "B", "b")});
    auto b = make_model("B", "b");
    SchemaState state({a, b});
    const SchemaState before = state;

    std::vector<Operation> ops = {
        Operation::create_model(make_model("C", "c")),
        Operation::add_field("c", "C", fk_field("a", "A", "a")),
        Operation::remove_field("a", "A", a.fields[1]),
        Operation::remove_model(b),
    };

    state.apply_forwards(ops);
    REQUIRE(state.has_table("c"));
    REQUIRE_FALSE(state.has_table("b"));
    REQUIRE(state.columns("c").size() == 2);
    REQUIRE(state.columns("a").count("b") == 0);

    state.apply_backwards(ops);
    REQUIRE(state == before);
    REQUIRE(state.columns("a").at("b") == a.fields[1]);
}

TEST_CASE("Operations that do not fit are rejected", "[state]") {
    SchemaState state({make_model("A", "a")});

    auto expect_invalid = [&](const Operation& op) {
        try {
            state.apply_forwards(op);
        } catch (const MigrationError& e) {
            REQUIRE(e.kind() == MigrationError::Kind::InvalidState);
            return;
        }
        FAIL(describe(op) << " applied");
    };

    expect_invalid(Operation::create_model(make_model("A", "a")));
    expect_invalid(Operation::remove_model(make_model("X", "x")));
    expect_invalid(Operation::add_field("a", "A", id_field()));
    expect_invalid(Operation::add_field("x", "X", id_field()));
    expect_invalid(Operation::remove_field("a", "A", fk_field("nope", "B", "b")));

    REQUIRE_THROWS_AS(state.columns("x"), MigrationError);
}
