#include <catch2/catch.hpp>
#include <set>
#include "cyclebreaker.hpp"
#include "generator.hpp"
#include "helpers.hpp"
#include "opgraph.hpp"

TEST_CASE("Two-cycle moves one foreign key to an AddField", "[cycles]") {
    std::vector<Operation> ops = {
        Operation::create_model(make_model("Child", "child", {fk_field("parent", "Parent", "parent")})),
        Operation::create_model(make_model("Parent", "parent", {fk_field("child", "Child", "child")})),
    };

    REQUIRE(remove_cycles(ops) == 1);
    REQUIRE(ops.size() == 3);
    REQUIRE(ops[0].fields.size() == 1); // child lost 'parent'
    REQUIRE(ops[1].fields.size() == 2);
    REQUIRE(ops[2] == Operation::add_field("child", "Child", fk_field("parent", "Parent", "parent")));
    REQUIRE(build_dependency_graph(ops).is_acyclic());

    toposort_operations(ops);
    REQUIRE(describe(ops[0]) == "CreateModel(child)");
    REQUIRE(describe(ops[1]) == "CreateModel(parent)");
    REQUIRE(describe(ops[2]) == "AddField(child.parent)");
}

TEST_CASE("Three-cycle is broken", "[cycles]") {
    std::vector<Operation> ops = {
        Operation::create_model(make_model("A", "a", {fk_field("b", "B", "b")})),
        Operation::create_model(make_model("B", "b", {fk_field("c", "C", "c")})),
        Operation::create_model(make_model("C", "c", {fk_field("a", "A", "a")})),
    };

    std::size_t moved = remove_cycles(ops);
    REQUIRE(moved >= 1);
    REQUIRE(ops.size() == 3 + moved);
    REQUIRE(build_dependency_graph(ops).is_acyclic());

    // every foreign key still exists exactly once
    std::size_t fks = 0;
    for (const auto& op : ops) {
        if (op.kind == OpKind::AddField) ++fks;
        for (const auto& f : op.fields) if (f.foreign_key) ++fks;
    }
    REQUIRE(fks == 3);
}

TEST_CASE("Self reference becomes an AddField", "[cycles]") {
    std::vector<Operation> ops = {
        Operation::create_model(make_model("Node", "node", {fk_field("parent", "Node", "node")})),
    };
    REQUIRE(remove_cycles(ops) == 1);
    REQUIRE(ops.size() == 2);
    REQUIRE(ops[0].fields.size() == 1);
    REQUIRE(ops[1].kind == OpKind::AddField);
    REQUIRE(ops[1].field.column_name == "parent");
}

TEST_CASE("Moved fields match the feedback arc set", "[cycles]") {
    // two foreign keys from a to b: parallel edges
    std::vector<Operation> ops = {
        Operation::create_model(make_model("A", "a", {fk_field("b1", "B", "b"), fk_field("b2", "B", "b")})),
        Operation::create_model(make_model("B", "b", {fk_field("a", "A", "a")})),
        Operation::create_model(make_model("Z", "z")),
    };
    std::size_t arcs = build_dependency_graph(ops).greedy_feedback_arc_set().size();

    REQUIRE(remove_cycles(ops) == arcs);
    REQUIRE(build_dependency_graph(ops).is_acyclic());
    REQUIRE(ops.size() == 3 + arcs);
}

TEST_CASE("Acyclic operations are left alone", "[cycles]") {
    std::vector<Operation> ops = {
        Operation::create_model(make_model("A", "a")),
        Operation::create_model(make_model("B", "b", {fk_field("a", "A", "a")})),
    };
    auto before = ops;
    REQUIRE(remove_cycles(ops) == 0);
    REQUIRE(ops == before);
}

TEST_CASE("Planning yields a valid order", "[cycles]") {
    std::vector<Operation> ops = {
        Operation::create_model(make_model("A", "a", {fk_field("b", "B", "b")})),
        Operation::create_model(make_model("B", "b", {fk_field("a", "A", "a"), fk_field("c", "C", "c")})),
        Operation::create_model(make_model("C", "c", {fk_field("c", "C", "c")})),
    };
    auto planned = MigrationGenerator::plan_operations(ops);

    // every reference points backwards
    std::set<std::string> created;
    for (const auto& op : planned) {
        switch (op.kind) {
            case OpKind::CreateModel:
                for (const auto& f : op.fields) {
                    if (f.foreign_key) REQUIRE(created.count(f.foreign_key->model_type));
                }
                created.insert(op.type_identifier);
                break;
            case OpKind::AddField:
                REQUIRE(created.count(op.type_identifier));
                REQUIRE(created.count(op.field.foreign_key->model_type));
                break;
            case OpKind::RemoveField:
            case OpKind::RemoveModel:
                break;
        }
    }
    REQUIRE(created.size() == 3);
}
