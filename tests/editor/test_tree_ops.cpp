// mobdef_editor tree operation tests

#include <catch2/catch_test_macros.hpp>
#include <mobdef/editor/tree_ops.hpp>

using namespace mobdef_editor;
using mobdef_ai::BehaviorNodeType;
using mobdef_ai::CommandKind;
using mobdef_data::Value;

namespace {

Value action(const char* name) {
    return Value::table({{"type", "Action"}, {"name", name}, {"behaviors", Value::array()}});
}

Value sequence_of(std::initializer_list<Value> children) {
    return Value::table({{"type", "Sequence"}, {"children", Value::array(children)}});
}

const std::string& name_at(const Value& tree, const NodePath& path) {
    return *get_node(tree, path)->get_string("name");
}

} // namespace

// =============================================================================
// Node operations
// =============================================================================

TEST_CASE("add_default_behavior_tree", "[editor][tree_ops]") {
    Value doc = Value::table({{"name", "Grunt"}});
    REQUIRE(add_default_behavior_tree(doc));

    const Value* behavior = doc.get("behavior");
    REQUIRE(*behavior->get_string("type") == "Forever");
    REQUIRE(name_at(*behavior, {0}) == "Movement");
    REQUIRE(*get_node(*behavior, {0})->get("behaviors")->as_array()[0].get_string("action") == "MoveDown");

    SECTION("existing behavior is kept") {
        Value before = doc;
        REQUIRE_FALSE(add_default_behavior_tree(doc));
        REQUIRE(doc == before);
    }
}

TEST_CASE("insert_default_child", "[editor][tree_ops]") {
    Value tree = sequence_of({action("A")});
    REQUIRE(insert_default_child(tree, {}));
    REQUIRE(child_count(tree, {}) == 2);
    REQUIRE(name_at(tree, {1}) == "New Action");

    SECTION("creates a missing children array") {
        Value bare = Value::table({{"type", "Fallback"}});
        REQUIRE(insert_default_child(bare, {}));
        REQUIRE(child_count(bare, {}) == 1);
    }

    SECTION("leaves cannot take children") {
        REQUIRE_FALSE(insert_default_child(tree, {0}));
    }
}

TEST_CASE("delete_node", "[editor][tree_ops]") {
    SECTION("control parent drops the child") {
        Value tree = sequence_of({action("A"), action("B"), action("C")});
        REQUIRE(delete_node(tree, {1}));
        REQUIRE(child_count(tree, {}) == 2);
        REQUIRE(name_at(tree, {1}) == "C");
    }

    SECTION("root is never deleted") {
        Value tree = sequence_of({action("A")});
        REQUIRE_FALSE(delete_node(tree, {}));
    }

    SECTION("out of range is a no-op") {
        Value tree = sequence_of({action("A")});
        REQUIRE_FALSE(delete_node(tree, {5}));
    }

    SECTION("only optional slots are removable") {
        Value loop = Value::table({
            {"type", "While"},
            {"condition", Value::table({{"type", "Wait"}, {"seconds", 1.0}})},
            {"child", action("Loop")},
        });
        REQUIRE_FALSE(delete_node(loop, {1}));
        REQUIRE(delete_node(loop, {0}));
        REQUIRE_FALSE(loop.contains("condition"));
        REQUIRE_FALSE(delete_node(loop, {0}));

        Value branch = mobdef_ai::default_node(BehaviorNodeType::IfThen);
        REQUIRE(set_slot_default(branch, {}, "else_child"));
        REQUIRE_FALSE(delete_node(branch, {0}));
        REQUIRE_FALSE(delete_node(branch, {1}));
        REQUIRE(delete_node(branch, {2}));
        REQUIRE_FALSE(branch.contains("else_child"));
    }
}

TEST_CASE("move_node swaps siblings", "[editor][tree_ops]") {
    Value tree = sequence_of({action("A"), action("B"), action("C")});

    REQUIRE(move_node(tree, {0}, 1));
    REQUIRE(name_at(tree, {0}) == "B");
    REQUIRE(name_at(tree, {1}) == "A");

    REQUIRE(move_node(tree, {2}, -2));
    REQUIRE(name_at(tree, {0}) == "C");
    REQUIRE(name_at(tree, {2}) == "B");

    SECTION("moves past either end are no-ops") {
        Value before = tree;
        REQUIRE_FALSE(move_node(tree, {0}, -1));
        REQUIRE_FALSE(move_node(tree, {2}, 1));
        REQUIRE_FALSE(move_node(tree, {1}, 0));
        REQUIRE(tree == before);
    }

    SECTION("moving up then down is the identity") {
        Value before = tree;
        REQUIRE(move_node(tree, {1}, -1));
        REQUIRE(move_node(tree, {0}, 1));
        REQUIRE(tree == before);
    }
}

TEST_CASE("retype_node", "[editor][tree_ops]") {
    SECTION("control to control keeps children") {
        Value tree = sequence_of({action("A"), action("B")});
        REQUIRE(retype_node(tree, {}, BehaviorNodeType::Fallback));
        REQUIRE(*tree.get_string("type") == "Fallback");
        REQUIRE(child_count(tree, {}) == 2);
    }

    SECTION("other changes reset to defaults") {
        Value tree = sequence_of({action("A")});
        REQUIRE(retype_node(tree, {0}, BehaviorNodeType::Wait));
        const Value* wait = get_node(tree, {0});
        REQUIRE(*wait == mobdef_ai::default_node(BehaviorNodeType::Wait));
        REQUIRE_FALSE(wait->contains("name"));

        REQUIRE(retype_node(tree, {}, BehaviorNodeType::While));
        REQUIRE(*get_node(tree, {1})->get_string("name") == "Child");
        REQUIRE_FALSE(tree.contains("children"));
    }

    SECTION("same type is a no-op") {
        Value tree = sequence_of({action("A")});
        REQUIRE_FALSE(retype_node(tree, {}, BehaviorNodeType::Sequence));
        REQUIRE(child_count(tree, {}) == 1);
    }
}

TEST_CASE("set_slot_default", "[editor][tree_ops]") {
    Value loop = Value::table({{"type", "While"}, {"child", action("Loop")}});
    REQUIRE(set_slot_default(loop, {}, "condition"));
    REQUIRE(*get_node(loop, {0})->get_string("type") == "Wait");
    REQUIRE_FALSE(set_slot_default(loop, {}, "condition"));
    REQUIRE_FALSE(set_slot_default(loop, {}, "else_child"));
}

TEST_CASE("set_field and remove_field", "[editor][tree_ops]") {
    Value tree = sequence_of({Value::table({{"type", "Wait"}, {"seconds", 1.0}})});

    REQUIRE(set_field(tree, {0}, "seconds", 2.5));
    REQUIRE(get_node(tree, {0})->get("seconds")->as_float() == 2.5);
    REQUIRE_FALSE(set_field(tree, {0}, "seconds", 2.5));

    REQUIRE_FALSE(set_field(tree, {0}, "type", "Action"));
    REQUIRE_FALSE(remove_field(tree, {0}, "type"));

    REQUIRE(remove_field(tree, {0}, "seconds"));
    REQUIRE_FALSE(remove_field(tree, {0}, "seconds"));
    REQUIRE_FALSE(set_field(tree, {4}, "seconds", 1.0));
}

// =============================================================================
// Command operations
// =============================================================================

TEST_CASE("Command list editing", "[editor][tree_ops]") {
    Value tree = sequence_of({action("Move")});
    const NodePath move = {0};

    REQUIRE(add_command(tree, move));
    REQUIRE(add_command(tree, move));
    REQUIRE(*get_command(tree, move, {0})->get_string("action") == "MoveDown");

    SECTION("non-action nodes take no commands") {
        REQUIRE_FALSE(add_command(tree, {}));
        REQUIRE(get_command(tree, {}, {0}) == nullptr);
    }

    SECTION("retype resets params") {
        REQUIRE(retype_command(tree, move, {1}, CommandKind::MoveTo));
        const Value* cmd = get_command(tree, move, {1});
        REQUIRE(*cmd->get_string("action") == "MoveTo");
        REQUIRE(cmd->get("x")->as_float() == 0.0);
        REQUIRE_FALSE(retype_command(tree, move, {1}, CommandKind::MoveTo));

        REQUIRE(retype_command(tree, move, {1}, CommandKind::MoveUp));
        REQUIRE_FALSE(get_command(tree, move, {1})->contains("x"));
    }

    SECTION("params") {
        REQUIRE(retype_command(tree, move, {0}, CommandKind::DoForTime));
        REQUIRE(set_command_param(tree, move, {0}, "seconds", 3.0));
        REQUIRE(get_command(tree, move, {0})->get("seconds")->as_float() == 3.0);
        REQUIRE_FALSE(set_command_param(tree, move, {0}, "action", "MoveUp"));
        REQUIRE_FALSE(remove_command_param(tree, move, {0}, "action"));
        REQUIRE(remove_command_param(tree, move, {0}, "seconds"));
    }

    SECTION("move and delete") {
        REQUIRE(retype_command(tree, move, {1}, CommandKind::LoseTarget));
        REQUIRE(move_command(tree, move, {1}, -1));
        REQUIRE(*get_command(tree, move, {0})->get_string("action") == "LoseTarget");
        REQUIRE_FALSE(move_command(tree, move, {0}, -1));

        REQUIRE(delete_command(tree, move, {0}));
        REQUIRE(*get_command(tree, move, {0})->get_string("action") == "MoveDown");
        REQUIRE(get_command(tree, move, {1}) == nullptr);
        REQUIRE_FALSE(delete_command(tree, move, {3}));
    }
}

TEST_CASE("Nested TransmitMobBehavior commands", "[editor][tree_ops]") {
    Value tree = sequence_of({action("Transmit")});
    const NodePath node = {0};

    REQUIRE(add_command(tree, node));
    REQUIRE_FALSE(add_command(tree, node, 0));

    REQUIRE(retype_command(tree, node, {0}, CommandKind::TransmitMobBehavior));
    REQUIRE(add_command(tree, node, 0));
    REQUIRE(add_command(tree, node, 0));

    CommandPath nested{0, 1};
    REQUIRE(retype_command(tree, node, nested, CommandKind::FindPlayerTarget));
    REQUIRE(*get_command(tree, node, nested)->get_string("action") == "FindPlayerTarget");

    REQUIRE(move_command(tree, node, nested, -1));
    REQUIRE(*get_command(tree, node, CommandPath{0, 0})->get_string("action") == "FindPlayerTarget");

    REQUIRE(delete_command(tree, node, CommandPath{0, 0}));
    REQUIRE(get_command(tree, node, CommandPath{0, 1}) == nullptr);
    REQUIRE(get_command(tree, node, {0})->get("behaviors")->size() == 1);
}

TEST_CASE("Nested commands require a TransmitMobBehavior parent", "[editor][tree_ops]") {
    Value stray = Value::table({
        {"action", "MoveDown"},
        {"behaviors", Value::array({Value::table({{"action", "MoveUp"}})})},
    });
    Value move = action("Move");
    move.get_mut("behaviors")->as_array_mut().push_back(stray);
    Value tree = sequence_of({move});
    const NodePath node = {0};
    const CommandPath nested{0, 0};

    REQUIRE(get_command(tree, node, {0}) != nullptr);
    REQUIRE(get_command(tree, node, nested) == nullptr);
    REQUIRE_FALSE(set_command_param(tree, node, nested, "seconds", 1.0));
    REQUIRE_FALSE(delete_command(tree, node, nested));
    REQUIRE_FALSE(add_command(tree, node, 0));
}

TEST_CASE("Retyping a command keeps only the new defaults", "[editor][tree_ops]") {
    Value move = action("Move");
    move.get_mut("behaviors")->as_array_mut().push_back(
        Value::table({{"action", "MoveTo"}, {"x", 5.0}, {"y", 2.0}}));
    Value tree = sequence_of({move});

    REQUIRE(retype_command(tree, {0}, {0}, CommandKind::DoForTime));
    REQUIRE(*get_command(tree, {0}, {0}) == Value::table({{"action", "DoForTime"}, {"seconds", 1.0}}));
}
