// mobdef_editor tree path navigation tests

#include <catch2/catch_test_macros.hpp>
#include <mobdef/editor/tree_path.hpp>

using namespace mobdef_editor;
using mobdef_data::Value;

namespace {

Value action(const char* name) {
    return Value::table({{"type", "Action"}, {"name", name}, {"behaviors", Value::array()}});
}

// Forever
//   [0] Action "A"
//   [1] While
//         [0] condition: Wait
//         [1] child: Action "Loop"
//   [2] IfThen
//         [0] condition: Trigger
//         [1] then_child: Action "Then"
Value sample_tree() {
    return Value::table({
        {"type", "Forever"},
        {"children", Value::array({
            action("A"),
            Value::table({
                {"type", "While"},
                {"condition", Value::table({{"type", "Wait"}, {"seconds", 1.0}})},
                {"child", action("Loop")},
            }),
            Value::table({
                {"type", "IfThen"},
                {"condition", Value::table({{"type", "Trigger"}, {"trigger_type", "Hit"}})},
                {"then_child", action("Then")},
            }),
        })},
    });
}

} // namespace

TEST_CASE("get_node follows paths", "[editor][tree_path]") {
    Value tree = sample_tree();

    REQUIRE(get_node(tree, {}) == &tree);
    REQUIRE(*get_node(tree, {0})->get_string("name") == "A");
    REQUIRE(*get_node(tree, {1, 0})->get_string("type") == "Wait");
    REQUIRE(*get_node(tree, {1, 1})->get_string("name") == "Loop");
    REQUIRE(*get_node(tree, {2, 1})->get_string("name") == "Then");

    SECTION("invalid paths") {
        REQUIRE(get_node(tree, {3}) == nullptr);
        REQUIRE(get_node(tree, {0, 0}) == nullptr);
        REQUIRE(get_node(tree, {1, 2}) == nullptr);
        REQUIRE(get_node(tree, {2, 2}) == nullptr);
    }

    SECTION("mutable access") {
        get_node_mut(tree, {0})->set("name", "Renamed");
        REQUIRE(*get_node(tree, {0})->get_string("name") == "Renamed");
    }
}

TEST_CASE("child_count only counts control children", "[editor][tree_path]") {
    Value tree = sample_tree();
    REQUIRE(child_count(tree, {}) == 3);
    REQUIRE(child_count(tree, {1}) == 0);
    REQUIRE(child_count(tree, {0}) == 0);
    REQUIRE(child_count(tree, {9}) == 0);
}

TEST_CASE("format_path names slots", "[editor][tree_path]") {
    Value tree = sample_tree();
    REQUIRE(format_path(tree, {}) == "root");
    REQUIRE(format_path(tree, {0}) == "root.children[0]");
    REQUIRE(format_path(tree, {1, 1}) == "root.children[1].child");
    REQUIRE(format_path(tree, {2, 0}) == "root.children[2].condition");
}

TEST_CASE("Every reachable node has exactly one path", "[editor][tree_path]") {
    Value tree = sample_tree();
    std::vector<NodePath> paths = {{}, {0}, {1}, {1, 0}, {1, 1}, {2}, {2, 0}, {2, 1}};

    for (std::size_t i = 0; i < paths.size(); ++i) {
        const Value* node = get_node(tree, paths[i]);
        REQUIRE(node != nullptr);
        for (std::size_t j = 0; j < paths.size(); ++j) {
            if (i != j) {
                REQUIRE(get_node(tree, paths[j]) != node);
            }
        }
    }
}

TEST_CASE("node_type_of", "[editor][tree_path]") {
    REQUIRE(node_type_of(action("x")) == mobdef_ai::BehaviorNodeType::Action);
    REQUIRE_FALSE(node_type_of(Value::table({{"type", "Teleport"}})).has_value());
    REQUIRE_FALSE(node_type_of(Value(3)).has_value());
}
