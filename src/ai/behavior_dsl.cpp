/// @file behavior_dsl.cpp
/// @brief Behavior DSL layout table, parsing and serialization

#include <mobdef/ai/behavior_dsl.hpp>

namespace mobdef_ai {

using namespace dsl;
using mobdef_data::Array;
using mobdef_data::Table;
using mobdef_data::Value;

// =============================================================================
// Names
// =============================================================================

const char* behavior_node_type_name(BehaviorNodeType type) {
    switch (type) {
        case BehaviorNodeType::Forever: return "Forever";
        case BehaviorNodeType::Sequence: return "Sequence";
        case BehaviorNodeType::Fallback: return "Fallback";
        case BehaviorNodeType::While: return "While";
        case BehaviorNodeType::IfThen: return "IfThen";
        case BehaviorNodeType::Wait: return "Wait";
        case BehaviorNodeType::Action: return "Action";
        case BehaviorNodeType::Trigger: return "Trigger";
        default: return "Unknown";
    }
}

std::optional<BehaviorNodeType> parse_behavior_node_type(std::string_view name) {
    for (BehaviorNodeType type : k_all_node_types) {
        if (name == behavior_node_type_name(type)) {
            return type;
        }
    }
    return std::nullopt;
}

// =============================================================================
// Layout table
// =============================================================================

namespace {

const NodeLayout k_layouts[] = {
    {BehaviorNodeType::Forever, true, {}, 0},
    {BehaviorNodeType::Sequence, true, {}, 0},
    {BehaviorNodeType::Fallback, true, {}, 0},
    {BehaviorNodeType::While, false, {{{"condition", true}, {"child", false}, {}}}, 2},
    {BehaviorNodeType::IfThen, false, {{{"condition", false}, {"then_child", false}, {"else_child", true}}}, 3},
    {BehaviorNodeType::Wait, false, {}, 0},
    {BehaviorNodeType::Action, false, {}, 0},
    {BehaviorNodeType::Trigger, false, {}, 0},
};

/// Non-slot fields of leaf nodes
const std::vector<std::string>& leaf_fields(BehaviorNodeType type) {
    static const std::vector<std::string> wait = {"seconds"};
    static const std::vector<std::string> action = {"name", "behaviors"};
    static const std::vector<std::string> trigger = {"trigger_type"};
    static const std::vector<std::string> none;
    switch (type) {
        case BehaviorNodeType::Wait: return wait;
        case BehaviorNodeType::Action: return action;
        case BehaviorNodeType::Trigger: return trigger;
        default: return none;
    }
}

bool is_allowed_field(const NodeLayout& layout, const std::string& key) {
    if (key == "type") return true;
    if (layout.has_child_array) return key == "children";
    for (std::size_t i = 0; i < layout.slot_count; ++i) {
        if (key == layout.slots[i].key) return true;
    }
    for (const auto& field : leaf_fields(layout.type)) {
        if (key == field) return true;
    }
    return false;
}

} // anonymous namespace

const NodeLayout& node_layout(BehaviorNodeType type) {
    return k_layouts[static_cast<std::size_t>(type)];
}

Value default_action(const std::string& name) {
    return Value::table({
        {"type", Value("Action")},
        {"name", Value(name)},
        {"behaviors", Value::array()},
    });
}

Table node_default_fields(BehaviorNodeType type) {
    switch (type) {
        case BehaviorNodeType::Forever:
        case BehaviorNodeType::Sequence:
        case BehaviorNodeType::Fallback:
            return Table{{"children", Value::array()}};
        case BehaviorNodeType::While:
            return Table{{"child", default_action("Child")}};
        case BehaviorNodeType::IfThen:
            return Table{
                {"condition", Value::table({{"type", Value("Wait")}, {"seconds", Value(1.0)}})},
                {"then_child", default_action("Then")},
            };
        case BehaviorNodeType::Wait:
            return Table{{"seconds", Value(1.0)}};
        case BehaviorNodeType::Action:
            return Table{{"name", Value("New Action")}, {"behaviors", Value::array()}};
        case BehaviorNodeType::Trigger:
            return Table{{"trigger_type", Value("")}};
        default:
            return Table{};
    }
}

Value default_node(BehaviorNodeType type) {
    Table fields = node_default_fields(type);
    fields.emplace("type", Value(behavior_node_type_name(type)));
    return Value(std::move(fields));
}

// =============================================================================
// Parsing
// =============================================================================

namespace {

BehaviorNode make_unknown(const Value& raw, std::string type_name, std::string reason) {
    return UnknownNode{std::move(type_name), std::move(reason), raw};
}

std::vector<BehaviorNode> parse_children(const Array& items) {
    std::vector<BehaviorNode> children;
    children.reserve(items.size());
    for (const auto& item : items) {
        children.push_back(parse_behavior_node(item));
    }
    return children;
}

} // anonymous namespace

BehaviorNode parse_behavior_node(const Value& value) {
    if (!value.is_table()) {
        return make_unknown(value, "", std::string("expected table, got ") + value.type_name());
    }

    const std::string* tag = value.get_string("type");
    if (tag == nullptr) {
        return make_unknown(value, "", "missing string field 'type'");
    }

    auto type = parse_behavior_node_type(*tag);
    if (!type) {
        return make_unknown(value, *tag, "unknown node type '" + *tag + "'");
    }

    const NodeLayout& layout = node_layout(*type);
    for (const auto& [key, field] : value.as_table()) {
        if (!is_allowed_field(layout, key)) {
            return make_unknown(value, *tag, "unexpected field '" + key + "'");
        }
    }

    if (layout.has_child_array) {
        const Value* children = value.get("children");
        if (children == nullptr || !children->is_array()) {
            return make_unknown(value, *tag, "missing array field 'children'");
        }
        auto parsed = parse_children(children->as_array());
        switch (*type) {
            case BehaviorNodeType::Forever: return ForeverNode{std::move(parsed)};
            case BehaviorNodeType::Sequence: return SequenceNode{std::move(parsed)};
            default: return FallbackNode{std::move(parsed)};
        }
    }

    switch (*type) {
        case BehaviorNodeType::While: {
            const Value* child = value.get("child");
            if (child == nullptr) {
                return make_unknown(value, *tag, "missing field 'child'");
            }
            std::optional<NodeBox> condition;
            if (const Value* cond = value.get("condition")) {
                condition.emplace(parse_behavior_node(*cond));
            }
            return WhileNode{std::move(condition), NodeBox(parse_behavior_node(*child))};
        }
        case BehaviorNodeType::IfThen: {
            const Value* condition = value.get("condition");
            if (condition == nullptr) {
                return make_unknown(value, *tag, "missing field 'condition'");
            }
            const Value* then_child = value.get("then_child");
            if (then_child == nullptr) {
                return make_unknown(value, *tag, "missing field 'then_child'");
            }
            std::optional<NodeBox> else_child;
            if (const Value* other = value.get("else_child")) {
                else_child.emplace(parse_behavior_node(*other));
            }
            return IfThenNode{NodeBox(parse_behavior_node(*condition)),
                              NodeBox(parse_behavior_node(*then_child)),
                              std::move(else_child)};
        }
        case BehaviorNodeType::Wait: {
            const Value* seconds = value.get("seconds");
            auto number = seconds ? seconds->try_numeric() : std::nullopt;
            if (!number) {
                return make_unknown(value, *tag, "missing numeric field 'seconds'");
            }
            return WaitNode{*number};
        }
        case BehaviorNodeType::Action: {
            const std::string* name = value.get_string("name");
            if (name == nullptr) {
                return make_unknown(value, *tag, "missing string field 'name'");
            }
            const Value* behaviors = value.get("behaviors");
            if (behaviors == nullptr) {
                return make_unknown(value, *tag, "missing field 'behaviors'");
            }
            auto commands = parse_behavior_commands(*behaviors);
            if (!commands) {
                return make_unknown(value, *tag, "behaviors" + commands.error().message());
            }
            return ActionNode{*name, std::move(*commands)};
        }
        case BehaviorNodeType::Trigger: {
            const std::string* trigger_type = value.get_string("trigger_type");
            if (trigger_type == nullptr) {
                return make_unknown(value, *tag, "missing string field 'trigger_type'");
            }
            return TriggerNode{*trigger_type};
        }
        default:
            return make_unknown(value, *tag, "unhandled node type");
    }
}

// =============================================================================
// Serialization
// =============================================================================

namespace {

Value typed_table(BehaviorNodeType type) {
    return Value::table({{"type", Value(behavior_node_type_name(type))}});
}

Value children_to_value(const std::vector<BehaviorNode>& children) {
    Array out;
    out.reserve(children.size());
    for (const auto& child : children) {
        out.push_back(behavior_to_value(child));
    }
    return Value(std::move(out));
}

} // anonymous namespace

Value behavior_to_value(const BehaviorNode& node) {
    return std::visit([](const auto& n) -> Value {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, ForeverNode>) {
            Value out = typed_table(BehaviorNodeType::Forever);
            out.set("children", children_to_value(n.children));
            return out;
        } else if constexpr (std::is_same_v<T, SequenceNode>) {
            Value out = typed_table(BehaviorNodeType::Sequence);
            out.set("children", children_to_value(n.children));
            return out;
        } else if constexpr (std::is_same_v<T, FallbackNode>) {
            Value out = typed_table(BehaviorNodeType::Fallback);
            out.set("children", children_to_value(n.children));
            return out;
        } else if constexpr (std::is_same_v<T, WhileNode>) {
            Value out = typed_table(BehaviorNodeType::While);
            if (n.condition) {
                out.set("condition", behavior_to_value(**n.condition));
            }
            out.set("child", behavior_to_value(*n.child));
            return out;
        } else if constexpr (std::is_same_v<T, IfThenNode>) {
            Value out = typed_table(BehaviorNodeType::IfThen);
            out.set("condition", behavior_to_value(*n.condition));
            out.set("then_child", behavior_to_value(*n.then_child));
            if (n.else_child) {
                out.set("else_child", behavior_to_value(**n.else_child));
            }
            return out;
        } else if constexpr (std::is_same_v<T, WaitNode>) {
            Value out = typed_table(BehaviorNodeType::Wait);
            out.set("seconds", n.seconds);
            return out;
        } else if constexpr (std::is_same_v<T, ActionNode>) {
            Value out = typed_table(BehaviorNodeType::Action);
            out.set("name", n.name);
            out.set("behaviors", commands_to_value(n.behaviors));
            return out;
        } else if constexpr (std::is_same_v<T, TriggerNode>) {
            Value out = typed_table(BehaviorNodeType::Trigger);
            out.set("trigger_type", n.trigger_type);
            return out;
        } else {
            return n.raw;
        }
    }, node.variant());
}

std::size_t count_unknown_nodes(const BehaviorNode& node) {
    return std::visit([](const auto& n) -> std::size_t {
        using T = std::decay_t<decltype(n)>;
        std::size_t count = 0;
        if constexpr (std::is_same_v<T, ForeverNode> || std::is_same_v<T, SequenceNode> ||
                      std::is_same_v<T, FallbackNode>) {
            for (const auto& child : n.children) {
                count += count_unknown_nodes(child);
            }
        } else if constexpr (std::is_same_v<T, WhileNode>) {
            if (n.condition) count += count_unknown_nodes(**n.condition);
            count += count_unknown_nodes(*n.child);
        } else if constexpr (std::is_same_v<T, IfThenNode>) {
            count += count_unknown_nodes(*n.condition);
            count += count_unknown_nodes(*n.then_child);
            if (n.else_child) count += count_unknown_nodes(**n.else_child);
        } else if constexpr (std::is_same_v<T, UnknownNode>) {
            count = 1;
        }
        return count;
    }, node.variant());
}

} // namespace mobdef_ai
