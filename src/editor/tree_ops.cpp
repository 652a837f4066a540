/// @file tree_ops.cpp
/// @brief Structural and field edits on a behavior tree document

#include <mobdef/editor/tree_ops.hpp>

#include <utility>

namespace mobdef_editor {

using mobdef_ai::BehaviorNodeType;
using mobdef_ai::CommandKind;
using mobdef_data::Array;
using mobdef_data::Table;
using mobdef_data::Value;

namespace {

/// Index after moving `index` by `delta`, nullopt if outside [0, size)
std::optional<std::size_t> shifted(std::size_t index, int delta, std::size_t size) {
    auto target = static_cast<long long>(index) + delta;
    if (delta == 0 || index >= size || target < 0 || target >= static_cast<long long>(size)) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(target);
}

/// `children` of a control node, created when missing and `create` is set
Array* children_of(Value& node, bool create = false) {
    auto type = node_type_of(node);
    if (!type || !mobdef_ai::node_layout(*type).has_child_array) {
        return nullptr;
    }
    if (!node.contains("children")) {
        if (!create) return nullptr;
        node.set("children", Value::array());
    }
    return node.get_mut("children")->try_array_mut();
}

bool set_if_changed(Value& node, const std::string& field, Value value) {
    const Value* existing = node.get(field);
    if (existing != nullptr && *existing == value) {
        return false;
    }
    node.set(field, std::move(value));
    return true;
}

Value default_slot_node(const std::string& slot) {
    if (slot == "condition") {
        return mobdef_ai::default_node(BehaviorNodeType::Wait);
    }
    if (slot == "child") return mobdef_ai::default_action("Child");
    if (slot == "then_child") return mobdef_ai::default_action("Then");
    return mobdef_ai::default_action("Else");
}

} // anonymous namespace

// =============================================================================
// Node operations
// =============================================================================

bool add_default_behavior_tree(Value& document) {
    if (!document.is_table() || document.contains("behavior")) {
        return false;
    }

    Value movement = mobdef_ai::default_action("Movement");
    movement.set("behaviors", Value::array({Value::table({{"action", Value("MoveDown")}})}));

    Value root = mobdef_ai::default_node(BehaviorNodeType::Forever);
    root.set("children", Value::array({std::move(movement)}));
    document.set("behavior", std::move(root));
    return true;
}

bool insert_default_child(Value& tree, const NodePath& path) {
    Value* node = get_node_mut(tree, path);
    Array* children = node ? children_of(*node, true) : nullptr;
    if (children == nullptr) {
        return false;
    }
    children->push_back(mobdef_ai::default_action("New Action"));
    return true;
}

bool delete_node(Value& tree, const NodePath& path) {
    if (path.empty()) {
        return false;
    }
    NodePath parent_path(path.begin(), path.end() - 1);
    std::size_t index = path.back();

    Value* parent = get_node_mut(tree, parent_path);
    if (parent == nullptr) {
        return false;
    }
    auto type = node_type_of(*parent);
    if (!type) {
        return false;
    }

    if (mobdef_ai::node_layout(*type).has_child_array) {
        Array* children = children_of(*parent);
        if (children == nullptr || index >= children->size()) {
            return false;
        }
        children->erase(children->begin() + static_cast<std::ptrdiff_t>(index));
        return true;
    }

    const auto* slot = mobdef_ai::node_layout(*type).slot(index);
    if (slot == nullptr || !slot->optional) {
        return false;
    }
    return parent->erase(slot->key);
}

bool move_node(Value& tree, const NodePath& path, int delta) {
    if (path.empty()) {
        return false;
    }
    NodePath parent_path(path.begin(), path.end() - 1);
    Value* parent = get_node_mut(tree, parent_path);
    Array* children = parent ? children_of(*parent) : nullptr;
    if (children == nullptr) {
        return false;
    }

    std::size_t index = path.back();
    auto target = shifted(index, delta, children->size());
    if (!target) {
        return false;
    }
    std::swap((*children)[index], (*children)[*target]);
    return true;
}

bool retype_node(Value& tree, const NodePath& path, BehaviorNodeType new_type) {
    Value* node = get_node_mut(tree, path);
    if (node == nullptr || !node->is_table()) {
        return false;
    }

    auto old_type = node_type_of(*node);
    if (old_type == new_type) {
        return false;
    }

    std::optional<Value> kept_children;
    if (old_type && mobdef_ai::node_layout(*old_type).has_child_array &&
        mobdef_ai::node_layout(new_type).has_child_array) {
        if (const Value* children = node->get("children")) {
            kept_children = *children;
        }
    }

    *node = mobdef_ai::default_node(new_type);
    if (kept_children) {
        node->set("children", std::move(*kept_children));
    }
    return true;
}

bool set_slot_default(Value& tree, const NodePath& path, const std::string& slot) {
    Value* node = get_node_mut(tree, path);
    auto type = node ? node_type_of(*node) : std::nullopt;
    if (!type) {
        return false;
    }

    const auto& layout = mobdef_ai::node_layout(*type);
    for (std::size_t i = 0; i < layout.slot_count; ++i) {
        if (slot == layout.slot(i)->key) {
            return set_if_changed(*node, slot, default_slot_node(slot));
        }
    }
    return false;
}

bool set_field(Value& tree, const NodePath& path, const std::string& field, Value value) {
    Value* node = get_node_mut(tree, path);
    if (node == nullptr || !node->is_table() || field == "type") {
        return false;
    }
    return set_if_changed(*node, field, std::move(value));
}

bool remove_field(Value& tree, const NodePath& path, const std::string& field) {
    Value* node = get_node_mut(tree, path);
    if (node == nullptr || field == "type") {
        return false;
    }
    return node->erase(field);
}

// =============================================================================
// Action command operations
// =============================================================================

namespace {

/// `behaviors` of the Action at `path`, or the nested list of its
/// TransmitMobBehavior command at `transmit_index`. Missing lists are
/// created only when `create` is set.
Array* command_list(Value& tree, const NodePath& path, std::optional<std::size_t> transmit_index,
                    bool create = false) {
    Value* node = get_node_mut(tree, path);
    if (node == nullptr || node_type_of(*node) != BehaviorNodeType::Action) {
        return nullptr;
    }
    if (!node->contains("behaviors")) {
        if (!create) return nullptr;
        node->set("behaviors", Value::array());
    }
    Array* list = node->get_mut("behaviors")->try_array_mut();
    if (list == nullptr || !transmit_index) {
        return list;
    }

    if (*transmit_index >= list->size()) {
        return nullptr;
    }
    Value& transmit = (*list)[*transmit_index];
    const std::string* action = transmit.get_string("action");
    if (action == nullptr || *action != mobdef_ai::command_kind_name(CommandKind::TransmitMobBehavior)) {
        return nullptr;
    }
    if (!transmit.contains("behaviors")) {
        if (!create) return nullptr;
        transmit.set("behaviors", Value::array());
    }
    return transmit.get_mut("behaviors")->try_array_mut();
}

/// List holding the addressed command and the command's index in it
std::pair<Array*, std::size_t> locate(Value& tree, const NodePath& path, const CommandPath& command) {
    if (command.nested) {
        return {command_list(tree, path, command.index), *command.nested};
    }
    return {command_list(tree, path, std::nullopt), command.index};
}

Value* command_mut(Value& tree, const NodePath& path, const CommandPath& command) {
    auto [list, index] = locate(tree, path, command);
    if (list == nullptr || index >= list->size()) {
        return nullptr;
    }
    return &(*list)[index];
}

} // anonymous namespace

const Value* get_command(const Value& tree, const NodePath& path, const CommandPath& command) {
    const Value* node = get_node(tree, path);
    if (node == nullptr || node_type_of(*node) != BehaviorNodeType::Action) {
        return nullptr;
    }
    const Value* list = node->get("behaviors");
    const Array* arr = list ? list->try_array() : nullptr;
    if (arr == nullptr || command.index >= arr->size()) {
        return nullptr;
    }
    const Value* cmd = &(*arr)[command.index];
    if (!command.nested) {
        return cmd;
    }
    const std::string* action = cmd->get_string("action");
    if (action == nullptr || *action != mobdef_ai::command_kind_name(CommandKind::TransmitMobBehavior)) {
        return nullptr;
    }
    const Value* nested = cmd->get("behaviors");
    const Array* nested_arr = nested ? nested->try_array() : nullptr;
    if (nested_arr == nullptr || *command.nested >= nested_arr->size()) {
        return nullptr;
    }
    return &(*nested_arr)[*command.nested];
}

bool add_command(Value& tree, const NodePath& path, std::optional<std::size_t> transmit_index) {
    Array* list = command_list(tree, path, transmit_index, true);
    if (list == nullptr) {
        return false;
    }
    list->push_back(Value::table({{"action", Value(mobdef_ai::command_kind_name(CommandKind::MoveDown))}}));
    return true;
}

bool delete_command(Value& tree, const NodePath& path, const CommandPath& command) {
    auto [list, index] = locate(tree, path, command);
    if (list == nullptr || index >= list->size()) {
        return false;
    }
    list->erase(list->begin() + static_cast<std::ptrdiff_t>(index));
    return true;
}

bool move_command(Value& tree, const NodePath& path, const CommandPath& command, int delta) {
    auto [list, index] = locate(tree, path, command);
    if (list == nullptr) {
        return false;
    }
    auto target = shifted(index, delta, list->size());
    if (!target) {
        return false;
    }
    std::swap((*list)[index], (*list)[*target]);
    return true;
}

bool retype_command(Value& tree, const NodePath& path, const CommandPath& command, CommandKind kind) {
    Value* cmd = command_mut(tree, path, command);
    if (cmd == nullptr) {
        return false;
    }
    const std::string* action = cmd->get_string("action");
    if (action != nullptr && *action == mobdef_ai::command_kind_name(kind)) {
        return false;
    }

    Table fields = mobdef_ai::command_default_params(kind);
    fields["action"] = Value(mobdef_ai::command_kind_name(kind));
    *cmd = Value(std::move(fields));
    return true;
}

bool set_command_param(Value& tree, const NodePath& path, const CommandPath& command, const std::string& field,
                       Value value) {
    Value* cmd = command_mut(tree, path, command);
    if (cmd == nullptr || !cmd->is_table() || field == "action") {
        return false;
    }
    return set_if_changed(*cmd, field, std::move(value));
}

bool remove_command_param(Value& tree, const NodePath& path, const CommandPath& command,
                          const std::string& field) {
    Value* cmd = command_mut(tree, path, command);
    if (cmd == nullptr || field == "action") {
        return false;
    }
    return cmd->erase(field);
}

} // namespace mobdef_editor
