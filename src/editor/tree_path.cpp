/// @file tree_path.cpp
/// @brief Index-path navigation of a behavior tree document

#include <mobdef/editor/tree_path.hpp>

namespace mobdef_editor {

using mobdef_data::Array;
using mobdef_data::Value;

std::optional<mobdef_ai::BehaviorNodeType> node_type_of(const Value& node) {
    const std::string* tag = node.get_string("type");
    if (tag == nullptr) {
        return std::nullopt;
    }
    return mobdef_ai::parse_behavior_node_type(*tag);
}

const Value* child_at(const Value& node, std::size_t index) {
    auto type = node_type_of(node);
    if (!type) {
        return nullptr;
    }

    const auto& layout = mobdef_ai::node_layout(*type);
    if (layout.has_child_array) {
        const Value* children = node.get("children");
        const Array* arr = children ? children->try_array() : nullptr;
        if (arr == nullptr || index >= arr->size()) {
            return nullptr;
        }
        return &(*arr)[index];
    }

    const auto* slot = layout.slot(index);
    return slot ? node.get(slot->key) : nullptr;
}

const Value* get_node(const Value& tree, const NodePath& path) {
    const Value* node = &tree;
    for (std::size_t index : path) {
        node = child_at(*node, index);
        if (node == nullptr) {
            return nullptr;
        }
    }
    return node;
}

Value* get_node_mut(Value& tree, const NodePath& path) {
    return const_cast<Value*>(get_node(static_cast<const Value&>(tree), path));
}

std::size_t child_count(const Value& tree, const NodePath& path) {
    const Value* node = get_node(tree, path);
    if (node == nullptr) {
        return 0;
    }
    auto type = node_type_of(*node);
    if (!type || !mobdef_ai::node_layout(*type).has_child_array) {
        return 0;
    }
    const Value* children = node->get("children");
    return children && children->is_array() ? children->size() : 0;
}

std::string format_path(const Value& tree, const NodePath& path) {
    std::string out = "root";
    const Value* node = &tree;
    for (std::size_t index : path) {
        auto type = node ? node_type_of(*node) : std::nullopt;
        const auto* slot = type ? mobdef_ai::node_layout(*type).slot(index) : nullptr;
        if (slot != nullptr) {
            out += std::string(".") + slot->key;
        } else {
            out += ".children[" + std::to_string(index) + "]";
        }
        node = node ? child_at(*node, index) : nullptr;
    }
    return out;
}

} // namespace mobdef_editor
