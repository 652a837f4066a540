#pragma once

/// @file tree_path.hpp
/// @brief Index-path navigation of a behavior tree document

#include <mobdef/ai/behavior_dsl.hpp>
#include <mobdef/data/value.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace mobdef_editor {

/// Indices descending from the root. Control nodes index `children`,
/// While and IfThen index their named slots (see mobdef_ai::node_layout).
using NodePath = std::vector<std::size_t>;

/// Node type of a tree table, nullopt if untyped or unknown
[[nodiscard]] std::optional<mobdef_ai::BehaviorNodeType> node_type_of(const mobdef_data::Value& node);

/// Direct child at `index`, nullptr for leaves, out-of-range indices and
/// absent optional slots
[[nodiscard]] const mobdef_data::Value* child_at(const mobdef_data::Value& node, std::size_t index);

/// Node at `path` (the empty path is the root), nullptr if not found
[[nodiscard]] const mobdef_data::Value* get_node(const mobdef_data::Value& tree, const NodePath& path);
[[nodiscard]] mobdef_data::Value* get_node_mut(mobdef_data::Value& tree, const NodePath& path);

/// Children of the control node at `path`, 0 otherwise
[[nodiscard]] std::size_t child_count(const mobdef_data::Value& tree, const NodePath& path);

/// "root", "root.children[2].child", ...
[[nodiscard]] std::string format_path(const mobdef_data::Value& tree, const NodePath& path);

} // namespace mobdef_editor
