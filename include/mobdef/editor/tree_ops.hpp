#pragma once

/// @file tree_ops.hpp
/// @brief Structural and field edits on a behavior tree document
///
/// Every operation returns true if the tree changed. Invalid paths and
/// out-of-range indices are no-ops. None of these touch undo history;
/// EditorSession::edit() snapshots around them.

#include "tree_path.hpp"

#include <mobdef/ai/behavior_command.hpp>
#include <mobdef/ai/behavior_dsl.hpp>
#include <mobdef/data/value.hpp>

#include <cstddef>
#include <optional>
#include <string>

namespace mobdef_editor {

// =============================================================================
// Node operations
// =============================================================================

/// Set the document's `behavior` to Forever[Action "Movement" [MoveDown]]
/// if it has none
bool add_default_behavior_tree(mobdef_data::Value& document);

/// Append Action{name="New Action", behaviors=[]} to a control node
bool insert_default_child(mobdef_data::Value& tree, const NodePath& path);

/// Remove the node at `path` from its parent.
/// Control parents drop `children[i]`; While drops its condition (index 0);
/// IfThen drops its else branch (index 2). Mandatory slots and the root are
/// never removed.
bool delete_node(mobdef_data::Value& tree, const NodePath& path);

/// Swap a control node's child with the sibling `delta` places away.
/// No-op when the target index is out of range.
bool move_node(mobdef_data::Value& tree, const NodePath& path, int delta);

/// Replace every field but `type` with the defaults of `new_type`.
/// Switching between control types keeps `children`.
bool retype_node(mobdef_data::Value& tree, const NodePath& path, mobdef_ai::BehaviorNodeType new_type);

/// Fill a named slot (condition, child, then_child, else_child) with its
/// default node
bool set_slot_default(mobdef_data::Value& tree, const NodePath& path, const std::string& slot);

/// Set a field of the node at `path`; `type` is changed only via retype_node()
bool set_field(mobdef_data::Value& tree, const NodePath& path, const std::string& field,
               mobdef_data::Value value);

bool remove_field(mobdef_data::Value& tree, const NodePath& path, const std::string& field);

// =============================================================================
// Action command operations
// =============================================================================

/// Command inside an Action node's `behaviors`.
/// With `nested` set, addresses `behaviors[index].behaviors[nested]` of a
/// TransmitMobBehavior command.
struct CommandPath {
    std::size_t index = 0;
    std::optional<std::size_t> nested;
};

[[nodiscard]] const mobdef_data::Value* get_command(const mobdef_data::Value& tree, const NodePath& path,
                                                    const CommandPath& command);

/// Append MoveDown to the Action at `path`, or to the nested list of the
/// TransmitMobBehavior command at `transmit_index`
bool add_command(mobdef_data::Value& tree, const NodePath& path,
                 std::optional<std::size_t> transmit_index = std::nullopt);

bool delete_command(mobdef_data::Value& tree, const NodePath& path, const CommandPath& command);

bool move_command(mobdef_data::Value& tree, const NodePath& path, const CommandPath& command, int delta);

/// Replace every field but `action` with the defaults of `kind`
bool retype_command(mobdef_data::Value& tree, const NodePath& path, const CommandPath& command,
                    mobdef_ai::CommandKind kind);

/// Set a parameter; `action` is changed only via retype_command()
bool set_command_param(mobdef_data::Value& tree, const NodePath& path, const CommandPath& command,
                       const std::string& field, mobdef_data::Value value);

bool remove_command_param(mobdef_data::Value& tree, const NodePath& path, const CommandPath& command,
                          const std::string& field);

} // namespace mobdef_editor
