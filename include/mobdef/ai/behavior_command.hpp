#pragma once

/// @file behavior_command.hpp
/// @brief Commands carried by Action nodes (tagged by `action`)

#include "fwd.hpp"

#include <mobdef/core/error.hpp>
#include <mobdef/data/value.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mobdef_ai {

// =============================================================================
// CommandKind
// =============================================================================

enum class CommandKind : std::uint8_t {
    MoveDown,
    MoveUp,
    MoveLeft,
    MoveRight,
    BrakeHorizontal,
    BrakeAngular,
    MoveTo,
    FindPlayerTarget,
    MoveToTarget,
    RotateToTarget,
    MoveForward,
    LoseTarget,
    SpawnMob,
    SpawnProjectile,
    DoForTime,
    TransmitMobBehavior,
    RotateJointsClockwise,
};

/// All command kinds in declaration order
inline constexpr CommandKind k_all_command_kinds[] = {
    CommandKind::MoveDown, CommandKind::MoveUp, CommandKind::MoveLeft, CommandKind::MoveRight,
    CommandKind::BrakeHorizontal, CommandKind::BrakeAngular, CommandKind::MoveTo,
    CommandKind::FindPlayerTarget, CommandKind::MoveToTarget, CommandKind::RotateToTarget,
    CommandKind::MoveForward, CommandKind::LoseTarget, CommandKind::SpawnMob,
    CommandKind::SpawnProjectile, CommandKind::DoForTime, CommandKind::TransmitMobBehavior,
    CommandKind::RotateJointsClockwise,
};

[[nodiscard]] const char* command_kind_name(CommandKind kind);

/// Case-sensitive lookup of an `action` tag
[[nodiscard]] std::optional<CommandKind> parse_command_kind(std::string_view name);

/// Parameter table a freshly retyped command starts with (excluding `action`)
[[nodiscard]] mobdef_data::Table command_default_params(CommandKind kind);

// =============================================================================
// BehaviorCommand
// =============================================================================

/// One command of an Action node. Only the fields of `kind` are meaningful.
struct BehaviorCommand {
    CommandKind kind = CommandKind::MoveDown;

    double x = 0.0;                                 // MoveTo
    double y = 0.0;                                 // MoveTo
    double seconds = 0.0;                           // DoForTime
    std::optional<std::vector<std::string>> keys;   // SpawnMob, SpawnProjectile, RotateJointsClockwise
    std::string mob_type;                           // TransmitMobBehavior
    std::vector<BehaviorCommand> behaviors;         // TransmitMobBehavior

    bool operator==(const BehaviorCommand& other) const = default;

    [[nodiscard]] static BehaviorCommand simple(CommandKind kind) {
        BehaviorCommand cmd;
        cmd.kind = kind;
        return cmd;
    }
};

/// Parse one command table
[[nodiscard]] mobdef_core::Result<BehaviorCommand> parse_behavior_command(const mobdef_data::Value& value);

/// Parse an array of command tables; errors name the failing index
[[nodiscard]] mobdef_core::Result<std::vector<BehaviorCommand>> parse_behavior_commands(
    const mobdef_data::Value& value);

[[nodiscard]] mobdef_data::Value command_to_value(const BehaviorCommand& command);

[[nodiscard]] mobdef_data::Value commands_to_value(const std::vector<BehaviorCommand>& commands);

} // namespace mobdef_ai
