/// @file behavior_command.cpp
/// @brief Action command parsing and serialization

#include <mobdef/ai/behavior_command.hpp>

#include <set>

namespace mobdef_ai {

using mobdef_core::Err;
using mobdef_core::Error;
using mobdef_core::ErrorCode;
using mobdef_core::Result;
using mobdef_data::Array;
using mobdef_data::Table;
using mobdef_data::Value;

// =============================================================================
// Kind names
// =============================================================================

const char* command_kind_name(CommandKind kind) {
    switch (kind) {
        case CommandKind::MoveDown: return "MoveDown";
        case CommandKind::MoveUp: return "MoveUp";
        case CommandKind::MoveLeft: return "MoveLeft";
        case CommandKind::MoveRight: return "MoveRight";
        case CommandKind::BrakeHorizontal: return "BrakeHorizontal";
        case CommandKind::BrakeAngular: return "BrakeAngular";
        case CommandKind::MoveTo: return "MoveTo";
        case CommandKind::FindPlayerTarget: return "FindPlayerTarget";
        case CommandKind::MoveToTarget: return "MoveToTarget";
        case CommandKind::RotateToTarget: return "RotateToTarget";
        case CommandKind::MoveForward: return "MoveForward";
        case CommandKind::LoseTarget: return "LoseTarget";
        case CommandKind::SpawnMob: return "SpawnMob";
        case CommandKind::SpawnProjectile: return "SpawnProjectile";
        case CommandKind::DoForTime: return "DoForTime";
        case CommandKind::TransmitMobBehavior: return "TransmitMobBehavior";
        case CommandKind::RotateJointsClockwise: return "RotateJointsClockwise";
        default: return "Unknown";
    }
}

std::optional<CommandKind> parse_command_kind(std::string_view name) {
    for (CommandKind kind : k_all_command_kinds) {
        if (name == command_kind_name(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

Table command_default_params(CommandKind kind) {
    switch (kind) {
        case CommandKind::MoveTo:
            return Table{{"x", Value(0.0)}, {"y", Value(0.0)}};
        case CommandKind::DoForTime:
            return Table{{"seconds", Value(1.0)}};
        case CommandKind::TransmitMobBehavior:
            return Table{{"mob_type", Value("")}, {"behaviors", Value::array()}};
        case CommandKind::RotateJointsClockwise:
            return Table{{"keys", Value::array()}};
        default:
            return Table{};
    }
}

// =============================================================================
// Parsing
// =============================================================================

namespace {

Error schema_error(const std::string& field, const std::string& reason) {
    return Error(ErrorCode::SchemaError, field + ": " + reason);
}

/// Fields each kind accepts besides `action`
std::set<std::string> allowed_fields(CommandKind kind) {
    switch (kind) {
        case CommandKind::MoveTo: return {"x", "y"};
        case CommandKind::SpawnMob:
        case CommandKind::SpawnProjectile:
        case CommandKind::RotateJointsClockwise: return {"keys"};
        case CommandKind::DoForTime: return {"seconds"};
        case CommandKind::TransmitMobBehavior: return {"mob_type", "behaviors"};
        default: return {};
    }
}

Result<double> require_number(const Value& table, const std::string& key) {
    const Value* v = table.get(key);
    if (v == nullptr) {
        return Err<double>(schema_error(key, "missing field"));
    }
    auto number = v->try_numeric();
    if (!number) {
        return Err<double>(schema_error(key, std::string("expected number, got ") + v->type_name()));
    }
    return *number;
}

Result<std::vector<std::string>> read_keys(const Value& v) {
    const Array* arr = v.try_array();
    if (arr == nullptr) {
        return Err<std::vector<std::string>>(
            schema_error("keys", std::string("expected array, got ") + v.type_name()));
    }
    std::vector<std::string> keys;
    for (std::size_t i = 0; i < arr->size(); ++i) {
        const std::string* s = (*arr)[i].try_string();
        if (s == nullptr) {
            return Err<std::vector<std::string>>(
                schema_error("keys[" + std::to_string(i) + "]", "expected string"));
        }
        keys.push_back(*s);
    }
    return keys;
}

} // anonymous namespace

Result<BehaviorCommand> parse_behavior_command(const Value& value) {
    if (!value.is_table()) {
        return Err<BehaviorCommand>(schema_error("action", std::string("expected table, got ") + value.type_name()));
    }

    const std::string* tag = value.get_string("action");
    if (tag == nullptr) {
        return Err<BehaviorCommand>(schema_error("action", "missing string tag"));
    }

    auto kind = parse_command_kind(*tag);
    if (!kind) {
        return Err<BehaviorCommand>(schema_error("action", "unknown command '" + *tag + "'"));
    }

    auto allowed = allowed_fields(*kind);
    for (const auto& [key, field] : value.as_table()) {
        if (key != "action" && allowed.count(key) == 0) {
            return Err<BehaviorCommand>(schema_error(key, "unknown field for " + *tag));
        }
    }

    BehaviorCommand cmd = BehaviorCommand::simple(*kind);

    switch (*kind) {
        case CommandKind::MoveTo: {
            auto x = require_number(value, "x");
            if (!x) return Err<BehaviorCommand>(x.error());
            auto y = require_number(value, "y");
            if (!y) return Err<BehaviorCommand>(y.error());
            cmd.x = *x;
            cmd.y = *y;
            break;
        }
        case CommandKind::DoForTime: {
            auto seconds = require_number(value, "seconds");
            if (!seconds) return Err<BehaviorCommand>(seconds.error());
            cmd.seconds = *seconds;
            break;
        }
        case CommandKind::SpawnMob:
        case CommandKind::SpawnProjectile:
        case CommandKind::RotateJointsClockwise: {
            const Value* keys = value.get("keys");
            if (keys == nullptr) {
                if (*kind == CommandKind::RotateJointsClockwise) {
                    return Err<BehaviorCommand>(schema_error("keys", "missing field"));
                }
                break;
            }
            auto parsed = read_keys(*keys);
            if (!parsed) return Err<BehaviorCommand>(parsed.error());
            cmd.keys = std::move(*parsed);
            break;
        }
        case CommandKind::TransmitMobBehavior: {
            const std::string* mob_type = value.get_string("mob_type");
            if (mob_type == nullptr) {
                return Err<BehaviorCommand>(schema_error("mob_type", "missing string field"));
            }
            const Value* nested = value.get("behaviors");
            if (nested == nullptr) {
                return Err<BehaviorCommand>(schema_error("behaviors", "missing field"));
            }
            auto parsed = parse_behavior_commands(*nested);
            if (!parsed) {
                return Err<BehaviorCommand>(schema_error("behaviors", parsed.error().message()));
            }
            cmd.mob_type = *mob_type;
            cmd.behaviors = std::move(*parsed);
            break;
        }
        default:
            break;
    }

    return cmd;
}

Result<std::vector<BehaviorCommand>> parse_behavior_commands(const Value& value) {
    const Array* arr = value.try_array();
    if (arr == nullptr) {
        return Err<std::vector<BehaviorCommand>>(
            schema_error("behaviors", std::string("expected array, got ") + value.type_name()));
    }

    std::vector<BehaviorCommand> commands;
    commands.reserve(arr->size());
    for (std::size_t i = 0; i < arr->size(); ++i) {
        auto cmd = parse_behavior_command((*arr)[i]);
        if (!cmd) {
            return Err<std::vector<BehaviorCommand>>(
                Error(ErrorCode::SchemaError, "[" + std::to_string(i) + "]." + cmd.error().message()));
        }
        commands.push_back(std::move(*cmd));
    }
    return commands;
}

// =============================================================================
// Serialization
// =============================================================================

Value command_to_value(const BehaviorCommand& command) {
    Value out = Value::table({{"action", Value(command_kind_name(command.kind))}});

    switch (command.kind) {
        case CommandKind::MoveTo:
            out.set("x", command.x);
            out.set("y", command.y);
            break;
        case CommandKind::DoForTime:
            out.set("seconds", command.seconds);
            break;
        case CommandKind::SpawnMob:
        case CommandKind::SpawnProjectile:
        case CommandKind::RotateJointsClockwise:
            if (command.keys) {
                Array keys;
                for (const auto& key : *command.keys) {
                    keys.emplace_back(key);
                }
                out.set("keys", Value(std::move(keys)));
            } else if (command.kind == CommandKind::RotateJointsClockwise) {
                out.set("keys", Value::array());
            }
            break;
        case CommandKind::TransmitMobBehavior:
            out.set("mob_type", command.mob_type);
            out.set("behaviors", commands_to_value(command.behaviors));
            break;
        default:
            break;
    }

    return out;
}

Value commands_to_value(const std::vector<BehaviorCommand>& commands) {
    Array out;
    out.reserve(commands.size());
    for (const auto& cmd : commands) {
        out.push_back(command_to_value(cmd));
    }
    return Value(std::move(out));
}

} // namespace mobdef_ai
