// mobdef_ai BehaviorCommand tests

#include <catch2/catch_test_macros.hpp>
#include <mobdef/ai/behavior_command.hpp>

#include <string>

using namespace mobdef_ai;
using mobdef_data::Value;

TEST_CASE("Command kind names", "[ai][command]") {
    SECTION("every kind round trips") {
        for (CommandKind kind : k_all_command_kinds) {
            auto parsed = parse_command_kind(command_kind_name(kind));
            REQUIRE(parsed.has_value());
            REQUIRE(*parsed == kind);
        }
    }

    SECTION("lookup is case-sensitive") {
        REQUIRE_FALSE(parse_command_kind("movedown").has_value());
        REQUIRE_FALSE(parse_command_kind("Teleport").has_value());
    }
}

TEST_CASE("Command default params", "[ai][command]") {
    REQUIRE(command_default_params(CommandKind::MoveDown).empty());

    auto move_to = command_default_params(CommandKind::MoveTo);
    REQUIRE(move_to.at("x") == Value(0.0));
    REQUIRE(move_to.at("y") == Value(0.0));

    REQUIRE(command_default_params(CommandKind::DoForTime).at("seconds") == Value(1.0));
    REQUIRE(command_default_params(CommandKind::RotateJointsClockwise).at("keys") == Value::array());

    auto transmit = command_default_params(CommandKind::TransmitMobBehavior);
    REQUIRE(transmit.at("mob_type") == Value(""));
    REQUIRE(transmit.at("behaviors") == Value::array());
}

// =============================================================================
// Parsing
// =============================================================================

TEST_CASE("parse_behavior_command accepts each shape", "[ai][command]") {
    SECTION("unit command") {
        auto cmd = parse_behavior_command(Value::table({{"action", "MoveDown"}}));
        REQUIRE(cmd.is_ok());
        REQUIRE(*cmd == BehaviorCommand::simple(CommandKind::MoveDown));
    }

    SECTION("MoveTo accepts integers") {
        auto cmd = parse_behavior_command(Value::table({{"action", "MoveTo"}, {"x", 3}, {"y", -2.5}}));
        REQUIRE(cmd.is_ok());
        REQUIRE(cmd->x == 3.0);
        REQUIRE(cmd->y == -2.5);
    }

    SECTION("SpawnMob keys are optional") {
        auto bare = parse_behavior_command(Value::table({{"action", "SpawnMob"}}));
        REQUIRE(bare.is_ok());
        REQUIRE_FALSE(bare->keys.has_value());

        auto keyed = parse_behavior_command(
            Value::table({{"action", "SpawnMob"}, {"keys", Value::array({"left", "right"})}}));
        REQUIRE(keyed.is_ok());
        REQUIRE(keyed->keys == std::vector<std::string>{"left", "right"});
    }

    SECTION("TransmitMobBehavior nests commands") {
        auto cmd = parse_behavior_command(Value::table({
            {"action", "TransmitMobBehavior"},
            {"mob_type", "xhitara/spawn"},
            {"behaviors", Value::array({
                Value::table({{"action", "DoForTime"}, {"seconds", 2}}),
                Value::table({{"action", "MoveUp"}}),
            })},
        }));
        REQUIRE(cmd.is_ok());
        REQUIRE(cmd->mob_type == "xhitara/spawn");
        REQUIRE(cmd->behaviors.size() == 2);
        REQUIRE(cmd->behaviors[0].kind == CommandKind::DoForTime);
        REQUIRE(cmd->behaviors[0].seconds == 2.0);
    }
}

TEST_CASE("parse_behavior_command rejects malformed commands", "[ai][command]") {
    SECTION("unknown action") {
        auto cmd = parse_behavior_command(Value::table({{"action", "Teleport"}}));
        REQUIRE(cmd.is_err());
        REQUIRE(cmd.error().message().find("Teleport") != std::string::npos);
    }

    SECTION("missing tag") {
        REQUIRE(parse_behavior_command(Value::table({{"x", 1}})).is_err());
    }

    SECTION("unexpected field") {
        REQUIRE(parse_behavior_command(Value::table({{"action", "MoveDown"}, {"speed", 3}})).is_err());
    }

    SECTION("missing MoveTo coordinate") {
        REQUIRE(parse_behavior_command(Value::table({{"action", "MoveTo"}, {"x", 1}})).is_err());
    }

    SECTION("RotateJointsClockwise requires keys") {
        REQUIRE(parse_behavior_command(Value::table({{"action", "RotateJointsClockwise"}})).is_err());
    }

    SECTION("list errors name the failing index") {
        auto list = parse_behavior_commands(Value::array({
            Value::table({{"action", "MoveDown"}}),
            Value::table({{"action", "Nope"}}),
        }));
        REQUIRE(list.is_err());
        REQUIRE(list.error().message().rfind("[1].", 0) == 0);
    }
}

TEST_CASE("command_to_value writes the action tag", "[ai][command]") {
    BehaviorCommand cmd = BehaviorCommand::simple(CommandKind::MoveTo);
    cmd.x = 4.0;
    cmd.y = 5.0;

    Value out = command_to_value(cmd);
    REQUIRE(*out.get_string("action") == "MoveTo");
    REQUIRE(out.get("x")->as_float() == 4.0);

    auto reparsed = parse_behavior_command(out);
    REQUIRE(reparsed.is_ok());
    REQUIRE(*reparsed == cmd);
}
