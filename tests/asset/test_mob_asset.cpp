// mobdef_asset MobAsset deserialization tests

#include <catch2/catch_test_macros.hpp>
#include <mobdef/asset/mob_asset.hpp>
#include <mobdef/data/toml_codec.hpp>

#include <string>

using namespace mobdef_asset;
using mobdef_data::Value;

namespace {

Value parse(const std::string& text) {
    auto result = mobdef_data::parse_toml(text, "test.mob");
    REQUIRE(result.is_ok());
    return *result;
}

std::string failing_field(const mobdef_core::Result<MobAsset>& result) {
    REQUIRE(result.is_err());
    REQUIRE(result.error().code() == mobdef_core::ErrorCode::SchemaError);
    return result.error().as<mobdef_core::DefinitionError>()->field;
}

} // namespace

// =============================================================================
// Defaults
// =============================================================================

TEST_CASE("Minimal definition gets every default", "[asset][mob_asset]") {
    auto result = mob_asset_from_value("grunt", parse("name = \"Grunt\"\n"));
    REQUIRE(result.is_ok());

    const MobAsset& mob = *result;
    REQUIRE(mob.name == "Grunt");
    REQUIRE(mob.spawnable);
    REQUIRE(mob.health == 50);
    REQUIRE(mob.rotation_locked);
    REQUIRE(mob.max_linear_speed == Vec2{20.0, 20.0});
    REQUIRE(mob.linear_deceleration == Vec2{0.3, 0.3});
    REQUIRE(mob.restitution == 0.5);
    REQUIRE(mob.projectile_damage == 5);
    REQUIRE(mob.projectile_speed == 100.0);
    REQUIRE_FALSE(mob.targeting_range.has_value());
    REQUIRE_FALSE(mob.behavior.has_value());
    REQUIRE_FALSE(mob.mob_spawners.has_value());

    REQUIRE(mob.colliders.size() == 1);
    REQUIRE(std::get<RectangleShape>(mob.colliders[0].shape) == RectangleShape{10.0, 10.0});

    REQUIRE(mob.collision_layer_membership == std::vector<PhysicsLayer>{PhysicsLayer::EnemyMob});
    REQUIRE(mob.collision_layer_filter.size() == 5);
    REQUIRE(mob.collision_layer_filter.back() == PhysicsLayer::EnemyTentacle);
}

TEST_CASE("Full definition deserializes", "[asset][mob_asset]") {
    auto result = mob_asset_from_value("xhitara/spitter", parse(R"(
name = "Spitter"
health = 120
spawnable = false
max_linear_speed = [5, 7.5]
targeting_range = 300
collision_layer_membership = ["EnemyMob", "EnemyTentacle"]
decorations = [["eye", [1, 2]]]

[[colliders]]
shape = { Circle = 4.0 }
position = [0, 1]
rotation = 0.5

[projectile_spawners.spawners.front]
timer = 1.5
position = [0, 10]
rotation = 0
projectile_type = "Blast"
faction = "Enemy"

[mob_spawners.spawners.belly]
timer = 3
position = [0, -5]
rotation = 3.14
mob_ref = "mobs/xhitara/grunt.mob"

[[jointed_mobs]]
key = "tail"
mob_ref = "xhitara/tail.mob"
[jointed_mobs.chain]
length = 4
pos_offset = [0, -2]
anchor_offset = [0, 1]

[behavior]
type = "Forever"
children = [{ type = "Action", name = "Move", behaviors = [{ action = "MoveDown" }] }]
)"));

    REQUIRE(result.is_ok());
    const MobAsset& mob = *result;
    REQUIRE(mob.health == 120);
    REQUIRE_FALSE(mob.spawnable);
    REQUIRE(mob.max_linear_speed == Vec2{5.0, 7.5});
    REQUIRE(mob.targeting_range == 300.0);
    REQUIRE(mob.collision_layer_membership.size() == 2);
    REQUIRE(mob.decorations == std::vector<Decoration>{{"eye", {1.0, 2.0}}});

    REQUIRE(std::get<CircleShape>(mob.colliders[0].shape).radius == 4.0);
    REQUIRE(mob.colliders[0].rotation == 0.5);

    const auto& front = mob.projectile_spawners->spawners.at("front");
    REQUIRE(front.projectile_type == ProjectileType::Blast);
    REQUIRE(front.speed_multiplier == 1.0);
    REQUIRE(front.pre_spawn_animation_start_time == 0.75);

    REQUIRE(mob.mob_spawners->spawners.at("belly").mob_ref == "xhitara/grunt");

    REQUIRE(mob.jointed_mobs.size() == 1);
    REQUIRE(mob.jointed_mobs[0].mob_ref == "xhitara/tail");
    REQUIRE(mob.jointed_mobs[0].chain->length == 4);
    REQUIRE_FALSE(mob.jointed_mobs[0].chain->random_chain.has_value());

    REQUIRE(mob.behavior.has_value());
    REQUIRE(mob.behavior->type() == mobdef_ai::BehaviorNodeType::Forever);
}

// =============================================================================
// Closed schema
// =============================================================================

TEST_CASE("Schema errors name the field", "[asset][mob_asset]") {
    SECTION("missing name") {
        REQUIRE(failing_field(mob_asset_from_value("x", parse("health = 5\n"))) == "name");
    }

    SECTION("unknown top-level field") {
        REQUIRE(failing_field(mob_asset_from_value("x", parse("name = \"X\"\nspeed = 3\n"))) == "speed");
    }

    SECTION("wrong type") {
        auto result = mob_asset_from_value("x", parse("name = \"X\"\nhealth = \"lots\"\n"));
        REQUIRE(failing_field(result) == "health");
        REQUIRE(result.error().message().find("expected integer, got string") != std::string::npos);
    }

    SECTION("float where integer is required") {
        REQUIRE(failing_field(mob_asset_from_value("x", parse("name = \"X\"\nhealth = 5.5\n"))) == "health");
    }

    SECTION("negative unsigned integer") {
        REQUIRE(failing_field(mob_asset_from_value("x", parse("name = \"X\"\nprojectile_damage = -1\n"))) ==
                "projectile_damage");
    }

    SECTION("bad vector") {
        REQUIRE(failing_field(mob_asset_from_value("x", parse("name = \"X\"\nmax_linear_speed = [1]\n"))) ==
                "max_linear_speed");
    }

    SECTION("nested collider shape") {
        auto value = parse("name = \"X\"\n[[colliders]]\nshape = { Hexagon = 3 }\n");
        REQUIRE(failing_field(mob_asset_from_value("x", value)) == "colliders[0].shape");
    }

    SECTION("unknown physics layer") {
        auto value = parse("name = \"X\"\ncollision_layer_filter = [\"Player\", \"Ghost\"]\n");
        REQUIRE(failing_field(mob_asset_from_value("x", value)) == "collision_layer_filter[1]");
    }

    SECTION("spawner missing timer") {
        auto value = parse("name = \"X\"\n[mob_spawners.spawners.a]\nposition = [0, 0]\nrotation = 0\n"
                           "mob_ref = \"y\"\n");
        REQUIRE(failing_field(mob_asset_from_value("x", value)) == "mob_spawners.spawners.a.timer");
    }

    SECTION("empty projectile type") {
        auto value = parse("name = \"X\"\n[projectile_spawners.spawners.a]\ntimer = 1\nposition = [0, 0]\n"
                           "rotation = 0\nprojectile_type = \"\"\nfaction = \"Enemy\"\n");
        auto result = mob_asset_from_value("x", value);
        REQUIRE(failing_field(result) == "projectile_spawners.spawners.a.projectile_type");
        REQUIRE(result.error().message().find("expected Bullet or Blast") != std::string::npos);
    }

    SECTION("empty faction") {
        auto value = parse("name = \"X\"\n[projectile_spawners.spawners.a]\ntimer = 1\nposition = [0, 0]\n"
                           "rotation = 0\nprojectile_type = \"Bullet\"\nfaction = \"\"\n");
        auto result = mob_asset_from_value("x", value);
        REQUIRE(failing_field(result) == "projectile_spawners.spawners.a.faction");
        REQUIRE(result.error().message().find("expected Ally or Enemy") != std::string::npos);
    }

    SECTION("missing faction is reported once as missing") {
        auto value = parse("name = \"X\"\n[projectile_spawners.spawners.a]\ntimer = 1\nposition = [0, 0]\n"
                           "rotation = 0\nprojectile_type = \"Bullet\"\n");
        auto result = mob_asset_from_value("x", value);
        REQUIRE(failing_field(result) == "projectile_spawners.spawners.a.faction");
        REQUIRE(result.error().message().find("missing required field") != std::string::npos);
    }

    SECTION("error names the entity") {
        auto result = mob_asset_from_value("xhitara/grunt", parse("health = 5\n"));
        REQUIRE(result.error().as<mobdef_core::DefinitionError>()->entity == "xhitara/grunt");
    }
}

TEST_CASE("Malformed behavior does not fail deserialization", "[asset][mob_asset]") {
    auto result = mob_asset_from_value("x", parse("name = \"X\"\n[behavior]\ntype = \"Teleport\"\n"));
    REQUIRE(result.is_ok());
    REQUIRE(result->behavior->is_unknown());
}

// =============================================================================
// Serialization
// =============================================================================

TEST_CASE("mob_asset_to_value writes every field", "[asset][mob_asset]") {
    MobAsset mob;
    mob.name = "Grunt";

    Value out = mob_asset_to_value(mob);
    for (const auto& field : mob_asset_field_names()) {
        if (field == "targeting_range" || field == "mob_spawners" || field == "projectile_spawners" ||
            field == "behavior") {
            REQUIRE_FALSE(out.contains(field));
        } else {
            REQUIRE(out.contains(field));
        }
    }

    auto back = mob_asset_from_value("grunt", out);
    REQUIRE(back.is_ok());
    REQUIRE(*back == mob);
}

TEST_CASE("Full definition survives a TOML round trip", "[asset][mob_asset]") {
    auto first = mob_asset_from_value("xhitara/mother", parse(R"(
name = "Mother"
health = 400
targeting_range = 250.5
sprite = "mother"
decorations = [["eye", [1, 2]], ["fin", [-3.5, 0]]]

[[colliders]]
shape = { Capsule = [2.0, 6.0] }
position = [0, 1]
rotation = 0.25

[mob_spawners.spawners.belly]
timer = 3
position = [0, -5]
rotation = 3.14
mob_ref = "mobs/xhitara/grunt.mob"

[projectile_spawners.spawners.left]
timer = 0.8
position = [-4, 0]
rotation = 1.57
projectile_type = "Bullet"
faction = "Ally"
damage_multiplier = 2.5

[[jointed_mobs]]
key = "arm"
mob_ref = "xhitara/arm"
offset_pos = [3, 0]
anchor_1_pos = [1, 0]
anchor_2_pos = [-1, 0]
compliance = 0.001
angle_limit_range = { min = -0.5, max = 0.5, torque = 10 }

[[jointed_mobs]]
key = "tail"
mob_ref = "xhitara/tail.mob"
[jointed_mobs.chain]
length = 6
pos_offset = [0, -2]
anchor_offset = [0, 1]
random_chain = { min_length = 2, end_chance = 0.25 }

[behavior]
type = "Forever"
children = [
    { type = "Action", name = "Move", behaviors = [{ action = "MoveTo", x = 5.0, y = 2.0 }, { action = "DoForTime", seconds = 2.0 }] },
    { type = "Wait", seconds = 1.5 },
    { type = "IfThen", condition = { type = "Wait", seconds = 1.0 }, then_child = { type = "Action", name = "Then", behaviors = [] }, else_child = { type = "Trigger", trigger_type = "OnHit" } },
]
)"));
    REQUIRE(first.is_ok());
    REQUIRE(first->jointed_mobs.size() == 2);
    REQUIRE(first->jointed_mobs[0].angle_limit_range->torque == 10.0);
    REQUIRE(first->jointed_mobs[1].chain->random_chain->min_length == 2);

    auto text = mobdef_data::to_toml_string(mob_asset_to_value(*first));
    REQUIRE(text.is_ok());

    auto second = mob_asset_from_value("xhitara/mother", parse(*text));
    REQUIRE(second.is_ok());
    REQUIRE(*second == *first);
    REQUIRE(second->mob_spawners->spawners.at("belly").mob_ref == "xhitara/grunt");
    REQUIRE(second->targeting_range == 250.5);
}

TEST_CASE("Spawner references use the given naming rules", "[asset][mob_asset]") {
    mobdef_core::LayerPaths rules;
    rules.root_prefix = "enemies/";
    rules.definition_extension = ".def";

    auto value = parse("name = \"X\"\n[mob_spawners.spawners.a]\ntimer = 1\nposition = [0, 0]\nrotation = 0\n"
                       "mob_ref = \"enemies/xhitara/grunt.def\"\n"
                       "[[jointed_mobs]]\nkey = \"tail\"\nmob_ref = \"enemies/xhitara/tail.def\"\n");

    auto custom = mob_asset_from_value("x", value, rules);
    REQUIRE(custom.is_ok());
    REQUIRE(custom->mob_spawners->spawners.at("a").mob_ref == "xhitara/grunt");
    REQUIRE(custom->jointed_mobs[0].mob_ref == "xhitara/tail");

    auto defaults = mob_asset_from_value("x", value);
    REQUIRE(defaults.is_ok());
    REQUIRE(defaults->mob_spawners->spawners.at("a").mob_ref == "enemies/xhitara/grunt.def");
}

TEST_CASE("Physics layer names", "[asset][mob_asset]") {
    REQUIRE(parse_physics_layer("AllyProjectile") == PhysicsLayer::AllyProjectile);
    REQUIRE_FALSE(parse_physics_layer("allyprojectile").has_value());
    REQUIRE(std::string(physics_layer_name(PhysicsLayer::EnemyTentacle)) == "EnemyTentacle");
}
