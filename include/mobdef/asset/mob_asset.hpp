#pragma once

/// @file mob_asset.hpp
/// @brief Typed mob definition with compiled defaults and a closed field set

#include <mobdef/ai/behavior_dsl.hpp>
#include <mobdef/core/config.hpp>
#include <mobdef/core/error.hpp>
#include <mobdef/data/value.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mobdef_asset {

// =============================================================================
// Math / physics primitives
// =============================================================================

/// 2D vector, written as [x, y]
struct Vec2 {
    double x = 0.0;
    double y = 0.0;

    bool operator==(const Vec2&) const = default;
};

struct RectangleShape {
    double width = 10.0;
    double height = 10.0;
    bool operator==(const RectangleShape&) const = default;
};

struct CircleShape {
    double radius = 0.0;
    bool operator==(const CircleShape&) const = default;
};

struct CapsuleShape {
    double radius = 0.0;
    double half_length = 0.0;
    bool operator==(const CapsuleShape&) const = default;
};

/// Written as a single-key table: {Rectangle=[w,h]}, {Circle=r} or {Capsule=[r,l]}
using ColliderShape = std::variant<RectangleShape, CircleShape, CapsuleShape>;

struct Collider {
    ColliderShape shape = RectangleShape{};
    Vec2 position;
    double rotation = 0.0;

    bool operator==(const Collider&) const = default;
};

enum class PhysicsLayer : std::uint8_t {
    Player,
    AllyMob,
    EnemyMob,
    AllyProjectile,
    EnemyProjectile,
    AllyTentacle,
    EnemyTentacle,
};

[[nodiscard]] const char* physics_layer_name(PhysicsLayer layer);
[[nodiscard]] std::optional<PhysicsLayer> parse_physics_layer(const std::string& name);

// =============================================================================
// Spawners
// =============================================================================

struct MobSpawner {
    double timer = 0.0;
    Vec2 position;
    double rotation = 0.0;
    std::string mob_ref;  // normalized

    bool operator==(const MobSpawner&) const = default;
};

enum class ProjectileType : std::uint8_t { Bullet, Blast };
enum class Faction : std::uint8_t { Ally, Enemy };

struct ProjectileSpawner {
    double timer = 0.0;
    Vec2 position;
    double rotation = 0.0;
    ProjectileType projectile_type = ProjectileType::Bullet;
    Faction faction = Faction::Enemy;
    double speed_multiplier = 1.0;
    double damage_multiplier = 1.0;
    double range_seconds_multiplier = 1.0;
    double pre_spawn_animation_start_time = 0.75;
    double pre_spawn_animation_end_time = 0.2;

    bool operator==(const ProjectileSpawner&) const = default;
};

struct MobSpawnerComponent {
    std::map<std::string, MobSpawner> spawners;
    bool operator==(const MobSpawnerComponent&) const = default;
};

struct ProjectileSpawnerComponent {
    std::map<std::string, ProjectileSpawner> spawners;
    bool operator==(const ProjectileSpawnerComponent&) const = default;
};

// =============================================================================
// Joints
// =============================================================================

struct JointAngleLimit {
    double min = 0.0;
    double max = 0.0;
    double torque = 0.0;
    bool operator==(const JointAngleLimit&) const = default;
};

struct RandomMobChain {
    std::uint8_t min_length = 0;
    double end_chance = 0.0;
    bool operator==(const RandomMobChain&) const = default;
};

struct MobChain {
    std::uint8_t length = 0;
    Vec2 pos_offset;
    Vec2 anchor_offset;
    std::optional<RandomMobChain> random_chain;
    bool operator==(const MobChain&) const = default;
};

struct JointedMobRef {
    std::string key;
    std::string mob_ref;  // normalized
    Vec2 offset_pos;
    Vec2 anchor_1_pos;
    Vec2 anchor_2_pos;
    std::optional<JointAngleLimit> angle_limit_range;
    double compliance = 0.0;
    std::optional<MobChain> chain;

    bool operator==(const JointedMobRef&) const = default;
};

/// Decorative sprite, written as [sprite, [x, y]]
struct Decoration {
    std::string sprite;
    Vec2 position;
    bool operator==(const Decoration&) const = default;
};

// =============================================================================
// MobAsset
// =============================================================================

namespace defaults {

inline constexpr bool k_spawnable = true;
inline constexpr double k_z_level = 0.0;
inline constexpr bool k_rotation_locked = true;
inline constexpr Vec2 k_max_linear_speed{20.0, 20.0};
inline constexpr Vec2 k_linear_acceleration{0.1, 0.1};
inline constexpr Vec2 k_linear_deceleration{0.3, 0.3};
inline constexpr double k_angular_acceleration = 0.1;
inline constexpr double k_angular_deceleration = 0.1;
inline constexpr double k_max_angular_speed = 1.0;
inline constexpr double k_restitution = 0.5;
inline constexpr double k_friction = 0.5;
inline constexpr double k_collider_density = 1.0;
inline constexpr std::uint32_t k_health = 50;
inline constexpr double k_projectile_speed = 100.0;
inline constexpr std::uint32_t k_projectile_damage = 5;
inline constexpr double k_projectile_range_seconds = 1.0;

[[nodiscard]] std::vector<Collider> colliders();
[[nodiscard]] std::vector<PhysicsLayer> collision_layer_membership();
[[nodiscard]] std::vector<PhysicsLayer> collision_layer_filter();

} // namespace defaults

/// One fully-resolved mob definition
struct MobAsset {
    std::string name;
    bool spawnable = defaults::k_spawnable;

    std::vector<Collider> colliders = defaults::colliders();
    double z_level = defaults::k_z_level;
    bool rotation_locked = defaults::k_rotation_locked;

    Vec2 max_linear_speed = defaults::k_max_linear_speed;
    Vec2 linear_acceleration = defaults::k_linear_acceleration;
    Vec2 linear_deceleration = defaults::k_linear_deceleration;
    double angular_acceleration = defaults::k_angular_acceleration;
    double angular_deceleration = defaults::k_angular_deceleration;
    double max_angular_speed = defaults::k_max_angular_speed;

    double restitution = defaults::k_restitution;
    double friction = defaults::k_friction;
    double collider_density = defaults::k_collider_density;
    std::vector<PhysicsLayer> collision_layer_membership = defaults::collision_layer_membership();
    std::vector<PhysicsLayer> collision_layer_filter = defaults::collision_layer_filter();

    std::uint32_t health = defaults::k_health;
    std::optional<double> targeting_range;
    double projectile_speed = defaults::k_projectile_speed;
    std::uint32_t projectile_damage = defaults::k_projectile_damage;
    double projectile_range_seconds = defaults::k_projectile_range_seconds;

    std::string sprite;
    std::vector<Decoration> decorations;

    std::optional<MobSpawnerComponent> mob_spawners;
    std::optional<ProjectileSpawnerComponent> projectile_spawners;

    std::vector<JointedMobRef> jointed_mobs;

    bool behavior_transmitter = false;
    std::optional<mobdef_ai::dsl::BehaviorNode> behavior;

    bool operator==(const MobAsset&) const = default;
};

/// Top-level keys a definition may contain
[[nodiscard]] const std::vector<std::string>& mob_asset_field_names();

/// Deserialize a merged definition table.
/// Unknown fields, wrong types and missing required fields fail with a
/// Schema DefinitionError naming `entity` and the dotted field path.
/// Float fields accept integers. Behavior tables never fail here; malformed
/// nodes are kept as UnknownNode. Spawner and joint `mob_ref`s are
/// normalized with `rules`.
[[nodiscard]] mobdef_core::Result<MobAsset> mob_asset_from_value(const std::string& entity,
                                                                 const mobdef_data::Value& value,
                                                                 const mobdef_core::LayerPaths& rules = {});

/// Serialize every field (defaults included) back to a table
[[nodiscard]] mobdef_data::Value mob_asset_to_value(const MobAsset& asset);

} // namespace mobdef_asset
