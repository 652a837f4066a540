/// @file mob_asset.cpp
/// @brief MobAsset deserialization and serialization

#include <mobdef/asset/mob_asset.hpp>
#include <mobdef/asset/mob_ref.hpp>

#include <limits>
#include <set>

namespace mobdef_asset {

using mobdef_core::DefinitionError;
using mobdef_core::Err;
using mobdef_core::Result;
using mobdef_data::Array;
using mobdef_data::Table;
using mobdef_data::Value;

// =============================================================================
// Names and defaults
// =============================================================================

const char* physics_layer_name(PhysicsLayer layer) {
    switch (layer) {
        case PhysicsLayer::Player: return "Player";
        case PhysicsLayer::AllyMob: return "AllyMob";
        case PhysicsLayer::EnemyMob: return "EnemyMob";
        case PhysicsLayer::AllyProjectile: return "AllyProjectile";
        case PhysicsLayer::EnemyProjectile: return "EnemyProjectile";
        case PhysicsLayer::AllyTentacle: return "AllyTentacle";
        case PhysicsLayer::EnemyTentacle: return "EnemyTentacle";
        default: return "Unknown";
    }
}

std::optional<PhysicsLayer> parse_physics_layer(const std::string& name) {
    for (auto layer : {PhysicsLayer::Player, PhysicsLayer::AllyMob, PhysicsLayer::EnemyMob,
                       PhysicsLayer::AllyProjectile, PhysicsLayer::EnemyProjectile,
                       PhysicsLayer::AllyTentacle, PhysicsLayer::EnemyTentacle}) {
        if (name == physics_layer_name(layer)) {
            return layer;
        }
    }
    return std::nullopt;
}

namespace defaults {

std::vector<Collider> colliders() {
    return {Collider{RectangleShape{10.0, 10.0}, Vec2{}, 0.0}};
}

std::vector<PhysicsLayer> collision_layer_membership() {
    return {PhysicsLayer::EnemyMob};
}

std::vector<PhysicsLayer> collision_layer_filter() {
    return {PhysicsLayer::AllyMob, PhysicsLayer::AllyProjectile, PhysicsLayer::EnemyMob,
            PhysicsLayer::Player, PhysicsLayer::EnemyTentacle};
}

} // namespace defaults

const std::vector<std::string>& mob_asset_field_names() {
    static const std::vector<std::string> names = {
        "name", "spawnable", "colliders", "z_level", "rotation_locked",
        "max_linear_speed", "linear_acceleration", "linear_deceleration",
        "angular_acceleration", "angular_deceleration", "max_angular_speed",
        "restitution", "friction", "collider_density",
        "collision_layer_membership", "collision_layer_filter",
        "health", "targeting_range", "projectile_speed", "projectile_damage",
        "projectile_range_seconds", "sprite", "decorations",
        "mob_spawners", "projectile_spawners", "jointed_mobs",
        "behavior_transmitter", "behavior",
    };
    return names;
}

// =============================================================================
// Field reader
// =============================================================================

namespace {

struct Failure {
    std::string field;
    std::string reason;
};

std::string expected(const char* what, const Value& got) {
    return std::string("expected ") + what + ", got " + got.type_name();
}

bool parse_vec2(const Value& value, Vec2& out) {
    const Array* arr = value.try_array();
    if (arr == nullptr || arr->size() != 2) {
        return false;
    }
    auto x = (*arr)[0].try_numeric();
    auto y = (*arr)[1].try_numeric();
    if (!x || !y) {
        return false;
    }
    out = Vec2{*x, *y};
    return true;
}

/// Reads typed fields out of one table, tracking which keys were consumed.
/// The first failure anywhere in the document is kept in the shared sink.
class FieldReader {
public:
    FieldReader(const Value& value, std::string path, std::optional<Failure>& failure)
        : m_value(value), m_path(std::move(path)), m_failure(failure)
    {
        if (!value.is_table()) {
            fail_at(m_path, expected("table", value));
        }
    }

    std::string path_of(const std::string& key) const {
        return m_path.empty() ? key : m_path + "." + key;
    }

    void fail(const std::string& key, std::string reason) {
        fail_at(path_of(key), std::move(reason));
    }

    void fail_at(std::string field, std::string reason) {
        if (!m_failure) {
            m_failure = Failure{std::move(field), std::move(reason)};
        }
    }

    bool has(const std::string& key) const {
        return m_value.get(key) != nullptr;
    }

    const Value* take(const std::string& key) {
        m_consumed.insert(key);
        return m_value.get(key);
    }

    const Value* require(const std::string& key) {
        const Value* v = take(key);
        if (v == nullptr) {
            fail(key, "missing required field");
        }
        return v;
    }

    void number(const std::string& key, double& out, bool required = false) {
        const Value* v = required ? require(key) : take(key);
        if (v == nullptr) return;
        if (auto n = v->try_numeric()) {
            out = *n;
        } else {
            fail(key, expected("number", *v));
        }
    }

    void optional_number(const std::string& key, std::optional<double>& out) {
        const Value* v = take(key);
        if (v == nullptr) return;
        if (auto n = v->try_numeric()) {
            out = *n;
        } else {
            fail(key, expected("number", *v));
        }
    }

    void boolean(const std::string& key, bool& out) {
        const Value* v = take(key);
        if (v == nullptr) return;
        if (auto b = v->try_bool()) {
            out = *b;
        } else {
            fail(key, expected("boolean", *v));
        }
    }

    void string(const std::string& key, std::string& out, bool required = false) {
        const Value* v = required ? require(key) : take(key);
        if (v == nullptr) return;
        if (const std::string* s = v->try_string()) {
            out = *s;
        } else {
            fail(key, expected("string", *v));
        }
    }

    template<typename UInt>
    void unsigned_int(const std::string& key, UInt& out, bool required = false) {
        const Value* v = required ? require(key) : take(key);
        if (v == nullptr) return;
        auto i = v->try_int();
        if (!i) {
            fail(key, expected("integer", *v));
        } else if (*i < 0 || static_cast<std::uint64_t>(*i) > std::numeric_limits<UInt>::max()) {
            fail(key, "integer out of range: " + std::to_string(*i));
        } else {
            out = static_cast<UInt>(*i);
        }
    }

    void vec2(const std::string& key, Vec2& out, bool required = false) {
        const Value* v = required ? require(key) : take(key);
        if (v == nullptr) return;
        if (!parse_vec2(*v, out)) {
            fail(key, "expected [x, y] number pair");
        }
    }

    /// Report every key that was never read
    void finish() {
        if (const Table* tbl = m_value.try_table()) {
            for (const auto& [key, value] : *tbl) {
                if (m_consumed.count(key) == 0) {
                    fail(key, "unknown field");
                }
            }
        }
    }

    std::optional<Failure>& sink() { return m_failure; }

private:
    const Value& m_value;
    std::string m_path;
    std::optional<Failure>& m_failure;
    std::set<std::string> m_consumed;
};

// -----------------------------------------------------------------------------
// Sub-record readers
// -----------------------------------------------------------------------------

void read_shape(const Value& value, const std::string& path, ColliderShape& out, std::optional<Failure>& failure) {
    auto fail = [&](std::string reason) {
        if (!failure) failure = Failure{path, std::move(reason)};
    };

    const Table* tbl = value.try_table();
    if (tbl == nullptr || tbl->size() != 1) {
        fail("shape must be a table with exactly one of Rectangle, Circle, Capsule");
        return;
    }

    const auto& [kind, dims] = *tbl->begin();
    if (kind == "Rectangle" || kind == "Capsule") {
        Vec2 pair;
        if (!parse_vec2(dims, pair)) {
            fail(kind + " expects a pair of numbers");
            return;
        }
        if (kind == "Rectangle") {
            out = RectangleShape{pair.x, pair.y};
        } else {
            out = CapsuleShape{pair.x, pair.y};
        }
    } else if (kind == "Circle") {
        auto radius = dims.try_numeric();
        if (!radius) {
            fail("Circle expects a radius number");
            return;
        }
        out = CircleShape{*radius};
    } else {
        fail("unknown shape '" + kind + "'");
    }
}

void read_layers(FieldReader& reader, const std::string& key, std::vector<PhysicsLayer>& out) {
    const Value* v = reader.take(key);
    if (v == nullptr) return;
    const Array* arr = v->try_array();
    if (arr == nullptr) {
        reader.fail(key, expected("array", *v));
        return;
    }
    std::vector<PhysicsLayer> layers;
    for (std::size_t i = 0; i < arr->size(); ++i) {
        const std::string* name = (*arr)[i].try_string();
        auto layer = name ? parse_physics_layer(*name) : std::nullopt;
        if (!layer) {
            reader.fail(key + "[" + std::to_string(i) + "]", "unknown physics layer");
            return;
        }
        layers.push_back(*layer);
    }
    out = std::move(layers);
}

void read_colliders(FieldReader& reader, std::vector<Collider>& out) {
    const Value* v = reader.take("colliders");
    if (v == nullptr) return;
    const Array* arr = v->try_array();
    if (arr == nullptr) {
        reader.fail("colliders", expected("array", *v));
        return;
    }
    std::vector<Collider> colliders;
    for (std::size_t i = 0; i < arr->size(); ++i) {
        std::string path = reader.path_of("colliders[" + std::to_string(i) + "]");
        FieldReader item((*arr)[i], path, reader.sink());
        Collider collider;
        if (const Value* shape = item.require("shape")) {
            read_shape(*shape, item.path_of("shape"), collider.shape, reader.sink());
        }
        item.vec2("position", collider.position);
        item.number("rotation", collider.rotation);
        item.finish();
        colliders.push_back(collider);
    }
    out = std::move(colliders);
}

void read_decorations(FieldReader& reader, std::vector<Decoration>& out) {
    const Value* v = reader.take("decorations");
    if (v == nullptr) return;
    const Array* arr = v->try_array();
    if (arr == nullptr) {
        reader.fail("decorations", expected("array", *v));
        return;
    }
    for (std::size_t i = 0; i < arr->size(); ++i) {
        const Array* pair = (*arr)[i].try_array();
        Decoration decoration;
        if (pair == nullptr || pair->size() != 2 || !(*pair)[0].is_string() ||
            !parse_vec2((*pair)[1], decoration.position)) {
            reader.fail("decorations[" + std::to_string(i) + "]", "expected [sprite, [x, y]]");
            return;
        }
        decoration.sprite = (*pair)[0].as_string();
        out.push_back(std::move(decoration));
    }
}

template<typename Spawner, typename ReadFn>
void read_spawner_map(FieldReader& reader, const std::string& key, std::map<std::string, Spawner>& out,
                      ReadFn read_one) {
    const Value* component = reader.take(key);
    if (component == nullptr) return;

    FieldReader comp(*component, reader.path_of(key), reader.sink());
    if (const Value* spawners = comp.require("spawners")) {
        if (const Table* tbl = spawners->try_table()) {
            for (const auto& [name, body] : *tbl) {
                FieldReader item(body, comp.path_of("spawners." + name), reader.sink());
                Spawner spawner;
                read_one(item, spawner);
                item.finish();
                out.emplace(name, std::move(spawner));
            }
        } else {
            comp.fail("spawners", expected("table", *spawners));
        }
    }
    comp.finish();
}

void read_mob_spawner(FieldReader& item, MobSpawner& spawner) {
    item.number("timer", spawner.timer, true);
    item.vec2("position", spawner.position, true);
    item.number("rotation", spawner.rotation, true);
    item.string("mob_ref", spawner.mob_ref, true);
}

void read_projectile_spawner(FieldReader& item, ProjectileSpawner& spawner) {
    item.number("timer", spawner.timer, true);
    item.vec2("position", spawner.position, true);
    item.number("rotation", spawner.rotation, true);

    std::string projectile_type;
    item.string("projectile_type", projectile_type, true);
    if (projectile_type == "Bullet") {
        spawner.projectile_type = ProjectileType::Bullet;
    } else if (projectile_type == "Blast") {
        spawner.projectile_type = ProjectileType::Blast;
    } else if (item.has("projectile_type")) {
        item.fail("projectile_type", "expected Bullet or Blast");
    }

    std::string faction;
    item.string("faction", faction, true);
    if (faction == "Ally") {
        spawner.faction = Faction::Ally;
    } else if (faction == "Enemy") {
        spawner.faction = Faction::Enemy;
    } else if (item.has("faction")) {
        item.fail("faction", "expected Ally or Enemy");
    }

    item.number("speed_multiplier", spawner.speed_multiplier);
    item.number("damage_multiplier", spawner.damage_multiplier);
    item.number("range_seconds_multiplier", spawner.range_seconds_multiplier);
    item.number("pre_spawn_animation_start_time", spawner.pre_spawn_animation_start_time);
    item.number("pre_spawn_animation_end_time", spawner.pre_spawn_animation_end_time);
}

void read_jointed_mobs(FieldReader& reader, std::vector<JointedMobRef>& out) {
    const Value* v = reader.take("jointed_mobs");
    if (v == nullptr) return;
    const Array* arr = v->try_array();
    if (arr == nullptr) {
        reader.fail("jointed_mobs", expected("array", *v));
        return;
    }

    for (std::size_t i = 0; i < arr->size(); ++i) {
        FieldReader item((*arr)[i], reader.path_of("jointed_mobs[" + std::to_string(i) + "]"), reader.sink());
        JointedMobRef joint;
        item.string("key", joint.key, true);
        item.string("mob_ref", joint.mob_ref, true);
        item.vec2("offset_pos", joint.offset_pos);
        item.vec2("anchor_1_pos", joint.anchor_1_pos);
        item.vec2("anchor_2_pos", joint.anchor_2_pos);
        item.number("compliance", joint.compliance);

        if (const Value* limit = item.take("angle_limit_range")) {
            FieldReader lr(*limit, item.path_of("angle_limit_range"), reader.sink());
            JointAngleLimit angle;
            lr.number("min", angle.min, true);
            lr.number("max", angle.max, true);
            lr.number("torque", angle.torque, true);
            lr.finish();
            joint.angle_limit_range = angle;
        }

        if (const Value* chain_value = item.take("chain")) {
            FieldReader cr(*chain_value, item.path_of("chain"), reader.sink());
            MobChain chain;
            cr.unsigned_int("length", chain.length, true);
            cr.vec2("pos_offset", chain.pos_offset, true);
            cr.vec2("anchor_offset", chain.anchor_offset, true);
            if (const Value* random = cr.take("random_chain")) {
                FieldReader rr(*random, cr.path_of("random_chain"), reader.sink());
                RandomMobChain rc;
                rr.unsigned_int("min_length", rc.min_length, true);
                rr.number("end_chance", rc.end_chance, true);
                rr.finish();
                chain.random_chain = rc;
            }
            cr.finish();
            joint.chain = chain;
        }

        item.finish();
        out.push_back(std::move(joint));
    }
}

} // anonymous namespace

// =============================================================================
// Deserialization
// =============================================================================

Result<MobAsset> mob_asset_from_value(const std::string& entity, const Value& value,
                                      const mobdef_core::LayerPaths& rules) {
    std::optional<Failure> failure;
    FieldReader reader(value, "", failure);
    MobAsset asset;

    if (!failure) {
        reader.string("name", asset.name, true);
        reader.boolean("spawnable", asset.spawnable);

        read_colliders(reader, asset.colliders);
        reader.number("z_level", asset.z_level);
        reader.boolean("rotation_locked", asset.rotation_locked);

        reader.vec2("max_linear_speed", asset.max_linear_speed);
        reader.vec2("linear_acceleration", asset.linear_acceleration);
        reader.vec2("linear_deceleration", asset.linear_deceleration);
        reader.number("angular_acceleration", asset.angular_acceleration);
        reader.number("angular_deceleration", asset.angular_deceleration);
        reader.number("max_angular_speed", asset.max_angular_speed);

        reader.number("restitution", asset.restitution);
        reader.number("friction", asset.friction);
        reader.number("collider_density", asset.collider_density);
        read_layers(reader, "collision_layer_membership", asset.collision_layer_membership);
        read_layers(reader, "collision_layer_filter", asset.collision_layer_filter);

        reader.unsigned_int("health", asset.health);
        reader.optional_number("targeting_range", asset.targeting_range);
        reader.number("projectile_speed", asset.projectile_speed);
        reader.unsigned_int("projectile_damage", asset.projectile_damage);
        reader.number("projectile_range_seconds", asset.projectile_range_seconds);

        reader.string("sprite", asset.sprite);
        read_decorations(reader, asset.decorations);

        {
            MobSpawnerComponent component;
            bool present = value.contains("mob_spawners");
            read_spawner_map(reader, "mob_spawners", component.spawners, read_mob_spawner);
            if (present) asset.mob_spawners = std::move(component);
        }
        {
            ProjectileSpawnerComponent component;
            bool present = value.contains("projectile_spawners");
            read_spawner_map(reader, "projectile_spawners", component.spawners, read_projectile_spawner);
            if (present) asset.projectile_spawners = std::move(component);
        }

        read_jointed_mobs(reader, asset.jointed_mobs);

        reader.boolean("behavior_transmitter", asset.behavior_transmitter);
        if (const Value* behavior = reader.take("behavior")) {
            asset.behavior = mobdef_ai::parse_behavior_node(*behavior);
        }

        reader.finish();
    }

    if (failure) {
        return Err<MobAsset>(DefinitionError::schema(entity, failure->field, failure->reason));
    }

    if (asset.mob_spawners) {
        for (auto& [key, spawner] : asset.mob_spawners->spawners) {
            spawner.mob_ref = normalize_mob_ref(spawner.mob_ref, rules);
        }
    }
    for (auto& joint : asset.jointed_mobs) {
        joint.mob_ref = normalize_mob_ref(joint.mob_ref, rules);
    }
    return asset;
}

// =============================================================================
// Serialization
// =============================================================================

namespace {

Value vec2_value(const Vec2& v) {
    return Value::array({Value(v.x), Value(v.y)});
}

Value shape_value(const ColliderShape& shape) {
    return std::visit([](const auto& s) -> Value {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, RectangleShape>) {
            return Value::table({{"Rectangle", Value::array({Value(s.width), Value(s.height)})}});
        } else if constexpr (std::is_same_v<T, CircleShape>) {
            return Value::table({{"Circle", Value(s.radius)}});
        } else {
            return Value::table({{"Capsule", Value::array({Value(s.radius), Value(s.half_length)})}});
        }
    }, shape);
}

Value layers_value(const std::vector<PhysicsLayer>& layers) {
    Array out;
    for (auto layer : layers) {
        out.emplace_back(physics_layer_name(layer));
    }
    return Value(std::move(out));
}

Value spawner_base(double timer, const Vec2& position, double rotation) {
    return Value::table({
        {"timer", Value(timer)},
        {"position", vec2_value(position)},
        {"rotation", Value(rotation)},
    });
}

} // anonymous namespace

Value mob_asset_to_value(const MobAsset& asset) {
    Value out = Value::table();

    out.set("name", asset.name);
    out.set("spawnable", asset.spawnable);

    Array colliders;
    for (const auto& collider : asset.colliders) {
        colliders.push_back(Value::table({
            {"shape", shape_value(collider.shape)},
            {"position", vec2_value(collider.position)},
            {"rotation", Value(collider.rotation)},
        }));
    }
    out.set("colliders", Value(std::move(colliders)));
    out.set("z_level", asset.z_level);
    out.set("rotation_locked", asset.rotation_locked);

    out.set("max_linear_speed", vec2_value(asset.max_linear_speed));
    out.set("linear_acceleration", vec2_value(asset.linear_acceleration));
    out.set("linear_deceleration", vec2_value(asset.linear_deceleration));
    out.set("angular_acceleration", asset.angular_acceleration);
    out.set("angular_deceleration", asset.angular_deceleration);
    out.set("max_angular_speed", asset.max_angular_speed);

    out.set("restitution", asset.restitution);
    out.set("friction", asset.friction);
    out.set("collider_density", asset.collider_density);
    out.set("collision_layer_membership", layers_value(asset.collision_layer_membership));
    out.set("collision_layer_filter", layers_value(asset.collision_layer_filter));

    out.set("health", static_cast<std::int64_t>(asset.health));
    if (asset.targeting_range) {
        out.set("targeting_range", *asset.targeting_range);
    }
    out.set("projectile_speed", asset.projectile_speed);
    out.set("projectile_damage", static_cast<std::int64_t>(asset.projectile_damage));
    out.set("projectile_range_seconds", asset.projectile_range_seconds);

    out.set("sprite", asset.sprite);
    Array decorations;
    for (const auto& decoration : asset.decorations) {
        decorations.push_back(Value::array({Value(decoration.sprite), vec2_value(decoration.position)}));
    }
    out.set("decorations", Value(std::move(decorations)));

    if (asset.mob_spawners) {
        Value spawners = Value::table();
        for (const auto& [name, s] : asset.mob_spawners->spawners) {
            Value entry = spawner_base(s.timer, s.position, s.rotation);
            entry.set("mob_ref", s.mob_ref);
            spawners.set(name, std::move(entry));
        }
        out.set("mob_spawners", Value::table({{"spawners", std::move(spawners)}}));
    }

    if (asset.projectile_spawners) {
        Value spawners = Value::table();
        for (const auto& [name, s] : asset.projectile_spawners->spawners) {
            Value entry = spawner_base(s.timer, s.position, s.rotation);
            entry.set("projectile_type", s.projectile_type == ProjectileType::Bullet ? "Bullet" : "Blast");
            entry.set("faction", s.faction == Faction::Ally ? "Ally" : "Enemy");
            entry.set("speed_multiplier", s.speed_multiplier);
            entry.set("damage_multiplier", s.damage_multiplier);
            entry.set("range_seconds_multiplier", s.range_seconds_multiplier);
            entry.set("pre_spawn_animation_start_time", s.pre_spawn_animation_start_time);
            entry.set("pre_spawn_animation_end_time", s.pre_spawn_animation_end_time);
            spawners.set(name, std::move(entry));
        }
        out.set("projectile_spawners", Value::table({{"spawners", std::move(spawners)}}));
    }

    Array joints;
    for (const auto& joint : asset.jointed_mobs) {
        Value entry = Value::table({
            {"key", Value(joint.key)},
            {"mob_ref", Value(joint.mob_ref)},
            {"offset_pos", vec2_value(joint.offset_pos)},
            {"anchor_1_pos", vec2_value(joint.anchor_1_pos)},
            {"anchor_2_pos", vec2_value(joint.anchor_2_pos)},
            {"compliance", Value(joint.compliance)},
        });
        if (joint.angle_limit_range) {
            entry.set("angle_limit_range", Value::table({
                {"min", Value(joint.angle_limit_range->min)},
                {"max", Value(joint.angle_limit_range->max)},
                {"torque", Value(joint.angle_limit_range->torque)},
            }));
        }
        if (joint.chain) {
            Value chain = Value::table({
                {"length", Value(static_cast<std::int64_t>(joint.chain->length))},
                {"pos_offset", vec2_value(joint.chain->pos_offset)},
                {"anchor_offset", vec2_value(joint.chain->anchor_offset)},
            });
            if (joint.chain->random_chain) {
                chain.set("random_chain", Value::table({
                    {"min_length", Value(static_cast<std::int64_t>(joint.chain->random_chain->min_length))},
                    {"end_chance", Value(joint.chain->random_chain->end_chance)},
                }));
            }
            entry.set("chain", std::move(chain));
        }
        joints.push_back(std::move(entry));
    }
    out.set("jointed_mobs", Value(std::move(joints)));

    out.set("behavior_transmitter", asset.behavior_transmitter);
    if (asset.behavior) {
        out.set("behavior", mobdef_ai::behavior_to_value(*asset.behavior));
    }

    return out;
}

} // namespace mobdef_asset
