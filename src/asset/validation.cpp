/// @file validation.cpp
/// @brief Authoring checks run on a definition document before it is saved

#include <mobdef/asset/mob_asset.hpp>
#include <mobdef/asset/validation.hpp>
#include <mobdef/ai/behavior_dsl.hpp>

#include <algorithm>
#include <sstream>

namespace mobdef_asset {

using mobdef_data::Array;
using mobdef_data::Table;
using mobdef_data::Value;

// =============================================================================
// ValidationIssue / ValidationResult
// =============================================================================

std::string ValidationIssue::to_string() const {
    std::string out = severity == Severity::Error ? "[ERROR] " : "[WARN] ";
    if (!path.empty()) {
        out += path + ": ";
    }
    return out + message;
}

void ValidationResult::add_error(std::string path, std::string message) {
    m_issues.push_back(ValidationIssue{ValidationIssue::Severity::Error, std::move(path), std::move(message)});
}

void ValidationResult::add_warning(std::string path, std::string message) {
    m_issues.push_back(ValidationIssue{ValidationIssue::Severity::Warning, std::move(path), std::move(message)});
}

void ValidationResult::merge(const ValidationResult& other) {
    m_issues.insert(m_issues.end(), other.m_issues.begin(), other.m_issues.end());
}

bool ValidationResult::has_errors() const {
    return std::any_of(m_issues.begin(), m_issues.end(),
                       [](const ValidationIssue& i) { return i.severity == ValidationIssue::Severity::Error; });
}

bool ValidationResult::has_warnings() const {
    return std::any_of(m_issues.begin(), m_issues.end(),
                       [](const ValidationIssue& i) { return i.severity == ValidationIssue::Severity::Warning; });
}

std::vector<std::string> ValidationResult::error_messages() const {
    std::vector<std::string> out;
    for (const auto& issue : m_issues) {
        if (issue.severity == ValidationIssue::Severity::Error) {
            out.push_back(issue.to_string());
        }
    }
    return out;
}

std::string ValidationResult::format() const {
    std::ostringstream oss;
    for (std::size_t i = 0; i < m_issues.size(); ++i) {
        if (i > 0) oss << '\n';
        oss << m_issues[i].to_string();
    }
    return oss.str();
}

// =============================================================================
// Field checks
// =============================================================================

namespace {

std::string join(const std::string& prefix, const std::string& field) {
    return prefix.empty() ? field : prefix + "." + field;
}

std::string indexed(const std::string& prefix, std::size_t i) {
    return prefix + "[" + std::to_string(i) + "]";
}

void check_string(ValidationResult& result, const Value& value, const std::string& path) {
    const std::string* s = value.try_string();
    if (s == nullptr) {
        result.add_error(path, "Must be a string");
    } else if (s->empty()) {
        result.add_error(path, "Cannot be empty");
    }
}

void check_positive_integer(ValidationResult& result, const Value& value, const std::string& path) {
    auto i = value.try_int();
    if (!i) {
        result.add_error(path, "Must be an integer");
    } else if (*i <= 0) {
        result.add_error(path, "Must be a positive integer");
    }
}

void check_positive_number(ValidationResult& result, const Value& value, const std::string& path) {
    auto n = value.try_numeric();
    if (!n) {
        result.add_error(path, "Must be a number");
    } else if (*n <= 0.0) {
        result.add_error(path, "Must be positive");
    }
}

void check_range(ValidationResult& result, const Value& value, const std::string& path, double min, double max) {
    auto n = value.try_numeric();
    if (!n) {
        result.add_error(path, "Must be a number");
    } else if (*n < min || *n > max) {
        std::ostringstream oss;
        oss << "Must be between " << min << " and " << max;
        result.add_error(path, oss.str());
    }
}

void check_vec2(ValidationResult& result, const Value& value, const std::string& path) {
    const Array* arr = value.try_array();
    if (arr == nullptr) {
        result.add_error(path, "Must be an array [x, y]");
        return;
    }
    if (arr->size() != 2) {
        result.add_error(path, "Must be an array of 2 numbers [x, y]");
        return;
    }
    for (std::size_t i = 0; i < 2; ++i) {
        if (!(*arr)[i].is_numeric()) {
            result.add_error(path, "Element " + std::to_string(i) + " must be a number");
        }
    }
}

template<typename Check>
void optional_field(ValidationResult& result, const Value& table, const std::string& field, Check check) {
    if (const Value* v = table.get(field)) {
        check(result, *v, field);
    }
}

void require_key(ValidationResult& result, const Value& table, const std::string& path, const char* key) {
    if (!table.contains(key)) {
        result.add_error(path, std::string("Missing required field '") + key + "'");
    }
}

// -----------------------------------------------------------------------------
// Colliders
// -----------------------------------------------------------------------------

void check_pair(ValidationResult& result, const Value& dims, const std::string& path, const std::string& shape,
                const char* usage) {
    const Array* arr = dims.try_array();
    if (arr == nullptr || arr->size() != 2) {
        result.add_error(path, shape + " requires " + usage);
        return;
    }
    for (std::size_t i = 0; i < 2; ++i) {
        auto v = (*arr)[i].try_numeric();
        if (!v) {
            result.add_error(path, shape + " dimension " + std::to_string(i) + " must be a number");
        } else if (*v <= 0.0) {
            result.add_error(path, shape + " dimension " + std::to_string(i) + " must be positive");
        }
    }
}

void check_collider_shape(ValidationResult& result, const Value& value, const std::string& path) {
    const Table* tbl = value.try_table();
    if (tbl == nullptr) {
        result.add_error(path, "Shape must be a table");
        return;
    }
    if (tbl->size() != 1) {
        result.add_error(path, "Shape must have exactly one type");
        return;
    }

    const auto& [shape, dims] = *tbl->begin();
    if (shape == "Rectangle") {
        check_pair(result, dims, path, shape, "[width, height]");
    } else if (shape == "Capsule") {
        check_pair(result, dims, path, shape, "[radius, half_length]");
    } else if (shape == "Circle") {
        auto r = dims.try_numeric();
        if (!r) {
            result.add_error(path, "Circle requires a radius number");
        } else if (*r <= 0.0) {
            result.add_error(path, "Circle radius must be positive");
        }
    } else {
        result.add_error(path, "Unknown shape type '" + shape + "'");
    }
}

void check_colliders(ValidationResult& result, const Value& value) {
    const Array* arr = value.try_array();
    if (arr == nullptr) {
        result.add_error("colliders", "Must be an array");
        return;
    }
    for (std::size_t i = 0; i < arr->size(); ++i) {
        std::string path = indexed("colliders", i);
        const Value& collider = (*arr)[i];
        if (!collider.is_table()) {
            result.add_error(path, "Must be a table");
            continue;
        }
        if (const Value* shape = collider.get("shape")) {
            check_collider_shape(result, *shape, path + ".shape");
        } else {
            result.add_error(path, "Missing required field 'shape'");
        }
        if (const Value* pos = collider.get("position")) {
            check_vec2(result, *pos, path + ".position");
        }
        if (const Value* rot = collider.get("rotation"); rot && !rot->is_numeric()) {
            result.add_error(path + ".rotation", "Must be a number");
        }
    }
}

void check_layers(ValidationResult& result, const Value& value, const std::string& path) {
    const Array* arr = value.try_array();
    if (arr == nullptr) {
        result.add_error(path, "Must be an array");
        return;
    }
    for (std::size_t i = 0; i < arr->size(); ++i) {
        const std::string* name = (*arr)[i].try_string();
        if (name == nullptr || !parse_physics_layer(*name)) {
            result.add_error(indexed(path, i), "Unknown physics layer");
        }
    }
}

// -----------------------------------------------------------------------------
// Spawners
// -----------------------------------------------------------------------------

void check_timer(ValidationResult& result, const Value& spawner, const std::string& path) {
    if (const Value* timer = spawner.get("timer")) {
        check_positive_number(result, *timer, path + ".timer");
    } else {
        result.add_error(path, "Missing required field 'timer'");
    }
}

template<typename CheckEntry>
void check_spawner_component(ValidationResult& result, const Value& value, const std::string& field,
                             CheckEntry check_entry) {
    if (!value.is_table()) {
        result.add_error(field, "Must be a table");
        return;
    }
    const Value* spawners = value.get("spawners");
    if (spawners == nullptr) {
        result.add_error(field, "Missing required field 'spawners'");
        return;
    }
    const Table* tbl = spawners->try_table();
    if (tbl == nullptr) {
        result.add_error(field + ".spawners", "Must be a table");
        return;
    }
    for (const auto& [key, spawner] : *tbl) {
        std::string path = field + ".spawners." + key;
        if (!spawner.is_table()) {
            result.add_error(path, "Must be a table");
            continue;
        }
        check_timer(result, spawner, path);
        check_entry(spawner, path);
    }
}

// -----------------------------------------------------------------------------
// Behavior
// -----------------------------------------------------------------------------

void check_behavior(ValidationResult& result, const Value& value, const std::string& path) {
    if (!value.is_table()) {
        result.add_error(path, "Must be a table");
        return;
    }

    const Value* type_value = value.get("type");
    if (type_value == nullptr) {
        result.add_error(path, "Missing required field 'type'");
        return;
    }
    const std::string* type_name = type_value->try_string();
    if (type_name == nullptr) {
        result.add_error(path + ".type", "Must be a string");
        return;
    }
    auto type = mobdef_ai::parse_behavior_node_type(*type_name);
    if (!type) {
        result.add_warning(path + ".type", "Unknown behavior type '" + *type_name + "'");
        return;
    }

    const auto& layout = mobdef_ai::node_layout(*type);
    if (layout.has_child_array) {
        if (const Value* children = value.get("children")) {
            if (const Array* arr = children->try_array()) {
                for (std::size_t i = 0; i < arr->size(); ++i) {
                    check_behavior(result, (*arr)[i], indexed(path + ".children", i));
                }
            } else {
                result.add_error(path + ".children", "Must be an array");
            }
        }
    }
    for (std::size_t i = 0; i < layout.slot_count; ++i) {
        const auto* slot = layout.slot(i);
        if (const Value* child = value.get(slot->key)) {
            check_behavior(result, *child, path + "." + slot->key);
        } else if (!slot->optional) {
            result.add_error(path, std::string("Missing required field '") + slot->key + "'");
        }
    }

    switch (*type) {
        case mobdef_ai::BehaviorNodeType::Wait:
            if (const Value* seconds = value.get("seconds")) {
                if (!seconds->is_numeric()) result.add_error(path + ".seconds", "Must be a number");
            } else {
                result.add_error(path, "Missing required field 'seconds'");
            }
            break;
        case mobdef_ai::BehaviorNodeType::Action:
            if (const Value* name = value.get("name")) {
                check_string(result, *name, path + ".name");
            } else {
                result.add_error(path, "Missing required field 'name'");
            }
            if (const Value* behaviors = value.get("behaviors"); behaviors && !behaviors->is_array()) {
                result.add_error(path + ".behaviors", "Must be an array");
            }
            break;
        case mobdef_ai::BehaviorNodeType::Trigger:
            if (const Value* trigger = value.get("trigger_type"); trigger == nullptr || !trigger->is_string()) {
                result.add_error(path + ".trigger_type", "Must be a string");
            }
            break;
        default:
            break;
    }
}

// -----------------------------------------------------------------------------
// Joints / decorations
// -----------------------------------------------------------------------------

void check_jointed_mobs(ValidationResult& result, const Value& value) {
    const Array* arr = value.try_array();
    if (arr == nullptr) {
        result.add_error("jointed_mobs", "Must be an array");
        return;
    }
    for (std::size_t i = 0; i < arr->size(); ++i) {
        std::string path = indexed("jointed_mobs", i);
        const Value& joint = (*arr)[i];
        if (!joint.is_table()) {
            result.add_error(path, "Must be a table");
            continue;
        }
        require_key(result, joint, path, "key");
        require_key(result, joint, path, "mob_ref");
        for (const char* field : {"offset_pos", "anchor_1_pos", "anchor_2_pos"}) {
            if (const Value* v = joint.get(field)) {
                check_vec2(result, *v, path + "." + field);
            }
        }
    }
}

void check_decorations(ValidationResult& result, const Value& value) {
    const Array* arr = value.try_array();
    if (arr == nullptr) {
        result.add_error("decorations", "Must be an array");
        return;
    }
    for (std::size_t i = 0; i < arr->size(); ++i) {
        std::string path = indexed("decorations", i);
        const Array* pair = (*arr)[i].try_array();
        if (pair == nullptr) {
            result.add_error(path, "Must be an array [sprite_key, [x, y]]");
            continue;
        }
        if (pair->size() != 2) {
            result.add_error(path, "Must be [sprite_key, [x, y]]");
            continue;
        }
        if (!(*pair)[0].is_string()) {
            result.add_error(path, "First element must be a string (sprite key)");
        }
        const Array* pos = (*pair)[1].try_array();
        if (pos == nullptr) {
            result.add_error(path, "Second element must be position [x, y]");
        } else if (pos->size() != 2) {
            result.add_error(path, "Position must be [x, y]");
        }
    }
}

} // anonymous namespace

// =============================================================================
// validate_mob
// =============================================================================

ValidationResult validate_mob(const Value& value, bool is_patch) {
    ValidationResult result;

    const Table* table = value.try_table();
    if (table == nullptr) {
        result.add_error("", "Root must be a TOML table");
        return result;
    }

    const auto& known = mob_asset_field_names();
    for (const auto& [key, v] : *table) {
        if (std::find(known.begin(), known.end(), key) == known.end()) {
            result.add_error(key, "Unknown field");
        }
    }

    if (const Value* name = value.get("name")) {
        check_string(result, *name, "name");
    } else if (!is_patch) {
        result.add_error("name", "Required field is missing");
    }

    optional_field(result, value, "health", check_positive_integer);

    optional_field(result, value, "max_linear_speed", check_vec2);
    optional_field(result, value, "linear_acceleration", check_vec2);
    optional_field(result, value, "linear_deceleration", check_vec2);
    optional_field(result, value, "max_angular_speed", check_positive_number);
    optional_field(result, value, "angular_acceleration", check_positive_number);
    optional_field(result, value, "angular_deceleration", check_positive_number);

    if (const Value* v = value.get("restitution")) check_range(result, *v, "restitution", 0.0, 1.0);
    if (const Value* v = value.get("friction")) check_range(result, *v, "friction", 0.0, 10.0);
    optional_field(result, value, "collider_density", check_positive_number);

    optional_field(result, value, "projectile_speed", check_positive_number);
    optional_field(result, value, "projectile_damage", check_positive_integer);
    optional_field(result, value, "projectile_range_seconds", check_positive_number);
    optional_field(result, value, "targeting_range", check_positive_number);

    optional_field(result, value, "collision_layer_membership", check_layers);
    optional_field(result, value, "collision_layer_filter", check_layers);

    if (const Value* colliders = value.get("colliders")) {
        check_colliders(result, *colliders);
    }

    if (const Value* spawners = value.get("projectile_spawners")) {
        check_spawner_component(result, *spawners, "projectile_spawners",
                                [&](const Value& spawner, const std::string& path) {
                                    require_key(result, spawner, path, "projectile_type");
                                    require_key(result, spawner, path, "faction");
                                });
    }

    if (const Value* spawners = value.get("mob_spawners")) {
        check_spawner_component(result, *spawners, "mob_spawners",
                                [&](const Value& spawner, const std::string& path) {
                                    require_key(result, spawner, path, "mob_ref");
                                });
    }

    if (const Value* behavior = value.get("behavior")) {
        check_behavior(result, *behavior, "behavior");
    }

    if (const Value* jointed = value.get("jointed_mobs")) {
        check_jointed_mobs(result, *jointed);
    }

    if (const Value* decorations = value.get("decorations")) {
        check_decorations(result, *decorations);
    }

    return result;
}

} // namespace mobdef_asset
