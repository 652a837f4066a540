/// @file json_codec.cpp
/// @brief Value -> JSON conversion

#include <mobdef/data/json_codec.hpp>

namespace mobdef_data {

nlohmann::json to_json(const Value& value) {
    switch (value.type()) {
        case ValueType::Table: {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& [key, child] : value.as_table()) {
                obj[key] = to_json(child);
            }
            return obj;
        }
        case ValueType::Array: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& child : value.as_array()) {
                arr.push_back(to_json(child));
            }
            return arr;
        }
        case ValueType::String: return value.as_string();
        case ValueType::Integer: return value.as_int();
        case ValueType::Float: return value.as_float();
        case ValueType::Boolean: return value.as_bool();
    }
    return nullptr;
}

} // namespace mobdef_data
