#pragma once

/// @file json_codec.hpp
/// @brief Value -> JSON conversion for tooling output

#include "value.hpp"

#include <nlohmann/json.hpp>

namespace mobdef_data {

/// Convert a Value to JSON (tables become objects)
[[nodiscard]] nlohmann::json to_json(const Value& value);

} // namespace mobdef_data
