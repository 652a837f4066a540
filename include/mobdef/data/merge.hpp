#pragma once

/// @file merge.hpp
/// @brief Hierarchical merge of definition documents

#include "value.hpp"

namespace mobdef_data {

/// Merge `override_value` into `base` in place.
///
/// Table with table recurses key by key, inserting keys the base lacks.
/// Every other pairing (including array with array) replaces the base
/// wholesale with the override.
void merge(Value& base, Value override_value);

/// Non-mutating form of merge()
[[nodiscard]] Value merged(Value base, Value override_value);

} // namespace mobdef_data
