#pragma once

/// @file toml_codec.hpp
/// @brief TOML text <-> Value conversion (toml++)

#include "value.hpp"

#include <mobdef/core/error.hpp>

#include <filesystem>
#include <string>

namespace mobdef_data {

/// Parse TOML text into a table Value.
/// Dates and times are rejected as unsupported.
/// @param source_name Name used in error messages
[[nodiscard]] mobdef_core::Result<Value> parse_toml(const std::string& content,
                                                   const std::string& source_name);

/// Read a file and parse it as TOML
[[nodiscard]] mobdef_core::Result<Value> read_toml_file(const std::filesystem::path& path);

/// Serialize a table Value to TOML text
[[nodiscard]] mobdef_core::Result<std::string> to_toml_string(const Value& value);

} // namespace mobdef_data
