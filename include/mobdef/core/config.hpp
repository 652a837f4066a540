#pragma once

/// @file config.hpp
/// @brief Pipeline configuration (mobdef.toml)

#include "error.hpp"
#include "log.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace mobdef_core {

/// Directory and naming conventions of the definition layers
struct LayerPaths {
    std::filesystem::path base_dir = "assets/mobs";
    std::optional<std::filesystem::path> extended_dir;
    std::string root_prefix = "mobs/";
    std::string definition_extension = ".mob";
    std::string patch_extension = ".mobpatch";
};

/// Full configuration of the pipeline and editor
struct PipelineConfig {
    LayerPaths paths;
    std::size_t history_limit = 50;
    LogConfig logging;

    /// Load from a file; a missing file yields the defaults
    [[nodiscard]] static Result<PipelineConfig> load(const std::filesystem::path& path);

    /// Parse from TOML text
    [[nodiscard]] static Result<PipelineConfig> parse(const std::string& content,
                                                      const std::string& source_name = "mobdef.toml");
};

} // namespace mobdef_core
