#pragma once

/// @file layer_source.hpp
/// @brief Filesystem discovery of definition layers

#include <mobdef/core/config.hpp>
#include <mobdef/core/error.hpp>

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace mobdef_asset {

/// TOML text of one layer keyed by normalized entity name
struct LayerFiles {
    std::map<std::string, std::string> definitions;  ///< complete definitions (.mob)
    std::map<std::string, std::string> patches;      ///< partial overrides (.mobpatch)
    std::vector<std::string> unreadable;             ///< skipped files of an optional layer

    [[nodiscard]] bool empty() const { return definitions.empty() && patches.empty(); }
};

/// Scan a directory recursively for definition and patch files.
/// Names are the normalized paths relative to `dir`.
/// @param optional A missing optional directory yields an empty layer and
///                 unreadable files are skipped with a warning; for a
///                 required layer both are errors
[[nodiscard]] mobdef_core::Result<LayerFiles> collect_layer(const std::filesystem::path& dir,
                                                            const mobdef_core::LayerPaths& rules,
                                                            bool optional = false);

} // namespace mobdef_asset
