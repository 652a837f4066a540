#pragma once

/// @file mob_ref.hpp
/// @brief Entity name normalization

#include <mobdef/core/config.hpp>

#include <string>
#include <string_view>

namespace mobdef_asset {

/// Canonical entity name of a file path or reference.
/// Separators become '/', then the root prefix ("mobs/") and one of the
/// definition or patch extensions are stripped:
/// "mobs/xhitara/grunt.mob" -> "xhitara/grunt".
[[nodiscard]] std::string normalize_mob_ref(std::string_view ref,
                                            const mobdef_core::LayerPaths& rules = {});

} // namespace mobdef_asset
