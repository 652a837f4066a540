#pragma once

/// @file mob_resolver.hpp
/// @brief Three-layer resolution: base, extended, patch
///
/// Base definitions are parsed first; any syntax error there aborts the whole
/// resolve. Extended definitions add new entities or replace base entities
/// outright. Patches are merged field by field into an existing entity; a
/// patch without a target is skipped. Every merged value is then
/// deserialized into a MobAsset. Entities that fail in the extended, patch or
/// schema stage are left out and reported, the rest still resolve.

#include "layer_source.hpp"
#include "mob_asset.hpp"

#include <mobdef/core/error.hpp>
#include <mobdef/data/value.hpp>

#include <map>
#include <string>
#include <vector>

namespace mobdef_asset {

/// Raw TOML text of every layer keyed by normalized entity name
struct LayerSources {
    std::map<std::string, std::string> base;
    std::map<std::string, std::string> extended;
    std::map<std::string, std::string> patches;

    /// Base definitions, extended definitions and extended patches.
    /// Patch files found in the base layer are ignored with a warning.
    [[nodiscard]] static LayerSources from_layers(LayerFiles base, LayerFiles extended);
};

/// Stage at which an entity was dropped
enum class FailureStage : std::uint8_t {
    Extended,  // extended definition did not parse
    Patch,     // patch did not parse
    Schema,    // merged value did not deserialize
};

[[nodiscard]] const char* failure_stage_name(FailureStage stage);

struct EntityFailure {
    std::string entity;
    FailureStage stage = FailureStage::Schema;
    mobdef_core::Error error;
};

/// Merged documents before deserialization
struct MergedLayers {
    std::map<std::string, mobdef_data::Value> values;
    std::vector<EntityFailure> failures;
    std::vector<std::string> orphan_patches;
};

struct ResolveReport {
    std::map<std::string, MobAsset> mobs;
    std::vector<EntityFailure> failures;
    std::vector<std::string> orphan_patches;
};

/// Parse and merge the three layers without deserializing.
/// Fails only on a base-layer parse error.
[[nodiscard]] mobdef_core::Result<MergedLayers> merge_layers(const LayerSources& sources);

/// Merge every layer and deserialize each entity.
/// Fails only on a base-layer parse error.
[[nodiscard]] mobdef_core::Result<ResolveReport> resolve_all(const LayerSources& sources,
                                                             const mobdef_core::LayerPaths& rules = {});

} // namespace mobdef_asset
