/// @file mob_resolver.cpp
/// @brief Three-layer resolution: base, extended, patch

#include <mobdef/asset/mob_resolver.hpp>
#include <mobdef/core/log.hpp>
#include <mobdef/data/merge.hpp>
#include <mobdef/data/toml_codec.hpp>

namespace mobdef_asset {

using mobdef_core::Result;
using mobdef_data::Value;

const char* failure_stage_name(FailureStage stage) {
    switch (stage) {
        case FailureStage::Extended: return "extended";
        case FailureStage::Patch: return "patch";
        case FailureStage::Schema: return "schema";
        default: return "unknown";
    }
}

LayerSources LayerSources::from_layers(LayerFiles base, LayerFiles extended) {
    auto logger = mobdef_core::asset_logger();
    for (const auto& [name, text] : base.patches) {
        logger->warn("[Resolver] Patch '{}' in base layer ignored (patches belong to the extended layer)", name);
    }

    LayerSources sources;
    sources.base = std::move(base.definitions);
    sources.extended = std::move(extended.definitions);
    sources.patches = std::move(extended.patches);
    return sources;
}

Result<MergedLayers> merge_layers(const LayerSources& sources) {
    auto logger = mobdef_core::asset_logger();
    MergedLayers merged;

    for (const auto& [name, text] : sources.base) {
        auto parsed = mobdef_data::parse_toml(text, name);
        if (!parsed) {
            logger->error("[Resolver] Base definition '{}' failed to parse: {}", name, parsed.error().message());
            return mobdef_core::Err<MergedLayers>(std::move(parsed.error()));
        }
        merged.values[name] = std::move(*parsed);
    }
    logger->info("[Resolver] Loaded {} base definitions", merged.values.size());

    for (const auto& [name, text] : sources.extended) {
        auto parsed = mobdef_data::parse_toml(text, name);
        if (!parsed) {
            logger->warn("[Resolver] Skipping extended definition '{}': {}", name, parsed.error().message());
            merged.failures.push_back(EntityFailure{name, FailureStage::Extended, std::move(parsed.error())});
            continue;
        }
        if (merged.values.count(name) > 0) {
            logger->info("[Resolver] Extended definition '{}' replaces base definition", name);
        } else {
            logger->debug("[Resolver] Adding extended definition '{}'", name);
        }
        merged.values[name] = std::move(*parsed);
    }

    std::size_t patched = 0;
    for (const auto& [name, text] : sources.patches) {
        auto parsed = mobdef_data::parse_toml(text, name);
        if (!parsed) {
            logger->warn("[Resolver] Skipping patch '{}': {}", name, parsed.error().message());
            merged.failures.push_back(EntityFailure{name, FailureStage::Patch, std::move(parsed.error())});
            continue;
        }
        auto it = merged.values.find(name);
        if (it == merged.values.end()) {
            logger->warn("[Resolver] No definition found for patch '{}', skipping", name);
            merged.orphan_patches.push_back(name);
            continue;
        }
        mobdef_data::merge(it->second, std::move(*parsed));
        ++patched;
    }
    if (patched > 0) {
        logger->info("[Resolver] Merged {} patches", patched);
    }

    return merged;
}

Result<ResolveReport> resolve_all(const LayerSources& sources, const mobdef_core::LayerPaths& rules) {
    MOBDEF_LOG_SCOPE("resolve_all", "mobdef_asset");
    auto logger = mobdef_core::asset_logger();

    auto merged = merge_layers(sources);
    if (!merged) {
        return mobdef_core::Err<ResolveReport>(std::move(merged.error()));
    }

    ResolveReport report;
    report.failures = std::move(merged->failures);
    report.orphan_patches = std::move(merged->orphan_patches);

    for (const auto& [name, value] : merged->values) {
        auto asset = mob_asset_from_value(name, value, rules);
        if (!asset) {
            logger->warn("[Resolver] Failed to deserialize '{}': {}", name, asset.error().message());
            report.failures.push_back(EntityFailure{name, FailureStage::Schema, std::move(asset.error())});
            continue;
        }
        report.mobs.emplace(name, std::move(*asset));
    }

    logger->info("[Resolver] Resolved {} mobs ({} failures)", report.mobs.size(), report.failures.size());
    return report;
}

} // namespace mobdef_asset
