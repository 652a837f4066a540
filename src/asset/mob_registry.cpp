/// @file mob_registry.cpp
/// @brief Resolved mob definitions with pre-compiled behavior trees

#include <mobdef/asset/mob_registry.hpp>
#include <mobdef/asset/mob_ref.hpp>
#include <mobdef/core/log.hpp>

namespace mobdef_asset {

MobRegistry MobRegistry::build(ResolveReport report, mobdef_core::LayerPaths rules) {
    auto logger = mobdef_core::asset_logger();

    MobRegistry registry;
    registry.m_rules = std::move(rules);
    registry.m_mobs = std::move(report.mobs);
    registry.m_failures = std::move(report.failures);
    registry.m_orphan_patches = std::move(report.orphan_patches);

    for (const auto& [name, mob] : registry.m_mobs) {
        if (!mob.behavior) {
            continue;
        }
        auto compiled = mobdef_ai::compile_behavior(*mob.behavior, name);
        for (const auto& diag : compiled.diagnostics) {
            if (diag.severity == mobdef_ai::CompileDiagnostic::Severity::Warning) {
                logger->warn("[MobRegistry] '{}' {}: {}", name, diag.path, diag.message);
            } else {
                logger->debug("[MobRegistry] '{}' {}: {}", name, diag.path, diag.message);
            }
        }
        if (!compiled.diagnostics.empty()) {
            registry.m_diagnostics[name] = std::move(compiled.diagnostics);
        }
        registry.m_behaviors[name] = std::move(compiled.tree);
    }

    logger->info("[MobRegistry] Built registry: {} mobs, {} behaviors", registry.m_mobs.size(),
                 registry.m_behaviors.size());
    return registry;
}

std::string MobRegistry::key_of(std::string_view mob_ref) const {
    return normalize_mob_ref(mob_ref, m_rules);
}

const MobAsset* MobRegistry::get_mob(std::string_view mob_ref) const {
    auto it = m_mobs.find(key_of(mob_ref));
    return it != m_mobs.end() ? &it->second : nullptr;
}

const mobdef_ai::BehaviorTree* MobRegistry::get_behavior(std::string_view mob_ref) const {
    auto it = m_behaviors.find(key_of(mob_ref));
    return it != m_behaviors.end() ? it->second.get() : nullptr;
}

bool MobRegistry::contains(std::string_view mob_ref) const {
    return m_mobs.count(key_of(mob_ref)) > 0;
}

std::vector<std::string> MobRegistry::keys() const {
    std::vector<std::string> out;
    out.reserve(m_mobs.size());
    for (const auto& [name, mob] : m_mobs) {
        out.push_back(name);
    }
    return out;
}

std::vector<std::pair<std::string, const MobAsset*>> MobRegistry::spawnable_mobs() const {
    std::vector<std::pair<std::string, const MobAsset*>> out;
    for (const auto& [name, mob] : m_mobs) {
        if (mob.spawnable) {
            out.emplace_back(name, &mob);
        }
    }
    return out;
}

mobdef_core::Result<MobRegistry> load_registry(const mobdef_core::LayerPaths& paths) {
    auto base = collect_layer(paths.base_dir, paths, false);
    if (!base) {
        return mobdef_core::Err<MobRegistry>(std::move(base.error()));
    }

    LayerFiles extended;
    if (paths.extended_dir) {
        auto ext = collect_layer(*paths.extended_dir, paths, true);
        if (ext) {
            extended = std::move(*ext);
        } else {
            mobdef_core::asset_logger()->warn("[MobRegistry] Extended layer '{}' unavailable, continuing without it: {}",
                                              paths.extended_dir->string(), ext.error().message());
        }
    }

    auto report = resolve_all(LayerSources::from_layers(std::move(*base), std::move(extended)), paths);
    if (!report) {
        return mobdef_core::Err<MobRegistry>(std::move(report.error()));
    }
    return MobRegistry::build(std::move(*report), paths);
}

} // namespace mobdef_asset
