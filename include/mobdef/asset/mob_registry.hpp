#pragma once

/// @file mob_registry.hpp
/// @brief Resolved mob definitions with pre-compiled behavior trees

#include "mob_resolver.hpp"

#include <mobdef/ai/behavior_compiler.hpp>
#include <mobdef/core/config.hpp>

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace mobdef_asset {

/// Immutable lookup of every resolved mob.
/// All queries take a mob reference and normalize it first, so
/// "mobs/xhitara/grunt.mob" and "xhitara/grunt" name the same entry.
class MobRegistry {
public:
    MobRegistry() = default;

    MobRegistry(const MobRegistry&) = delete;
    MobRegistry& operator=(const MobRegistry&) = delete;
    MobRegistry(MobRegistry&&) = default;
    MobRegistry& operator=(MobRegistry&&) = default;

    /// Take ownership of a resolve report and compile every behavior
    [[nodiscard]] static MobRegistry build(ResolveReport report, mobdef_core::LayerPaths rules = {});

    // -------------------------------------------------------------------------
    // Queries
    // -------------------------------------------------------------------------

    [[nodiscard]] const MobAsset* get_mob(std::string_view mob_ref) const;

    /// Compiled behavior, nullptr when the mob has none
    [[nodiscard]] const mobdef_ai::BehaviorTree* get_behavior(std::string_view mob_ref) const;

    [[nodiscard]] bool contains(std::string_view mob_ref) const;

    /// Sorted entity names
    [[nodiscard]] std::vector<std::string> keys() const;

    /// Mobs with spawnable == true, sorted by name
    [[nodiscard]] std::vector<std::pair<std::string, const MobAsset*>> spawnable_mobs() const;

    [[nodiscard]] std::size_t size() const { return m_mobs.size(); }
    [[nodiscard]] bool empty() const { return m_mobs.empty(); }

    // -------------------------------------------------------------------------
    // Reports
    // -------------------------------------------------------------------------

    [[nodiscard]] const std::vector<EntityFailure>& failures() const { return m_failures; }
    [[nodiscard]] const std::vector<std::string>& orphan_patches() const { return m_orphan_patches; }

    /// Compiler notes per entity (entities without notes are absent)
    [[nodiscard]] const std::map<std::string, std::vector<mobdef_ai::CompileDiagnostic>>& diagnostics() const {
        return m_diagnostics;
    }

private:
    [[nodiscard]] std::string key_of(std::string_view mob_ref) const;

    mobdef_core::LayerPaths m_rules;
    std::map<std::string, MobAsset> m_mobs;
    std::map<std::string, mobdef_ai::BehaviorTreePtr> m_behaviors;
    std::map<std::string, std::vector<mobdef_ai::CompileDiagnostic>> m_diagnostics;
    std::vector<EntityFailure> m_failures;
    std::vector<std::string> m_orphan_patches;
};

/// Scan the configured base (required) and extended (optional) directories,
/// resolve and build a registry
[[nodiscard]] mobdef_core::Result<MobRegistry> load_registry(const mobdef_core::LayerPaths& paths);

} // namespace mobdef_asset
