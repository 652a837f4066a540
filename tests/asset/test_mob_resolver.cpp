// mobdef_asset layer resolution and registry tests

#include <catch2/catch_test_macros.hpp>
#include <mobdef/asset/mob_registry.hpp>
#include <mobdef/asset/mob_resolver.hpp>

#include <algorithm>
#include <string>

using namespace mobdef_asset;

namespace {

LayerSources three_layer_sources() {
    LayerSources sources;
    sources.base["xhitara/grunt"] = "name = \"Grunt\"\nhealth = 50\n"
                                    "collision_layer_filter = [\"Player\"]\n";
    sources.base["xhitara/brute"] = "name = \"Brute\"\nhealth = 300\n";
    sources.extended["xhitara/brute"] = "name = \"Modded Brute\"\n";
    sources.extended["custom/wisp"] = "name = \"Wisp\"\nspawnable = false\n";
    sources.patches["xhitara/grunt"] = "health = 80\ncollision_layer_filter = [\"AllyMob\", \"Player\"]\n";
    sources.patches["xhitara/ghost"] = "health = 1\n";
    return sources;
}

const EntityFailure* find_failure(const std::vector<EntityFailure>& failures, const std::string& entity) {
    auto it = std::find_if(failures.begin(), failures.end(),
                           [&](const EntityFailure& f) { return f.entity == entity; });
    return it == failures.end() ? nullptr : &*it;
}

} // namespace

// =============================================================================
// Layer merging
// =============================================================================

TEST_CASE("Three-layer resolution", "[asset][resolver]") {
    auto report = resolve_all(three_layer_sources());
    REQUIRE(report.is_ok());
    REQUIRE(report->mobs.size() == 3);
    REQUIRE(report->failures.empty());

    SECTION("patch merges field by field") {
        const MobAsset& grunt = report->mobs.at("xhitara/grunt");
        REQUIRE(grunt.name == "Grunt");
        REQUIRE(grunt.health == 80);
        REQUIRE(grunt.collision_layer_filter ==
                std::vector<PhysicsLayer>{PhysicsLayer::AllyMob, PhysicsLayer::Player});
    }

    SECTION("extended replaces base outright") {
        const MobAsset& brute = report->mobs.at("xhitara/brute");
        REQUIRE(brute.name == "Modded Brute");
        REQUIRE(brute.health == 50);
    }

    SECTION("extended adds new entities") {
        REQUIRE(report->mobs.count("custom/wisp") == 1);
        REQUIRE_FALSE(report->mobs.at("custom/wisp").spawnable);
    }

    SECTION("patch without a target is an orphan") {
        REQUIRE(report->orphan_patches == std::vector<std::string>{"xhitara/ghost"});
        REQUIRE(report->mobs.count("xhitara/ghost") == 0);
    }
}

TEST_CASE("merge_layers exposes merged documents", "[asset][resolver]") {
    auto merged = merge_layers(three_layer_sources());
    REQUIRE(merged.is_ok());
    REQUIRE(merged->values.at("xhitara/grunt").get("health")->as_int() == 80);
    REQUIRE(*merged->values.at("xhitara/grunt").get_string("name") == "Grunt");
}

TEST_CASE("Failure policy", "[asset][resolver]") {
    SECTION("base parse error aborts") {
        LayerSources sources;
        sources.base["good"] = "name = \"Good\"\n";
        sources.base["bad"] = "name = \n";
        auto report = resolve_all(sources);
        REQUIRE(report.is_err());
        REQUIRE(report.error().code() == mobdef_core::ErrorCode::ParseError);
    }

    SECTION("other failures skip the entity") {
        LayerSources sources;
        sources.base["good"] = "name = \"Good\"\n";
        sources.base["wrong"] = "name = \"Wrong\"\nhealth = \"many\"\n";
        sources.base["patched"] = "name = \"Patched\"\n";
        sources.extended["broken"] = "name = [\n";
        sources.patches["patched"] = "health = \n";

        auto report = resolve_all(sources);
        REQUIRE(report.is_ok());
        REQUIRE(report->mobs.count("good") == 1);
        REQUIRE(report->mobs.count("wrong") == 0);
        REQUIRE(report->mobs.count("broken") == 0);

        const auto* wrong = find_failure(report->failures, "wrong");
        REQUIRE(wrong != nullptr);
        REQUIRE(wrong->stage == FailureStage::Schema);
        REQUIRE(wrong->error.as<mobdef_core::DefinitionError>()->field == "health");

        const auto* broken = find_failure(report->failures, "broken");
        REQUIRE(broken != nullptr);
        REQUIRE(broken->stage == FailureStage::Extended);

        const auto* patch = find_failure(report->failures, "patched");
        REQUIRE(patch != nullptr);
        REQUIRE(patch->stage == FailureStage::Patch);
        REQUIRE(report->mobs.at("patched").health == 50);
    }
}

TEST_CASE("from_layers ignores base patches", "[asset][resolver]") {
    LayerFiles base;
    base.definitions["a"] = "name = \"A\"\n";
    base.patches["a"] = "health = 1\n";

    LayerFiles extended;
    extended.patches["a"] = "health = 2\n";

    auto sources = LayerSources::from_layers(base, extended);
    REQUIRE(sources.base.size() == 1);
    REQUIRE(sources.patches.at("a") == "health = 2\n");

    auto report = resolve_all(sources);
    REQUIRE(report.is_ok());
    REQUIRE(report->mobs.at("a").health == 2);
}

TEST_CASE("Failure stage names", "[asset][resolver]") {
    REQUIRE(std::string(failure_stage_name(FailureStage::Extended)) == "extended");
    REQUIRE(std::string(failure_stage_name(FailureStage::Patch)) == "patch");
    REQUIRE(std::string(failure_stage_name(FailureStage::Schema)) == "schema");
}

// =============================================================================
// Registry
// =============================================================================

TEST_CASE("MobRegistry queries", "[asset][registry]") {
    LayerSources sources = three_layer_sources();
    sources.base["xhitara/walker"] = R"(
name = "Walker"
[behavior]
type = "Sequence"
children = [
    { type = "Action", name = "Step", behaviors = [{ action = "MoveDown" }] },
    { type = "Teleport" },
]
)";

    auto report = resolve_all(sources);
    REQUIRE(report.is_ok());
    MobRegistry registry = MobRegistry::build(std::move(*report));

    SECTION("lookups normalize references") {
        REQUIRE(registry.contains("xhitara/grunt"));
        REQUIRE(registry.contains("mobs/xhitara/grunt.mob"));
        REQUIRE(registry.get_mob("mobs/xhitara/grunt.mob")->health == 80);
        REQUIRE(registry.get_mob("xhitara/nobody") == nullptr);
    }

    SECTION("keys are sorted") {
        auto keys = registry.keys();
        REQUIRE(keys.size() == 4);
        REQUIRE(std::is_sorted(keys.begin(), keys.end()));
        REQUIRE(registry.size() == 4);
    }

    SECTION("spawnable filter") {
        auto spawnable = registry.spawnable_mobs();
        REQUIRE(spawnable.size() == 3);
        for (const auto& [name, mob] : spawnable) {
            REQUIRE(name != "custom/wisp");
            REQUIRE(mob->spawnable);
        }
    }

    SECTION("behaviors are precompiled") {
        REQUIRE(registry.get_behavior("xhitara/grunt") == nullptr);

        const auto* tree = registry.get_behavior("xhitara/walker");
        REQUIRE(tree != nullptr);
        REQUIRE(tree->name() == "xhitara/walker");
        REQUIRE(tree->root()->type() == mobdef_ai::NodeType::Sequence);
        REQUIRE(tree->node_count() == 3);
    }

    SECTION("diagnostics only for entities with notes") {
        REQUIRE(registry.diagnostics().size() == 1);
        const auto& notes = registry.diagnostics().at("xhitara/walker");
        REQUIRE(notes.size() == 1);
        REQUIRE(notes[0].severity == mobdef_ai::CompileDiagnostic::Severity::Warning);
    }

    SECTION("reports carry over") {
        REQUIRE(registry.orphan_patches().size() == 1);
        REQUIRE(registry.failures().empty());
    }
}
