// mobdef_core PipelineConfig tests

#include <catch2/catch_test_macros.hpp>
#include <mobdef/core/config.hpp>

#include <filesystem>

using namespace mobdef_core;

TEST_CASE("PipelineConfig defaults", "[core][config]") {
    PipelineConfig config;
    REQUIRE(config.paths.base_dir == std::filesystem::path("assets/mobs"));
    REQUIRE_FALSE(config.paths.extended_dir.has_value());
    REQUIRE(config.paths.root_prefix == "mobs/");
    REQUIRE(config.paths.definition_extension == ".mob");
    REQUIRE(config.paths.patch_extension == ".mobpatch");
    REQUIRE(config.history_limit == 50);
    REQUIRE(config.logging.level == spdlog::level::info);
}

TEST_CASE("PipelineConfig parses every section", "[core][config]") {
    auto result = PipelineConfig::parse(R"(
[paths]
base = "data/mobs"
extended = "mods/mobs"
root_prefix = "enemies/"

[files]
definition_extension = ".def"
patch_extension = ".patch"

[editor]
history_limit = 10

[logging]
level = "debug"
console = false
file = true
directory = "out/logs"
)");

    REQUIRE(result.is_ok());
    const auto& config = *result;
    REQUIRE(config.paths.base_dir == std::filesystem::path("data/mobs"));
    REQUIRE(config.paths.extended_dir == std::filesystem::path("mods/mobs"));
    REQUIRE(config.paths.root_prefix == "enemies/");
    REQUIRE(config.paths.definition_extension == ".def");
    REQUIRE(config.paths.patch_extension == ".patch");
    REQUIRE(config.history_limit == 10);
    REQUIRE(config.logging.level == spdlog::level::debug);
    REQUIRE_FALSE(config.logging.console_enabled);
    REQUIRE(config.logging.file_enabled);
    REQUIRE(config.logging.log_directory == "out/logs");
}

TEST_CASE("PipelineConfig rejects bad input", "[core][config]") {
    SECTION("malformed TOML") {
        auto result = PipelineConfig::parse("[paths\nbase = 1");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ParseError);
    }

    SECTION("unknown log level") {
        auto result = PipelineConfig::parse("[logging]\nlevel = \"loud\"\n");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ValidationError);
        REQUIRE(result.error().as<ConfigError>()->key == "logging.level");
    }

    SECTION("extension without dot") {
        auto result = PipelineConfig::parse("[files]\ndefinition_extension = \"mob\"\n");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ValidationError);
    }

    SECTION("identical extensions") {
        auto result = PipelineConfig::parse("[files]\npatch_extension = \".mob\"\n");
        REQUIRE(result.is_err());
    }

    SECTION("non-positive history limit") {
        auto result = PipelineConfig::parse("[editor]\nhistory_limit = 0\n");
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<ConfigError>()->key == "editor.history_limit");
    }
}

TEST_CASE("PipelineConfig::load falls back to defaults", "[core][config]") {
    auto result = PipelineConfig::load("definitely/not/here/mobdef.toml");
    REQUIRE(result.is_ok());
    REQUIRE(result->history_limit == 50);
}
