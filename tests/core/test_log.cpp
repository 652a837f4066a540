// mobdef_core logging tests

#include <catch2/catch_test_macros.hpp>
#include <mobdef/core/log.hpp>

using namespace mobdef_core;

TEST_CASE("parse_log_level", "[core][log]") {
    REQUIRE(parse_log_level("trace") == spdlog::level::trace);
    REQUIRE(parse_log_level("warn") == spdlog::level::warn);
    REQUIRE(parse_log_level("warning") == spdlog::level::warn);
    REQUIRE(parse_log_level("error") == spdlog::level::err);
    REQUIRE(parse_log_level("off") == spdlog::level::off);
    REQUIRE_FALSE(parse_log_level("verbose").has_value());
    REQUIRE_FALSE(parse_log_level("INFO").has_value());
}

TEST_CASE("log_level_name round trips", "[core][log]") {
    for (auto level : {spdlog::level::trace, spdlog::level::debug, spdlog::level::info, spdlog::level::warn,
                       spdlog::level::err, spdlog::level::critical, spdlog::level::off}) {
        REQUIRE(parse_log_level(log_level_name(level)) == level);
    }
}

TEST_CASE("Named loggers", "[core][log]") {
    SECTION("stage loggers have stable names") {
        REQUIRE(core_logger()->name() == "mobdef_core");
        REQUIRE(asset_logger()->name() == "mobdef_asset");
        REQUIRE(ai_logger()->name() == "mobdef_ai");
        REQUIRE(editor_logger()->name() == "mobdef_editor");
    }

    SECTION("get_logger returns the same instance") {
        auto a = get_logger("mobdef_test");
        auto b = get_logger("mobdef_test");
        REQUIRE(a == b);
    }

    SECTION("global level applies to existing loggers") {
        auto logger = get_logger("mobdef_level_test");
        set_global_log_level(spdlog::level::err);
        REQUIRE(get_global_log_level() == spdlog::level::err);
        REQUIRE(logger->level() == spdlog::level::err);
        set_global_log_level(spdlog::level::info);
    }
}

TEST_CASE("configure_logging with console only", "[core][log]") {
    LogConfig config;
    config.console_enabled = true;
    config.file_enabled = false;
    config.level = spdlog::level::warn;
    configure_logging(config);

    REQUIRE(asset_logger()->level() == spdlog::level::warn);

    {
        LogScope scope("scoped_work", "mobdef_asset");
        asset_logger()->info("inside scope");
    }

    config.level = spdlog::level::info;
    configure_logging(config);
    REQUIRE(asset_logger()->level() == spdlog::level::info);
}
