// mobdef_data TOML and JSON codec tests

#include <catch2/catch_test_macros.hpp>
#include <mobdef/data/json_codec.hpp>
#include <mobdef/data/toml_codec.hpp>

#include <filesystem>
#include <fstream>

using namespace mobdef_data;
using mobdef_core::ErrorCode;

// =============================================================================
// TOML parsing
// =============================================================================

TEST_CASE("parse_toml converts every supported type", "[data][toml]") {
    auto result = parse_toml(R"(
name = "Grunt"
health = 50
speed = 1.5
spawnable = true
offset = [0, 2.5]

[behavior]
type = "Forever"
)", "grunt.mob");

    REQUIRE(result.is_ok());
    const Value& doc = *result;
    REQUIRE(*doc.get_string("name") == "Grunt");
    REQUIRE(doc.get("health")->as_int() == 50);
    REQUIRE(doc.get("speed")->as_float() == 1.5);
    REQUIRE(doc.get("spawnable")->as_bool());
    REQUIRE(doc.get("offset")->as_array()[0].is_int());
    REQUIRE(doc.get("offset")->as_array()[1].is_float());
    REQUIRE(*doc.get("behavior")->get_string("type") == "Forever");
}

TEST_CASE("parse_toml reports errors", "[data][toml]") {
    SECTION("syntax error") {
        auto result = parse_toml("name = \n", "broken.mob");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ParseError);
        REQUIRE(result.error().message().find("broken.mob") != std::string::npos);
    }

    SECTION("dates are rejected with their path") {
        auto result = parse_toml("[meta]\ncreated = 1979-05-27\n", "dated.mob");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::SchemaError);
        REQUIRE(result.error().as<mobdef_core::DefinitionError>()->field == "meta.created");
    }
}

// =============================================================================
// TOML serialization
// =============================================================================

TEST_CASE("to_toml_string output parses back to the same value", "[data][toml]") {
    Value doc = Value::table({
        {"name", "Grunt"},
        {"health", 50},
        {"offset", Value::array({0.5, -1.0})},
        {"behavior", Value::table({
            {"type", "Sequence"},
            {"children", Value::array({Value::table({{"type", "Wait"}, {"seconds", 1.0}})})},
        })},
    });

    auto text = to_toml_string(doc);
    REQUIRE(text.is_ok());

    auto parsed = parse_toml(*text, "roundtrip.mob");
    REQUIRE(parsed.is_ok());
    REQUIRE(*parsed == doc);
}

TEST_CASE("to_toml_string rejects non-table roots", "[data][toml]") {
    auto text = to_toml_string(Value(3));
    REQUIRE(text.is_err());
    REQUIRE(text.error().code() == ErrorCode::InvalidArgument);
}

TEST_CASE("read_toml_file", "[data][toml]") {
    auto dir = std::filesystem::temp_directory_path() / "mobdef_toml_codec_test";
    std::filesystem::create_directories(dir);

    SECTION("missing file") {
        auto result = read_toml_file(dir / "missing.mob");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::NotFound);
    }

    SECTION("existing file") {
        {
            std::ofstream out(dir / "grunt.mob");
            out << "name = \"Grunt\"\n";
        }
        auto result = read_toml_file(dir / "grunt.mob");
        REQUIRE(result.is_ok());
        REQUIRE(*result->get_string("name") == "Grunt");
    }

    std::filesystem::remove_all(dir);
}

// =============================================================================
// JSON
// =============================================================================

TEST_CASE("to_json maps values onto JSON types", "[data][json]") {
    Value doc = Value::table({
        {"name", "Grunt"},
        {"health", 50},
        {"speed", 1.5},
        {"spawnable", false},
        {"tags", Value::array({"a", "b"})},
    });

    auto json = to_json(doc);
    REQUIRE(json.is_object());
    REQUIRE(json["name"] == "Grunt");
    REQUIRE(json["health"] == 50);
    REQUIRE(json["speed"] == 1.5);
    REQUIRE(json["spawnable"] == false);
    REQUIRE(json["tags"].is_array());
    REQUIRE(json["tags"].size() == 2);
}
