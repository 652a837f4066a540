/// @file toml_codec.cpp
/// @brief TOML text <-> Value conversion (toml++)

#include <mobdef/data/toml_codec.hpp>

#include <toml++/toml.hpp>

#include <fstream>
#include <optional>
#include <sstream>

namespace mobdef_data {

using mobdef_core::DefinitionError;
using mobdef_core::Err;
using mobdef_core::Result;

namespace {

// =============================================================================
// toml++ -> Value
// =============================================================================

/// Converts a node, recording the dotted path of the first unsupported value
std::optional<Value> from_node(const toml::node& node, const std::string& path, std::string& bad_path) {
    switch (node.type()) {
        case toml::node_type::table: {
            Table out;
            for (auto&& [key, child] : *node.as_table()) {
                std::string name(key.str());
                auto converted = from_node(child, path.empty() ? name : path + "." + name, bad_path);
                if (!converted) return std::nullopt;
                out.emplace(std::move(name), std::move(*converted));
            }
            return Value(std::move(out));
        }
        case toml::node_type::array: {
            Array out;
            std::size_t index = 0;
            for (auto&& child : *node.as_array()) {
                auto converted = from_node(child, path + "[" + std::to_string(index++) + "]", bad_path);
                if (!converted) return std::nullopt;
                out.push_back(std::move(*converted));
            }
            return Value(std::move(out));
        }
        case toml::node_type::string:
            return Value(node.as_string()->get());
        case toml::node_type::integer:
            return Value(node.as_integer()->get());
        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());
        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());
        default:
            // date, time, date_time
            bad_path = path;
            return std::nullopt;
    }
}

// =============================================================================
// Value -> toml++
// =============================================================================

toml::array build_array(const Array& values);

toml::table build_table(const Table& values) {
    toml::table out;
    for (const auto& [key, value] : values) {
        switch (value.type()) {
            case ValueType::Table: out.insert_or_assign(key, build_table(value.as_table())); break;
            case ValueType::Array: out.insert_or_assign(key, build_array(value.as_array())); break;
            case ValueType::String: out.insert_or_assign(key, value.as_string()); break;
            case ValueType::Integer: out.insert_or_assign(key, value.as_int()); break;
            case ValueType::Float: out.insert_or_assign(key, value.as_float()); break;
            case ValueType::Boolean: out.insert_or_assign(key, value.as_bool()); break;
        }
    }
    return out;
}

toml::array build_array(const Array& values) {
    toml::array out;
    for (const auto& value : values) {
        switch (value.type()) {
            case ValueType::Table: out.push_back(build_table(value.as_table())); break;
            case ValueType::Array: out.push_back(build_array(value.as_array())); break;
            case ValueType::String: out.push_back(value.as_string()); break;
            case ValueType::Integer: out.push_back(value.as_int()); break;
            case ValueType::Float: out.push_back(value.as_float()); break;
            case ValueType::Boolean: out.push_back(value.as_bool()); break;
        }
    }
    return out;
}

} // anonymous namespace

Result<Value> parse_toml(const std::string& content, const std::string& source_name) {
    try {
        toml::table tbl = toml::parse(content, source_name);

        std::string bad_path;
        auto converted = from_node(tbl, "", bad_path);
        if (!converted) {
            return Err<Value>(DefinitionError::schema(source_name, bad_path,
                                                      "date and time values are not supported"));
        }
        return std::move(*converted);

    } catch (const toml::parse_error& err) {
        std::ostringstream oss;
        oss << err.description() << " (line " << err.source().begin.line
            << ", column " << err.source().begin.column << ")";
        return Err<Value>(DefinitionError::parse(source_name, oss.str()));
    }
}

Result<Value> read_toml_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return Err<Value>(DefinitionError::not_found(path.string()));
        }
        return Err<Value>(DefinitionError::io(path.string(), "cannot open file"));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_toml(buffer.str(), path.string());
}

Result<std::string> to_toml_string(const Value& value) {
    const Table* root = value.try_table();
    if (root == nullptr) {
        return Err<std::string>(mobdef_core::Error(mobdef_core::ErrorCode::InvalidArgument,
            std::string("TOML document root must be a table, got ") + value.type_name()));
    }

    std::ostringstream oss;
    oss << build_table(*root);
    return oss.str();
}

} // namespace mobdef_data
