#pragma once

/// @file value.hpp
/// @brief Generic recursive value for definition documents

#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace mobdef_data {

// =============================================================================
// ValueType
// =============================================================================

/// Value type discriminator (matches variant index)
enum class ValueType : std::uint8_t {
    Table = 0,
    Array,
    String,
    Integer,
    Float,
    Boolean,
};

[[nodiscard]] inline const char* value_type_name(ValueType type) noexcept {
    switch (type) {
        case ValueType::Table: return "table";
        case ValueType::Array: return "array";
        case ValueType::String: return "string";
        case ValueType::Integer: return "integer";
        case ValueType::Float: return "float";
        case ValueType::Boolean: return "boolean";
        default: return "unknown";
    }
}

// =============================================================================
// Value
// =============================================================================

class Value;

/// Ordered key/value table, keys unique
using Table = std::map<std::string, Value>;

/// Sequence of values
using Array = std::vector<Value>;

/// Dynamic TOML-shaped value. A default-constructed Value is an empty table.
class Value {
public:
    using Variant = std::variant<
        Table,         // Table
        Array,         // Array
        std::string,   // String
        std::int64_t,  // Integer
        double,        // Float
        bool           // Boolean
    >;

    Value() : m_data(Table{}) {}

    Value(bool v) : m_data(v) {}
    Value(int v) : m_data(static_cast<std::int64_t>(v)) {}
    Value(std::int64_t v) : m_data(v) {}
    Value(double v) : m_data(v) {}
    Value(const char* v) : m_data(std::string(v)) {}
    Value(std::string v) : m_data(std::move(v)) {}
    Value(std::string_view v) : m_data(std::string(v)) {}
    Value(Table v) : m_data(std::move(v)) {}
    Value(Array v) : m_data(std::move(v)) {}

    // -------------------------------------------------------------------------
    // Factory methods
    // -------------------------------------------------------------------------

    [[nodiscard]] static Value table() { return Value(Table{}); }

    [[nodiscard]] static Value table(std::initializer_list<std::pair<const std::string, Value>> entries) {
        return Value(Table(entries));
    }

    [[nodiscard]] static Value array() { return Value(Array{}); }

    [[nodiscard]] static Value array(std::initializer_list<Value> values) {
        return Value(Array(values));
    }

    // -------------------------------------------------------------------------
    // Type checking
    // -------------------------------------------------------------------------

    [[nodiscard]] ValueType type() const noexcept {
        return static_cast<ValueType>(m_data.index());
    }

    [[nodiscard]] const char* type_name() const noexcept {
        return value_type_name(type());
    }

    [[nodiscard]] bool is_table() const noexcept { return std::holds_alternative<Table>(m_data); }
    [[nodiscard]] bool is_array() const noexcept { return std::holds_alternative<Array>(m_data); }
    [[nodiscard]] bool is_string() const noexcept { return std::holds_alternative<std::string>(m_data); }
    [[nodiscard]] bool is_int() const noexcept { return std::holds_alternative<std::int64_t>(m_data); }
    [[nodiscard]] bool is_float() const noexcept { return std::holds_alternative<double>(m_data); }
    [[nodiscard]] bool is_bool() const noexcept { return std::holds_alternative<bool>(m_data); }

    /// Integer or float
    [[nodiscard]] bool is_numeric() const noexcept { return is_int() || is_float(); }

    // -------------------------------------------------------------------------
    // Accessors (throw std::bad_variant_access on type mismatch)
    // -------------------------------------------------------------------------

    [[nodiscard]] const Table& as_table() const { return std::get<Table>(m_data); }
    [[nodiscard]] Table& as_table_mut() { return std::get<Table>(m_data); }
    [[nodiscard]] const Array& as_array() const { return std::get<Array>(m_data); }
    [[nodiscard]] Array& as_array_mut() { return std::get<Array>(m_data); }
    [[nodiscard]] const std::string& as_string() const { return std::get<std::string>(m_data); }
    [[nodiscard]] std::int64_t as_int() const { return std::get<std::int64_t>(m_data); }
    [[nodiscard]] double as_float() const { return std::get<double>(m_data); }
    [[nodiscard]] bool as_bool() const { return std::get<bool>(m_data); }

    /// Integer widened to double, or the float itself
    [[nodiscard]] double as_numeric() const {
        if (is_int()) {
            return static_cast<double>(as_int());
        }
        return as_float();
    }

    // -------------------------------------------------------------------------
    // Optional accessors (nullopt / nullptr on type mismatch)
    // -------------------------------------------------------------------------

    [[nodiscard]] const Table* try_table() const noexcept { return std::get_if<Table>(&m_data); }
    [[nodiscard]] Table* try_table_mut() noexcept { return std::get_if<Table>(&m_data); }
    [[nodiscard]] const Array* try_array() const noexcept { return std::get_if<Array>(&m_data); }
    [[nodiscard]] Array* try_array_mut() noexcept { return std::get_if<Array>(&m_data); }
    [[nodiscard]] const std::string* try_string() const noexcept { return std::get_if<std::string>(&m_data); }

    [[nodiscard]] std::optional<std::int64_t> try_int() const noexcept {
        if (auto* p = std::get_if<std::int64_t>(&m_data)) return *p;
        return std::nullopt;
    }

    [[nodiscard]] std::optional<double> try_numeric() const noexcept {
        if (auto* p = std::get_if<double>(&m_data)) return *p;
        if (auto* p = std::get_if<std::int64_t>(&m_data)) return static_cast<double>(*p);
        return std::nullopt;
    }

    [[nodiscard]] std::optional<bool> try_bool() const noexcept {
        if (auto* p = std::get_if<bool>(&m_data)) return *p;
        return std::nullopt;
    }

    // -------------------------------------------------------------------------
    // Table operations
    // -------------------------------------------------------------------------

    /// Entry count of a table or array, 0 otherwise
    [[nodiscard]] std::size_t size() const noexcept {
        if (auto* arr = std::get_if<Array>(&m_data)) {
            return arr->size();
        }
        if (auto* tbl = std::get_if<Table>(&m_data)) {
            return tbl->size();
        }
        return 0;
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        if (auto* tbl = std::get_if<Table>(&m_data)) {
            return tbl->find(key) != tbl->end();
        }
        return false;
    }

    /// Lookup in a table (nullptr if missing or not a table)
    [[nodiscard]] const Value* get(const std::string& key) const {
        if (auto* tbl = std::get_if<Table>(&m_data)) {
            auto it = tbl->find(key);
            if (it != tbl->end()) {
                return &it->second;
            }
        }
        return nullptr;
    }

    [[nodiscard]] Value* get_mut(const std::string& key) {
        if (auto* tbl = std::get_if<Table>(&m_data)) {
            auto it = tbl->find(key);
            if (it != tbl->end()) {
                return &it->second;
            }
        }
        return nullptr;
    }

    /// String entry of a table, nullptr otherwise
    [[nodiscard]] const std::string* get_string(const std::string& key) const {
        const Value* v = get(key);
        return v ? v->try_string() : nullptr;
    }

    /// Insert or replace a table entry (no-op if not a table)
    void set(const std::string& key, Value value) {
        if (auto* tbl = std::get_if<Table>(&m_data)) {
            (*tbl)[key] = std::move(value);
        }
    }

    /// Remove a table entry, returns true if it existed
    bool erase(const std::string& key) {
        if (auto* tbl = std::get_if<Table>(&m_data)) {
            return tbl->erase(key) > 0;
        }
        return false;
    }

    // -------------------------------------------------------------------------
    // Comparison
    // -------------------------------------------------------------------------

    bool operator==(const Value& other) const { return m_data == other.m_data; }
    bool operator!=(const Value& other) const { return m_data != other.m_data; }

    [[nodiscard]] const Variant& variant() const noexcept { return m_data; }

private:
    Variant m_data;
};

/// Equality that treats Integer(n) and Float(n) as equal, recursively
[[nodiscard]] bool values_equal_loose(const Value& a, const Value& b);

} // namespace mobdef_data
