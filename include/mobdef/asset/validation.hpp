#pragma once

/// @file validation.hpp
/// @brief Authoring checks run on a definition document before it is saved

#include <mobdef/data/value.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace mobdef_asset {

struct ValidationIssue {
    enum class Severity : std::uint8_t {
        Error,    // blocks saving
        Warning,  // reported only
    };

    Severity severity = Severity::Error;
    std::string path;  // dotted, e.g. "colliders[0].shape"; empty for the root
    std::string message;

    /// "[ERROR] path: message" or "[WARN] path: message"
    [[nodiscard]] std::string to_string() const;
};

class ValidationResult {
public:
    void add_error(std::string path, std::string message);
    void add_warning(std::string path, std::string message);

    /// Append every issue of another result
    void merge(const ValidationResult& other);

    [[nodiscard]] bool has_errors() const;
    [[nodiscard]] bool has_warnings() const;
    [[nodiscard]] bool empty() const { return m_issues.empty(); }

    [[nodiscard]] const std::vector<ValidationIssue>& issues() const { return m_issues; }

    /// Messages of error-severity issues only
    [[nodiscard]] std::vector<std::string> error_messages() const;

    /// All issues, one per line
    [[nodiscard]] std::string format() const;

private:
    std::vector<ValidationIssue> m_issues;
};

/// Validate a definition (or patch) document.
/// Patches may omit `name`; every other rule applies to the keys present.
[[nodiscard]] ValidationResult validate_mob(const mobdef_data::Value& value, bool is_patch);

} // namespace mobdef_asset
