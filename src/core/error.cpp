/// @file error.cpp
/// @brief Error formatting for mobdef_core

#include <mobdef/core/error.hpp>
#include <sstream>

namespace mobdef_core {

namespace detail {

const char* definition_kind_name(DefinitionError::Kind kind) {
    switch (kind) {
        case DefinitionError::Kind::Io: return "io";
        case DefinitionError::Kind::Parse: return "parse";
        case DefinitionError::Kind::Schema: return "schema";
        case DefinitionError::Kind::NotFound: return "not_found";
        default: return "unknown";
    }
}

std::string format_definition_error(const DefinitionError& err) {
    std::ostringstream oss;
    oss << "[DefinitionError:" << definition_kind_name(err.kind) << "] " << err.message;

    if (!err.entity.empty()) {
        oss << " (entity: " << err.entity << ")";
    }
    if (!err.field.empty()) {
        oss << " (field: " << err.field << ")";
    }

    return oss.str();
}

std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError] " << err.message;
    if (!err.key.empty()) {
        oss << " (key: " << err.key << ")";
    }
    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, DefinitionError>) {
            oss << detail::format_definition_error(err);
        } else if constexpr (std::is_same_v<T, ConfigError>) {
            oss << detail::format_config_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << "\n  " << key << ": " << value;
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::string, Error>;

} // namespace mobdef_core
