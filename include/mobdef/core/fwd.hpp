#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for mobdef_core module

#include <cstdint>

namespace mobdef_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct DefinitionError;
struct ConfigError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging / Configuration
// =============================================================================

struct LogConfig;
class LogScope;
struct PipelineConfig;

} // namespace mobdef_core
