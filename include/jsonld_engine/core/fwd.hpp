#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for jsonld_core module

#include <cstdint>

namespace jsonld_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct LoaderError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace jsonld_core
