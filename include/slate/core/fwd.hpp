#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for slate_core module

#include <cstdint>

namespace slate_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct ContentError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace slate_core
