#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for artisan_core module

#include <cstdint>

namespace artisan_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct CraftingError;
struct StorageError;
struct ImportError;
struct ConfigError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;

} // namespace artisan_core
