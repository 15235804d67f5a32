#pragma once

/// @file log.hpp
/// @brief Logging utilities for artisan

#include <spdlog/spdlog.h>
#include <string>
#include <memory>
#include <optional>

namespace artisan_core {

// =============================================================================
// Basic Logging (Inline)
// =============================================================================

/// @brief Console-only logging used until settings are loaded
inline void init_logging() {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);
}

// =============================================================================
// Log Configuration
// =============================================================================

/// Sinks and level applied to every subsystem logger
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 5 * 1024 * 1024;  // 5 MB
    std::size_t max_files = 3;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Apply @p config; loggers created earlier are re-sinked
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Crafting engine logger
std::shared_ptr<spdlog::logger> crafting_logger();

/// Local store and import logger
std::shared_ptr<spdlog::logger> catalog_logger();

/// Settings/config logger
std::shared_ptr<spdlog::logger> config_logger();

// =============================================================================
// Log Level Management
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level);
spdlog::level::level_enum get_global_log_level();

/// Parse log level from string (case-insensitive, "warning" and "fatal" accepted)
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Lifecycle
// =============================================================================

/// Flush and drop every subsystem logger
void shutdown_logging();

} // namespace artisan_core
