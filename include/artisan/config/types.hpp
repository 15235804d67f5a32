/// @file types.hpp
/// @brief Configuration value types for artisan_config

#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace artisan_config {

// =============================================================================
// Config Value
// =============================================================================

/// Configuration value variant
using ConfigValue = std::variant<
    bool,
    std::int64_t,
    double,
    std::string,
    std::vector<std::string>
>;

/// Configuration value type
enum class ConfigValueType : std::uint8_t {
    Bool,
    Int,
    Float,
    String,
    StringArray,
};

/// Get the type tag of a value
[[nodiscard]] ConfigValueType config_value_type(const ConfigValue& value);

/// Get type name
[[nodiscard]] const char* config_value_type_name(ConfigValueType type);

/// Render a value as text (arrays comma-separated)
[[nodiscard]] std::string config_value_to_string(const ConfigValue& value);

/// Infer a typed value from text: bool, then integer, then float, else string
[[nodiscard]] ConfigValue parse_config_value(const std::string& text);

/// Convert text to a value of the given type, if it can be read as one
[[nodiscard]] bool parse_config_value_as(const std::string& text, ConfigValueType type, ConfigValue& out);

// =============================================================================
// Layer Priority
// =============================================================================

/// Configuration layer priority (lower = higher priority)
enum class ConfigLayerPriority : std::int32_t {
    CommandLine = -1000,    ///< Command-line arguments (highest)
    Environment = -500,     ///< Environment variables
    User = 0,               ///< Settings persisted in the local store
    File = 100,             ///< Configuration file
    Default = 1000,         ///< Built-in defaults (lowest)
};

} // namespace artisan_config
