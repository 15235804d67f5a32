/// @file config.hpp
/// @brief Configuration system for artisan
///
/// Provides layered configuration with:
/// - Default values
/// - JSON configuration files
/// - Environment variables
/// - Command-line arguments
/// - Change notification

#pragma once

#include "types.hpp"

#include <artisan/core/error.hpp>

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace artisan_config {

// =============================================================================
// Config Layer
// =============================================================================

/// A configuration layer
class ConfigLayer {
public:
    explicit ConfigLayer(const std::string& name, ConfigLayerPriority priority = ConfigLayerPriority::User)
        : m_name(name), m_priority(priority) {}

    /// Get layer name
    [[nodiscard]] const std::string& name() const { return m_name; }

    /// Get priority
    [[nodiscard]] ConfigLayerPriority priority() const { return m_priority; }

    /// Check if key exists
    [[nodiscard]] bool contains(const std::string& key) const;

    /// Get value
    [[nodiscard]] std::optional<ConfigValue> get(const std::string& key) const;

    /// Set value
    void set(const std::string& key, ConfigValue value);

    /// Remove key
    bool remove(const std::string& key);

    /// Clear all values
    void clear();

    /// Get all keys
    [[nodiscard]] std::vector<std::string> keys() const;

    /// Get value count
    [[nodiscard]] std::size_t size() const { return m_values.size(); }

    /// Check if empty
    [[nodiscard]] bool empty() const { return m_values.empty(); }

    /// Check if modified
    [[nodiscard]] bool is_modified() const { return m_modified; }

    /// Clear modified flag
    void clear_modified() { m_modified = false; }

private:
    std::string m_name;
    ConfigLayerPriority m_priority;
    std::map<std::string, ConfigValue> m_values;
    bool m_modified = false;
};

// =============================================================================
// Config Schema
// =============================================================================

/// Configuration value schema for validation
struct ConfigSchema {
    std::string key;
    ConfigValueType type = ConfigValueType::String;
    std::optional<ConfigValue> default_value;
    std::optional<double> min_value;
    std::optional<double> max_value;
    std::vector<ConfigValue> allowed_values;
    std::string description;

    /// Validate a value against this schema
    [[nodiscard]] artisan_core::Result<void> validate(const ConfigValue& value) const;
};

/// Schema registry for validation
class ConfigSchemaRegistry {
public:
    /// Register a schema
    void register_schema(ConfigSchema schema);

    /// Get schema for key
    [[nodiscard]] const ConfigSchema* get_schema(const std::string& key) const;

    /// All registered keys, sorted
    [[nodiscard]] std::vector<std::string> keys() const;

    /// Validate all values in a layer
    [[nodiscard]] std::vector<std::string> validate(const ConfigLayer& layer) const;

    /// Validate a specific value
    [[nodiscard]] artisan_core::Result<void> validate(const std::string& key, const ConfigValue& value) const;

    /// Coerce text to the registered type of @p key and validate it
    [[nodiscard]] artisan_core::Result<ConfigValue> coerce(const std::string& key, const std::string& text) const;

    /// Schemas for every artisan setting
    [[nodiscard]] static ConfigSchemaRegistry artisan_defaults();

private:
    std::map<std::string, ConfigSchema> m_schemas;
};

// =============================================================================
// Config Manager
// =============================================================================

/// Layered configuration manager
class ConfigManager {
public:
    using ChangeCallback = std::function<void(const std::string& key, const ConfigValue& value)>;

    ConfigManager() = default;
    ~ConfigManager() = default;

    // Non-copyable
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    // =========================================================================
    // Layer Management
    // =========================================================================

    /// Add a configuration layer
    void add_layer(std::unique_ptr<ConfigLayer> layer);

    /// Get layer by name
    [[nodiscard]] ConfigLayer* get_layer(const std::string& name);
    [[nodiscard]] const ConfigLayer* get_layer(const std::string& name) const;

    /// Remove layer
    bool remove_layer(const std::string& name);

    /// Get layer count
    [[nodiscard]] std::size_t layer_count() const;

    // =========================================================================
    // Value Access (Merged View)
    // =========================================================================

    /// Check if key exists in any layer
    [[nodiscard]] bool contains(const std::string& key) const;

    /// Get value (from highest priority layer that contains it)
    [[nodiscard]] std::optional<ConfigValue> get(const std::string& key) const;

    /// Name of the layer that currently supplies @p key
    [[nodiscard]] std::optional<std::string> source_of(const std::string& key) const;

    /// Get value with default
    template<typename T>
    [[nodiscard]] T get_or(const std::string& key, T default_value) const {
        auto value = get(key);
        if (!value) return default_value;

        if constexpr (std::is_same_v<T, bool>) {
            if (auto* v = std::get_if<bool>(&*value)) return *v;
        } else if constexpr (std::is_integral_v<T>) {
            if (auto* v = std::get_if<std::int64_t>(&*value)) return static_cast<T>(*v);
        } else if constexpr (std::is_floating_point_v<T>) {
            if (auto* v = std::get_if<double>(&*value)) return static_cast<T>(*v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            if (auto* v = std::get_if<std::string>(&*value)) return *v;
        } else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
            if (auto* v = std::get_if<std::vector<std::string>>(&*value)) return *v;
        }

        return default_value;
    }

    /// Get bool value
    [[nodiscard]] bool get_bool(const std::string& key, bool default_value = false) const;

    /// Get int value
    [[nodiscard]] std::int64_t get_int(const std::string& key, std::int64_t default_value = 0) const;

    /// Get float value
    [[nodiscard]] double get_float(const std::string& key, double default_value = 0.0) const;

    /// Get string value
    [[nodiscard]] std::string get_string(const std::string& key, const std::string& default_value = "") const;

    // =========================================================================
    // Value Setting
    // =========================================================================

    /// Set value in specific layer (or user layer by default)
    void set(const std::string& key, ConfigValue value, const std::string& layer_name = "user");

    void set_bool(const std::string& key, bool value, const std::string& layer_name = "user");
    void set_int(const std::string& key, std::int64_t value, const std::string& layer_name = "user");
    void set_float(const std::string& key, double value, const std::string& layer_name = "user");
    void set_string(const std::string& key, const std::string& value, const std::string& layer_name = "user");

    // =========================================================================
    // File Operations
    // =========================================================================

    /// Load configuration from JSON file
    ///
    /// Nested objects flatten to dotted keys ({"data": {"database_path": ".."}}
    /// becomes "data.database_path").
    [[nodiscard]] artisan_core::Result<void> load_json(const std::filesystem::path& path,
                                                       const std::string& layer_name = "file");

    /// Load configuration from a JSON string
    [[nodiscard]] artisan_core::Result<void> load_json_string(const std::string& content,
                                                              const std::string& layer_name = "file");

    /// Save layer to JSON file (nested by dotted key)
    [[nodiscard]] artisan_core::Result<void> save_json(const std::filesystem::path& path,
                                                       const std::string& layer_name = "user") const;

    // =========================================================================
    // Command Line
    // =========================================================================

    /// Parse --key=value, --key value and --flag arguments into the cmdline layer
    ///
    /// Arguments that are not options are returned in order.
    [[nodiscard]] artisan_core::Result<std::vector<std::string>> parse_args(int argc, char** argv);

    [[nodiscard]] artisan_core::Result<std::vector<std::string>> parse_args(const std::vector<std::string>& args);

    // =========================================================================
    // Environment
    // =========================================================================

    /// Load the known environment variables with prefix (ARTISAN_DB_PATH, ...)
    void load_environment(const std::string& prefix = "ARTISAN_");

    // =========================================================================
    // Events
    // =========================================================================

    /// Set callback for config changes
    void on_change(ChangeCallback callback);

    // =========================================================================
    // Defaults
    // =========================================================================

    /// Create default layers and fill the defaults layer from the schema registry
    void setup_defaults();

    /// Create default layers (defaults, file, user, environment, cmdline)
    void create_default_layers();

private:
    /// Find or create a layer. Caller holds m_mutex.
    ConfigLayer* ensure_layer_locked(const std::string& name, ConfigLayerPriority priority);

    /// Get layers sorted by priority (highest to lowest). Caller holds m_mutex.
    [[nodiscard]] std::vector<ConfigLayer*> sorted_layers() const;

    /// Notify change callbacks
    void notify_change(const std::string& key, const ConfigValue& value);

private:
    std::vector<std::unique_ptr<ConfigLayer>> m_layers;
    mutable std::mutex m_mutex;
    std::vector<ChangeCallback> m_change_callbacks;
};

// =============================================================================
// Config Keys (Constants)
// =============================================================================

namespace config_keys {

// Crafting
constexpr const char* CRAFTING_DEFAULT_TAX_RATE = "crafting.default_tax_rate";       ///< Percent
constexpr const char* CRAFTING_PRICE_LOOKBACK_DAYS = "crafting.price_lookback_days";
constexpr const char* CRAFTING_DEFAULT_PROFESSION = "crafting.default_profession";
constexpr const char* CRAFTING_USE_INVENTORY = "crafting.use_inventory_constraints";

// Market
constexpr const char* MARKET_PERIOD_DAYS = "market.period_days";
constexpr const char* MARKET_PRICE_ALERTS = "market.show_price_alerts";

// Inventory
constexpr const char* INVENTORY_LOW_STOCK_ALERTS = "inventory.show_low_stock_alerts";

// Data
constexpr const char* DATA_DATABASE_PATH = "data.database_path";
constexpr const char* DATA_API_CACHE_DIR = "data.api_cache_dir";
constexpr const char* DATA_AUTO_SYNC = "data.auto_sync_enabled";
constexpr const char* DATA_SYNC_INTERVAL_HOURS = "data.sync_interval_hours";

// API
constexpr const char* API_TIMEOUT_SECONDS = "api.timeout_seconds";
constexpr const char* API_RATE_LIMIT_SECONDS = "api.rate_limit_seconds";

// Cache
constexpr const char* CACHE_ENABLED = "cache.enabled";
constexpr const char* CACHE_MAX_AGE_HOURS = "cache.max_age_hours";

// Logging
constexpr const char* LOG_LEVEL = "logging.level";
constexpr const char* LOG_FILE_ENABLED = "logging.file_enabled";
constexpr const char* LOG_DIRECTORY = "logging.directory";
constexpr const char* DEBUG_MODE = "logging.debug_mode";

} // namespace config_keys

} // namespace artisan_config
