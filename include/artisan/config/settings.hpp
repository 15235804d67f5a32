/// @file settings.hpp
/// @brief Typed user settings on top of the configuration layers

#pragma once

#include "config.hpp"

#include <artisan/core/error.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace artisan_config {

// =============================================================================
// UserSettings
// =============================================================================

/// @brief User preferences with defaults
struct UserSettings {
    // Calculation
    double default_tax_rate{15.0};                  ///< Percent
    std::int32_t price_lookback_days{7};
    std::string default_profession{"Scribe"};
    bool use_inventory_constraints{true};

    // Market
    std::int32_t market_period_days{30};
    bool show_price_alerts{true};
    bool show_low_stock_alerts{true};

    // Data
    std::string database_path{"artisan_toolbox.db"};
    std::string api_cache_dir{"api_cache"};
    bool auto_sync_enabled{true};
    std::int32_t sync_interval_hours{24};
    std::int32_t api_timeout_seconds{15};
    double api_rate_limit_seconds{1.5};
    bool cache_enabled{true};
    std::int32_t cache_max_age_hours{24};

    // Logging
    std::string log_level{"info"};
    bool log_file_enabled{false};
    std::string log_directory{"logs"};
    bool debug_mode{false};

    /// @brief Default tax as a 0..1 rate for the cost engine
    double tax_rate() const { return default_tax_rate / 100.0; }

    /// @brief Read every setting from the merged configuration view
    [[nodiscard]] static UserSettings from_config(const ConfigManager& config);
};

// =============================================================================
// ISettingsStore
// =============================================================================

/// @brief Persistent key/value storage for user settings
class ISettingsStore {
public:
    virtual ~ISettingsStore() = default;

    /// @brief All persisted settings
    [[nodiscard]] virtual artisan_core::Result<std::map<std::string, std::string>> load_settings() = 0;

    /// @brief Persist one setting
    [[nodiscard]] virtual artisan_core::Result<void> save_setting(const std::string& key,
                                                                  const std::string& value) = 0;
};

// =============================================================================
// SettingsManager
// =============================================================================

/// @brief Validated, persisted settings with per-key change callbacks
///
/// Persisted values live in the "user" layer of the configuration manager, so
/// environment and command-line layers still override them.
class SettingsManager {
public:
    using Callback = std::function<void(const std::string& key,
                                        const std::optional<ConfigValue>& old_value,
                                        const ConfigValue& new_value)>;

    explicit SettingsManager(ConfigManager& config, ISettingsStore* store = nullptr);

    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;

    /// @brief Load persisted settings into the user layer
    ///
    /// Unknown or invalid persisted entries are skipped with a warning.
    [[nodiscard]] artisan_core::Result<void> load();

    /// @brief Current typed settings
    [[nodiscard]] const UserSettings& settings() const { return m_settings; }

    /// @brief Current value of one setting as text
    [[nodiscard]] std::optional<std::string> get(const std::string& key) const;

    /// @brief Validate, apply and persist a setting given as text
    [[nodiscard]] artisan_core::Result<void> set(const std::string& key, const std::string& value);

    /// @brief Write every default back to the user layer and the store
    [[nodiscard]] artisan_core::Result<void> reset_to_defaults();

    /// @brief All settings as key -> text
    [[nodiscard]] std::map<std::string, std::string> export_settings() const;

    /// @brief Apply several settings; stops at the first invalid one
    [[nodiscard]] artisan_core::Result<void> import_settings(const std::map<std::string, std::string>& values);

    /// @brief Register a callback for one key
    void on_setting_changed(const std::string& key, Callback callback);

    /// @brief Known setting keys, sorted
    [[nodiscard]] std::vector<std::string> keys() const { return m_schemas.keys(); }

    [[nodiscard]] const ConfigSchemaRegistry& schemas() const { return m_schemas; }

private:
    artisan_core::Result<void> apply(const std::string& key, const ConfigValue& value);
    void refresh();

    ConfigManager& m_config;
    ISettingsStore* m_store{nullptr};
    ConfigSchemaRegistry m_schemas;
    UserSettings m_settings;
    std::map<std::string, std::vector<Callback>> m_callbacks;
};

} // namespace artisan_config
