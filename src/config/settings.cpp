/// @file settings.cpp
/// @brief UserSettings and SettingsManager implementation

#include <artisan/config/settings.hpp>
#include <artisan/core/log.hpp>

namespace artisan_config {

using artisan_core::Err;
using artisan_core::Error;
using artisan_core::Ok;
using artisan_core::Result;

// =============================================================================
// UserSettings
// =============================================================================

UserSettings UserSettings::from_config(const ConfigManager& config) {
    using namespace config_keys;
    UserSettings s;

    s.default_tax_rate = config.get_float(CRAFTING_DEFAULT_TAX_RATE, s.default_tax_rate);
    s.price_lookback_days = static_cast<std::int32_t>(
        config.get_int(CRAFTING_PRICE_LOOKBACK_DAYS, s.price_lookback_days));
    s.default_profession = config.get_string(CRAFTING_DEFAULT_PROFESSION, s.default_profession);
    s.use_inventory_constraints = config.get_bool(CRAFTING_USE_INVENTORY, s.use_inventory_constraints);

    s.market_period_days = static_cast<std::int32_t>(config.get_int(MARKET_PERIOD_DAYS, s.market_period_days));
    s.show_price_alerts = config.get_bool(MARKET_PRICE_ALERTS, s.show_price_alerts);
    s.show_low_stock_alerts = config.get_bool(INVENTORY_LOW_STOCK_ALERTS, s.show_low_stock_alerts);

    s.database_path = config.get_string(DATA_DATABASE_PATH, s.database_path);
    s.api_cache_dir = config.get_string(DATA_API_CACHE_DIR, s.api_cache_dir);
    s.auto_sync_enabled = config.get_bool(DATA_AUTO_SYNC, s.auto_sync_enabled);
    s.sync_interval_hours = static_cast<std::int32_t>(
        config.get_int(DATA_SYNC_INTERVAL_HOURS, s.sync_interval_hours));
    s.api_timeout_seconds = static_cast<std::int32_t>(config.get_int(API_TIMEOUT_SECONDS, s.api_timeout_seconds));
    s.api_rate_limit_seconds = config.get_float(API_RATE_LIMIT_SECONDS, s.api_rate_limit_seconds);
    s.cache_enabled = config.get_bool(CACHE_ENABLED, s.cache_enabled);
    s.cache_max_age_hours = static_cast<std::int32_t>(config.get_int(CACHE_MAX_AGE_HOURS, s.cache_max_age_hours));

    s.log_level = config.get_string(LOG_LEVEL, s.log_level);
    s.log_file_enabled = config.get_bool(LOG_FILE_ENABLED, s.log_file_enabled);
    s.log_directory = config.get_string(LOG_DIRECTORY, s.log_directory);
    s.debug_mode = config.get_bool(DEBUG_MODE, s.debug_mode);

    return s;
}

// =============================================================================
// SettingsManager
// =============================================================================

SettingsManager::SettingsManager(ConfigManager& config, ISettingsStore* store)
    : m_config(config)
    , m_store(store)
    , m_schemas(ConfigSchemaRegistry::artisan_defaults())
{
    if (!m_config.get_layer("defaults")) {
        m_config.setup_defaults();
    }
    refresh();
}

Result<void> SettingsManager::load() {
    if (!m_store) {
        refresh();
        return Ok();
    }

    auto persisted = m_store->load_settings();
    if (!persisted) {
        return Err(std::move(persisted.error()));
    }

    auto logger = artisan_core::config_logger();
    std::size_t applied = 0;
    for (const auto& [key, text] : *persisted) {
        auto value = m_schemas.coerce(key, text);
        if (!value) {
            logger->warn("Ignoring stored setting {}={}: {}", key, text, value.error().message());
            continue;
        }
        m_config.set(key, *value, "user");
        ++applied;
    }

    refresh();
    logger->debug("Loaded {} stored settings", applied);
    return Ok();
}

std::optional<std::string> SettingsManager::get(const std::string& key) const {
    auto value = m_config.get(key);
    if (!value) {
        return std::nullopt;
    }
    return config_value_to_string(*value);
}

Result<void> SettingsManager::set(const std::string& key, const std::string& value) {
    auto coerced = m_schemas.coerce(key, value);
    if (!coerced) {
        return Err(std::move(coerced.error()));
    }
    return apply(key, *coerced);
}

Result<void> SettingsManager::reset_to_defaults() {
    for (const auto& key : m_schemas.keys()) {
        const auto* schema = m_schemas.get_schema(key);
        if (!schema || !schema->default_value) continue;

        auto result = apply(key, *schema->default_value);
        if (!result) {
            return result;
        }
    }
    artisan_core::config_logger()->info("Settings reset to defaults");
    return Ok();
}

std::map<std::string, std::string> SettingsManager::export_settings() const {
    std::map<std::string, std::string> result;
    for (const auto& key : m_schemas.keys()) {
        if (auto value = get(key)) {
            result[key] = *value;
        }
    }
    return result;
}

Result<void> SettingsManager::import_settings(const std::map<std::string, std::string>& values) {
    for (const auto& [key, text] : values) {
        auto result = set(key, text);
        if (!result) {
            return result;
        }
    }
    return Ok();
}

void SettingsManager::on_setting_changed(const std::string& key, Callback callback) {
    m_callbacks[key].push_back(std::move(callback));
}

Result<void> SettingsManager::apply(const std::string& key, const ConfigValue& value) {
    auto old_value = m_config.get(key);

    if (m_store) {
        auto saved = m_store->save_setting(key, config_value_to_string(value));
        if (!saved) {
            return saved;
        }
    }

    m_config.set(key, value, "user");
    refresh();

    if (!old_value || *old_value != value) {
        artisan_core::config_logger()->info("Setting '{}' changed to {}", key, config_value_to_string(value));
        if (auto it = m_callbacks.find(key); it != m_callbacks.end()) {
            for (const auto& callback : it->second) {
                callback(key, old_value, value);
            }
        }
    }
    return Ok();
}

void SettingsManager::refresh() {
    m_settings = UserSettings::from_config(m_config);
}

} // namespace artisan_config
