// artisan_config settings manager tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <artisan/config/settings.hpp>

using namespace artisan_config;
using artisan_core::ErrorCode;
using artisan_core::Ok;
using artisan_core::Result;
using Catch::Approx;

namespace {

/// In-memory settings store
class MemoryStore : public ISettingsStore {
public:
    Result<std::map<std::string, std::string>> load_settings() override {
        return Ok(values);
    }

    Result<void> save_setting(const std::string& key, const std::string& value) override {
        if (fail_writes) {
            return artisan_core::Err(artisan_core::StorageError::query_failed("INSERT INTO settings", "disk full"));
        }
        values[key] = value;
        ++writes;
        return Ok();
    }

    std::map<std::string, std::string> values;
    int writes = 0;
    bool fail_writes = false;
};

} // anonymous namespace

TEST_CASE("UserSettings defaults", "[config][settings]") {
    UserSettings settings;
    REQUIRE(settings.default_tax_rate == Approx(15.0));
    REQUIRE(settings.tax_rate() == Approx(0.15));
    REQUIRE(settings.price_lookback_days == 7);
    REQUIRE(settings.market_period_days == 30);
    REQUIRE(settings.database_path == "artisan_toolbox.db");

    ConfigManager config;
    config.setup_defaults();
    auto from_config = UserSettings::from_config(config);
    REQUIRE(from_config.default_profession == "Scribe");
    REQUIRE(from_config.sync_interval_hours == 24);
    REQUIRE(from_config.log_level == "info");
}

TEST_CASE("SettingsManager loads stored values", "[config][settings]") {
    ConfigManager config;
    MemoryStore store;
    store.values["crafting.default_tax_rate"] = "10";
    store.values["market.period_days"] = "14";
    store.values["market.show_price_alerts"] = "false";
    store.values["crafting.price_lookback_days"] = "not-a-number";
    store.values["retired.setting"] = "1";

    SettingsManager manager(config, &store);
    REQUIRE(manager.load().is_ok());

    REQUIRE(manager.settings().default_tax_rate == Approx(10.0));
    REQUIRE(manager.settings().tax_rate() == Approx(0.10));
    REQUIRE(manager.settings().market_period_days == 14);
    REQUIRE_FALSE(manager.settings().show_price_alerts);

    // Invalid and unknown entries are skipped
    REQUIRE(manager.settings().price_lookback_days == 7);
    REQUIRE_FALSE(manager.get("retired.setting").has_value());
    REQUIRE(store.writes == 0);
}

TEST_CASE("SettingsManager set", "[config][settings]") {
    ConfigManager config;
    MemoryStore store;
    SettingsManager manager(config, &store);

    SECTION("valid value is applied and persisted") {
        REQUIRE(manager.set("crafting.default_tax_rate", "20").is_ok());
        REQUIRE(manager.settings().tax_rate() == Approx(0.20));
        REQUIRE(store.values.at("crafting.default_tax_rate") == "20");
        REQUIRE(manager.get("crafting.default_tax_rate") == "20");
    }

    SECTION("out of range") {
        auto result = manager.set("crafting.default_tax_rate", "120");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::InvalidInput);
        REQUIRE(store.values.empty());
        REQUIRE(manager.settings().default_tax_rate == Approx(15.0));
    }

    SECTION("unknown key") {
        auto result = manager.set("crafting.magic", "1");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::NotFound);
    }

    SECTION("store failure leaves settings unchanged") {
        store.fail_writes = true;
        auto result = manager.set("market.period_days", "10");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::IOError);
        REQUIRE(manager.settings().market_period_days == 30);
    }

    SECTION("command line still overrides") {
        config.set_string(config_keys::DATA_DATABASE_PATH, "cli.db", "cmdline");
        REQUIRE(manager.set(config_keys::DATA_DATABASE_PATH, "stored.db").is_ok());
        REQUIRE(manager.settings().database_path == "cli.db");
        REQUIRE(store.values.at(config_keys::DATA_DATABASE_PATH) == "stored.db");
    }
}

TEST_CASE("SettingsManager change callbacks", "[config][settings]") {
    ConfigManager config;
    SettingsManager manager(config);

    int calls = 0;
    std::string last_value;
    manager.on_setting_changed(config_keys::LOG_LEVEL,
        [&](const std::string& key, const std::optional<ConfigValue>& old_value, const ConfigValue& new_value) {
            ++calls;
            REQUIRE(key == config_keys::LOG_LEVEL);
            REQUIRE(old_value.has_value());
            last_value = config_value_to_string(new_value);
        });

    REQUIRE(manager.set(config_keys::LOG_LEVEL, "debug").is_ok());
    REQUIRE(calls == 1);
    REQUIRE(last_value == "debug");

    SECTION("same value does not fire") {
        REQUIRE(manager.set(config_keys::LOG_LEVEL, "debug").is_ok());
        REQUIRE(calls == 1);
    }

    SECTION("other keys do not fire") {
        REQUIRE(manager.set(config_keys::CACHE_ENABLED, "false").is_ok());
        REQUIRE(calls == 1);
    }
}

TEST_CASE("SettingsManager reset, export and import", "[config][settings]") {
    ConfigManager config;
    MemoryStore store;
    SettingsManager manager(config, &store);

    REQUIRE(manager.set("market.period_days", "90").is_ok());
    REQUIRE(manager.set("crafting.default_profession", "Tailor").is_ok());

    SECTION("reset writes every default") {
        REQUIRE(manager.reset_to_defaults().is_ok());
        REQUIRE(manager.settings().market_period_days == 30);
        REQUIRE(manager.settings().default_profession == "Scribe");
        REQUIRE(store.values.size() == manager.keys().size());
        REQUIRE(store.values.at("market.period_days") == "30");
    }

    SECTION("export covers every key") {
        auto exported = manager.export_settings();
        REQUIRE(exported.size() == manager.keys().size());
        REQUIRE(exported.at("market.period_days") == "90");
        REQUIRE(exported.at("crafting.default_profession") == "Tailor");
    }

    SECTION("import applies values into another manager") {
        auto exported = manager.export_settings();

        ConfigManager other_config;
        SettingsManager other(other_config);
        REQUIRE(other.import_settings(exported).is_ok());
        REQUIRE(other.settings().market_period_days == 90);
        REQUIRE(other.settings().default_profession == "Tailor");
    }

    SECTION("import stops at the first invalid value") {
        auto result = manager.import_settings({{"api.timeout_seconds", "0"}});
        REQUIRE(result.is_err());
        REQUIRE(manager.settings().api_timeout_seconds == 15);
    }
}
