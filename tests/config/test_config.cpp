// artisan_config layered configuration tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <artisan/config/config.hpp>

#include <filesystem>

using namespace artisan_config;
using artisan_core::ErrorCode;
using Catch::Approx;

// =============================================================================
// Value Helpers
// =============================================================================

TEST_CASE("ConfigValue parsing", "[config][value]") {
    SECTION("inferred types") {
        REQUIRE(std::get<bool>(parse_config_value("true")));
        REQUIRE(std::get<std::int64_t>(parse_config_value("42")) == 42);
        REQUIRE(std::get<double>(parse_config_value("0.15")) == Approx(0.15));
        REQUIRE(std::get<std::string>(parse_config_value("Scribe")) == "Scribe");
    }

    SECTION("typed parsing") {
        ConfigValue out;
        REQUIRE(parse_config_value_as("yes", ConfigValueType::Bool, out));
        REQUIRE(std::get<bool>(out));
        REQUIRE(parse_config_value_as("12", ConfigValueType::Float, out));
        REQUIRE(std::get<double>(out) == Approx(12.0));
        REQUIRE_FALSE(parse_config_value_as("twelve", ConfigValueType::Int, out));
        REQUIRE(parse_config_value_as("a,b", ConfigValueType::StringArray, out));
        REQUIRE(std::get<std::vector<std::string>>(out).size() == 2);
    }

    SECTION("rendering") {
        REQUIRE(config_value_to_string(ConfigValue{false}) == "false");
        REQUIRE(config_value_to_string(ConfigValue{std::int64_t(7)}) == "7");
        REQUIRE(config_value_to_string(ConfigValue{std::vector<std::string>{"a", "b"}}) == "a,b");
        REQUIRE(config_value_type(ConfigValue{2.5}) == ConfigValueType::Float);
    }
}

// =============================================================================
// ConfigLayer
// =============================================================================

TEST_CASE("ConfigLayer basic operations", "[config][layer]") {
    ConfigLayer layer("test");
    REQUIRE(layer.name() == "test");
    REQUIRE(layer.empty());

    layer.set("crafting.default_tax_rate", ConfigValue{12.5});
    REQUIRE(layer.contains("crafting.default_tax_rate"));
    REQUIRE(layer.is_modified());
    REQUIRE(layer.size() == 1);

    layer.clear_modified();
    REQUIRE(layer.remove("crafting.default_tax_rate"));
    REQUIRE_FALSE(layer.remove("crafting.default_tax_rate"));
    REQUIRE(layer.is_modified());
    REQUIRE(layer.empty());
}

// =============================================================================
// ConfigManager
// =============================================================================

TEST_CASE("ConfigManager layer priority", "[config][manager]") {
    ConfigManager config;
    config.setup_defaults();
    REQUIRE(config.layer_count() == 5);

    SECTION("defaults are filled from the schema") {
        REQUIRE(config.get_float(config_keys::CRAFTING_DEFAULT_TAX_RATE) == Approx(15.0));
        REQUIRE(config.get_int(config_keys::CRAFTING_PRICE_LOOKBACK_DAYS) == 7);
        REQUIRE(config.get_string(config_keys::DATA_DATABASE_PATH) == "artisan_toolbox.db");
        REQUIRE(config.source_of(config_keys::LOG_LEVEL) == "defaults");
    }

    SECTION("higher layers win") {
        config.set_int(config_keys::MARKET_PERIOD_DAYS, 14, "file");
        REQUIRE(config.get_int(config_keys::MARKET_PERIOD_DAYS) == 14);

        config.set_int(config_keys::MARKET_PERIOD_DAYS, 21, "user");
        REQUIRE(config.get_int(config_keys::MARKET_PERIOD_DAYS) == 21);

        config.set_int(config_keys::MARKET_PERIOD_DAYS, 60, "cmdline");
        REQUIRE(config.get_int(config_keys::MARKET_PERIOD_DAYS) == 60);
        REQUIRE(config.source_of(config_keys::MARKET_PERIOD_DAYS) == "cmdline");

        REQUIRE(config.remove_layer("cmdline"));
        REQUIRE(config.get_int(config_keys::MARKET_PERIOD_DAYS) == 21);
    }

    SECTION("typed getters convert") {
        config.set_int("x.count", 3);
        REQUIRE(config.get_float("x.count") == Approx(3.0));
        config.set_string("x.flag", "on");
        REQUIRE(config.get_bool("x.flag"));
        config.set_string("x.number", "12");
        REQUIRE(config.get_int("x.number") == 12);
        REQUIRE(config.get_int("x.missing", -1) == -1);
        REQUIRE(config.get_or<std::string>("x.flag", "") == "on");
    }

    SECTION("change callbacks") {
        std::string seen_key;
        config.on_change([&seen_key](const std::string& key, const ConfigValue&) { seen_key = key; });
        config.set_bool(config_keys::CACHE_ENABLED, false);
        REQUIRE(seen_key == config_keys::CACHE_ENABLED);
        REQUIRE_FALSE(config.get_bool(config_keys::CACHE_ENABLED, true));
    }
}

TEST_CASE("ConfigManager JSON loading", "[config][manager][json]") {
    ConfigManager config;
    config.setup_defaults();

    SECTION("nested objects flatten to dotted keys") {
        auto result = config.load_json_string(R"({
            "data": { "database_path": "/tmp/crafting.db", "sync_interval_hours": 12 },
            "crafting": { "default_tax_rate": 10.5 },
            "logging": { "level": "debug", "file_enabled": true }
        })");
        REQUIRE(result.is_ok());
        REQUIRE(config.get_string(config_keys::DATA_DATABASE_PATH) == "/tmp/crafting.db");
        REQUIRE(config.get_int(config_keys::DATA_SYNC_INTERVAL_HOURS) == 12);
        REQUIRE(config.get_float(config_keys::CRAFTING_DEFAULT_TAX_RATE) == Approx(10.5));
        REQUIRE(config.get_bool(config_keys::LOG_FILE_ENABLED));
        REQUIRE(config.source_of(config_keys::LOG_LEVEL) == "file");
    }

    SECTION("invalid JSON") {
        auto result = config.load_json_string("{ not json");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ParseError);
    }

    SECTION("top level must be an object") {
        REQUIRE(config.load_json_string("[1, 2]").is_err());
    }

    SECTION("arrays hold strings only") {
        auto result = config.load_json_string(R"({ "x": [1, 2] })");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::InvalidInput);
    }

    SECTION("missing file") {
        auto result = config.load_json("/nonexistent/artisan.json");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::NotFound);
    }
}

TEST_CASE("ConfigManager JSON save and reload", "[config][manager][json]") {
    const auto path = std::filesystem::temp_directory_path() / "artisan_config_roundtrip.json";

    {
        ConfigManager config;
        config.setup_defaults();
        config.set_string(config_keys::CRAFTING_DEFAULT_PROFESSION, "Blacksmith");
        config.set_int(config_keys::MARKET_PERIOD_DAYS, 45);
        REQUIRE(config.save_json(path).is_ok());
    }

    ConfigManager reloaded;
    reloaded.setup_defaults();
    REQUIRE(reloaded.load_json(path).is_ok());
    REQUIRE(reloaded.get_string(config_keys::CRAFTING_DEFAULT_PROFESSION) == "Blacksmith");
    REQUIRE(reloaded.get_int(config_keys::MARKET_PERIOD_DAYS) == 45);

    std::filesystem::remove(path);
}

TEST_CASE("ConfigManager command line", "[config][manager][args]") {
    ConfigManager config;
    config.setup_defaults();

    auto positional = config.parse_args(std::vector<std::string>{
        "calc", "--rarity=rare", "1042", "--quantity", "3", "--json"});
    REQUIRE(positional.is_ok());
    REQUIRE(positional->size() == 2);
    REQUIRE((*positional)[0] == "calc");
    REQUIRE((*positional)[1] == "1042");

    REQUIRE(config.get_string("rarity") == "rare");
    REQUIRE(config.get_int("quantity") == 3);
    REQUIRE(config.get_bool("json"));
    REQUIRE(config.source_of("quantity") == "cmdline");

    SECTION("empty option name") {
        auto bad = config.parse_args(std::vector<std::string>{"--=5"});
        REQUIRE(bad.is_err());
    }
}

// =============================================================================
// Schema
// =============================================================================

TEST_CASE("ConfigSchemaRegistry validation", "[config][schema]") {
    const auto registry = ConfigSchemaRegistry::artisan_defaults();

    SECTION("every key has a default") {
        for (const auto& key : registry.keys()) {
            const auto* schema = registry.get_schema(key);
            REQUIRE(schema != nullptr);
            REQUIRE(schema->default_value.has_value());
        }
    }

    SECTION("range checks") {
        REQUIRE(registry.validate(config_keys::CRAFTING_DEFAULT_TAX_RATE, ConfigValue{50.0}).is_ok());
        REQUIRE(registry.validate(config_keys::CRAFTING_DEFAULT_TAX_RATE, ConfigValue{std::int64_t(20)}).is_ok());
        REQUIRE(registry.validate(config_keys::CRAFTING_DEFAULT_TAX_RATE, ConfigValue{150.0}).is_err());
        REQUIRE(registry.validate(config_keys::CRAFTING_PRICE_LOOKBACK_DAYS, ConfigValue{std::int64_t(0)}).is_err());
    }

    SECTION("type mismatch") {
        auto result = registry.validate(config_keys::CACHE_ENABLED, ConfigValue{std::string("maybe")});
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::InvalidInput);
    }

    SECTION("allowed values are case-insensitive") {
        REQUIRE(registry.validate(config_keys::LOG_LEVEL, ConfigValue{std::string("DEBUG")}).is_ok());
        REQUIRE(registry.validate(config_keys::LOG_LEVEL, ConfigValue{std::string("loud")}).is_err());
    }

    SECTION("unknown key") {
        auto result = registry.validate("crafting.nope", ConfigValue{true});
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::NotFound);
    }

    SECTION("coerce text") {
        auto tax = registry.coerce(config_keys::CRAFTING_DEFAULT_TAX_RATE, "12");
        REQUIRE(tax.is_ok());
        REQUIRE(std::get<double>(*tax) == Approx(12.0));

        auto flag = registry.coerce(config_keys::MARKET_PRICE_ALERTS, "off");
        REQUIRE(flag.is_ok());
        REQUIRE_FALSE(std::get<bool>(*flag));

        REQUIRE(registry.coerce(config_keys::MARKET_PERIOD_DAYS, "soon").is_err());
        REQUIRE(registry.coerce(config_keys::MARKET_PERIOD_DAYS, "400").is_err());
    }

    SECTION("layer validation collects messages") {
        ConfigLayer layer("file", ConfigLayerPriority::File);
        layer.set(config_keys::MARKET_PERIOD_DAYS, ConfigValue{std::int64_t(30)});
        layer.set(config_keys::API_TIMEOUT_SECONDS, ConfigValue{std::int64_t(0)});
        layer.set("unknown.key", ConfigValue{true});
        REQUIRE(registry.validate(layer).size() == 2);
    }
}
