/// @file config.cpp
/// @brief Configuration system implementation for artisan_config

#include <artisan/config/config.hpp>
#include <artisan/core/log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

namespace artisan_config {

using artisan_core::ConfigError;
using artisan_core::Err;
using artisan_core::Error;
using artisan_core::Ok;
using artisan_core::Result;

// =============================================================================
// Value Helpers
// =============================================================================

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool parse_int(const std::string& text, std::int64_t& out) {
    if (text.empty()) return false;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    if (*first == '+') ++first;
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc{} && ptr == last;
}

bool parse_double(const std::string& text, double& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    out = std::strtod(text.c_str(), &end);
    return end == text.c_str() + text.size();
}

std::vector<std::string> split_list(const std::string& text) {
    std::vector<std::string> items;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

std::vector<std::string> split_key(const std::string& key) {
    std::vector<std::string> parts;
    std::stringstream ss(key);
    std::string part;
    while (std::getline(ss, part, '.')) {
        parts.push_back(part);
    }
    return parts;
}

/// Flatten a JSON object into dotted keys
Result<void> flatten_json(const nlohmann::json& node, const std::string& prefix,
                          std::vector<std::pair<std::string, ConfigValue>>& out) {
    for (auto it = node.begin(); it != node.end(); ++it) {
        const std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();
        const auto& value = it.value();

        if (value.is_object()) {
            auto nested = flatten_json(value, key, out);
            if (!nested) {
                return nested;
            }
        } else if (value.is_boolean()) {
            out.emplace_back(key, ConfigValue{value.get<bool>()});
        } else if (value.is_number_integer()) {
            out.emplace_back(key, ConfigValue{value.get<std::int64_t>()});
        } else if (value.is_number_float()) {
            out.emplace_back(key, ConfigValue{value.get<double>()});
        } else if (value.is_string()) {
            out.emplace_back(key, ConfigValue{value.get<std::string>()});
        } else if (value.is_array()) {
            std::vector<std::string> items;
            for (const auto& element : value) {
                if (!element.is_string()) {
                    return Err(ConfigError::invalid_value(key, "arrays may only hold strings"));
                }
                items.push_back(element.get<std::string>());
            }
            out.emplace_back(key, ConfigValue{std::move(items)});
        }
        // null values leave the key unset
    }
    return Ok();
}

nlohmann::json to_json(const ConfigValue& value) {
    return std::visit([](const auto& arg) -> nlohmann::json { return arg; }, value);
}

} // anonymous namespace

ConfigValueType config_value_type(const ConfigValue& value) {
    return static_cast<ConfigValueType>(value.index());
}

const char* config_value_type_name(ConfigValueType type) {
    switch (type) {
        case ConfigValueType::Bool: return "bool";
        case ConfigValueType::Int: return "int";
        case ConfigValueType::Float: return "float";
        case ConfigValueType::String: return "string";
        case ConfigValueType::StringArray: return "string array";
        default: return "unknown";
    }
}

std::string config_value_to_string(const ConfigValue& value) {
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << arg;
            return oss.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return arg;
        } else {
            std::string joined;
            for (std::size_t i = 0; i < arg.size(); ++i) {
                if (i > 0) joined += ",";
                joined += arg[i];
            }
            return joined;
        }
    }, value);
}

ConfigValue parse_config_value(const std::string& text) {
    if (text == "true" || text == "false") {
        return ConfigValue{text == "true"};
    }
    std::int64_t int_val = 0;
    if (parse_int(text, int_val)) {
        return ConfigValue{int_val};
    }
    double float_val = 0.0;
    if (parse_double(text, float_val)) {
        return ConfigValue{float_val};
    }
    return ConfigValue{text};
}

bool parse_config_value_as(const std::string& text, ConfigValueType type, ConfigValue& out) {
    switch (type) {
        case ConfigValueType::Bool: {
            const auto lower = to_lower(text);
            if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
                out = true;
                return true;
            }
            if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
                out = false;
                return true;
            }
            return false;
        }
        case ConfigValueType::Int: {
            std::int64_t v = 0;
            if (!parse_int(text, v)) return false;
            out = v;
            return true;
        }
        case ConfigValueType::Float: {
            double v = 0.0;
            if (!parse_double(text, v)) return false;
            out = v;
            return true;
        }
        case ConfigValueType::String:
            out = text;
            return true;
        case ConfigValueType::StringArray:
            out = split_list(text);
            return true;
        default:
            return false;
    }
}

// =============================================================================
// ConfigLayer
// =============================================================================

bool ConfigLayer::contains(const std::string& key) const {
    return m_values.find(key) != m_values.end();
}

std::optional<ConfigValue> ConfigLayer::get(const std::string& key) const {
    auto it = m_values.find(key);
    if (it != m_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

void ConfigLayer::set(const std::string& key, ConfigValue value) {
    m_values[key] = std::move(value);
    m_modified = true;
}

bool ConfigLayer::remove(const std::string& key) {
    bool removed = m_values.erase(key) > 0;
    if (removed) {
        m_modified = true;
    }
    return removed;
}

void ConfigLayer::clear() {
    m_values.clear();
    m_modified = true;
}

std::vector<std::string> ConfigLayer::keys() const {
    std::vector<std::string> result;
    result.reserve(m_values.size());
    for (const auto& [key, _] : m_values) {
        result.push_back(key);
    }
    return result;
}

// =============================================================================
// ConfigManager
// =============================================================================

void ConfigManager::add_layer(std::unique_ptr<ConfigLayer> layer) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_layers.push_back(std::move(layer));
}

ConfigLayer* ConfigManager::get_layer(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& layer : m_layers) {
        if (layer->name() == name) {
            return layer.get();
        }
    }
    return nullptr;
}

const ConfigLayer* ConfigManager::get_layer(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& layer : m_layers) {
        if (layer->name() == name) {
            return layer.get();
        }
    }
    return nullptr;
}

bool ConfigManager::remove_layer(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = std::remove_if(m_layers.begin(), m_layers.end(),
        [&name](const std::unique_ptr<ConfigLayer>& layer) {
            return layer->name() == name;
        });
    if (it != m_layers.end()) {
        m_layers.erase(it, m_layers.end());
        return true;
    }
    return false;
}

std::size_t ConfigManager::layer_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_layers.size();
}

bool ConfigManager::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& layer : m_layers) {
        if (layer->contains(key)) {
            return true;
        }
    }
    return false;
}

std::optional<ConfigValue> ConfigManager::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto* layer : sorted_layers()) {
        auto value = layer->get(key);
        if (value) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<std::string> ConfigManager::source_of(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto* layer : sorted_layers()) {
        if (layer->contains(key)) {
            return layer->name();
        }
    }
    return std::nullopt;
}

bool ConfigManager::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<bool>(&*value)) {
        return *v;
    }
    // Try to parse from string
    if (auto* v = std::get_if<std::string>(&*value)) {
        ConfigValue parsed;
        if (parse_config_value_as(*v, ConfigValueType::Bool, parsed)) {
            return std::get<bool>(parsed);
        }
        return default_value;
    }
    // Try from int
    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return *v != 0;
    }

    return default_value;
}

std::int64_t ConfigManager::get_int(const std::string& key, std::int64_t default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return *v;
    }
    // Try to parse from string
    if (auto* v = std::get_if<std::string>(&*value)) {
        std::int64_t parsed = 0;
        return parse_int(*v, parsed) ? parsed : default_value;
    }
    // Try from double
    if (auto* v = std::get_if<double>(&*value)) {
        return static_cast<std::int64_t>(*v);
    }
    // Try from bool
    if (auto* v = std::get_if<bool>(&*value)) {
        return *v ? 1 : 0;
    }

    return default_value;
}

double ConfigManager::get_float(const std::string& key, double default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<double>(&*value)) {
        return *v;
    }
    // Try from int
    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return static_cast<double>(*v);
    }
    // Try to parse from string
    if (auto* v = std::get_if<std::string>(&*value)) {
        double parsed = 0.0;
        return parse_double(*v, parsed) ? parsed : default_value;
    }

    return default_value;
}

std::string ConfigManager::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    if (!value) return default_value;
    return config_value_to_string(*value);
}

void ConfigManager::set(const std::string& key, ConfigValue value, const std::string& layer_name) {
    ConfigValue stored = value;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto* layer = ensure_layer_locked(layer_name, ConfigLayerPriority::User);
        layer->set(key, std::move(value));
    }
    notify_change(key, stored);
}

void ConfigManager::set_bool(const std::string& key, bool value, const std::string& layer_name) {
    set(key, ConfigValue{value}, layer_name);
}

void ConfigManager::set_int(const std::string& key, std::int64_t value, const std::string& layer_name) {
    set(key, ConfigValue{value}, layer_name);
}

void ConfigManager::set_float(const std::string& key, double value, const std::string& layer_name) {
    set(key, ConfigValue{value}, layer_name);
}

void ConfigManager::set_string(const std::string& key, const std::string& value, const std::string& layer_name) {
    set(key, ConfigValue{value}, layer_name);
}

// =============================================================================
// File Operations
// =============================================================================

Result<void> ConfigManager::load_json(const std::filesystem::path& path, const std::string& layer_name) {
    std::ifstream file(path);
    if (!file) {
        return Err(ConfigError::file_not_found(path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = load_json_string(buffer.str(), layer_name);
    if (!result) {
        Error err = std::move(result.error());
        err.with_context("path", path.string());
        return Err(std::move(err));
    }

    artisan_core::config_logger()->info("Loaded configuration from {}", path.string());
    return Ok();
}

Result<void> ConfigManager::load_json_string(const std::string& content, const std::string& layer_name) {
    auto document = nlohmann::json::parse(content, nullptr, false);
    if (document.is_discarded()) {
        return Err(ConfigError::parse_failed(layer_name, "invalid JSON"));
    }
    if (!document.is_object()) {
        return Err(ConfigError::parse_failed(layer_name, "top level must be an object"));
    }

    std::vector<std::pair<std::string, ConfigValue>> values;
    auto flattened = flatten_json(document, "", values);
    if (!flattened) {
        return flattened;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto priority = layer_name == "file" ? ConfigLayerPriority::File : ConfigLayerPriority::User;
        auto* layer = ensure_layer_locked(layer_name, priority);
        for (const auto& [key, value] : values) {
            layer->set(key, value);
        }
    }

    for (const auto& [key, value] : values) {
        notify_change(key, value);
    }

    artisan_core::config_logger()->debug("Layer '{}' received {} values", layer_name, values.size());
    return Ok();
}

Result<void> ConfigManager::save_json(const std::filesystem::path& path, const std::string& layer_name) const {
    nlohmann::json root = nlohmann::json::object();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const ConfigLayer* layer = nullptr;
        for (const auto& l : m_layers) {
            if (l->name() == layer_name) {
                layer = l.get();
                break;
            }
        }
        if (!layer) {
            return Err(Error(artisan_core::ErrorCode::NotFound, "Layer not found: " + layer_name));
        }

        for (const auto& key : layer->keys()) {
            auto value = layer->get(key);
            if (!value) continue;

            auto parts = split_key(key);
            nlohmann::json* node = &root;
            for (std::size_t i = 0; i + 1 < parts.size(); ++i) {
                node = &(*node)[parts[i]];
            }
            (*node)[parts.empty() ? key : parts.back()] = to_json(*value);
        }
    }

    std::ofstream file(path);
    if (!file) {
        return Err(ConfigError::write_failed(path.string()));
    }
    file << root.dump(4) << "\n";
    if (!file) {
        return Err(ConfigError::write_failed(path.string()));
    }

    return Ok();
}

// =============================================================================
// Command Line
// =============================================================================

Result<std::vector<std::string>> ConfigManager::parse_args(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse_args(args);
}

Result<std::vector<std::string>> ConfigManager::parse_args(const std::vector<std::string>& args) {
    std::vector<std::string> positional;
    std::vector<std::pair<std::string, ConfigValue>> values;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];

        if (!arg.starts_with("--")) {
            positional.push_back(arg);
            continue;
        }

        std::string key_value = arg.substr(2);
        auto eq_pos = key_value.find('=');

        std::string key;
        std::string value;

        if (eq_pos != std::string::npos) {
            // --key=value format
            key = key_value.substr(0, eq_pos);
            value = key_value.substr(eq_pos + 1);
        } else if (i + 1 < args.size() && !args[i + 1].starts_with("-")) {
            // --key value format
            key = key_value;
            value = args[++i];
        } else {
            // --flag format (boolean true)
            key = key_value;
            value = "true";
        }

        if (key.empty()) {
            return Err<std::vector<std::string>>(ConfigError::invalid_value(arg, "option name is empty"));
        }

        values.emplace_back(key, parse_config_value(value));
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto* layer = ensure_layer_locked("cmdline", ConfigLayerPriority::CommandLine);
        for (const auto& [key, value] : values) {
            layer->set(key, value);
        }
    }

    for (const auto& [key, value] : values) {
        notify_change(key, value);
    }

    return Ok(std::move(positional));
}

// =============================================================================
// Environment
// =============================================================================

void ConfigManager::load_environment(const std::string& prefix) {
    static const std::vector<std::pair<std::string, std::string>> env_mappings = {
        {"DB_PATH", config_keys::DATA_DATABASE_PATH},
        {"CACHE_DIR", config_keys::DATA_API_CACHE_DIR},
        {"SYNC_INTERVAL_HOURS", config_keys::DATA_SYNC_INTERVAL_HOURS},
        {"TAX_RATE", config_keys::CRAFTING_DEFAULT_TAX_RATE},
        {"LOOKBACK_DAYS", config_keys::CRAFTING_PRICE_LOOKBACK_DAYS},
        {"PROFESSION", config_keys::CRAFTING_DEFAULT_PROFESSION},
        {"MARKET_DAYS", config_keys::MARKET_PERIOD_DAYS},
        {"LOG_LEVEL", config_keys::LOG_LEVEL},
        {"LOG_DIR", config_keys::LOG_DIRECTORY},
        {"DEBUG", config_keys::DEBUG_MODE},
    };

    std::vector<std::pair<std::string, ConfigValue>> values;
    for (const auto& [suffix, config_key] : env_mappings) {
        const std::string env_name = prefix + suffix;
        const char* value = std::getenv(env_name.c_str());
        if (value) {
            values.emplace_back(config_key, parse_config_value(value));
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto* layer = ensure_layer_locked("environment", ConfigLayerPriority::Environment);
        for (const auto& [key, value] : values) {
            layer->set(key, value);
        }
    }

    for (const auto& [key, value] : values) {
        notify_change(key, value);
    }
}

// =============================================================================
// Events & Defaults
// =============================================================================

void ConfigManager::on_change(ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_change_callbacks.push_back(std::move(callback));
}

void ConfigManager::setup_defaults() {
    create_default_layers();

    const auto schemas = ConfigSchemaRegistry::artisan_defaults();

    std::lock_guard<std::mutex> lock(m_mutex);
    auto* defaults = ensure_layer_locked("defaults", ConfigLayerPriority::Default);
    for (const auto& key : schemas.keys()) {
        const auto* schema = schemas.get_schema(key);
        if (schema && schema->default_value) {
            defaults->set(key, *schema->default_value);
        }
    }
    defaults->clear_modified();
}

void ConfigManager::create_default_layers() {
    std::lock_guard<std::mutex> lock(m_mutex);
    ensure_layer_locked("defaults", ConfigLayerPriority::Default);
    ensure_layer_locked("file", ConfigLayerPriority::File);
    ensure_layer_locked("user", ConfigLayerPriority::User);
    ensure_layer_locked("environment", ConfigLayerPriority::Environment);
    ensure_layer_locked("cmdline", ConfigLayerPriority::CommandLine);
}

ConfigLayer* ConfigManager::ensure_layer_locked(const std::string& name, ConfigLayerPriority priority) {
    for (auto& layer : m_layers) {
        if (layer->name() == name) {
            return layer.get();
        }
    }
    m_layers.push_back(std::make_unique<ConfigLayer>(name, priority));
    return m_layers.back().get();
}

std::vector<ConfigLayer*> ConfigManager::sorted_layers() const {
    std::vector<ConfigLayer*> result;
    for (const auto& layer : m_layers) {
        result.push_back(layer.get());
    }

    // Sort by priority (lower value = higher priority)
    std::stable_sort(result.begin(), result.end(),
        [](const ConfigLayer* a, const ConfigLayer* b) {
            return static_cast<int>(a->priority()) < static_cast<int>(b->priority());
        });

    return result;
}

void ConfigManager::notify_change(const std::string& key, const ConfigValue& value) {
    std::vector<ChangeCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        callbacks = m_change_callbacks;
    }
    for (const auto& callback : callbacks) {
        callback(key, value);
    }
}

// =============================================================================
// ConfigSchema
// =============================================================================

Result<void> ConfigSchema::validate(const ConfigValue& value) const {
    const auto actual = config_value_type(value);
    const bool numeric_widening = type == ConfigValueType::Float && actual == ConfigValueType::Int;

    if (actual != type && !numeric_widening) {
        return Err(ConfigError::invalid_value(key,
            std::string("expected ") + config_value_type_name(type) +
            ", got " + config_value_type_name(actual)));
    }

    // Range checking for numeric types
    if (type == ConfigValueType::Int || type == ConfigValueType::Float) {
        double number = 0.0;
        if (auto* i = std::get_if<std::int64_t>(&value)) {
            number = static_cast<double>(*i);
        } else if (auto* d = std::get_if<double>(&value)) {
            number = *d;
        }
        if (min_value && number < *min_value) {
            return Err(ConfigError::invalid_value(key, "below minimum " + config_value_to_string(ConfigValue{*min_value})));
        }
        if (max_value && number > *max_value) {
            return Err(ConfigError::invalid_value(key, "above maximum " + config_value_to_string(ConfigValue{*max_value})));
        }
    }

    // Allowed values checking (strings compare case-insensitively)
    if (!allowed_values.empty()) {
        bool found = false;
        for (const auto& allowed : allowed_values) {
            auto* a = std::get_if<std::string>(&allowed);
            auto* v = std::get_if<std::string>(&value);
            if ((a && v && to_lower(*a) == to_lower(*v)) || value == allowed) {
                found = true;
                break;
            }
        }
        if (!found) {
            return Err(ConfigError::invalid_value(key, "value not in allowed list"));
        }
    }

    return Ok();
}

// =============================================================================
// ConfigSchemaRegistry
// =============================================================================

void ConfigSchemaRegistry::register_schema(ConfigSchema schema) {
    m_schemas[schema.key] = std::move(schema);
}

const ConfigSchema* ConfigSchemaRegistry::get_schema(const std::string& key) const {
    auto it = m_schemas.find(key);
    return it != m_schemas.end() ? &it->second : nullptr;
}

std::vector<std::string> ConfigSchemaRegistry::keys() const {
    std::vector<std::string> result;
    result.reserve(m_schemas.size());
    for (const auto& [key, _] : m_schemas) {
        result.push_back(key);
    }
    return result;
}

std::vector<std::string> ConfigSchemaRegistry::validate(const ConfigLayer& layer) const {
    std::vector<std::string> errors;
    for (const auto& key : layer.keys()) {
        auto value = layer.get(key);
        if (!value) continue;

        auto result = validate(key, *value);
        if (!result) {
            errors.push_back(result.error().message());
        }
    }
    return errors;
}

Result<void> ConfigSchemaRegistry::validate(const std::string& key, const ConfigValue& value) const {
    const ConfigSchema* schema = get_schema(key);
    if (!schema) {
        return Err(ConfigError::unknown_key(key));
    }
    return schema->validate(value);
}

Result<ConfigValue> ConfigSchemaRegistry::coerce(const std::string& key, const std::string& text) const {
    const ConfigSchema* schema = get_schema(key);
    if (!schema) {
        return Err<ConfigValue>(ConfigError::unknown_key(key));
    }

    ConfigValue value;
    if (!parse_config_value_as(text, schema->type, value)) {
        return Err<ConfigValue>(ConfigError::invalid_value(key,
            std::string("'") + text + "' is not a valid " + config_value_type_name(schema->type)));
    }

    auto valid = schema->validate(value);
    if (!valid) {
        return Err<ConfigValue>(std::move(valid.error()));
    }
    return Ok(std::move(value));
}

ConfigSchemaRegistry ConfigSchemaRegistry::artisan_defaults() {
    ConfigSchemaRegistry registry;

    auto add = [&registry](const char* key, ConfigValueType type, ConfigValue def,
                           std::optional<double> min_v, std::optional<double> max_v,
                           const char* description) {
        ConfigSchema schema;
        schema.key = key;
        schema.type = type;
        schema.default_value = std::move(def);
        schema.min_value = min_v;
        schema.max_value = max_v;
        schema.description = description;
        registry.register_schema(std::move(schema));
    };

    using T = ConfigValueType;
    using namespace config_keys;

    add(CRAFTING_DEFAULT_TAX_RATE, T::Float, ConfigValue{15.0}, 0.0, 100.0, "Default node tax, percent");
    add(CRAFTING_PRICE_LOOKBACK_DAYS, T::Int, ConfigValue{std::int64_t(7)}, 1.0, 365.0,
        "Market history window used for component prices");
    add(CRAFTING_DEFAULT_PROFESSION, T::String, ConfigValue{std::string("Scribe")}, std::nullopt, std::nullopt,
        "Profession preselected in listings");
    add(CRAFTING_USE_INVENTORY, T::Bool, ConfigValue{true}, std::nullopt, std::nullopt,
        "Check inventory after cost calculations");
    add(MARKET_PERIOD_DAYS, T::Int, ConfigValue{std::int64_t(30)}, 1.0, 365.0, "Market analysis window");
    add(MARKET_PRICE_ALERTS, T::Bool, ConfigValue{true}, std::nullopt, std::nullopt,
        "Report significant price swings");
    add(INVENTORY_LOW_STOCK_ALERTS, T::Bool, ConfigValue{true}, std::nullopt, std::nullopt,
        "Report components that run short");
    add(DATA_DATABASE_PATH, T::String, ConfigValue{std::string("artisan_toolbox.db")}, std::nullopt, std::nullopt,
        "SQLite database file");
    add(DATA_API_CACHE_DIR, T::String, ConfigValue{std::string("api_cache")}, std::nullopt, std::nullopt,
        "Directory of saved API item pages");
    add(DATA_AUTO_SYNC, T::Bool, ConfigValue{true}, std::nullopt, std::nullopt, "Suggest a sync when data is stale");
    add(DATA_SYNC_INTERVAL_HOURS, T::Int, ConfigValue{std::int64_t(24)}, 1.0, std::nullopt,
        "Hours before data counts as stale");
    add(API_TIMEOUT_SECONDS, T::Int, ConfigValue{std::int64_t(15)}, 1.0, 300.0, "API request timeout");
    add(API_RATE_LIMIT_SECONDS, T::Float, ConfigValue{1.5}, 0.0, 60.0, "Delay between API requests");
    add(CACHE_ENABLED, T::Bool, ConfigValue{true}, std::nullopt, std::nullopt, "Keep fetched pages on disk");
    add(CACHE_MAX_AGE_HOURS, T::Int, ConfigValue{std::int64_t(24)}, 1.0, std::nullopt, "Cached page lifetime");
    add(LOG_FILE_ENABLED, T::Bool, ConfigValue{false}, std::nullopt, std::nullopt, "Write rotating log files");
    add(LOG_DIRECTORY, T::String, ConfigValue{std::string("logs")}, std::nullopt, std::nullopt, "Log file directory");
    add(DEBUG_MODE, T::Bool, ConfigValue{false}, std::nullopt, std::nullopt, "Force debug log level");

    ConfigSchema level;
    level.key = LOG_LEVEL;
    level.type = T::String;
    level.default_value = ConfigValue{std::string("info")};
    level.allowed_values = {
        ConfigValue{std::string("trace")}, ConfigValue{std::string("debug")},
        ConfigValue{std::string("info")}, ConfigValue{std::string("warn")},
        ConfigValue{std::string("error")}, ConfigValue{std::string("critical")},
        ConfigValue{std::string("off")},
    };
    level.description = "Log level";
    registry.register_schema(std::move(level));

    return registry;
}

} // namespace artisan_config
