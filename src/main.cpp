/// @file main.cpp
/// @brief artisan command-line entry point
///
/// Subcommands mirror the crafting tool's panels:
/// - calc / avail: cost a recipe at a target rarity and check it against inventory
/// - market: price statistics, trend and advice for one item
/// - batch: plan several crafts together and print a shopping list
/// - inventory / price / craft: maintain holdings and price history
/// - import / status: load saved API pages and report database state
/// - settings: inspect and change persisted user settings

#include <artisan/catalog/api_import.hpp>
#include <artisan/catalog/data_manager.hpp>
#include <artisan/catalog/store.hpp>
#include <artisan/config/config.hpp>
#include <artisan/config/settings.hpp>
#include <artisan/core/log.hpp>
#include <artisan/crafting/crafting.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <filesystem>
#include <iostream>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using artisan_catalog::DataManager;
using artisan_config::ConfigManager;
using artisan_config::SettingsManager;
using artisan_core::Error;
using namespace artisan_crafting;

namespace {

constexpr const char* k_version = "0.3.0";
constexpr const char* k_default_config_file = "artisan.json";

// =============================================================================
// Usage
// =============================================================================

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [OPTIONS] COMMAND [ARGS]\n"
              << "\n"
              << "Commands:\n"
              << "  calc ITEM_ID                 Crafting cost breakdown\n"
              << "  avail ITEM_ID                Check inventory for a craft\n"
              << "  market ITEM_ID               Market statistics and advice\n"
              << "  batch ID:RARITY:QTY...       Plan several crafts and list missing materials\n"
              << "  search TERM                  Find items by name\n"
              << "  inventory set ID RARITY NODE QTY\n"
              << "  inventory list ID            Holdings of an item\n"
              << "  price record ID RARITY PRICE Record a market observation\n"
              << "  craft ID RARITY QTY NODE     Add crafted output to inventory\n"
              << "  import DIRECTORY             Import saved API item pages\n"
              << "  status                       Database statistics and sync age\n"
              << "  settings [list|get KEY|set KEY VALUE|reset]\n"
              << "\n"
              << "Options:\n"
              << "  --rarity NAME       Target rarity (common..legendary)\n"
              << "  --qty N             Number of crafts\n"
              << "  --tax PERCENT       Node tax on the crafting fee\n"
              << "  --quality N         Quality rating\n"
              << "  --overrides K=V,..  Custom unit prices keyed ITEMID_RANK\n"
              << "  --location NAME     Restrict inventory to one storage node\n"
              << "  --days N            Price history window\n"
              << "  --source NAME       Price source when recording (default market)\n"
              << "  --profession NAME   Restrict a search to one profession\n"
              << "  --config PATH       JSON configuration file (default artisan.json)\n"
              << "  --<setting>=VALUE   Override any setting, e.g. --data.database_path=x.db\n"
              << "  --help, -h          Show this help message\n"
              << "  --version, -v       Show version information\n"
              << "\n"
              << "Examples:\n"
              << "  " << program_name << " calc 1042 --rarity rare --qty 3 --tax 15\n"
              << "  " << program_name << " batch 1042:rare:2 2210:common:5 --location Lionhold\n";
}

void print_version() {
    std::cout << "artisan " << k_version << "\n";
}

int report(const Error& error) {
    std::cerr << "Error: " << artisan_core::build_error_chain(error) << "\n";
    return 1;
}

int usage_error(const std::string& message) {
    std::cerr << "Error: " << message << "\n\nRun with --help for usage.\n";
    return 2;
}

// =============================================================================
// Option Access
// =============================================================================

/// Command context shared by every subcommand
struct Context {
    ConfigManager& config;
    SettingsManager& settings;
    DataManager& data;
    std::vector<std::string> args;      ///< Positionals after the command word
};

std::optional<std::string> option(const ConfigManager& config, const std::string& key) {
    auto value = config.get_layer("cmdline") ? config.get_layer("cmdline")->get(key) : std::nullopt;
    if (!value) {
        return std::nullopt;
    }
    return artisan_config::config_value_to_string(*value);
}

std::optional<std::int64_t> parse_integer(const std::string& text) {
    std::int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::int32_t> parse_int32(const std::string& text) {
    auto value = parse_integer(text);
    if (!value || *value < std::numeric_limits<std::int32_t>::min() ||
        *value > std::numeric_limits<std::int32_t>::max()) {
        return std::nullopt;
    }
    return static_cast<std::int32_t>(*value);
}

std::optional<double> parse_number(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    try {
        std::size_t consumed = 0;
        double value = std::stod(text, &consumed);
        if (consumed == text.size()) {
            return value;
        }
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
    return std::nullopt;
}

std::optional<ItemId> parse_item_id(const std::string& text) {
    auto value = parse_integer(text);
    if (!value || *value <= 0) {
        return std::nullopt;
    }
    return static_cast<ItemId>(*value);
}

std::optional<Rarity> parse_rarity_strict(const std::string& text) {
    for (Rarity r : all_rarities()) {
        if (rarity_name(r) == text || rarity_display_name(r) == text) {
            return r;
        }
    }
    if (auto rank = parse_integer(text)) {
        return rarity_from_rank(*rank);
    }
    return std::nullopt;
}

std::optional<std::int32_t> int_option(const Context& ctx, const std::string& key, std::int32_t fallback,
                                       bool& ok) {
    auto text = option(ctx.config, key);
    if (!text) {
        return fallback;
    }
    auto value = parse_int32(*text);
    if (!value) {
        ok = false;
    }
    return value;
}

/// Parse "ID_RANK=PRICE,ID_RANK=PRICE"
std::optional<std::map<std::string, double>> parse_overrides(const std::string& text) {
    std::map<std::string, double> result;
    std::size_t start = 0;
    while (start <= text.size()) {
        auto end = text.find(',', start);
        if (end == std::string::npos) end = text.size();
        const std::string entry = text.substr(start, end - start);
        start = end + 1;
        if (entry.empty()) continue;

        auto eq = entry.find('=');
        if (eq == std::string::npos) {
            return std::nullopt;
        }
        auto price = parse_number(entry.substr(eq + 1));
        if (!price) {
            return std::nullopt;
        }
        result[entry.substr(0, eq)] = *price;
    }
    return result;
}

// =============================================================================
// Output
// =============================================================================

const char* source_label(const std::string& source) {
    if (source == "custom") return "custom";
    if (source == "no_data") return "no data";
    return source.c_str();
}

void print_breakdown(const CostBreakdown& b, const std::string& output_name) {
    fmt::print("{} ({}) x{}\n", output_name, rarity_display_name(b.target_rarity), b.quantity);
    fmt::print("{:<28} {:>10} {:>6} {:>10} {:>10}  {}\n", "Component", "Rarity", "Qty", "Unit", "Total", "Source");
    for (const auto& c : b.components) {
        fmt::print("{:<28} {:>10} {:>6} {:>10.2f} {:>10.2f}  {}{}\n",
                   c.name, rarity_display_name(c.required_rarity), c.quantity_needed,
                   c.unit_price, c.total_cost, source_label(c.price_source),
                   c.optional ? " (optional)" : "");
    }
    fmt::print("\n");
    fmt::print("Materials:     {:>12.2f}\n", b.material_cost);
    fmt::print("Crafting fees: {:>12.2f}\n", b.base_fee_total);
    fmt::print("Tax ({:>5.1f}%): {:>12.2f}\n", b.tax_rate * 100.0, b.tax_amount);
    fmt::print("Total:         {:>12.2f}\n", b.total_cost);
    fmt::print("Per unit:      {:>12.2f}\n", b.cost_per_unit);
    if (b.has_unpriced_components()) {
        fmt::print("\nWarning: {} component(s) have no price data and count as 0.\n", b.unpriced_count());
    }
}

std::string item_name(DataManager& data, ItemId id) {
    auto item = data.store().get_item(id);
    if (item && *item) {
        return (*item)->name;
    }
    return "Item " + std::to_string(id);
}

// =============================================================================
// Commands
// =============================================================================

bool read_common(const Context& ctx, CostRequest& request) {
    auto rarity_text = option(ctx.config, "rarity");
    if (rarity_text) {
        auto rarity = parse_rarity_strict(*rarity_text);
        if (!rarity) {
            usage_error("unknown rarity '" + *rarity_text + "'");
            return false;
        }
        request.target_rarity = *rarity;
    }

    bool ok = true;
    request.quantity = int_option(ctx, "qty", 1, ok).value_or(0);
    request.quality_rating = int_option(ctx, "quality", 0, ok).value_or(0);
    request.lookback_days = int_option(ctx, "days", ctx.settings.settings().price_lookback_days, ok).value_or(0);
    if (!ok) {
        usage_error("--qty, --quality and --days take whole numbers in 32-bit range");
        return false;
    }
    return true;
}

int cmd_calc(Context& ctx) {
    if (ctx.args.size() != 1) return usage_error("calc takes one ITEM_ID");
    auto id = parse_item_id(ctx.args[0]);
    if (!id) return usage_error("invalid item id '" + ctx.args[0] + "'");

    CostRequest request;
    request.output_item_id = *id;
    if (!read_common(ctx, request)) return 2;

    request.tax_rate = ctx.settings.settings().tax_rate();
    if (auto tax = option(ctx.config, "tax")) {
        auto percent = parse_number(*tax);
        if (!percent) return usage_error("--tax takes a percentage");
        request.tax_rate = *percent / 100.0;
    }
    if (auto text = option(ctx.config, "overrides")) {
        auto overrides = parse_overrides(*text);
        if (!overrides) return usage_error("--overrides expects ID_RANK=PRICE pairs");
        request.overrides = std::move(*overrides);
    }

    auto breakdown = ctx.data.calculate_crafting_cost(request);
    if (!breakdown) return report(breakdown.error());

    print_breakdown(*breakdown, item_name(ctx.data, *id));
    return 0;
}

int cmd_avail(Context& ctx) {
    if (ctx.args.size() != 1) return usage_error("avail takes one ITEM_ID");
    auto id = parse_item_id(ctx.args[0]);
    if (!id) return usage_error("invalid item id '" + ctx.args[0] + "'");

    CostRequest request;
    if (!read_common(ctx, request)) return 2;

    auto report_result = ctx.data.check_crafting_availability(*id, request.target_rarity, request.quantity,
                                                              option(ctx.config, "location"),
                                                              request.lookback_days);
    if (!report_result) return report(report_result.error());

    const auto& availability = *report_result;
    for (const auto& c : availability.available) {
        fmt::print("  ok       {:<32} {:>6}/{:<6}\n", format_with_rarity(c.name, c.rarity), c.available, c.needed);
    }
    for (const auto& c : availability.missing) {
        fmt::print("  missing  {:<32} {:>6}/{:<6} short {}\n",
                   format_with_rarity(c.name, c.rarity), c.available, c.needed, c.shortfall());
    }
    fmt::print("\n{}\n", availability.can_craft ? "All components available." : "Cannot craft: components missing.");
    return availability.can_craft ? 0 : 3;
}

int cmd_market(Context& ctx) {
    if (ctx.args.size() != 1) return usage_error("market takes one ITEM_ID");
    auto id = parse_item_id(ctx.args[0]);
    if (!id) return usage_error("invalid item id '" + ctx.args[0] + "'");

    std::optional<Rarity> rarity;
    if (auto text = option(ctx.config, "rarity")) {
        rarity = parse_rarity_strict(*text);
        if (!rarity) return usage_error("unknown rarity '" + *text + "'");
    }
    bool ok = true;
    auto days = int_option(ctx, "days", ctx.settings.settings().market_period_days, ok);
    if (!ok || !days) return usage_error("--days takes a whole number");

    auto analysis = ctx.data.market_analysis(*id, rarity, *days);
    if (!analysis) return report(analysis.error());

    fmt::print("{} over {} days\n", item_name(ctx.data, *id), *days);
    if (analysis->data_points == 0) {
        fmt::print("No price data recorded.\n");
        return 0;
    }
    fmt::print("Average: {:.2f}  Min: {:.2f}  Max: {:.2f}  Points: {}  Trend: {}\n",
               analysis->average, analysis->min_price, analysis->max_price,
               analysis->data_points, trend_name(analysis->trend));
    fmt::print("{}\n", recommendation(*analysis));
    if (ctx.settings.settings().show_price_alerts && is_significant_swing(*analysis)) {
        fmt::print("Alert: price swing of {:.1f}%\n", price_swing_percent(*analysis));
    }
    return 0;
}

int cmd_batch(Context& ctx) {
    if (ctx.args.empty()) return usage_error("batch takes at least one ID:RARITY:QTY entry");

    BatchPlan plan;
    for (const auto& spec : ctx.args) {
        auto first = spec.find(':');
        auto second = first == std::string::npos ? std::string::npos : spec.find(':', first + 1);
        if (second == std::string::npos) return usage_error("batch entries look like 1042:rare:3");

        auto id = parse_item_id(spec.substr(0, first));
        auto rarity = parse_rarity_strict(spec.substr(first + 1, second - first - 1));
        auto qty = parse_int32(spec.substr(second + 1));
        if (!id || !rarity || !qty) return usage_error("invalid batch entry '" + spec + "'");

        auto added = plan.add(BatchEntry{*id, item_name(ctx.data, *id), *rarity, *qty});
        if (!added) return report(added.error());
    }

    double tax_rate = ctx.settings.settings().tax_rate();
    if (auto tax = option(ctx.config, "tax")) {
        auto percent = parse_number(*tax);
        if (!percent) return usage_error("--tax takes a percentage");
        tax_rate = *percent / 100.0;
    }
    std::map<std::string, double> overrides;
    if (auto text = option(ctx.config, "overrides")) {
        auto parsed = parse_overrides(*text);
        if (!parsed) return usage_error("--overrides expects ID_RANK=PRICE pairs");
        overrides = std::move(*parsed);
    }

    auto result = ctx.data.plan_batch(plan, tax_rate, overrides, ctx.settings.settings().price_lookback_days,
                                      option(ctx.config, "location"));
    if (!result) return report(result.error());

    fmt::print("{} recipes, {} items, total cost {:.2f}\n\n", plan.total_recipes(), plan.total_items(),
               result->total_cost);
    fmt::print("{:<32} {:>8} {:>10} {:>8}\n", "Material", "Needed", "Available", "Missing");
    for (const auto& m : result->materials) {
        fmt::print("{:<32} {:>8} {:>10} {:>8}\n",
                   format_with_rarity(m.name, m.key.rarity), m.total_needed, m.available, m.missing);
    }

    auto list = shopping_list(*result);
    if (list.empty()) {
        fmt::print("\nAll materials available.\n");
        return 0;
    }
    fmt::print("\nShopping list:\n");
    for (const auto& line : list.lines) {
        fmt::print("  {:<32} x{:<6} @ {:>8.2f} = {:>10.2f}\n",
                   format_with_rarity(line.name, line.key.rarity), line.quantity, line.unit_price, line.cost);
    }
    fmt::print("  Total: {:.2f}\n", list.total_cost);
    return 0;
}

int cmd_search(Context& ctx) {
    if (ctx.args.size() != 1) return usage_error("search takes one TERM");
    auto items = ctx.data.store().search_items(ctx.args[0], option(ctx.config, "profession"));
    if (!items) return report(items.error());

    for (const auto& item : *items) {
        fmt::print("{:>8}  {:<32} {:<10} {}\n", item.id, item.name, rarity_display_name(item.rarity),
                   item.profession.value_or("-"));
    }
    return 0;
}

int cmd_inventory(Context& ctx) {
    if (ctx.args.empty()) return usage_error("inventory takes 'set' or 'list'");
    const std::string sub = ctx.args[0];

    if (sub == "set") {
        if (ctx.args.size() != 5) return usage_error("inventory set ID RARITY NODE QTY");
        auto id = parse_item_id(ctx.args[1]);
        auto rarity = parse_rarity_strict(ctx.args[2]);
        auto qty = parse_integer(ctx.args[4]);
        if (!id || !rarity || !qty) return usage_error("invalid inventory arguments");

        auto r = ctx.data.store().update_inventory(*id, *rarity, ctx.args[3], *qty);
        if (!r) return report(r.error());
        fmt::print("{} at {}: {}\n", format_with_rarity(item_name(ctx.data, *id), *rarity), ctx.args[3], *qty);
        return 0;
    }

    if (sub == "list") {
        if (ctx.args.size() != 2) return usage_error("inventory list ID");
        auto id = parse_item_id(ctx.args[1]);
        if (!id) return usage_error("invalid item id '" + ctx.args[1] + "'");

        auto records = ctx.data.store().inventory_for(*id);
        if (!records) return report(records.error());
        for (const auto& record : *records) {
            fmt::print("{:<24} {:<10} {:>8}\n", record.node_name, rarity_display_name(record.rarity),
                       record.quantity);
        }
        return 0;
    }

    return usage_error("unknown inventory command '" + sub + "'");
}

int cmd_price(Context& ctx) {
    if (ctx.args.size() != 4 || ctx.args[0] != "record") return usage_error("price record ID RARITY PRICE");
    auto id = parse_item_id(ctx.args[1]);
    auto rarity = parse_rarity_strict(ctx.args[2]);
    auto price = parse_number(ctx.args[3]);
    if (!id || !rarity || !price) return usage_error("invalid price arguments");

    MarketPrice observation;
    observation.price = *price;
    observation.rarity = *rarity;
    observation.source = option(ctx.config, "source").value_or("market");
    observation.node_name = option(ctx.config, "location");

    auto r = ctx.data.store().record_market_price(*id, observation);
    if (!r) return report(r.error());
    fmt::print("Recorded {:.2f} for {}\n", *price, format_with_rarity(item_name(ctx.data, *id), *rarity));
    return 0;
}

int cmd_craft(Context& ctx) {
    if (ctx.args.size() != 4) return usage_error("craft ID RARITY QTY NODE");
    auto id = parse_item_id(ctx.args[0]);
    auto rarity = parse_rarity_strict(ctx.args[1]);
    auto qty = parse_integer(ctx.args[2]);
    if (!id || !rarity || !qty) return usage_error("invalid craft arguments");

    auto r = ctx.data.mark_crafted(*id, *rarity, *qty, ctx.args[3]);
    if (!r) return report(r.error());
    return 0;
}

int cmd_import(Context& ctx) {
    if (ctx.args.size() != 1) return usage_error("import takes one DIRECTORY");

    auto summary = artisan_catalog::import_pages(ctx.args[0], ctx.data.store());
    if (!summary) return report(summary.error());

    fmt::print("Imported {} pages: {} items, {} recipes ({} skipped)\n",
               summary->pages, summary->items, summary->recipes, summary->skipped);
    return 0;
}

int cmd_status(Context& ctx) {
    auto status = ctx.data.data_status();
    if (!status) return report(status.error());

    const auto& s = status->stats;
    fmt::print("Items:         {}\n", s.items);
    fmt::print("Recipes:       {} ({} components)\n", s.recipes, s.recipe_components);
    fmt::print("Inventory:     {}\n", s.inventory);
    fmt::print("Market prices: {}\n", s.market_prices);
    fmt::print("Transactions:  {}\n", s.transactions);
    if (!status->last_sync) {
        fmt::print("Last sync:     never\n");
    } else {
        fmt::print("Last sync:     {:.1f} hours ago\n", status->sync_age_hours);
    }
    if (ctx.settings.settings().auto_sync_enabled &&
        status->needs_sync(ctx.settings.settings().sync_interval_hours)) {
        fmt::print("Data is stale; run 'import' with fresh pages.\n");
    }
    return 0;
}

int cmd_settings(Context& ctx) {
    const std::string sub = ctx.args.empty() ? "list" : ctx.args[0];

    if (sub == "list") {
        for (const auto& [key, value] : ctx.settings.export_settings()) {
            fmt::print("{} = {}\n", key, value);
        }
        return 0;
    }
    if (sub == "get") {
        if (ctx.args.size() != 2) return usage_error("settings get KEY");
        auto value = ctx.settings.get(ctx.args[1]);
        if (!value) return report(artisan_core::ConfigError::unknown_key(ctx.args[1]));
        fmt::print("{}\n", *value);
        return 0;
    }
    if (sub == "set") {
        if (ctx.args.size() != 3) return usage_error("settings set KEY VALUE");
        auto r = ctx.settings.set(ctx.args[1], ctx.args[2]);
        if (!r) return report(r.error());
        return 0;
    }
    if (sub == "reset") {
        auto r = ctx.settings.reset_to_defaults();
        if (!r) return report(r.error());
        return 0;
    }
    return usage_error("unknown settings command '" + sub + "'");
}

// =============================================================================
// Logging Setup
// =============================================================================

void setup_logging(const artisan_config::UserSettings& settings) {
    artisan_core::LogConfig log_config;
    log_config.file_enabled = settings.log_file_enabled;
    log_config.log_directory = settings.log_directory;
    log_config.level = artisan_core::parse_log_level(settings.log_level).value_or(spdlog::level::info);
    if (settings.debug_mode) {
        log_config.level = spdlog::level::debug;
    }
    artisan_core::configure_logging(log_config);
    artisan_core::config_logger()->debug("Log level {}",
                                         artisan_core::log_level_name(artisan_core::get_global_log_level()));
}

} // anonymous namespace

// =============================================================================
// Main
// =============================================================================

int main(int argc, char** argv) {
    artisan_core::init_logging();

    ConfigManager config;
    config.setup_defaults();

    auto positional = config.parse_args(argc, argv);
    if (!positional) {
        return report(positional.error());
    }

    if (config.get_bool("help")) {
        print_usage(argv[0]);
        return 0;
    }
    if (config.get_bool("version")) {
        print_version();
        return 0;
    }

    // Short flags arrive as positionals
    for (const auto& arg : *positional) {
        if (arg == "-h") {
            print_usage(argv[0]);
            return 0;
        }
        if (arg == "-v") {
            print_version();
            return 0;
        }
    }

    config.load_environment();

    const fs::path config_path = option(config, "config").value_or(k_default_config_file);
    std::error_code ec;
    if (fs::exists(config_path, ec)) {
        auto loaded = config.load_json(config_path);
        if (!loaded) {
            return report(loaded.error());
        }
    } else if (option(config, "config")) {
        return report(artisan_core::ConfigError::file_not_found(config_path.string()));
    }

    setup_logging(artisan_config::UserSettings::from_config(config));

    if (positional->empty()) {
        print_usage(argv[0]);
        return 2;
    }

    const std::string db_path = artisan_config::UserSettings::from_config(config).database_path;
    auto store = artisan_catalog::ArtisanStore::open(db_path);
    if (!store) {
        return report(store.error());
    }

    SettingsManager settings(config, &*store);
    if (auto loaded = settings.load(); !loaded) {
        return report(loaded.error());
    }
    settings.on_setting_changed(artisan_config::config_keys::LOG_LEVEL,
                                [](const std::string&, const auto&, const artisan_config::ConfigValue& value) {
        if (auto level = artisan_core::parse_log_level(artisan_config::config_value_to_string(value))) {
            artisan_core::set_global_log_level(*level);
        }
    });

    DataManager data(*store);

    const std::string command = positional->front();
    Context ctx{config, settings, data, {positional->begin() + 1, positional->end()}};

    int exit_code = 0;
    if (command == "calc") {
        exit_code = cmd_calc(ctx);
    } else if (command == "avail") {
        exit_code = cmd_avail(ctx);
    } else if (command == "market") {
        exit_code = cmd_market(ctx);
    } else if (command == "batch") {
        exit_code = cmd_batch(ctx);
    } else if (command == "search") {
        exit_code = cmd_search(ctx);
    } else if (command == "inventory") {
        exit_code = cmd_inventory(ctx);
    } else if (command == "price") {
        exit_code = cmd_price(ctx);
    } else if (command == "craft") {
        exit_code = cmd_craft(ctx);
    } else if (command == "import") {
        exit_code = cmd_import(ctx);
    } else if (command == "status") {
        exit_code = cmd_status(ctx);
    } else if (command == "settings") {
        exit_code = cmd_settings(ctx);
    } else {
        exit_code = usage_error("unknown command '" + command + "'");
    }

    artisan_core::shutdown_logging();
    return exit_code;
}
