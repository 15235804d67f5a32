/// @file store.cpp
/// @brief ArtisanStore implementation

#include <artisan/catalog/store.hpp>
#include <artisan/core/log.hpp>
#include <artisan/crafting/rarity.hpp>

#include <algorithm>

namespace artisan_catalog {

using artisan_core::Err;
using artisan_core::Ok;
using artisan_core::Result;
using artisan_core::StorageError;
using artisan_crafting::Item;
using artisan_crafting::MarketPrice;
using artisan_crafting::Recipe;
using artisan_crafting::RecipeComponent;

namespace {

// =============================================================================
// Schema
// =============================================================================

constexpr const char* k_schema = R"SQL(
CREATE TABLE IF NOT EXISTS schema_info (
    version INTEGER PRIMARY KEY,
    applied_at INTEGER NOT NULL DEFAULT (CAST(strftime('%s', 'now') AS INTEGER)),
    description TEXT
);

CREATE TABLE IF NOT EXISTS items (
    id INTEGER PRIMARY KEY,
    name TEXT NOT NULL,
    type TEXT,
    rarity TEXT NOT NULL DEFAULT 'common',
    level INTEGER NOT NULL DEFAULT 1,
    profession TEXT,
    description TEXT,
    icon_url TEXT,
    api_data TEXT,
    created_at INTEGER NOT NULL DEFAULT (CAST(strftime('%s', 'now') AS INTEGER)),
    updated_at INTEGER NOT NULL DEFAULT (CAST(strftime('%s', 'now') AS INTEGER))
);

CREATE TABLE IF NOT EXISTS recipes (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    output_item_id INTEGER NOT NULL REFERENCES items(id),
    profession TEXT NOT NULL,
    level_required INTEGER NOT NULL DEFAULT 1,
    base_crafting_fee REAL NOT NULL DEFAULT 0,
    station_type TEXT,
    crafting_time INTEGER,
    created_at INTEGER NOT NULL DEFAULT (CAST(strftime('%s', 'now') AS INTEGER)),
    UNIQUE(output_item_id, profession)
);

CREATE TABLE IF NOT EXISTS recipe_components (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    recipe_id INTEGER NOT NULL REFERENCES recipes(id) ON DELETE CASCADE,
    item_id INTEGER NOT NULL REFERENCES items(id),
    quantity INTEGER NOT NULL DEFAULT 1,
    component_type TEXT NOT NULL DEFAULT 'quality',
    is_optional INTEGER NOT NULL DEFAULT 0,
    UNIQUE(recipe_id, item_id)
);

CREATE TABLE IF NOT EXISTS inventory (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    item_id INTEGER NOT NULL REFERENCES items(id),
    rarity TEXT NOT NULL DEFAULT 'common',
    node_name TEXT NOT NULL,
    quantity INTEGER NOT NULL DEFAULT 0,
    average_cost REAL,
    last_updated INTEGER NOT NULL DEFAULT (CAST(strftime('%s', 'now') AS INTEGER)),
    notes TEXT,
    UNIQUE(item_id, rarity, node_name)
);

CREATE TABLE IF NOT EXISTS market_prices (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    item_id INTEGER NOT NULL REFERENCES items(id),
    rarity TEXT NOT NULL DEFAULT 'common',
    price REAL NOT NULL,
    source TEXT NOT NULL DEFAULT 'market',
    node_name TEXT,
    recorded_at INTEGER NOT NULL,
    notes TEXT
);

CREATE TABLE IF NOT EXISTS transactions (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    type TEXT NOT NULL CHECK (type IN ('buy', 'sell', 'craft', 'use')),
    item_id INTEGER NOT NULL REFERENCES items(id),
    rarity TEXT NOT NULL DEFAULT 'common',
    quantity INTEGER NOT NULL,
    unit_price REAL,
    total_cost REAL,
    node_name TEXT,
    transaction_date INTEGER NOT NULL,
    notes TEXT
);

CREATE TABLE IF NOT EXISTS settings (
    key TEXT PRIMARY KEY,
    value TEXT,
    updated_at INTEGER NOT NULL DEFAULT (CAST(strftime('%s', 'now') AS INTEGER))
);

CREATE INDEX IF NOT EXISTS idx_items_profession ON items(profession);
CREATE INDEX IF NOT EXISTS idx_items_name ON items(name);
CREATE INDEX IF NOT EXISTS idx_recipes_output ON recipes(output_item_id);
CREATE INDEX IF NOT EXISTS idx_components_recipe ON recipe_components(recipe_id);
CREATE INDEX IF NOT EXISTS idx_inventory_item ON inventory(item_id, rarity);
CREATE INDEX IF NOT EXISTS idx_market_item_date ON market_prices(item_id, rarity, recorded_at);
CREATE INDEX IF NOT EXISTS idx_transactions_item ON transactions(item_id, transaction_date);
)SQL";

constexpr const char* k_item_columns =
    "id, name, type, rarity, level, profession, description, icon_url";

// =============================================================================
// Conversions
// =============================================================================

std::int64_t to_unix(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_unix(std::int64_t seconds) {
    return std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
}

DbValue id_param(ItemId id) {
    return static_cast<std::int64_t>(id);
}

DbValue rarity_param(Rarity rarity) {
    return std::string(artisan_crafting::rarity_name(rarity));
}

Item item_from_row(const DbRow& row) {
    Item item;
    item.id = static_cast<ItemId>(row_int(row, "id"));
    item.name = row_string(row, "name");
    item.type = row_string(row, "type");
    item.rarity = artisan_crafting::parse_rarity(row_string(row, "rarity", "common"));
    item.level = static_cast<std::int32_t>(row_int(row, "level", 1));
    item.profession = row_optional_string(row, "profession");
    item.description = row_string(row, "description");
    item.icon_url = row_string(row, "icon_url");
    return item;
}

InventoryRecord inventory_from_row(const DbRow& row) {
    InventoryRecord record;
    record.item_id = static_cast<ItemId>(row_int(row, "item_id"));
    record.rarity = artisan_crafting::parse_rarity(row_string(row, "rarity", "common"));
    record.node_name = row_string(row, "node_name");
    record.quantity = row_int(row, "quantity");
    if (auto it = row.find("average_cost"); it != row.end() && !std::holds_alternative<DbNull>(it->second)) {
        record.average_cost = row_double(row, "average_cost");
    }
    record.last_updated = from_unix(row_int(row, "last_updated"));
    record.notes = row_string(row, "notes");
    return record;
}

std::optional<TransactionType> parse_transaction_type(const std::string& text) {
    if (text == "buy") return TransactionType::Buy;
    if (text == "sell") return TransactionType::Sell;
    if (text == "craft") return TransactionType::Craft;
    if (text == "use") return TransactionType::Use;
    return std::nullopt;
}

template<typename T>
Result<std::vector<T>> map_rows(Result<QueryResult> rows, T (*convert)(const DbRow&)) {
    if (!rows) {
        return Err<std::vector<T>>(std::move(rows.error()));
    }
    std::vector<T> result;
    result.reserve(rows->size());
    for (const auto& row : *rows) {
        result.push_back(convert(row));
    }
    return Ok(std::move(result));
}

} // anonymous namespace

const char* transaction_type_name(TransactionType type) {
    switch (type) {
        case TransactionType::Buy: return "buy";
        case TransactionType::Sell: return "sell";
        case TransactionType::Craft: return "craft";
        case TransactionType::Use: return "use";
    }
    return "buy";
}

// =============================================================================
// Lifecycle
// =============================================================================

Result<ArtisanStore> ArtisanStore::open(const std::string& path) {
    auto db = Database::open(path);
    if (!db) {
        return Err<ArtisanStore>(std::move(db.error()));
    }

    ArtisanStore store(std::move(*db));
    auto migrated = store.migrate();
    if (!migrated) {
        return Err<ArtisanStore>(std::move(migrated.error()));
    }
    return Result<ArtisanStore>(std::move(store));
}

Result<void> ArtisanStore::migrate() {
    auto logger = artisan_core::catalog_logger();

    auto tx = m_db.begin();
    if (!tx) {
        return Err(std::move(tx.error()));
    }

    if (auto r = m_db.execute_script(k_schema); !r) {
        return Err(StorageError::migration_failed(k_schema_version, r.error().message()));
    }

    auto current = m_db.query_int("SELECT COALESCE(MAX(version), 0) FROM schema_info");
    if (!current) {
        return Err(std::move(current.error()));
    }

    if (*current > k_schema_version) {
        return Err(StorageError::migration_failed(
            static_cast<int>(*current),
            "database was written by a newer version (schema " + std::to_string(*current) + ")"));
    }

    if (*current < k_schema_version) {
        auto recorded = m_db.execute(
            "INSERT INTO schema_info (version, description) VALUES (?, ?)",
            {std::int64_t{k_schema_version}, std::string("Rarity-aware inventory and market prices")});
        if (!recorded) {
            return Err(StorageError::migration_failed(k_schema_version, recorded.error().message()));
        }
        logger->info("Database schema migrated from version {} to {}", *current, k_schema_version);
    }

    return tx->commit();
}

Result<int> ArtisanStore::schema_version() {
    auto version = m_db.query_int("SELECT COALESCE(MAX(version), 0) FROM schema_info");
    if (!version) {
        return Err<int>(std::move(version.error()));
    }
    return Ok(static_cast<int>(*version));
}

// =============================================================================
// Items
// =============================================================================

Result<void> ArtisanStore::write_item(const Item& item, const std::string& api_data) {
    auto r = m_db.execute(
        "INSERT INTO items (id, name, type, rarity, level, profession, description, icon_url, api_data) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(id) DO UPDATE SET "
        "name = excluded.name, type = excluded.type, rarity = excluded.rarity, "
        "level = excluded.level, profession = excluded.profession, "
        "description = excluded.description, icon_url = excluded.icon_url, "
        "api_data = COALESCE(excluded.api_data, items.api_data), "
        "updated_at = CAST(strftime('%s', 'now') AS INTEGER)",
        {id_param(item.id), item.name, item.type, rarity_param(item.rarity),
         std::int64_t{item.level}, optional_text(item.profession), item.description, item.icon_url,
         api_data.empty() ? DbValue{DbNull{}} : DbValue{api_data}});
    if (!r) {
        return Err(std::move(r.error().with_context("item_id", std::to_string(item.id))));
    }
    return Ok();
}

Result<void> ArtisanStore::upsert_item(const Item& item, const std::string& api_data) {
    return write_item(item, api_data);
}

Result<std::size_t> ArtisanStore::bulk_upsert_items(const std::vector<Item>& items) {
    auto tx = m_db.begin();
    if (!tx) {
        return Err<std::size_t>(std::move(tx.error()));
    }

    for (const auto& item : items) {
        auto r = write_item(item, {});
        if (!r) {
            return Err<std::size_t>(std::move(r.error()));
        }
    }

    if (auto r = tx->commit(); !r) {
        return Err<std::size_t>(std::move(r.error()));
    }
    artisan_core::catalog_logger()->debug("Upserted {} items", items.size());
    return Ok(items.size());
}

Result<std::optional<Item>> ArtisanStore::get_item(ItemId item_id) {
    auto rows = m_db.query(std::string("SELECT ") + k_item_columns + " FROM items WHERE id = ?",
                           {id_param(item_id)});
    if (!rows) {
        return Err<std::optional<Item>>(std::move(rows.error()));
    }
    if (rows->empty()) {
        return Ok(std::optional<Item>{});
    }
    return Ok(std::optional<Item>(item_from_row(rows->front())));
}

Result<std::vector<Item>> ArtisanStore::search_items(const std::string& term,
                                                     const std::optional<std::string>& profession) {
    std::string sql = std::string("SELECT ") + k_item_columns + " FROM items WHERE name LIKE ?";
    std::vector<DbValue> params{"%" + term + "%"};
    if (profession) {
        sql += " AND profession = ?";
        params.emplace_back(*profession);
    }
    sql += " ORDER BY name";
    return map_rows<Item>(m_db.query(sql, params), &item_from_row);
}

Result<std::vector<Item>> ArtisanStore::items_by_profession(const std::string& profession) {
    return map_rows<Item>(
        m_db.query(std::string("SELECT ") + k_item_columns + " FROM items WHERE profession = ? ORDER BY name",
                   {profession}),
        &item_from_row);
}

// =============================================================================
// Recipes
// =============================================================================

Result<std::int64_t> ArtisanStore::upsert_recipe(const Recipe& recipe) {
    auto tx = m_db.begin();
    if (!tx) {
        return Err<std::int64_t>(std::move(tx.error()));
    }

    auto written = m_db.execute(
        "INSERT INTO recipes (output_item_id, profession, level_required, base_crafting_fee) "
        "VALUES (?, ?, ?, ?) "
        "ON CONFLICT(output_item_id, profession) DO UPDATE SET "
        "level_required = excluded.level_required, base_crafting_fee = excluded.base_crafting_fee",
        {id_param(recipe.output_item_id), recipe.profession,
         std::int64_t{recipe.level_required}, recipe.base_crafting_fee});
    if (!written) {
        return Err<std::int64_t>(std::move(
            written.error().with_context("output_item_id", std::to_string(recipe.output_item_id))));
    }

    auto recipe_id = m_db.query_int(
        "SELECT id FROM recipes WHERE output_item_id = ? AND profession = ?",
        {id_param(recipe.output_item_id), recipe.profession});
    if (!recipe_id) {
        return Err<std::int64_t>(std::move(recipe_id.error()));
    }

    if (auto r = m_db.execute("DELETE FROM recipe_components WHERE recipe_id = ?", {*recipe_id}); !r) {
        return Err<std::int64_t>(std::move(r.error()));
    }

    for (const auto& component : recipe.components) {
        auto r = m_db.execute(
            "INSERT INTO recipe_components (recipe_id, item_id, quantity, component_type, is_optional) "
            "VALUES (?, ?, ?, ?, ?)",
            {*recipe_id, id_param(component.item_id), std::int64_t{component.quantity},
             std::string(artisan_crafting::component_type_name(component.type)),
             std::int64_t{component.optional ? 1 : 0}});
        if (!r) {
            return Err<std::int64_t>(std::move(
                r.error().with_context("component_item_id", std::to_string(component.item_id))));
        }
    }

    if (auto r = tx->commit(); !r) {
        return Err<std::int64_t>(std::move(r.error()));
    }
    return Ok(*recipe_id);
}

Result<std::optional<Recipe>> ArtisanStore::recipe_for_output(ItemId output_item_id) {
    auto rows = m_db.query(
        "SELECT id, output_item_id, profession, level_required, base_crafting_fee "
        "FROM recipes WHERE output_item_id = ? ORDER BY id LIMIT 1",
        {id_param(output_item_id)});
    if (!rows) {
        return Err<std::optional<Recipe>>(std::move(rows.error()));
    }
    if (rows->empty()) {
        return Ok(std::optional<Recipe>{});
    }

    const auto& row = rows->front();
    Recipe recipe;
    recipe.id = row_int(row, "id");
    recipe.output_item_id = static_cast<ItemId>(row_int(row, "output_item_id"));
    recipe.profession = row_string(row, "profession");
    recipe.level_required = static_cast<std::int32_t>(row_int(row, "level_required", 1));
    recipe.base_crafting_fee = row_double(row, "base_crafting_fee");

    auto components = m_db.query(
        "SELECT item_id, quantity, component_type, is_optional "
        "FROM recipe_components WHERE recipe_id = ? ORDER BY id",
        {recipe.id});
    if (!components) {
        return Err<std::optional<Recipe>>(std::move(components.error()));
    }

    for (const auto& c : *components) {
        RecipeComponent component;
        component.item_id = static_cast<ItemId>(row_int(c, "item_id"));
        component.quantity = static_cast<std::int32_t>(row_int(c, "quantity", 1));
        component.type = artisan_crafting::parse_component_type(row_string(c, "component_type", "quality"));
        component.optional = row_int(c, "is_optional") != 0;
        recipe.components.push_back(component);
    }

    return Ok(std::optional<Recipe>(std::move(recipe)));
}

// =============================================================================
// Inventory
// =============================================================================

Result<void> ArtisanStore::update_inventory(ItemId item_id,
                                            Rarity rarity,
                                            const std::string& node_name,
                                            std::int64_t quantity,
                                            std::optional<double> average_cost,
                                            const std::string& notes) {
    if (quantity < 0) {
        return Err(artisan_core::Error(artisan_core::ErrorCode::InvalidInput,
                                       "Inventory quantity must not be negative, got " + std::to_string(quantity)));
    }

    auto r = m_db.execute(
        "INSERT INTO inventory (item_id, rarity, node_name, quantity, average_cost, last_updated, notes) "
        "VALUES (?, ?, ?, ?, ?, CAST(strftime('%s', 'now') AS INTEGER), ?) "
        "ON CONFLICT(item_id, rarity, node_name) DO UPDATE SET "
        "quantity = excluded.quantity, "
        "average_cost = COALESCE(excluded.average_cost, inventory.average_cost), "
        "last_updated = excluded.last_updated, notes = excluded.notes",
        {id_param(item_id), rarity_param(rarity), node_name, quantity,
         average_cost ? DbValue{*average_cost} : DbValue{DbNull{}}, notes});
    if (!r) {
        return Err(std::move(r.error().with_context("item_id", std::to_string(item_id))));
    }

    artisan_core::catalog_logger()->debug("Inventory {}@{} at '{}' set to {}",
                                          item_id, artisan_crafting::rarity_name(rarity), node_name, quantity);
    return Ok();
}

Result<std::vector<InventoryRecord>> ArtisanStore::inventory_for(ItemId item_id, std::optional<Rarity> rarity) {
    std::string sql = "SELECT * FROM inventory WHERE item_id = ? AND quantity > 0";
    std::vector<DbValue> params{id_param(item_id)};
    if (rarity) {
        sql += " AND rarity = ?";
        params.push_back(rarity_param(*rarity));
    }
    sql += " ORDER BY node_name";
    return map_rows<InventoryRecord>(m_db.query(sql, params), &inventory_from_row);
}

Result<std::vector<InventoryRecord>> ArtisanStore::inventory_by_rarity(Rarity rarity) {
    return map_rows<InventoryRecord>(
        m_db.query("SELECT * FROM inventory WHERE rarity = ? AND quantity > 0 ORDER BY item_id, node_name",
                   {rarity_param(rarity)}),
        &inventory_from_row);
}

Result<std::vector<Rarity>> ArtisanStore::available_rarities(ItemId item_id) {
    auto rows = m_db.query("SELECT DISTINCT rarity FROM inventory WHERE item_id = ? AND quantity > 0",
                           {id_param(item_id)});
    if (!rows) {
        return Err<std::vector<Rarity>>(std::move(rows.error()));
    }

    std::vector<Rarity> result;
    for (const auto& row : *rows) {
        result.push_back(artisan_crafting::parse_rarity(row_string(row, "rarity", "common")));
    }
    std::sort(result.begin(), result.end(), [](Rarity a, Rarity b) {
        return artisan_crafting::rarity_rank(a) < artisan_crafting::rarity_rank(b);
    });
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return Ok(std::move(result));
}

// =============================================================================
// Market
// =============================================================================

Result<void> ArtisanStore::record_market_price(ItemId item_id, const MarketPrice& price, const std::string& notes) {
    if (price.price < 0.0) {
        return Err(artisan_core::Error(artisan_core::ErrorCode::InvalidInput,
                                       "Market price must not be negative"));
    }

    const auto recorded_at = price.recorded_at == std::chrono::system_clock::time_point{}
        ? std::chrono::system_clock::now()
        : price.recorded_at;

    auto r = m_db.execute(
        "INSERT INTO market_prices (item_id, rarity, price, source, node_name, recorded_at, notes) "
        "VALUES (?, ?, ?, ?, ?, ?, ?)",
        {id_param(item_id), rarity_param(price.rarity), price.price,
         price.source.empty() ? std::string("market") : price.source,
         optional_text(price.node_name), to_unix(recorded_at),
         notes.empty() ? DbValue{DbNull{}} : DbValue{notes}});
    if (!r) {
        return Err(std::move(r.error().with_context("item_id", std::to_string(item_id))));
    }
    return Ok();
}

Result<std::vector<MarketPrice>> ArtisanStore::recent_market_prices(ItemId item_id,
                                                                    std::optional<Rarity> rarity,
                                                                    std::int32_t days,
                                                                    std::chrono::system_clock::time_point now) {
    if (days <= 0) {
        return Ok(std::vector<MarketPrice>{});
    }

    const auto cutoff = now - std::chrono::hours(24) * days;
    std::string sql = "SELECT rarity, price, source, node_name, recorded_at FROM market_prices "
                      "WHERE item_id = ? AND recorded_at >= ?";
    std::vector<DbValue> params{id_param(item_id), to_unix(cutoff)};
    if (rarity) {
        sql += " AND rarity = ?";
        params.push_back(rarity_param(*rarity));
    }
    sql += " ORDER BY recorded_at DESC, id DESC";

    auto rows = m_db.query(sql, params);
    if (!rows) {
        return Err<std::vector<MarketPrice>>(std::move(rows.error()));
    }

    std::vector<MarketPrice> result;
    result.reserve(rows->size());
    for (const auto& row : *rows) {
        MarketPrice price;
        price.price = row_double(row, "price");
        price.source = row_string(row, "source", "market");
        price.rarity = artisan_crafting::parse_rarity(row_string(row, "rarity", "common"));
        price.node_name = row_optional_string(row, "node_name");
        price.recorded_at = from_unix(row_int(row, "recorded_at"));
        result.push_back(std::move(price));
    }
    return Ok(std::move(result));
}

// =============================================================================
// Transactions & Settings
// =============================================================================

Result<void> ArtisanStore::record_transaction(const TransactionRecord& record) {
    const auto date = record.date.value_or(std::chrono::system_clock::now());
    DbValue total = DbNull{};
    if (record.unit_price) {
        total = *record.unit_price * static_cast<double>(record.quantity);
    }

    auto r = m_db.execute(
        "INSERT INTO transactions (type, item_id, rarity, quantity, unit_price, total_cost, "
        "node_name, transaction_date, notes) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)",
        {std::string(transaction_type_name(record.type)), id_param(record.item_id), rarity_param(record.rarity),
         record.quantity, record.unit_price ? DbValue{*record.unit_price} : DbValue{DbNull{}}, total,
         optional_text(record.node_name), to_unix(date),
         record.notes.empty() ? DbValue{DbNull{}} : DbValue{record.notes}});
    if (!r) {
        return Err(std::move(r.error().with_context("item_id", std::to_string(record.item_id))));
    }
    return Ok();
}

Result<std::vector<TransactionRecord>> ArtisanStore::transactions_for(ItemId item_id) {
    auto rows = m_db.query(
        "SELECT type, item_id, rarity, quantity, unit_price, node_name, transaction_date, notes "
        "FROM transactions WHERE item_id = ? ORDER BY transaction_date DESC, id DESC",
        {id_param(item_id)});
    if (!rows) {
        return Err<std::vector<TransactionRecord>>(std::move(rows.error()));
    }

    std::vector<TransactionRecord> result;
    for (const auto& row : *rows) {
        auto type = parse_transaction_type(row_string(row, "type"));
        if (!type) {
            artisan_core::catalog_logger()->warn("Skipping transaction with unknown type '{}'",
                                                 row_string(row, "type"));
            continue;
        }

        TransactionRecord record;
        record.type = *type;
        record.item_id = static_cast<ItemId>(row_int(row, "item_id"));
        record.rarity = artisan_crafting::parse_rarity(row_string(row, "rarity", "common"));
        record.quantity = row_int(row, "quantity");
        if (auto it = row.find("unit_price"); it != row.end() && !std::holds_alternative<DbNull>(it->second)) {
            record.unit_price = row_double(row, "unit_price");
        }
        record.node_name = row_optional_string(row, "node_name");
        record.notes = row_string(row, "notes");
        record.date = from_unix(row_int(row, "transaction_date"));
        result.push_back(std::move(record));
    }
    return Ok(std::move(result));
}

Result<std::optional<std::string>> ArtisanStore::get_setting(const std::string& key) {
    auto rows = m_db.query("SELECT value FROM settings WHERE key = ?", {key});
    if (!rows) {
        return Err<std::optional<std::string>>(std::move(rows.error()));
    }
    if (rows->empty()) {
        return Ok(std::optional<std::string>{});
    }
    return Ok(row_optional_string(rows->front(), "value"));
}

Result<void> ArtisanStore::set_setting(const std::string& key, const std::string& value) {
    auto r = m_db.execute(
        "INSERT INTO settings (key, value, updated_at) VALUES (?, ?, CAST(strftime('%s', 'now') AS INTEGER)) "
        "ON CONFLICT(key) DO UPDATE SET value = excluded.value, updated_at = excluded.updated_at",
        {key, value});
    if (!r) {
        return Err(std::move(r.error().with_context("key", key)));
    }
    return Ok();
}

Result<std::map<std::string, std::string>> ArtisanStore::load_settings() {
    auto rows = m_db.query("SELECT key, value FROM settings WHERE key != ? ORDER BY key",
                           {std::string(k_last_sync_key)});
    if (!rows) {
        return Err<std::map<std::string, std::string>>(std::move(rows.error()));
    }

    std::map<std::string, std::string> result;
    for (const auto& row : *rows) {
        result[row_string(row, "key")] = row_string(row, "value");
    }
    return Ok(std::move(result));
}

Result<void> ArtisanStore::save_setting(const std::string& key, const std::string& value) {
    return set_setting(key, value);
}

Result<StoreStats> ArtisanStore::stats() {
    StoreStats stats;
    const std::pair<const char*, std::int64_t*> tables[] = {
        {"items", &stats.items},
        {"recipes", &stats.recipes},
        {"recipe_components", &stats.recipe_components},
        {"inventory", &stats.inventory},
        {"market_prices", &stats.market_prices},
        {"transactions", &stats.transactions},
        {"settings", &stats.settings},
    };

    for (const auto& [table, field] : tables) {
        auto count = m_db.query_int(std::string("SELECT COUNT(*) FROM ") + table);
        if (!count) {
            return Err<StoreStats>(std::move(count.error()));
        }
        *field = *count;
    }
    return Ok(stats);
}

// =============================================================================
// Snapshots
// =============================================================================

Result<void> ArtisanStore::add_item_data(artisan_crafting::CatalogSnapshot& snapshot,
                                         ItemId item_id,
                                         std::int32_t lookback_days) {
    auto item = get_item(item_id);
    if (!item) {
        return Err(std::move(item.error()));
    }
    if (*item) {
        snapshot.add_item(**item);
    }

    auto prices = recent_market_prices(item_id, std::nullopt, lookback_days, snapshot.taken_at());
    if (!prices) {
        return Err(std::move(prices.error()));
    }
    for (auto& price : *prices) {
        snapshot.add_price(item_id, std::move(price));
    }

    auto holdings = inventory_for(item_id);
    if (!holdings) {
        return Err(std::move(holdings.error()));
    }
    for (const auto& record : *holdings) {
        snapshot.add_inventory(artisan_crafting::ItemKey{item_id, record.rarity},
                               artisan_crafting::InventoryEntry{record.node_name, record.quantity});
    }
    return Ok();
}

Result<void> ArtisanStore::extend_snapshot(artisan_crafting::CatalogSnapshot& snapshot,
                                           ItemId output_item_id,
                                           std::int32_t lookback_days) {
    if (auto r = add_item_data(snapshot, output_item_id, lookback_days); !r) {
        return r;
    }

    auto recipe = recipe_for_output(output_item_id);
    if (!recipe) {
        return Err(std::move(recipe.error()));
    }
    if (!*recipe) {
        return Ok();
    }

    for (const auto& component : (*recipe)->components) {
        if (auto r = add_item_data(snapshot, component.item_id, lookback_days); !r) {
            return r;
        }
    }
    snapshot.add_recipe(std::move(**recipe));
    return Ok();
}

Result<artisan_crafting::CatalogSnapshot> ArtisanStore::snapshot_for(ItemId output_item_id,
                                                                     std::int32_t lookback_days,
                                                                     std::chrono::system_clock::time_point now) {
    artisan_crafting::CatalogSnapshot snapshot(now);
    if (auto r = extend_snapshot(snapshot, output_item_id, lookback_days); !r) {
        return Err<artisan_crafting::CatalogSnapshot>(std::move(r.error()));
    }
    return Ok(std::move(snapshot));
}

} // namespace artisan_catalog
