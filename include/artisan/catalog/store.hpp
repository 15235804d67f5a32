/// @file store.hpp
/// @brief SQLite-backed catalog, inventory and market store

#pragma once

#include "database.hpp"

#include <artisan/config/settings.hpp>
#include <artisan/core/error.hpp>
#include <artisan/crafting/item_key.hpp>
#include <artisan/crafting/snapshot.hpp>
#include <artisan/crafting/types.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace artisan_catalog {

using artisan_crafting::ItemId;
using artisan_crafting::Rarity;

/// Current schema version written to schema_info
inline constexpr int k_schema_version = 2;

/// Settings key holding the last successful import, as unix seconds
inline constexpr const char* k_last_sync_key = "last_api_sync";

// =============================================================================
// Records
// =============================================================================

/// One inventory row: a rarity variant held at one storage node
struct InventoryRecord {
    ItemId item_id{0};
    Rarity rarity{Rarity::Common};
    std::string node_name;
    std::int64_t quantity{0};
    std::optional<double> average_cost;
    std::chrono::system_clock::time_point last_updated{};
    std::string notes;
};

/// Kind of an inventory movement
enum class TransactionType : std::uint8_t {
    Buy,
    Sell,
    Craft,
    Use
};

[[nodiscard]] const char* transaction_type_name(TransactionType type);

/// One row of the transaction history
struct TransactionRecord {
    TransactionType type{TransactionType::Buy};
    ItemId item_id{0};
    Rarity rarity{Rarity::Common};
    std::int64_t quantity{0};
    std::optional<double> unit_price;
    std::optional<std::string> node_name;
    std::string notes;
    std::optional<std::chrono::system_clock::time_point> date;  ///< Now if unset
};

/// Row counts per table
struct StoreStats {
    std::int64_t items{0};
    std::int64_t recipes{0};
    std::int64_t recipe_components{0};
    std::int64_t inventory{0};
    std::int64_t market_prices{0};
    std::int64_t transactions{0};
    std::int64_t settings{0};
};

// =============================================================================
// ArtisanStore
// =============================================================================

/// @brief Owns the database connection and every catalog query
///
/// Timestamps are stored as unix seconds and rarities as their lowercase
/// names. Not thread-safe; build a CatalogSnapshot with snapshot_for() to hand
/// data to another thread.
class ArtisanStore : public artisan_config::ISettingsStore {
public:
    /// @brief Open @p path (":memory:" for a private in-memory store) and migrate it
    [[nodiscard]] static artisan_core::Result<ArtisanStore> open(const std::string& path);

    ArtisanStore(ArtisanStore&&) noexcept = default;
    ArtisanStore& operator=(ArtisanStore&&) noexcept = default;

    /// @brief Create missing tables and bring schema_info up to k_schema_version
    [[nodiscard]] artisan_core::Result<void> migrate();

    [[nodiscard]] artisan_core::Result<int> schema_version();

    // -------------------------------------------------------------------------
    // Items
    // -------------------------------------------------------------------------

    [[nodiscard]] artisan_core::Result<void> upsert_item(const artisan_crafting::Item& item,
                                                         const std::string& api_data = {});

    /// @brief Upsert all items in one transaction; returns the count written
    [[nodiscard]] artisan_core::Result<std::size_t> bulk_upsert_items(
        const std::vector<artisan_crafting::Item>& items);

    [[nodiscard]] artisan_core::Result<std::optional<artisan_crafting::Item>> get_item(ItemId item_id);

    /// @brief Items whose name contains @p term, optionally for one profession, by name
    [[nodiscard]] artisan_core::Result<std::vector<artisan_crafting::Item>> search_items(
        const std::string& term,
        const std::optional<std::string>& profession = std::nullopt);

    [[nodiscard]] artisan_core::Result<std::vector<artisan_crafting::Item>> items_by_profession(
        const std::string& profession);

    // -------------------------------------------------------------------------
    // Recipes
    // -------------------------------------------------------------------------

    /// @brief Insert or update a recipe and replace its component list
    ///
    /// Returns the recipe row id.
    [[nodiscard]] artisan_core::Result<std::int64_t> upsert_recipe(const artisan_crafting::Recipe& recipe);

    /// @brief First recipe producing @p output_item_id, components in stored order
    [[nodiscard]] artisan_core::Result<std::optional<artisan_crafting::Recipe>> recipe_for_output(
        ItemId output_item_id);

    // -------------------------------------------------------------------------
    // Inventory
    // -------------------------------------------------------------------------

    /// @brief Set the quantity of one rarity variant at one node
    [[nodiscard]] artisan_core::Result<void> update_inventory(
        ItemId item_id,
        Rarity rarity,
        const std::string& node_name,
        std::int64_t quantity,
        std::optional<double> average_cost = std::nullopt,
        const std::string& notes = {});

    /// @brief Non-empty holdings of an item, optionally of one rarity, by node name
    [[nodiscard]] artisan_core::Result<std::vector<InventoryRecord>> inventory_for(
        ItemId item_id,
        std::optional<Rarity> rarity = std::nullopt);

    /// @brief Non-empty holdings of every item at @p rarity
    [[nodiscard]] artisan_core::Result<std::vector<InventoryRecord>> inventory_by_rarity(Rarity rarity);

    /// @brief Rarities of @p item_id with stock, lowest first
    [[nodiscard]] artisan_core::Result<std::vector<Rarity>> available_rarities(ItemId item_id);

    // -------------------------------------------------------------------------
    // Market
    // -------------------------------------------------------------------------

    [[nodiscard]] artisan_core::Result<void> record_market_price(
        ItemId item_id,
        const artisan_crafting::MarketPrice& price,
        const std::string& notes = {});

    /// @brief Observations in the last @p days, most recent first
    [[nodiscard]] artisan_core::Result<std::vector<artisan_crafting::MarketPrice>> recent_market_prices(
        ItemId item_id,
        std::optional<Rarity> rarity,
        std::int32_t days,
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    // -------------------------------------------------------------------------
    // Transactions & Settings
    // -------------------------------------------------------------------------

    [[nodiscard]] artisan_core::Result<void> record_transaction(const TransactionRecord& record);

    [[nodiscard]] artisan_core::Result<std::vector<TransactionRecord>> transactions_for(ItemId item_id);

    [[nodiscard]] artisan_core::Result<std::optional<std::string>> get_setting(const std::string& key);
    [[nodiscard]] artisan_core::Result<void> set_setting(const std::string& key, const std::string& value);

    /// @brief User settings, excluding internal bookkeeping keys
    [[nodiscard]] artisan_core::Result<std::map<std::string, std::string>> load_settings() override;
    [[nodiscard]] artisan_core::Result<void> save_setting(const std::string& key,
                                                          const std::string& value) override;

    [[nodiscard]] artisan_core::Result<StoreStats> stats();

    // -------------------------------------------------------------------------
    // Snapshots
    // -------------------------------------------------------------------------

    /// @brief Recipe, items, price histories and inventories needed to cost
    /// @p output_item_id at any rarity
    ///
    /// Prices cover @p lookback_days before @p now. A missing recipe yields a
    /// snapshot without it.
    [[nodiscard]] artisan_core::Result<artisan_crafting::CatalogSnapshot> snapshot_for(
        ItemId output_item_id,
        std::int32_t lookback_days,
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    /// @brief Add one output's recipe and component data to an existing snapshot
    [[nodiscard]] artisan_core::Result<void> extend_snapshot(artisan_crafting::CatalogSnapshot& snapshot,
                                                             ItemId output_item_id,
                                                             std::int32_t lookback_days);

    [[nodiscard]] Database& database() { return m_db; }

private:
    explicit ArtisanStore(Database db) : m_db(std::move(db)) {}

    artisan_core::Result<void> write_item(const artisan_crafting::Item& item, const std::string& api_data);
    artisan_core::Result<void> add_item_data(artisan_crafting::CatalogSnapshot& snapshot,
                                             ItemId item_id,
                                             std::int32_t lookback_days);

    Database m_db;
};

} // namespace artisan_catalog
