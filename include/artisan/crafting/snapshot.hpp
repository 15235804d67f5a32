/// @file snapshot.hpp
/// @brief Immutable catalog data handed to a calculation

#pragma once

#include "item_key.hpp"
#include "types.hpp"

#include <chrono>
#include <optional>
#include <unordered_map>
#include <vector>

namespace artisan_crafting {

// =============================================================================
// CatalogSnapshot
// =============================================================================

/// @brief Point-in-time copy of the recipes, items, prices and inventory a
/// calculation needs
///
/// Built once by the caller (usually the store) and then only read, so a
/// calculation may run on any thread without touching a live connection.
/// The lookups returned by the *_lookup() accessors refer to this snapshot and
/// must not outlive it.
class CatalogSnapshot {
public:
    using Clock = std::chrono::system_clock;

    CatalogSnapshot() : m_taken_at(Clock::now()) {}
    explicit CatalogSnapshot(Clock::time_point taken_at) : m_taken_at(taken_at) {}

    // -------------------------------------------------------------------------
    // Building
    // -------------------------------------------------------------------------

    void add_recipe(Recipe recipe);
    void add_item(Item item);

    /// @brief Record a price observation for (item_id, price.rarity)
    void add_price(ItemId item_id, MarketPrice price);

    /// @brief Record holdings of one rarity variant at one location
    void add_inventory(const ItemKey& key, InventoryEntry entry);

    // -------------------------------------------------------------------------
    // Queries
    // -------------------------------------------------------------------------

    [[nodiscard]] std::optional<Recipe> recipe_for(ItemId output_item_id) const;
    [[nodiscard]] std::optional<Item> item(ItemId item_id) const;

    /// @brief Observations no older than @p lookback_days before taken_at(), most recent first
    [[nodiscard]] std::vector<MarketPrice> recent_prices(ItemId item_id, Rarity rarity,
                                                         std::int32_t lookback_days) const;

    [[nodiscard]] std::vector<InventoryEntry> inventory(ItemId item_id, Rarity rarity) const;

    [[nodiscard]] RecipeLookup recipe_lookup() const;
    [[nodiscard]] ItemLookup item_lookup() const;
    [[nodiscard]] PriceHistoryLookup price_lookup() const;
    [[nodiscard]] InventoryLookup inventory_lookup() const;

    [[nodiscard]] Clock::time_point taken_at() const { return m_taken_at; }
    [[nodiscard]] std::size_t recipe_count() const { return m_recipes.size(); }
    [[nodiscard]] std::size_t item_count() const { return m_items.size(); }

private:
    std::unordered_map<ItemId, Recipe> m_recipes;
    std::unordered_map<ItemId, Item> m_items;
    std::unordered_map<ItemKey, std::vector<MarketPrice>> m_prices;
    std::unordered_map<ItemKey, std::vector<InventoryEntry>> m_inventory;
    Clock::time_point m_taken_at;
};

} // namespace artisan_crafting
