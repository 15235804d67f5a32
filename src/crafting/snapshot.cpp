/// @file snapshot.cpp
/// @brief CatalogSnapshot implementation

#include <artisan/crafting/snapshot.hpp>

#include <algorithm>

namespace artisan_crafting {

// =============================================================================
// Building
// =============================================================================

void CatalogSnapshot::add_recipe(Recipe recipe) {
    const ItemId output = recipe.output_item_id;
    m_recipes[output] = std::move(recipe);
}

void CatalogSnapshot::add_item(Item item) {
    const ItemId id = item.id;
    m_items[id] = std::move(item);
}

void CatalogSnapshot::add_price(ItemId item_id, MarketPrice price) {
    auto& history = m_prices[ItemKey{item_id, price.rarity}];

    // Keep most recent first; equal timestamps stay in insertion order
    auto pos = std::find_if(history.begin(), history.end(), [&price](const MarketPrice& existing) {
        return existing.recorded_at < price.recorded_at;
    });
    history.insert(pos, std::move(price));
}

void CatalogSnapshot::add_inventory(const ItemKey& key, InventoryEntry entry) {
    m_inventory[key].push_back(std::move(entry));
}

// =============================================================================
// Queries
// =============================================================================

std::optional<Recipe> CatalogSnapshot::recipe_for(ItemId output_item_id) const {
    auto it = m_recipes.find(output_item_id);
    if (it == m_recipes.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Item> CatalogSnapshot::item(ItemId item_id) const {
    auto it = m_items.find(item_id);
    if (it == m_items.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<MarketPrice> CatalogSnapshot::recent_prices(ItemId item_id, Rarity rarity,
                                                        std::int32_t lookback_days) const {
    std::vector<MarketPrice> result;
    auto it = m_prices.find(ItemKey{item_id, rarity});
    if (it == m_prices.end() || lookback_days <= 0) {
        return result;
    }

    const auto cutoff = m_taken_at - std::chrono::hours(24) * lookback_days;
    for (const auto& price : it->second) {
        if (price.recorded_at >= cutoff) {
            result.push_back(price);
        }
    }
    return result;
}

std::vector<InventoryEntry> CatalogSnapshot::inventory(ItemId item_id, Rarity rarity) const {
    auto it = m_inventory.find(ItemKey{item_id, rarity});
    if (it == m_inventory.end()) {
        return {};
    }
    return it->second;
}

RecipeLookup CatalogSnapshot::recipe_lookup() const {
    return [this](ItemId output_item_id) { return recipe_for(output_item_id); };
}

ItemLookup CatalogSnapshot::item_lookup() const {
    return [this](ItemId item_id) { return item(item_id); };
}

PriceHistoryLookup CatalogSnapshot::price_lookup() const {
    return [this](ItemId item_id, Rarity rarity, std::int32_t lookback_days) {
        return recent_prices(item_id, rarity, lookback_days);
    };
}

InventoryLookup CatalogSnapshot::inventory_lookup() const {
    return [this](ItemId item_id, Rarity rarity) { return inventory(item_id, rarity); };
}

} // namespace artisan_crafting
