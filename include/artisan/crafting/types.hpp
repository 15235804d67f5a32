/// @file types.hpp
/// @brief Core types and enumerations for artisan_crafting module

#pragma once

#include "fwd.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace artisan_crafting {

// =============================================================================
// Enumerations
// =============================================================================

/// @brief Rarity tier of an item or component, ranked 1..6
enum class Rarity : std::uint8_t {
    Common = 1,
    Uncommon = 2,
    Rare = 3,
    Heroic = 4,
    Epic = 5,
    Legendary = 6
};

/// @brief Pricing behavior of a recipe ingredient
enum class ComponentType : std::uint8_t {
    Quality,    ///< Required rarity tracks the craft's target rarity
    Basic       ///< Required rarity is the component's own base rarity
};

/// @brief Provenance of a resolved unit price
enum class PriceSource : std::uint8_t {
    Custom,     ///< Caller-supplied override
    Market,     ///< Most recent market observation
    NoData      ///< Unknown; unit price is 0.0
};

// =============================================================================
// Catalog Records
// =============================================================================

/// @brief Catalog item as imported from the game API
struct Item {
    ItemId id{0};
    std::string name;
    std::string type;
    Rarity rarity{Rarity::Common};                  ///< Base rarity
    std::int32_t level{1};
    std::optional<std::string> profession;
    std::string description;
    std::string icon_url;
};

/// @brief One ingredient line of a recipe
struct RecipeComponent {
    ItemId item_id{0};
    std::int32_t quantity{1};                       ///< Per craft
    ComponentType type{ComponentType::Quality};
    bool optional{false};
};

/// @brief Recipe producing a single output item
struct Recipe {
    std::int64_t id{0};                             ///< Store row id, 0 if not persisted
    ItemId output_item_id{0};
    std::string profession;
    std::int32_t level_required{1};
    double base_crafting_fee{0.0};
    std::vector<RecipeComponent> components;        ///< Stored order, unique item ids

    bool empty() const { return components.empty(); }

    /// @brief Sum of per-craft component quantities
    std::int64_t total_component_count() const {
        std::int64_t total = 0;
        for (const auto& c : components) {
            total += c.quantity;
        }
        return total;
    }
};

// =============================================================================
// Market & Inventory
// =============================================================================

/// @brief A single market price observation
struct MarketPrice {
    double price{0.0};
    std::string source;                             ///< e.g. "market", "auction", "vendor"
    Rarity rarity{Rarity::Common};
    std::optional<std::string> node_name;
    std::chrono::system_clock::time_point recorded_at{};
};

/// @brief Quantity of one rarity variant held at one storage location
struct InventoryEntry {
    std::string location;
    std::int64_t quantity{0};
};

// =============================================================================
// Collaborator Lookups
// =============================================================================

/// @brief Recipe producing an item, nullopt if none
using RecipeLookup = std::function<std::optional<Recipe>(ItemId output_item_id)>;

/// @brief Catalog item by id, nullopt if unknown
using ItemLookup = std::function<std::optional<Item>(ItemId item_id)>;

/// @brief Market observations for one rarity variant within the lookback window, most recent first
using PriceHistoryLookup =
    std::function<std::vector<MarketPrice>(ItemId item_id, Rarity rarity, std::int32_t lookback_days)>;

/// @brief Holdings of one rarity variant per storage location
using InventoryLookup = std::function<std::vector<InventoryEntry>(ItemId item_id, Rarity rarity)>;

} // namespace artisan_crafting
