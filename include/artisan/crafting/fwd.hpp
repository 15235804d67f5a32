/// @file fwd.hpp
/// @brief Forward declarations for artisan_crafting module

#pragma once

#include <cstdint>
#include <functional>

namespace artisan_crafting {

/// @brief Catalog item identifier (as assigned by the game API)
using ItemId = std::uint64_t;

// =============================================================================
// Forward Declarations - Model
// =============================================================================

enum class Rarity : std::uint8_t;
enum class ComponentType : std::uint8_t;
enum class PriceSource : std::uint8_t;
enum class PriceTrend : std::uint8_t;

struct Item;
struct RecipeComponent;
struct Recipe;
struct ItemKey;
struct MarketPrice;
struct InventoryEntry;

// =============================================================================
// Forward Declarations - Calculation
// =============================================================================

struct ResolvedPrice;
struct CostRequest;
struct ComponentCost;
struct CostBreakdown;
struct ComponentAvailability;
struct AvailabilityReport;
struct MarketAnalysis;
class CatalogSnapshot;

// =============================================================================
// Forward Declarations - Batch
// =============================================================================

struct BatchEntry;
class BatchPlan;
struct MaterialRequirement;
struct BatchResult;
struct ShoppingLine;
struct ShoppingList;

} // namespace artisan_crafting
