/// @file cost.hpp
/// @brief Crafting cost aggregation

#pragma once

#include "item_key.hpp"
#include "pricing.hpp"
#include "types.hpp"

#include <artisan/core/error.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace artisan_crafting {

// =============================================================================
// CostRequest
// =============================================================================

/// @brief Parameters of one cost calculation
struct CostRequest {
    ItemId output_item_id{0};
    Rarity target_rarity{Rarity::Common};
    std::int32_t quantity{1};
    double tax_rate{0.0};                           ///< Node tax on the base fee, 0..1
    std::map<std::string, double> overrides;        ///< Serialized ItemKey -> unit price
    std::int32_t quality_rating{0};                 ///< Reserved, no effect on the result
    std::int32_t lookback_days{7};                  ///< Market history window
};

// =============================================================================
// CostBreakdown
// =============================================================================

/// @brief Priced line for one recipe component
struct ComponentCost {
    ItemId item_id{0};
    std::string name;
    Rarity required_rarity{Rarity::Common};
    ComponentType type{ComponentType::Quality};
    bool optional{false};
    std::int64_t quantity_needed{0};                ///< Per-craft quantity x craft quantity
    double unit_price{0.0};
    std::string price_source;
    PriceSource source_kind{PriceSource::NoData};
    double total_cost{0.0};
    ItemKey key;
};

/// @brief Itemized result of a cost calculation
struct CostBreakdown {
    ItemId output_item_id{0};
    Rarity target_rarity{Rarity::Common};
    std::int32_t quantity{0};
    double tax_rate{0.0};
    std::int32_t quality_rating{0};

    std::vector<ComponentCost> components;          ///< Recipe order

    double material_cost{0.0};
    double base_fee_total{0.0};
    double tax_amount{0.0};
    double total_cost{0.0};
    double cost_per_unit{0.0};

    /// @brief Number of components priced as no_data
    std::size_t unpriced_count() const {
        std::size_t count = 0;
        for (const auto& c : components) {
            if (c.source_kind == PriceSource::NoData) ++count;
        }
        return count;
    }

    bool has_unpriced_components() const { return unpriced_count() > 0; }
};

// =============================================================================
// Calculation
// =============================================================================

/// @brief Check the request's scalar inputs and decode its overrides
///
/// Fails with InvalidInput for quantity < 1, a tax rate outside [0, 1], a
/// negative quality rating, or an override whose key is malformed or whose
/// price is negative.
[[nodiscard]] artisan_core::Result<PriceOverrides> validate_request(const CostRequest& request);

/// @brief Compute the full cost breakdown of crafting @p request.quantity items
///
/// Per component (in recipe order) the required rarity follows the component
/// type, the unit price comes from resolve_price, and the line total is
/// unit price x per-craft quantity x craft quantity. The base fee is scaled by
/// quantity and taxed; material cost is never taxed.
///
/// Fails with NotFound when the recipe has no components or a component item
/// is missing from the catalog, and with InvalidInput as per validate_request.
/// Missing prices never fail the calculation.
[[nodiscard]] artisan_core::Result<CostBreakdown> compute_cost(const CostRequest& request,
                                                               const Recipe& recipe,
                                                               const ItemLookup& items,
                                                               const PriceHistoryLookup& prices);

/// @brief Compute against an immutable catalog snapshot
[[nodiscard]] artisan_core::Result<CostBreakdown> compute_cost(const CostRequest& request,
                                                               const CatalogSnapshot& snapshot);

} // namespace artisan_crafting
