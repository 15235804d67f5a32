/// @file cost.cpp
/// @brief Cost aggregator implementation

#include <artisan/crafting/cost.hpp>
#include <artisan/crafting/rarity.hpp>
#include <artisan/crafting/snapshot.hpp>
#include <artisan/core/log.hpp>

namespace artisan_crafting {

using artisan_core::CraftingError;
using artisan_core::Err;
using artisan_core::Error;
using artisan_core::Ok;
using artisan_core::Result;

// =============================================================================
// Validation
// =============================================================================

Result<PriceOverrides> validate_request(const CostRequest& request) {
    if (request.quantity < 1) {
        return Err<PriceOverrides>(CraftingError::invalid_quantity(request.quantity));
    }

    // Written as a negated range check so NaN is rejected too
    if (!(request.tax_rate >= 0.0 && request.tax_rate <= 1.0)) {
        return Err<PriceOverrides>(CraftingError::invalid_tax_rate(request.tax_rate));
    }

    if (request.quality_rating < 0) {
        return Err<PriceOverrides>(CraftingError::invalid_quality(request.quality_rating));
    }

    PriceOverrides overrides;
    overrides.reserve(request.overrides.size());
    for (const auto& [text, price] : request.overrides) {
        auto key = ItemKey::try_parse(text);
        if (!key) {
            return Err<PriceOverrides>(CraftingError::invalid_override(text, "expected <item_id>_<rank>"));
        }
        if (!(price >= 0.0)) {
            return Err<PriceOverrides>(CraftingError::invalid_override(text, "price must not be negative"));
        }
        overrides[*key] = price;
    }

    return Ok(std::move(overrides));
}

// =============================================================================
// Aggregation
// =============================================================================

Result<CostBreakdown> compute_cost(const CostRequest& request,
                                   const Recipe& recipe,
                                   const ItemLookup& items,
                                   const PriceHistoryLookup& prices) {
    auto overrides = validate_request(request);
    if (!overrides) {
        return Err<CostBreakdown>(std::move(overrides.error()));
    }

    if (recipe.empty()) {
        return Err<CostBreakdown>(CraftingError::recipe_not_found(request.output_item_id));
    }

    auto logger = artisan_core::crafting_logger();
    logger->debug("Computing cost of {}x item {} at {} ({} components)",
                  request.quantity, request.output_item_id,
                  rarity_name(request.target_rarity), recipe.components.size());

    CostBreakdown breakdown;
    breakdown.output_item_id = request.output_item_id;
    breakdown.target_rarity = request.target_rarity;
    breakdown.quantity = request.quantity;
    breakdown.tax_rate = request.tax_rate;
    breakdown.quality_rating = request.quality_rating;
    breakdown.components.reserve(recipe.components.size());

    for (const auto& component : recipe.components) {
        auto item = items ? items(component.item_id) : std::nullopt;
        if (!item) {
            Error err = CraftingError::item_not_found(component.item_id);
            err.with_context("output_item_id", std::to_string(request.output_item_id));
            return Err<CostBreakdown>(std::move(err));
        }

        ComponentCost line;
        line.item_id = component.item_id;
        line.name = item->name;
        line.type = component.type;
        line.optional = component.optional;
        line.required_rarity = required_rarity(component.type, item->rarity, request.target_rarity);
        line.key = ItemKey{component.item_id, line.required_rarity};

        std::vector<MarketPrice> history;
        if (prices) {
            history = prices(component.item_id, line.required_rarity, request.lookback_days);
        }
        auto resolved = resolve_price(component.item_id, line.required_rarity, *overrides, history);

        line.unit_price = resolved.unit_price;
        line.price_source = std::move(resolved.source);
        line.source_kind = resolved.kind;
        line.quantity_needed = static_cast<std::int64_t>(component.quantity) * request.quantity;
        line.total_cost = line.unit_price * static_cast<double>(line.quantity_needed);

        logger->trace("  {} [{}] x{} @ {} ({})", line.name, line.key.encode(),
                      line.quantity_needed, line.unit_price, line.price_source);

        breakdown.material_cost += line.total_cost;
        breakdown.components.push_back(std::move(line));
    }

    breakdown.base_fee_total = recipe.base_crafting_fee * request.quantity;
    breakdown.tax_amount = breakdown.base_fee_total * request.tax_rate;
    breakdown.total_cost = breakdown.material_cost + breakdown.base_fee_total + breakdown.tax_amount;
    breakdown.cost_per_unit = request.quantity > 0
        ? breakdown.total_cost / request.quantity
        : 0.0;

    if (breakdown.has_unpriced_components()) {
        logger->debug("{} of {} components have no price data",
                      breakdown.unpriced_count(), breakdown.components.size());
    }

    return Ok(std::move(breakdown));
}

Result<CostBreakdown> compute_cost(const CostRequest& request, const CatalogSnapshot& snapshot) {
    auto recipe = snapshot.recipe_for(request.output_item_id);
    if (!recipe) {
        // Still report bad input ahead of a missing recipe
        auto overrides = validate_request(request);
        if (!overrides) {
            return Err<CostBreakdown>(std::move(overrides.error()));
        }
        return Err<CostBreakdown>(CraftingError::recipe_not_found(request.output_item_id));
    }
    return compute_cost(request, *recipe, snapshot.item_lookup(), snapshot.price_lookup());
}

} // namespace artisan_crafting
