/// @file pricing.hpp
/// @brief Unit price resolution for recipe components

#pragma once

#include "item_key.hpp"
#include "types.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace artisan_crafting {

/// @brief Validated override table
using PriceOverrides = std::unordered_map<ItemKey, double>;

// =============================================================================
// ResolvedPrice
// =============================================================================

/// @brief Unit price and where it came from
///
/// A NoData price is 0.0 but means "unknown", not "free".
struct ResolvedPrice {
    double unit_price{0.0};
    std::string source{"no_data"};      ///< "custom", "market_<source>" or "no_data"
    PriceSource kind{PriceSource::NoData};

    bool is_known() const { return kind != PriceSource::NoData; }
};

/// @brief Resolve the unit price of one rarity variant of a component
///
/// An override for ItemKey(item_id, rarity) wins outright. Otherwise the first
/// entry of @p recent_prices (most recent first, already filtered to the
/// lookback window) is used. Otherwise the price is unknown.
[[nodiscard]] ResolvedPrice resolve_price(ItemId item_id, Rarity rarity,
                                          const PriceOverrides& overrides,
                                          const std::vector<MarketPrice>& recent_prices);

[[nodiscard]] const char* price_source_name(PriceSource kind);

} // namespace artisan_crafting
