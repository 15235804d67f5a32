/// @file pricing.cpp
/// @brief Price resolver implementation

#include <artisan/crafting/pricing.hpp>

namespace artisan_crafting {

ResolvedPrice resolve_price(ItemId item_id, Rarity rarity,
                            const PriceOverrides& overrides,
                            const std::vector<MarketPrice>& recent_prices) {
    if (auto it = overrides.find(ItemKey{item_id, rarity}); it != overrides.end()) {
        return ResolvedPrice{it->second, "custom", PriceSource::Custom};
    }

    if (!recent_prices.empty()) {
        const auto& latest = recent_prices.front();
        return ResolvedPrice{latest.price, "market_" + latest.source, PriceSource::Market};
    }

    return ResolvedPrice{};
}

const char* price_source_name(PriceSource kind) {
    switch (kind) {
        case PriceSource::Custom: return "custom";
        case PriceSource::Market: return "market";
        case PriceSource::NoData: return "no_data";
        default: return "no_data";
    }
}

} // namespace artisan_crafting
