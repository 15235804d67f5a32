/// @file market.cpp
/// @brief Market analyzer implementation

#include <artisan/crafting/market.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <numeric>

namespace artisan_crafting {

const char* trend_name(PriceTrend trend) {
    switch (trend) {
        case PriceTrend::NoData: return "no_data";
        case PriceTrend::InsufficientData: return "insufficient_data";
        case PriceTrend::Stable: return "stable";
        case PriceTrend::Rising: return "rising";
        case PriceTrend::Falling: return "falling";
        default: return "no_data";
    }
}

MarketAnalysis analyze_market(const std::vector<MarketPrice>& prices, std::optional<Rarity> rarity) {
    MarketAnalysis analysis;
    analysis.rarity = rarity;

    std::vector<double> values;
    values.reserve(prices.size());
    for (const auto& p : prices) {
        if (!rarity || p.rarity == *rarity) {
            values.push_back(p.price);
        }
    }

    if (values.empty()) {
        return analysis;
    }

    const double sum = std::accumulate(values.begin(), values.end(), 0.0);
    analysis.data_points = values.size();
    analysis.average = sum / static_cast<double>(values.size());
    auto [min_it, max_it] = std::minmax_element(values.begin(), values.end());
    analysis.min_price = *min_it;
    analysis.max_price = *max_it;

    if (values.size() < k_trend_min_points) {
        analysis.trend = PriceTrend::InsufficientData;
        return analysis;
    }

    const double recent = std::accumulate(values.begin(), values.begin() + 3, 0.0) / 3.0;
    const double older = std::accumulate(values.end() - 3, values.end(), 0.0) / 3.0;

    if (recent > older * 1.1) {
        analysis.trend = PriceTrend::Rising;
    } else if (recent < older * 0.9) {
        analysis.trend = PriceTrend::Falling;
    } else {
        analysis.trend = PriceTrend::Stable;
    }
    return analysis;
}

std::string recommendation(const MarketAnalysis& analysis) {
    if (analysis.data_points < 3) {
        return "Insufficient data for recommendations. Record more prices.";
    }

    switch (analysis.trend) {
        case PriceTrend::Rising:
            return fmt::format("Prices are rising. Consider buying now if below {:.2f} gold. "
                               "Good time to sell if you have stock.", analysis.average);
        case PriceTrend::Falling:
            return fmt::format("Prices are falling. Wait to buy until prices stabilize. "
                               "Consider selling soon if above {:.2f} gold.", analysis.average);
        case PriceTrend::Stable:
            return fmt::format("Prices are stable around {:.2f} gold. Safe to buy/sell at market rates.",
                               analysis.average);
        default:
            return fmt::format("Current average: {:.2f} gold. Range: {:.2f} - {:.2f} gold.",
                               analysis.average, analysis.min_price, analysis.max_price);
    }
}

double price_swing_percent(const MarketAnalysis& analysis) {
    if (analysis.average == 0.0) {
        return 0.0;
    }
    return (analysis.max_price - analysis.min_price) / analysis.average * 100.0;
}

bool is_significant_swing(const MarketAnalysis& analysis) {
    const bool directional = analysis.trend == PriceTrend::Rising ||
                             analysis.trend == PriceTrend::Falling;
    return directional && analysis.data_points >= 5 && price_swing_percent(analysis) > 20.0;
}

} // namespace artisan_crafting
