/// @file market.hpp
/// @brief Market price statistics and trend detection

#pragma once

#include "types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace artisan_crafting {

/// @brief Direction of recent prices
enum class PriceTrend : std::uint8_t {
    NoData,
    InsufficientData,
    Stable,
    Rising,
    Falling
};

[[nodiscard]] const char* trend_name(PriceTrend trend);

/// @brief Summary statistics over a price history window
struct MarketAnalysis {
    double average{0.0};
    double min_price{0.0};
    double max_price{0.0};
    std::size_t data_points{0};
    PriceTrend trend{PriceTrend::NoData};
    std::optional<Rarity> rarity;                   ///< Filter applied, if any
};

/// @brief Points needed before a trend is reported
inline constexpr std::size_t k_trend_min_points = 6;

/// @brief Analyze a price history, most recent first
///
/// With at least six points the mean of the three most recent is compared
/// with the mean of the three oldest: more than 10% higher is Rising, more
/// than 10% lower is Falling, anything else Stable.
[[nodiscard]] MarketAnalysis analyze_market(const std::vector<MarketPrice>& prices,
                                            std::optional<Rarity> rarity = std::nullopt);

/// @brief Trading advice for an analysis
[[nodiscard]] std::string recommendation(const MarketAnalysis& analysis);

/// @brief (max - min) / average as a percentage, 0 when average is 0
[[nodiscard]] double price_swing_percent(const MarketAnalysis& analysis);

/// @brief A directional trend over at least five points swinging by more than 20%
[[nodiscard]] bool is_significant_swing(const MarketAnalysis& analysis);

} // namespace artisan_crafting
