/// @file data_manager.hpp
/// @brief Facade wiring the store into the crafting core

#pragma once

#include "store.hpp"

#include <artisan/core/error.hpp>
#include <artisan/crafting/availability.hpp>
#include <artisan/crafting/batch.hpp>
#include <artisan/crafting/cost.hpp>
#include <artisan/crafting/market.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace artisan_catalog {

/// Database health and import freshness
struct DataStatus {
    StoreStats stats;
    std::optional<std::chrono::system_clock::time_point> last_sync;
    double sync_age_hours{0.0};                     ///< 0 if never synced, -1 if unreadable

    /// @brief True when never synced or older than @p interval_hours
    [[nodiscard]] bool needs_sync(std::int32_t interval_hours) const {
        return !last_sync || sync_age_hours < 0.0 || sync_age_hours >= interval_hours;
    }
};

/// @brief High-level crafting operations against an ArtisanStore
///
/// Each calculation reads a CatalogSnapshot from the store and hands it to the
/// crafting core, so the core never sees the database.
class DataManager {
public:
    explicit DataManager(ArtisanStore& store) : m_store(store) {}

    [[nodiscard]] artisan_core::Result<artisan_crafting::CostBreakdown> calculate_crafting_cost(
        const artisan_crafting::CostRequest& request);

    /// @brief Cost with no overrides and zero tax, then check it against inventory
    [[nodiscard]] artisan_core::Result<artisan_crafting::AvailabilityReport> check_crafting_availability(
        ItemId output_item_id,
        Rarity target_rarity,
        std::int32_t quantity = 1,
        const std::optional<std::string>& location = std::nullopt,
        std::int32_t lookback_days = 7);

    [[nodiscard]] artisan_core::Result<artisan_crafting::MarketAnalysis> market_analysis(
        ItemId item_id,
        std::optional<Rarity> rarity = std::nullopt,
        std::int32_t days = 30);

    [[nodiscard]] artisan_core::Result<artisan_crafting::BatchResult> plan_batch(
        const artisan_crafting::BatchPlan& plan,
        double tax_rate,
        const std::map<std::string, double>& overrides = {},
        std::int32_t lookback_days = 7,
        const std::optional<std::string>& location = std::nullopt);

    /// @brief Add crafted output to a node and record a craft transaction
    [[nodiscard]] artisan_core::Result<void> mark_crafted(
        ItemId output_item_id,
        Rarity rarity,
        std::int64_t quantity,
        const std::string& node_name,
        std::optional<double> unit_cost = std::nullopt);

    [[nodiscard]] artisan_core::Result<DataStatus> data_status(
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    [[nodiscard]] ArtisanStore& store() { return m_store; }

private:
    ArtisanStore& m_store;
};

} // namespace artisan_catalog
