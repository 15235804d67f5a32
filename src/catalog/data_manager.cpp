/// @file data_manager.cpp
/// @brief DataManager implementation

#include <artisan/catalog/data_manager.hpp>
#include <artisan/core/log.hpp>
#include <artisan/crafting/rarity.hpp>

#include <charconv>

namespace artisan_catalog {

using artisan_core::Err;
using artisan_core::Ok;
using artisan_core::Result;
using namespace artisan_crafting;

Result<CostBreakdown> DataManager::calculate_crafting_cost(const CostRequest& request) {
    auto snapshot = m_store.snapshot_for(request.output_item_id, request.lookback_days);
    if (!snapshot) {
        return Err<CostBreakdown>(std::move(snapshot.error()));
    }
    return compute_cost(request, *snapshot);
}

Result<AvailabilityReport> DataManager::check_crafting_availability(ItemId output_item_id,
                                                                   Rarity target_rarity,
                                                                   std::int32_t quantity,
                                                                   const std::optional<std::string>& location,
                                                                   std::int32_t lookback_days) {
    CostRequest request;
    request.output_item_id = output_item_id;
    request.target_rarity = target_rarity;
    request.quantity = quantity;
    request.lookback_days = lookback_days;

    auto snapshot = m_store.snapshot_for(output_item_id, lookback_days);
    if (!snapshot) {
        return Err<AvailabilityReport>(std::move(snapshot.error()));
    }

    auto breakdown = compute_cost(request, *snapshot);
    if (!breakdown) {
        return Err<AvailabilityReport>(std::move(breakdown.error()));
    }
    return Ok(check_availability(*breakdown, snapshot->inventory_lookup(), location));
}

Result<MarketAnalysis> DataManager::market_analysis(ItemId item_id, std::optional<Rarity> rarity, std::int32_t days) {
    auto prices = m_store.recent_market_prices(item_id, rarity, days);
    if (!prices) {
        return Err<MarketAnalysis>(std::move(prices.error()));
    }
    return Ok(analyze_market(*prices, rarity));
}

Result<BatchResult> DataManager::plan_batch(const BatchPlan& plan,
                                            double tax_rate,
                                            const std::map<std::string, double>& overrides,
                                            std::int32_t lookback_days,
                                            const std::optional<std::string>& location) {
    CatalogSnapshot snapshot;
    for (const auto& entry : plan.entries()) {
        if (auto r = m_store.extend_snapshot(snapshot, entry.output_item_id, lookback_days); !r) {
            return Err<BatchResult>(std::move(r.error()));
        }
    }
    return artisan_crafting::plan_batch(plan, tax_rate, overrides, make_collaborators(snapshot, lookback_days),
                                        location);
}

Result<void> DataManager::mark_crafted(ItemId output_item_id,
                                       Rarity rarity,
                                       std::int64_t quantity,
                                       const std::string& node_name,
                                       std::optional<double> unit_cost) {
    if (quantity < 1) {
        return Err(artisan_core::CraftingError::invalid_quantity(quantity));
    }

    auto holdings = m_store.inventory_for(output_item_id, rarity);
    if (!holdings) {
        return Err(std::move(holdings.error()));
    }

    std::int64_t current = 0;
    for (const auto& record : *holdings) {
        if (record.node_name == node_name) {
            current = record.quantity;
        }
    }

    auto tx = m_store.database().begin();
    if (!tx) {
        return Err(std::move(tx.error()));
    }

    if (auto r = m_store.update_inventory(output_item_id, rarity, node_name, current + quantity); !r) {
        return r;
    }

    TransactionRecord record;
    record.type = TransactionType::Craft;
    record.item_id = output_item_id;
    record.rarity = rarity;
    record.quantity = quantity;
    record.unit_price = unit_cost;
    record.node_name = node_name;
    if (auto r = m_store.record_transaction(record); !r) {
        return r;
    }

    if (auto r = tx->commit(); !r) {
        return r;
    }

    artisan_core::catalog_logger()->info("Crafted {} at '{}'",
                                         format_with_rarity(std::to_string(output_item_id), rarity, quantity),
                                         node_name);
    return Ok();
}

Result<DataStatus> DataManager::data_status(std::chrono::system_clock::time_point now) {
    DataStatus status;

    auto stats = m_store.stats();
    if (!stats) {
        return Err<DataStatus>(std::move(stats.error()));
    }
    status.stats = *stats;

    auto last_sync = m_store.get_setting(k_last_sync_key);
    if (!last_sync) {
        return Err<DataStatus>(std::move(last_sync.error()));
    }

    if (*last_sync) {
        const std::string& text = **last_sync;
        std::int64_t seconds = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), seconds);
        if (ec == std::errc() && ptr == text.data() + text.size()) {
            status.last_sync = std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
            status.sync_age_hours = std::chrono::duration<double, std::ratio<3600>>(now - *status.last_sync).count();
        } else {
            artisan_core::catalog_logger()->warn("Unreadable last sync time '{}'", text);
            status.sync_age_hours = -1.0;
        }
    }
    return Ok(status);
}

} // namespace artisan_catalog
