/// @file batch.hpp
/// @brief Batch planning across several recipes

#pragma once

#include "cost.hpp"
#include "item_key.hpp"
#include "types.hpp"

#include <artisan/core/error.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace artisan_crafting {

// =============================================================================
// BatchPlan
// =============================================================================

/// @brief One recipe in a batch
struct BatchEntry {
    ItemId output_item_id{0};
    std::string name;
    Rarity target_rarity{Rarity::Common};
    std::int32_t quantity{1};
};

/// @brief Ordered list of crafts to plan together
class BatchPlan {
public:
    /// @brief Add an entry; an existing entry for the same output and rarity grows instead
    ///
    /// Fails with InvalidInput for a quantity below one or a merged quantity
    /// that no longer fits in 32 bits. The plan is unchanged on failure.
    [[nodiscard]] artisan_core::Result<void> add(BatchEntry entry);

    /// @brief Remove the entry at @p index
    bool remove(std::size_t index);

    void clear() { m_entries.clear(); }

    [[nodiscard]] const std::vector<BatchEntry>& entries() const { return m_entries; }
    [[nodiscard]] bool empty() const { return m_entries.empty(); }
    [[nodiscard]] std::size_t total_recipes() const { return m_entries.size(); }
    [[nodiscard]] std::int64_t total_items() const;

private:
    std::vector<BatchEntry> m_entries;
};

// =============================================================================
// BatchResult
// =============================================================================

/// @brief Merged need for one rarity variant across the whole batch
struct MaterialRequirement {
    ItemKey key;
    std::string name;
    std::int64_t total_needed{0};
    std::int64_t available{0};
    std::int64_t missing{0};
    double unit_price{0.0};
    std::string price_source;
    PriceSource source_kind{PriceSource::NoData};
    std::vector<InventoryEntry> locations;
};

struct BatchResult {
    std::vector<CostBreakdown> breakdowns;          ///< One per plan entry
    std::vector<MaterialRequirement> materials;     ///< First-seen order
    double total_cost{0.0};
    bool feasible{false};
    std::size_t missing_count{0};
};

/// @brief Data sources used to plan a batch
struct BatchCollaborators {
    RecipeLookup recipes;
    ItemLookup items;
    PriceHistoryLookup prices;
    InventoryLookup inventory;
    std::int32_t lookback_days{7};
};

/// @brief Collaborators reading from @p snapshot, which must outlive them
[[nodiscard]] BatchCollaborators make_collaborators(const CatalogSnapshot& snapshot,
                                                    std::int32_t lookback_days = 7);

/// @brief Cost every entry and merge the material needs
///
/// Fails on an empty plan or with the first failing entry's error, tagged with
/// its output_item_id.
[[nodiscard]] artisan_core::Result<BatchResult> plan_batch(
    const BatchPlan& plan,
    double tax_rate,
    const std::map<std::string, double>& overrides,
    const BatchCollaborators& collaborators,
    const std::optional<std::string>& location = std::nullopt);

// =============================================================================
// Shopping List
// =============================================================================

struct ShoppingLine {
    ItemKey key;
    std::string name;
    std::int64_t quantity{0};
    double unit_price{0.0};
    double cost{0.0};
};

struct ShoppingList {
    std::vector<ShoppingLine> lines;
    double total_cost{0.0};

    bool empty() const { return lines.empty(); }
};

/// @brief Missing materials priced at their resolved unit price
[[nodiscard]] ShoppingList shopping_list(const BatchResult& result);

} // namespace artisan_crafting
