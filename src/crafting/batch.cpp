/// @file batch.cpp
/// @brief Batch planner implementation

#include <artisan/crafting/batch.hpp>
#include <artisan/crafting/snapshot.hpp>
#include <artisan/core/log.hpp>

#include <limits>
#include <unordered_map>

namespace artisan_crafting {

using artisan_core::CraftingError;
using artisan_core::Err;
using artisan_core::Error;
using artisan_core::ErrorCode;
using artisan_core::Ok;
using artisan_core::Result;

// =============================================================================
// BatchPlan
// =============================================================================

Result<void> BatchPlan::add(BatchEntry entry) {
    if (entry.quantity < 1) {
        return Err(CraftingError::invalid_quantity(entry.quantity));
    }

    for (auto& existing : m_entries) {
        if (existing.output_item_id == entry.output_item_id &&
            existing.target_rarity == entry.target_rarity) {
            if (existing.quantity > std::numeric_limits<std::int32_t>::max() - entry.quantity) {
                Error error(ErrorCode::InvalidInput, "Merged batch quantity is out of range");
                error.with_context("output_item_id", std::to_string(entry.output_item_id));
                return Err(std::move(error));
            }
            existing.quantity += entry.quantity;
            return Ok();
        }
    }
    m_entries.push_back(std::move(entry));
    return Ok();
}

bool BatchPlan::remove(std::size_t index) {
    if (index >= m_entries.size()) {
        return false;
    }
    m_entries.erase(m_entries.begin() + static_cast<std::ptrdiff_t>(index));
    return true;
}

std::int64_t BatchPlan::total_items() const {
    std::int64_t total = 0;
    for (const auto& entry : m_entries) {
        total += entry.quantity;
    }
    return total;
}

// =============================================================================
// Planning
// =============================================================================

BatchCollaborators make_collaborators(const CatalogSnapshot& snapshot, std::int32_t lookback_days) {
    BatchCollaborators collaborators;
    collaborators.recipes = snapshot.recipe_lookup();
    collaborators.items = snapshot.item_lookup();
    collaborators.prices = snapshot.price_lookup();
    collaborators.inventory = snapshot.inventory_lookup();
    collaborators.lookback_days = lookback_days;
    return collaborators;
}

Result<BatchResult> plan_batch(const BatchPlan& plan,
                               double tax_rate,
                               const std::map<std::string, double>& overrides,
                               const BatchCollaborators& collaborators,
                               const std::optional<std::string>& location) {
    if (plan.empty()) {
        return Err<BatchResult>(Error(ErrorCode::InvalidInput, "Batch plan is empty"));
    }

    auto logger = artisan_core::crafting_logger();
    logger->debug("Planning batch of {} recipes ({} items)", plan.total_recipes(), plan.total_items());

    BatchResult result;
    std::unordered_map<ItemKey, std::size_t> material_index;

    for (const auto& entry : plan.entries()) {
        CostRequest request;
        request.output_item_id = entry.output_item_id;
        request.target_rarity = entry.target_rarity;
        request.quantity = entry.quantity;
        request.tax_rate = tax_rate;
        request.overrides = overrides;
        request.lookback_days = collaborators.lookback_days;

        Recipe recipe;
        if (collaborators.recipes) {
            recipe = collaborators.recipes(entry.output_item_id).value_or(Recipe{});
        }

        auto breakdown = compute_cost(request, recipe, collaborators.items, collaborators.prices);
        if (!breakdown) {
            Error err = std::move(breakdown.error());
            err.with_context("output_item_id", std::to_string(entry.output_item_id));
            return Err<BatchResult>(std::move(err));
        }

        for (const auto& component : breakdown->components) {
            auto [it, inserted] = material_index.try_emplace(component.key, result.materials.size());
            if (inserted) {
                MaterialRequirement material;
                material.key = component.key;
                material.name = component.name;
                material.unit_price = component.unit_price;
                material.price_source = component.price_source;
                material.source_kind = component.source_kind;
                result.materials.push_back(std::move(material));
            }
            result.materials[it->second].total_needed += component.quantity_needed;
        }

        result.total_cost += breakdown->total_cost;
        result.breakdowns.push_back(std::move(*breakdown));
    }

    for (auto& material : result.materials) {
        std::vector<InventoryEntry> holdings;
        if (collaborators.inventory) {
            holdings = collaborators.inventory(material.key.item_id, material.key.rarity);
        }
        for (auto& holding : holdings) {
            if (location && holding.location != *location) {
                continue;
            }
            material.available += holding.quantity;
            material.locations.push_back(std::move(holding));
        }

        material.missing = material.total_needed > material.available
            ? material.total_needed - material.available
            : 0;
        if (material.missing > 0) {
            ++result.missing_count;
        }
    }

    result.feasible = result.missing_count == 0;

    logger->debug("Batch needs {} materials, {} missing", result.materials.size(), result.missing_count);
    return Ok(std::move(result));
}

// =============================================================================
// Shopping List
// =============================================================================

ShoppingList shopping_list(const BatchResult& result) {
    ShoppingList list;
    for (const auto& material : result.materials) {
        if (material.missing <= 0) {
            continue;
        }
        ShoppingLine line;
        line.key = material.key;
        line.name = material.name;
        line.quantity = material.missing;
        line.unit_price = material.unit_price;
        line.cost = static_cast<double>(material.missing) * material.unit_price;
        list.total_cost += line.cost;
        list.lines.push_back(std::move(line));
    }
    return list;
}

} // namespace artisan_crafting
