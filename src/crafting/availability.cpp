/// @file availability.cpp
/// @brief Availability checker implementation

#include <artisan/crafting/availability.hpp>
#include <artisan/core/log.hpp>

namespace artisan_crafting {

AvailabilityReport check_availability(const CostBreakdown& breakdown,
                                      const InventoryLookup& inventory,
                                      const std::optional<std::string>& location) {
    AvailabilityReport report;
    report.total_components = breakdown.components.size();

    for (const auto& component : breakdown.components) {
        ComponentAvailability entry;
        entry.item_id = component.item_id;
        entry.name = component.name;
        entry.rarity = component.required_rarity;
        entry.key = component.key;
        entry.needed = component.quantity_needed;

        std::vector<InventoryEntry> holdings;
        if (inventory) {
            holdings = inventory(component.item_id, component.required_rarity);
        }

        for (auto& holding : holdings) {
            if (location && holding.location != *location) {
                continue;
            }
            entry.available += holding.quantity;
            entry.locations.push_back(std::move(holding));
        }

        entry.is_sufficient = entry.available >= entry.needed;
        if (entry.is_sufficient) {
            report.available.push_back(std::move(entry));
        } else {
            report.missing.push_back(std::move(entry));
        }
    }

    report.can_craft = report.missing.empty();

    artisan_core::crafting_logger()->debug(
        "Availability for item {}: {}/{} components sufficient{}",
        breakdown.output_item_id, report.available.size(), report.total_components,
        location ? " at " + *location : std::string{});

    return report;
}

} // namespace artisan_crafting
