/// @file availability.hpp
/// @brief Inventory sufficiency check for a cost breakdown

#pragma once

#include "cost.hpp"
#include "item_key.hpp"
#include "types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace artisan_crafting {

/// @brief Needed vs. held quantity for one component
struct ComponentAvailability {
    ItemId item_id{0};
    std::string name;
    Rarity rarity{Rarity::Common};
    ItemKey key;
    std::int64_t needed{0};
    std::int64_t available{0};
    bool is_sufficient{false};
    std::vector<InventoryEntry> locations;          ///< Holdings considered

    std::int64_t shortfall() const { return is_sufficient ? 0 : needed - available; }
};

/// @brief Components split into sufficient and missing, in breakdown order
struct AvailabilityReport {
    std::vector<ComponentAvailability> available;
    std::vector<ComponentAvailability> missing;
    bool can_craft{false};
    std::size_t total_components{0};
};

/// @brief Compare a breakdown's needs against inventory
///
/// With @p location set only holdings at that location count (0 if absent),
/// otherwise holdings are summed across all locations.
[[nodiscard]] AvailabilityReport check_availability(const CostBreakdown& breakdown,
                                                    const InventoryLookup& inventory,
                                                    const std::optional<std::string>& location = std::nullopt);

} // namespace artisan_crafting
