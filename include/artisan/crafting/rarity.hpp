/// @file rarity.hpp
/// @brief Rarity ordering, names and component type rules

#pragma once

#include "types.hpp"

#include <array>
#include <compare>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace artisan_crafting {

// =============================================================================
// Rarity
// =============================================================================

/// @brief Numeric rank, Common = 1 .. Legendary = 6
[[nodiscard]] constexpr int rarity_rank(Rarity r) { return static_cast<int>(r); }

/// @brief Rarity for a rank, nullopt outside 1..6
[[nodiscard]] std::optional<Rarity> rarity_from_rank(std::int64_t rank);

/// @brief Parse a rarity name
///
/// Case-insensitive, surrounding whitespace ignored. Unrecognized or empty
/// input yields Common; this never fails.
[[nodiscard]] Rarity parse_rarity(std::string_view text);

/// @brief Total order by rank
[[nodiscard]] constexpr std::strong_ordering compare_rarity(Rarity a, Rarity b) {
    return rarity_rank(a) <=> rarity_rank(b);
}

/// @brief Canonical lowercase name ("rare")
[[nodiscard]] const char* rarity_name(Rarity r);

/// @brief Display name ("Rare")
[[nodiscard]] const char* rarity_display_name(Rarity r);

/// @brief Display color as "#RRGGBB"
[[nodiscard]] const char* rarity_color(Rarity r);

/// @brief All six rarities, ascending
[[nodiscard]] const std::array<Rarity, 6>& all_rarities();

/// @brief Display names, ascending
[[nodiscard]] std::vector<std::string> rarity_display_list();

// =============================================================================
// Component Type
// =============================================================================

/// @brief "basic" (any case) is Basic, everything else Quality
[[nodiscard]] ComponentType parse_component_type(std::string_view text);

[[nodiscard]] const char* component_type_name(ComponentType type);

/// @brief Rarity a component must have for a craft at the target rarity
[[nodiscard]] constexpr Rarity required_rarity(ComponentType type, Rarity base, Rarity target) {
    return type == ComponentType::Basic ? base : target;
}

/// @brief Guess a component's type from catalog data
///
/// Items tied to a profession are crafted intermediates and therefore quality
/// components. Vendor staples (paper, ink, thread, flux, solvent) are basic.
[[nodiscard]] ComponentType component_type_for_item(const Item& item);

// =============================================================================
// Crafting Result Rules
// =============================================================================

/// @brief Whether the given component rarities can produce the target rarity
///
/// False for an empty list, otherwise true iff every rarity is at least the
/// target. The quality rating is accepted but has no effect yet.
[[nodiscard]] bool can_craft_rarity(const std::vector<Rarity>& component_rarities,
                                    Rarity target, std::int32_t quality_rating = 0);

/// @brief Rarity produced by the given quality component rarities
///
/// Common for an empty list, otherwise the lowest rarity present. The quality
/// rating is accepted but has no effect yet.
[[nodiscard]] Rarity crafting_result_rarity(const std::vector<Rarity>& quality_component_rarities,
                                            std::int32_t quality_rating = 0);

/// @brief "Rare Ink", or "3x Rare Ink" when a quantity is given
[[nodiscard]] std::string format_with_rarity(std::string_view name, Rarity r,
                                             std::optional<std::int64_t> quantity = std::nullopt);

} // namespace artisan_crafting
