/// @file item_key.hpp
/// @brief Composite (item id, rarity) key used for prices and inventory

#pragma once

#include "types.hpp"

#include <compare>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace artisan_crafting {

// =============================================================================
// ItemKey
// =============================================================================

/// @brief One rarity variant of a catalog item
///
/// The string form is "<item_id>_<rank>", e.g. "1042_3" for a Rare variant.
struct ItemKey {
    ItemId item_id{0};
    Rarity rarity{Rarity::Common};

    ItemKey() = default;
    ItemKey(ItemId id, Rarity r) : item_id(id), rarity(r) {}

    /// @brief Serialized form "<item_id>_<rank>"
    [[nodiscard]] std::string encode() const;
    [[nodiscard]] std::string to_string() const { return encode(); }

    /// @brief Lenient decode
    ///
    /// Anything that is not exactly two '_'-separated integers with a rank in
    /// 1..6 decodes to (0, Common). Callers cannot tell a malformed key from a
    /// real (0, Common) key; prefer try_parse wherever input comes from users.
    [[nodiscard]] static ItemKey parse(std::string_view text);

    /// @brief Strict decode, nullopt on malformed input
    [[nodiscard]] static std::optional<ItemKey> try_parse(std::string_view text);

    bool operator==(const ItemKey& other) const {
        return item_id == other.item_id && rarity == other.rarity;
    }
    bool operator!=(const ItemKey& other) const { return !(*this == other); }

    std::strong_ordering operator<=>(const ItemKey& other) const {
        if (auto cmp = item_id <=> other.item_id; cmp != 0) return cmp;
        return static_cast<int>(rarity) <=> static_cast<int>(other.rarity);
    }
};

} // namespace artisan_crafting

template<>
struct std::hash<artisan_crafting::ItemKey> {
    std::size_t operator()(const artisan_crafting::ItemKey& key) const noexcept {
        return std::hash<std::uint64_t>{}(key.item_id) ^
               (static_cast<std::size_t>(key.rarity) << 1);
    }
};
