/// @file item_key.cpp
/// @brief ItemKey codec

#include <artisan/crafting/item_key.hpp>
#include <artisan/crafting/rarity.hpp>

#include <charconv>
#include <system_error>

namespace artisan_crafting {

namespace {

template<typename T>
bool parse_integer(std::string_view text, T& out) {
    if (text.empty()) {
        return false;
    }
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc{} && ptr == last;
}

} // anonymous namespace

std::string ItemKey::encode() const {
    return std::to_string(item_id) + "_" + std::to_string(rarity_rank(rarity));
}

std::optional<ItemKey> ItemKey::try_parse(std::string_view text) {
    const auto sep = text.find('_');
    if (sep == std::string_view::npos) {
        return std::nullopt;
    }

    const auto id_part = text.substr(0, sep);
    const auto rank_part = text.substr(sep + 1);
    if (rank_part.find('_') != std::string_view::npos) {
        return std::nullopt;
    }

    ItemId id = 0;
    int rank = 0;
    if (!parse_integer(id_part, id) || !parse_integer(rank_part, rank)) {
        return std::nullopt;
    }

    auto rarity = rarity_from_rank(rank);
    if (!rarity) {
        return std::nullopt;
    }
    return ItemKey{id, *rarity};
}

ItemKey ItemKey::parse(std::string_view text) {
    return try_parse(text).value_or(ItemKey{0, Rarity::Common});
}

} // namespace artisan_crafting
