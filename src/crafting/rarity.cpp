/// @file rarity.cpp
/// @brief Rarity model implementation

#include <artisan/crafting/rarity.hpp>

#include <algorithm>
#include <cctype>

namespace artisan_crafting {

namespace {

struct RarityInfo {
    Rarity rarity;
    const char* name;
    const char* display;
    const char* color;
};

constexpr std::array<RarityInfo, 6> k_rarity_table = {{
    {Rarity::Common,    "common",    "Common",    "#FFFFFF"},
    {Rarity::Uncommon,  "uncommon",  "Uncommon",  "#1EFF00"},
    {Rarity::Rare,      "rare",      "Rare",      "#0070DD"},
    {Rarity::Heroic,    "heroic",    "Heroic",    "#A335EE"},
    {Rarity::Epic,      "epic",      "Epic",      "#FF8000"},
    {Rarity::Legendary, "legendary", "Legendary", "#E6CC80"},
}};

const RarityInfo& info_for(Rarity r) {
    int index = rarity_rank(r) - 1;
    if (index < 0 || index >= static_cast<int>(k_rarity_table.size())) {
        index = 0;
    }
    return k_rarity_table[static_cast<std::size_t>(index)];
}

std::string to_lower_trimmed(std::string_view text) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && is_space(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && is_space(static_cast<unsigned char>(text[end - 1]))) --end;

    std::string result(text.substr(begin, end - begin));
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // anonymous namespace

// =============================================================================
// Rarity
// =============================================================================

std::optional<Rarity> rarity_from_rank(std::int64_t rank) {
    if (rank < 1 || rank > 6) {
        return std::nullopt;
    }
    return static_cast<Rarity>(rank);
}

Rarity parse_rarity(std::string_view text) {
    const std::string lower = to_lower_trimmed(text);
    for (const auto& info : k_rarity_table) {
        if (lower == info.name) {
            return info.rarity;
        }
    }
    return Rarity::Common;
}

const char* rarity_name(Rarity r) { return info_for(r).name; }

const char* rarity_display_name(Rarity r) { return info_for(r).display; }

const char* rarity_color(Rarity r) { return info_for(r).color; }

const std::array<Rarity, 6>& all_rarities() {
    static const std::array<Rarity, 6> rarities = {
        Rarity::Common, Rarity::Uncommon, Rarity::Rare,
        Rarity::Heroic, Rarity::Epic, Rarity::Legendary
    };
    return rarities;
}

std::vector<std::string> rarity_display_list() {
    std::vector<std::string> names;
    names.reserve(k_rarity_table.size());
    for (const auto& info : k_rarity_table) {
        names.emplace_back(info.display);
    }
    return names;
}

// =============================================================================
// Component Type
// =============================================================================

ComponentType parse_component_type(std::string_view text) {
    return to_lower_trimmed(text) == "basic" ? ComponentType::Basic : ComponentType::Quality;
}

const char* component_type_name(ComponentType type) {
    switch (type) {
        case ComponentType::Basic: return "basic";
        case ComponentType::Quality: return "quality";
        default: return "quality";
    }
}

ComponentType component_type_for_item(const Item& item) {
    if (item.profession.has_value() && !item.profession->empty()) {
        return ComponentType::Quality;
    }

    static const std::array<const char*, 5> basic_markers = {
        "paper", "ink", "thread", "flux", "solvent"
    };

    const std::string type = to_lower_trimmed(item.type);
    for (const char* marker : basic_markers) {
        if (type.find(marker) != std::string::npos) {
            return ComponentType::Basic;
        }
    }
    return ComponentType::Quality;
}

// =============================================================================
// Crafting Result Rules
// =============================================================================

bool can_craft_rarity(const std::vector<Rarity>& component_rarities,
                      Rarity target, std::int32_t /*quality_rating*/) {
    if (component_rarities.empty()) {
        return false;
    }
    return std::all_of(component_rarities.begin(), component_rarities.end(),
                       [target](Rarity r) { return compare_rarity(r, target) >= 0; });
}

Rarity crafting_result_rarity(const std::vector<Rarity>& quality_component_rarities,
                              std::int32_t /*quality_rating*/) {
    if (quality_component_rarities.empty()) {
        return Rarity::Common;
    }
    return *std::min_element(quality_component_rarities.begin(), quality_component_rarities.end(),
                             [](Rarity a, Rarity b) { return compare_rarity(a, b) < 0; });
}

std::string format_with_rarity(std::string_view name, Rarity r,
                               std::optional<std::int64_t> quantity) {
    std::string result;
    if (quantity.has_value()) {
        result += std::to_string(*quantity);
        result += "x ";
    }
    result += rarity_display_name(r);
    result += ' ';
    result += name;
    return result;
}

} // namespace artisan_crafting
