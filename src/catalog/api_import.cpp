/// @file api_import.cpp
/// @brief Item page decoding and directory import

#include <artisan/catalog/api_import.hpp>
#include <artisan/catalog/store.hpp>
#include <artisan/core/log.hpp>
#include <artisan/crafting/rarity.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iterator>
#include <limits>
#include <optional>
#include <sstream>

namespace artisan_catalog {

using artisan_core::Err;
using artisan_core::ImportError;
using artisan_core::Ok;
using artisan_core::Result;
using artisan_crafting::Item;
using artisan_crafting::ItemId;
using artisan_crafting::Recipe;
using artisan_crafting::RecipeComponent;

namespace {

// =============================================================================
// Field Helpers
// =============================================================================

/// Integer from a number or a numeric string
std::optional<std::int64_t> json_int(const nlohmann::json& j) {
    if (j.is_number_unsigned()) {
        const auto u = j.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(u);
    }
    if (j.is_number_integer()) {
        return j.get<std::int64_t>();
    }
    if (j.is_number_float()) {
        // [-2^63, 2^63) is exactly representable at both ends; NaN fails both tests
        const double d = j.get<double>();
        if (!(d >= -9223372036854775808.0 && d < 9223372036854775808.0)) {
            return std::nullopt;
        }
        const auto i = static_cast<std::int64_t>(d);
        if (static_cast<double>(i) != d) {
            return std::nullopt;
        }
        return i;
    }
    if (j.is_string()) {
        const auto& text = j.get_ref<const std::string&>();
        if (text.empty()) return std::nullopt;
        std::size_t consumed = 0;
        try {
            std::int64_t value = std::stoll(text, &consumed);
            if (consumed == text.size()) {
                return value;
            }
        } catch (const std::logic_error&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

/// Integer that fits in 32 bits
std::optional<std::int32_t> json_int32(const nlohmann::json& j) {
    auto value = json_int(j);
    if (!value || *value < std::numeric_limits<std::int32_t>::min() ||
        *value > std::numeric_limits<std::int32_t>::max()) {
        return std::nullopt;
    }
    return static_cast<std::int32_t>(*value);
}

std::optional<double> json_number(const nlohmann::json& j) {
    if (j.is_number()) {
        return j.get<double>();
    }
    if (auto i = json_int(j)) {
        return static_cast<double>(*i);
    }
    return std::nullopt;
}

/// First present, non-null member among @p keys
const nlohmann::json* find_field(const nlohmann::json& obj, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = obj.find(key);
        if (it != obj.end() && !it->is_null()) {
            return &*it;
        }
    }
    return nullptr;
}

std::string string_field(const nlohmann::json& obj, std::initializer_list<const char*> keys) {
    const auto* field = find_field(obj, keys);
    if (field && field->is_string()) {
        return field->get<std::string>();
    }
    return {};
}

artisan_crafting::Rarity rarity_field(const nlohmann::json& obj) {
    const auto* field = find_field(obj, {"rarity"});
    if (!field) {
        return artisan_crafting::Rarity::Common;
    }
    if (field->is_string()) {
        return artisan_crafting::parse_rarity(field->get<std::string>());
    }
    if (auto rank = json_int(*field)) {
        return artisan_crafting::rarity_from_rank(*rank).value_or(artisan_crafting::Rarity::Common);
    }
    return artisan_crafting::Rarity::Common;
}

// =============================================================================
// Entry Decoding
// =============================================================================

std::optional<RecipeComponent> parse_component(const nlohmann::json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }

    const auto* id_field = find_field(j, {"item_id", "id"});
    auto id = id_field ? json_int(*id_field) : std::nullopt;
    if (!id || *id <= 0) {
        return std::nullopt;
    }

    RecipeComponent component;
    component.item_id = static_cast<ItemId>(*id);

    if (const auto* qty = find_field(j, {"quantity", "qty"})) {
        auto value = json_int32(*qty);
        if (!value || *value < 1) {
            return std::nullopt;
        }
        component.quantity = *value;
    }

    auto type = string_field(j, {"component_type", "type"});
    if (!type.empty()) {
        component.type = artisan_crafting::parse_component_type(type);
    }

    if (const auto* optional = find_field(j, {"optional"}); optional && optional->is_boolean()) {
        component.optional = optional->get<bool>();
    }
    return component;
}

std::optional<Recipe> parse_recipe(const nlohmann::json& j, const Item& output) {
    if (!j.is_object()) {
        return std::nullopt;
    }

    Recipe recipe;
    recipe.output_item_id = output.id;
    recipe.profession = string_field(j, {"profession"});
    if (recipe.profession.empty() && output.profession) {
        recipe.profession = *output.profession;
    }
    if (recipe.profession.empty()) {
        return std::nullopt;
    }

    if (const auto* level = find_field(j, {"level", "level_required"})) {
        recipe.level_required = json_int32(*level).value_or(1);
    }
    if (const auto* fee = find_field(j, {"base_crafting_fee", "fee"})) {
        auto value = json_number(*fee);
        if (!value || *value < 0.0) {
            return std::nullopt;
        }
        recipe.base_crafting_fee = *value;
    }

    const auto* components = find_field(j, {"components"});
    if (!components || !components->is_array()) {
        return std::nullopt;
    }
    for (const auto& entry : *components) {
        auto component = parse_component(entry);
        if (!component) {
            return std::nullopt;
        }
        auto duplicate = std::find_if(recipe.components.begin(), recipe.components.end(),
                                      [&](const RecipeComponent& c) { return c.item_id == component->item_id; });
        if (duplicate != recipe.components.end()) {
            if (duplicate->quantity > std::numeric_limits<std::int32_t>::max() - component->quantity) {
                return std::nullopt;
            }
            duplicate->quantity += component->quantity;
            continue;
        }
        recipe.components.push_back(*component);
    }

    if (recipe.components.empty()) {
        return std::nullopt;
    }
    return recipe;
}

std::optional<Item> parse_item(const nlohmann::json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }

    const auto* id_field = find_field(j, {"id", "item_id"});
    auto id = id_field ? json_int(*id_field) : std::nullopt;
    if (!id || *id <= 0) {
        return std::nullopt;
    }

    auto name = string_field(j, {"name"});
    if (name.empty()) {
        return std::nullopt;
    }

    Item item;
    item.id = static_cast<ItemId>(*id);
    item.name = std::move(name);
    item.type = string_field(j, {"type", "item_type"});
    item.rarity = rarity_field(j);
    if (const auto* level = find_field(j, {"level"})) {
        item.level = json_int32(*level).value_or(1);
    }
    auto profession = string_field(j, {"profession"});
    if (!profession.empty()) {
        item.profession = std::move(profession);
    }
    item.description = string_field(j, {"description"});
    item.icon_url = string_field(j, {"icon", "icon_url"});
    return item;
}

std::int32_t page_number(const nlohmann::json& doc, std::initializer_list<const char*> keys, std::int32_t fallback) {
    const nlohmann::json* containers[] = {&doc, nullptr, nullptr};
    if (auto it = doc.find("meta"); it != doc.end() && it->is_object()) containers[1] = &*it;
    if (auto it = doc.find("pagination"); it != doc.end() && it->is_object()) containers[2] = &*it;

    for (const auto* container : containers) {
        if (!container) continue;
        if (const auto* field = find_field(*container, keys)) {
            if (auto value = json_int32(*field); value && *value > 0) {
                return *value;
            }
        }
    }
    return fallback;
}

Result<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Err<std::string>(ImportError::read_failed(path.string()));
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return Err<std::string>(ImportError::read_failed(path.string()));
    }
    return Ok(buffer.str());
}

} // anonymous namespace

// =============================================================================
// parse_items_page
// =============================================================================

Result<ItemsPage> parse_items_page(const std::string& json_text) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        return Err<ItemsPage>(ImportError::invalid_document(e.what()));
    }

    const nlohmann::json* entries = nullptr;
    if (doc.is_array()) {
        entries = &doc;
    } else if (doc.is_object()) {
        entries = find_field(doc, {"data", "items"});
        if (!entries) {
            return Err<ItemsPage>(ImportError::invalid_document("no 'data' or 'items' array"));
        }
        if (!entries->is_array()) {
            return Err<ItemsPage>(ImportError::invalid_field(doc.contains("data") ? "data" : "items", "an array"));
        }
    } else {
        return Err<ItemsPage>(ImportError::invalid_document("expected an object or an array"));
    }

    ItemsPage page;
    if (doc.is_object()) {
        page.page = page_number(doc, {"page", "current_page"}, 1);
        page.total_pages = std::max(page.page, page_number(doc, {"total_pages", "last_page", "pages"}, page.page));
    }

    for (const auto& entry : *entries) {
        auto item = parse_item(entry);
        if (!item) {
            ++page.skipped;
            continue;
        }

        if (const auto* recipe_json = find_field(entry, {"recipe"})) {
            auto recipe = parse_recipe(*recipe_json, *item);
            if (recipe) {
                page.recipes.push_back(std::move(*recipe));
            } else {
                ++page.skipped;
            }
        }
        page.items.push_back(std::move(*item));
    }

    artisan_core::catalog_logger()->debug("Parsed page {}/{}: {} items, {} recipes, {} skipped",
                                          page.page, page.total_pages, page.items.size(),
                                          page.recipes.size(), page.skipped);
    return Ok(std::move(page));
}

// =============================================================================
// import_pages
// =============================================================================

Result<ImportSummary> import_pages(const std::filesystem::path& directory, ArtisanStore& store) {
    auto logger = artisan_core::catalog_logger();

    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        return Err<ImportSummary>(ImportError::read_failed(directory.string()));
    }

    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(directory, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") {
            files.push_back(entry.path());
        }
    }
    if (ec) {
        return Err<ImportSummary>(ImportError::read_failed(directory.string()));
    }
    std::sort(files.begin(), files.end(), [](const auto& a, const auto& b) {
        return a.filename().string() < b.filename().string();
    });

    ImportSummary summary;
    std::vector<Item> items;
    std::vector<Recipe> recipes;

    for (const auto& file : files) {
        auto text = read_file(file);
        if (!text) {
            return Err<ImportSummary>(std::move(text.error()));
        }

        auto page = parse_items_page(*text);
        if (!page) {
            return Err<ImportSummary>(std::move(page.error().with_context("file", file.filename().string())));
        }

        ++summary.pages;
        summary.skipped += page->skipped;
        std::move(page->items.begin(), page->items.end(), std::back_inserter(items));
        std::move(page->recipes.begin(), page->recipes.end(), std::back_inserter(recipes));
    }

    auto written = store.bulk_upsert_items(items);
    if (!written) {
        return Err<ImportSummary>(std::move(written.error()));
    }
    summary.items = *written;

    for (const auto& recipe : recipes) {
        bool resolvable = true;
        for (const auto& component : recipe.components) {
            auto known = store.get_item(component.item_id);
            if (!known) {
                return Err<ImportSummary>(std::move(known.error()));
            }
            if (!*known) {
                logger->warn("Skipping recipe for item {}: component {} is not in the catalog",
                             recipe.output_item_id, component.item_id);
                resolvable = false;
                break;
            }
        }
        if (!resolvable) {
            ++summary.skipped;
            continue;
        }

        auto stored = store.upsert_recipe(recipe);
        if (!stored) {
            return Err<ImportSummary>(std::move(stored.error()));
        }
        ++summary.recipes;
    }

    const auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    if (auto r = store.set_setting(k_last_sync_key, std::to_string(now)); !r) {
        return Err<ImportSummary>(std::move(r.error()));
    }

    logger->info("Imported {} pages: {} items, {} recipes, {} skipped",
                 summary.pages, summary.items, summary.recipes, summary.skipped);
    return Ok(summary);
}

} // namespace artisan_catalog
