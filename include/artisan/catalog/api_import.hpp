/// @file api_import.hpp
/// @brief Import of saved item pages from the game API

#pragma once

#include <artisan/core/error.hpp>
#include <artisan/crafting/types.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace artisan_catalog {

class ArtisanStore;

// =============================================================================
// Page Parsing
// =============================================================================

/// One decoded items page
struct ItemsPage {
    std::vector<artisan_crafting::Item> items;
    std::vector<artisan_crafting::Recipe> recipes;
    std::int32_t page{1};
    std::int32_t total_pages{1};
    std::size_t skipped{0};                         ///< Malformed entries dropped
};

/// @brief Decode one page document
///
/// Accepts an object with a "data" or "items" array, or a bare array. Entries
/// that are not objects or lack a usable id or name are skipped and counted;
/// a document that is not JSON or has no item array is a ParseError.
[[nodiscard]] artisan_core::Result<ItemsPage> parse_items_page(const std::string& json_text);

// =============================================================================
// Directory Import
// =============================================================================

struct ImportSummary {
    std::size_t pages{0};
    std::size_t items{0};
    std::size_t recipes{0};
    std::size_t skipped{0};                         ///< Malformed entries and unresolvable recipes
};

/// @brief Import every *.json page in @p directory, in file name order
///
/// Items of all pages are written before any recipe, so recipes may refer to
/// components from later pages. A recipe whose items are unknown is skipped.
/// Records the import time under k_last_sync_key.
[[nodiscard]] artisan_core::Result<ImportSummary> import_pages(const std::filesystem::path& directory,
                                                               ArtisanStore& store);

} // namespace artisan_catalog
