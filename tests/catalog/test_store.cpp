// artisan_catalog store tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <artisan/catalog/store.hpp>

using namespace artisan_catalog;
using artisan_core::ErrorCode;
using artisan_crafting::ComponentType;
using artisan_crafting::Item;
using artisan_crafting::MarketPrice;
using artisan_crafting::Recipe;
using artisan_crafting::RecipeComponent;
using Catch::Approx;

namespace {

using Clock = std::chrono::system_clock;

ArtisanStore open_store() {
    auto store = ArtisanStore::open(":memory:");
    REQUIRE(store.is_ok());
    return std::move(store).value();
}

Item make_item(ItemId id, const std::string& name, std::optional<std::string> profession = std::nullopt,
               Rarity rarity = Rarity::Common) {
    Item item;
    item.id = id;
    item.name = name;
    item.type = "Material";
    item.rarity = rarity;
    item.profession = std::move(profession);
    return item;
}

MarketPrice price_at(double value, Rarity rarity, Clock::time_point when, const std::string& source = "market") {
    MarketPrice p;
    p.price = value;
    p.source = source;
    p.rarity = rarity;
    p.recorded_at = when;
    return p;
}

const Clock::time_point k_now{std::chrono::seconds(1'700'000'000)};

} // anonymous namespace

// =============================================================================
// Schema
// =============================================================================

TEST_CASE("ArtisanStore schema", "[catalog][store]") {
    auto store = open_store();

    SECTION("fresh store is at the current version") {
        auto version = store.schema_version();
        REQUIRE(version.is_ok());
        REQUIRE(*version == k_schema_version);
    }

    SECTION("migrating again is a no-op") {
        REQUIRE(store.migrate().is_ok());
        auto rows = store.database().query_int("SELECT COUNT(*) FROM schema_info");
        REQUIRE(rows.is_ok());
        REQUIRE(*rows == 1);
    }

    SECTION("newer schema is refused") {
        REQUIRE(store.database().execute("INSERT INTO schema_info (version) VALUES (99)").is_ok());
        auto result = store.migrate();
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::IncompatibleVersion);
    }

    SECTION("empty stats") {
        auto stats = store.stats();
        REQUIRE(stats.is_ok());
        REQUIRE(stats->items == 0);
        REQUIRE(stats->recipes == 0);
        REQUIRE(stats->transactions == 0);
    }
}

// =============================================================================
// Items & Recipes
// =============================================================================

TEST_CASE("ArtisanStore items", "[catalog][store]") {
    auto store = open_store();
    REQUIRE(store.upsert_item(make_item(1, "Iron Ingot", "Blacksmith", Rarity::Uncommon)).is_ok());
    REQUIRE(store.upsert_item(make_item(2, "Iron Blade", "Blacksmith")).is_ok());
    REQUIRE(store.upsert_item(make_item(3, "Linen Thread", "Tailor")).is_ok());

    SECTION("get_item") {
        auto item = store.get_item(1);
        REQUIRE(item.is_ok());
        REQUIRE(item->has_value());
        REQUIRE((*item)->name == "Iron Ingot");
        REQUIRE((*item)->rarity == Rarity::Uncommon);
        REQUIRE((*item)->profession == "Blacksmith");

        auto missing = store.get_item(42);
        REQUIRE(missing.is_ok());
        REQUIRE_FALSE(missing->has_value());
    }

    SECTION("upsert updates in place") {
        auto renamed = make_item(1, "Refined Iron Ingot", "Blacksmith");
        REQUIRE(store.upsert_item(renamed).is_ok());
        REQUIRE(store.get_item(1).value()->name == "Refined Iron Ingot");
        REQUIRE(store.stats()->items == 3);
    }

    SECTION("search by name, sorted") {
        auto found = store.search_items("Iron");
        REQUIRE(found.is_ok());
        REQUIRE(found->size() == 2);
        REQUIRE((*found)[0].name == "Iron Blade");
        REQUIRE((*found)[1].name == "Iron Ingot");

        auto tailor = store.search_items("n", std::string("Tailor"));
        REQUIRE(tailor.is_ok());
        REQUIRE(tailor->size() == 1);
        REQUIRE(tailor->front().id == 3);
    }

    SECTION("items by profession") {
        auto smithing = store.items_by_profession("Blacksmith");
        REQUIRE(smithing.is_ok());
        REQUIRE(smithing->size() == 2);
    }

    SECTION("bulk upsert") {
        std::vector<Item> batch{make_item(10, "Paper"), make_item(11, "Ink"), make_item(1, "Iron Ingot")};
        auto written = store.bulk_upsert_items(batch);
        REQUIRE(written.is_ok());
        REQUIRE(*written == 3);
        REQUIRE(store.stats()->items == 5);
    }
}

TEST_CASE("ArtisanStore recipes", "[catalog][store]") {
    auto store = open_store();
    REQUIRE(store.upsert_item(make_item(100, "Iron Blade", "Blacksmith")).is_ok());
    REQUIRE(store.upsert_item(make_item(200, "Iron Ingot")).is_ok());
    REQUIRE(store.upsert_item(make_item(300, "Leather Strap")).is_ok());

    Recipe recipe;
    recipe.output_item_id = 100;
    recipe.profession = "Blacksmith";
    recipe.level_required = 12;
    recipe.base_crafting_fee = 5.0;
    recipe.components.push_back(RecipeComponent{200, 2, ComponentType::Quality, false});
    recipe.components.push_back(RecipeComponent{300, 1, ComponentType::Basic, true});

    auto id = store.upsert_recipe(recipe);
    REQUIRE(id.is_ok());

    SECTION("read back in stored order") {
        auto loaded = store.recipe_for_output(100);
        REQUIRE(loaded.is_ok());
        REQUIRE(loaded->has_value());

        const auto& r = **loaded;
        REQUIRE(r.id == *id);
        REQUIRE(r.profession == "Blacksmith");
        REQUIRE(r.level_required == 12);
        REQUIRE(r.base_crafting_fee == Approx(5.0));
        REQUIRE(r.components.size() == 2);
        REQUIRE(r.components[0].item_id == 200);
        REQUIRE(r.components[0].quantity == 2);
        REQUIRE(r.components[0].type == ComponentType::Quality);
        REQUIRE(r.components[1].type == ComponentType::Basic);
        REQUIRE(r.components[1].optional);
    }

    SECTION("upsert replaces the component list") {
        recipe.base_crafting_fee = 7.5;
        recipe.components.pop_back();
        auto again = store.upsert_recipe(recipe);
        REQUIRE(again.is_ok());
        REQUIRE(*again == *id);

        auto loaded = store.recipe_for_output(100);
        REQUIRE((*loaded)->components.size() == 1);
        REQUIRE((*loaded)->base_crafting_fee == Approx(7.5));
        REQUIRE(store.stats()->recipe_components == 1);
    }

    SECTION("unknown component item violates the foreign key") {
        Recipe bad;
        bad.output_item_id = 200;
        bad.profession = "Smelter";
        bad.components.push_back(RecipeComponent{999, 1, ComponentType::Quality, false});
        auto result = store.upsert_recipe(bad);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ValidationError);

        // Rolled back as a whole
        REQUIRE_FALSE(store.recipe_for_output(200)->has_value());
    }

    SECTION("no recipe") {
        auto none = store.recipe_for_output(300);
        REQUIRE(none.is_ok());
        REQUIRE_FALSE(none->has_value());
    }
}

// =============================================================================
// Inventory
// =============================================================================

TEST_CASE("ArtisanStore inventory", "[catalog][store]") {
    auto store = open_store();
    REQUIRE(store.upsert_item(make_item(200, "Iron Ingot")).is_ok());

    REQUIRE(store.update_inventory(200, Rarity::Rare, "Winstead", 4, 9.5).is_ok());
    REQUIRE(store.update_inventory(200, Rarity::Rare, "Miraleth", 3).is_ok());
    REQUIRE(store.update_inventory(200, Rarity::Common, "Winstead", 10).is_ok());
    REQUIRE(store.update_inventory(200, Rarity::Epic, "Winstead", 0).is_ok());

    SECTION("holdings by node name") {
        auto rare = store.inventory_for(200, Rarity::Rare);
        REQUIRE(rare.is_ok());
        REQUIRE(rare->size() == 2);
        REQUIRE((*rare)[0].node_name == "Miraleth");
        REQUIRE((*rare)[1].node_name == "Winstead");
        REQUIRE((*rare)[1].average_cost.has_value());
        REQUIRE(*(*rare)[1].average_cost == Approx(9.5));
        REQUIRE_FALSE((*rare)[0].average_cost.has_value());
    }

    SECTION("empty holdings are hidden") {
        auto all = store.inventory_for(200);
        REQUIRE(all->size() == 3);
        REQUIRE(store.inventory_by_rarity(Rarity::Epic)->empty());
    }

    SECTION("update overwrites and keeps the average cost") {
        REQUIRE(store.update_inventory(200, Rarity::Rare, "Winstead", 1).is_ok());
        auto rare = store.inventory_for(200, Rarity::Rare);
        REQUIRE((*rare)[1].quantity == 1);
        REQUIRE(*(*rare)[1].average_cost == Approx(9.5));
    }

    SECTION("available rarities ascend") {
        auto rarities = store.available_rarities(200);
        REQUIRE(rarities.is_ok());
        REQUIRE(rarities->size() == 2);
        REQUIRE((*rarities)[0] == Rarity::Common);
        REQUIRE((*rarities)[1] == Rarity::Rare);
    }

    SECTION("negative quantity") {
        auto result = store.update_inventory(200, Rarity::Rare, "Winstead", -1);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::InvalidInput);
    }

    SECTION("unknown item") {
        auto result = store.update_inventory(999, Rarity::Rare, "Winstead", 1);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ValidationError);
    }
}

// =============================================================================
// Market, Transactions & Settings
// =============================================================================

TEST_CASE("ArtisanStore market prices", "[catalog][store]") {
    auto store = open_store();
    REQUIRE(store.upsert_item(make_item(200, "Iron Ingot")).is_ok());

    using std::chrono::hours;
    REQUIRE(store.record_market_price(200, price_at(9.0, Rarity::Rare, k_now - hours(48))).is_ok());
    REQUIRE(store.record_market_price(200, price_at(11.0, Rarity::Rare, k_now - hours(2), "auction")).is_ok());
    REQUIRE(store.record_market_price(200, price_at(40.0, Rarity::Epic, k_now - hours(1))).is_ok());
    REQUIRE(store.record_market_price(200, price_at(7.0, Rarity::Rare, k_now - hours(24 * 20))).is_ok());

    SECTION("most recent first within the window") {
        auto prices = store.recent_market_prices(200, Rarity::Rare, 7, k_now);
        REQUIRE(prices.is_ok());
        REQUIRE(prices->size() == 2);
        REQUIRE((*prices)[0].price == Approx(11.0));
        REQUIRE((*prices)[0].source == "auction");
        REQUIRE((*prices)[1].price == Approx(9.0));
    }

    SECTION("all rarities") {
        auto prices = store.recent_market_prices(200, std::nullopt, 7, k_now);
        REQUIRE(prices->size() == 3);
        REQUIRE((*prices)[0].rarity == Rarity::Epic);
    }

    SECTION("wider window and empty window") {
        REQUIRE(store.recent_market_prices(200, Rarity::Rare, 30, k_now)->size() == 3);
        REQUIRE(store.recent_market_prices(200, Rarity::Rare, 0, k_now)->empty());
    }

    SECTION("negative price") {
        auto result = store.record_market_price(200, price_at(-1.0, Rarity::Rare, k_now));
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::InvalidInput);
    }
}

TEST_CASE("ArtisanStore transactions", "[catalog][store]") {
    auto store = open_store();
    REQUIRE(store.upsert_item(make_item(200, "Iron Ingot")).is_ok());

    TransactionRecord buy;
    buy.type = TransactionType::Buy;
    buy.item_id = 200;
    buy.rarity = Rarity::Rare;
    buy.quantity = 5;
    buy.unit_price = 10.0;
    buy.node_name = "Winstead";
    buy.date = k_now - std::chrono::hours(1);
    REQUIRE(store.record_transaction(buy).is_ok());

    TransactionRecord use;
    use.type = TransactionType::Use;
    use.item_id = 200;
    use.quantity = 2;
    use.date = k_now;
    REQUIRE(store.record_transaction(use).is_ok());

    auto history = store.transactions_for(200);
    REQUIRE(history.is_ok());
    REQUIRE(history->size() == 2);
    REQUIRE((*history)[0].type == TransactionType::Use);
    REQUIRE_FALSE((*history)[0].unit_price.has_value());
    REQUIRE((*history)[1].type == TransactionType::Buy);
    REQUIRE(*(*history)[1].unit_price == Approx(10.0));
    REQUIRE((*history)[1].node_name == "Winstead");

    REQUIRE(std::string(transaction_type_name(TransactionType::Craft)) == "craft");
}

TEST_CASE("ArtisanStore settings", "[catalog][store]") {
    auto store = open_store();

    REQUIRE(store.set_setting("market.period_days", "14").is_ok());
    REQUIRE(store.save_setting("market.period_days", "21").is_ok());
    REQUIRE(store.set_setting(k_last_sync_key, "1700000000").is_ok());

    auto value = store.get_setting("market.period_days");
    REQUIRE(value.is_ok());
    REQUIRE(*value == "21");
    REQUIRE_FALSE(store.get_setting("missing")->has_value());

    auto all = store.load_settings();
    REQUIRE(all.is_ok());
    REQUIRE(all->size() == 1);
    REQUIRE(all->count(k_last_sync_key) == 0);
    REQUIRE(store.stats()->settings == 2);
}

// =============================================================================
// Snapshots
// =============================================================================

TEST_CASE("ArtisanStore snapshot_for", "[catalog][store]") {
    auto store = open_store();
    REQUIRE(store.upsert_item(make_item(100, "Iron Blade", "Blacksmith")).is_ok());
    REQUIRE(store.upsert_item(make_item(200, "Iron Ingot")).is_ok());
    REQUIRE(store.upsert_item(make_item(300, "Unrelated")).is_ok());

    Recipe recipe;
    recipe.output_item_id = 100;
    recipe.profession = "Blacksmith";
    recipe.components.push_back(RecipeComponent{200, 2, ComponentType::Quality, false});
    REQUIRE(store.upsert_recipe(recipe).is_ok());

    using std::chrono::hours;
    REQUIRE(store.record_market_price(200, price_at(10.0, Rarity::Rare, k_now - hours(3))).is_ok());
    REQUIRE(store.record_market_price(200, price_at(12.0, Rarity::Epic, k_now - hours(3))).is_ok());
    REQUIRE(store.record_market_price(200, price_at(5.0, Rarity::Rare, k_now - hours(24 * 10))).is_ok());
    REQUIRE(store.update_inventory(200, Rarity::Rare, "Winstead", 6).is_ok());

    auto snapshot = store.snapshot_for(100, 7, k_now);
    REQUIRE(snapshot.is_ok());
    REQUIRE(snapshot->taken_at() == k_now);
    REQUIRE(snapshot->recipe_count() == 1);
    REQUIRE(snapshot->item_count() == 2);
    REQUIRE_FALSE(snapshot->item(300).has_value());

    REQUIRE(snapshot->recent_prices(200, Rarity::Rare, 7).size() == 1);
    REQUIRE(snapshot->recent_prices(200, Rarity::Epic, 7).size() == 1);
    REQUIRE(snapshot->inventory(200, Rarity::Rare).front().quantity == 6);

    SECTION("output without a recipe") {
        auto bare = store.snapshot_for(300, 7, k_now);
        REQUIRE(bare.is_ok());
        REQUIRE(bare->recipe_count() == 0);
        REQUIRE(bare->item_count() == 1);
    }
}
