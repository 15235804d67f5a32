// artisan_crafting cost aggregation tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <artisan/crafting/crafting.hpp>

using namespace artisan_crafting;
using artisan_core::ErrorCode;
using Catch::Approx;

namespace {

constexpr ItemId k_output = 100;
constexpr ItemId k_component = 200;
constexpr ItemId k_reagent = 300;

const CatalogSnapshot::Clock::time_point k_now{std::chrono::seconds(1'700'000'000)};

Item make_item(ItemId id, const std::string& name, Rarity rarity = Rarity::Common) {
    Item item;
    item.id = id;
    item.name = name;
    item.rarity = rarity;
    return item;
}

MarketPrice make_price(double price, const std::string& source, Rarity rarity,
                       std::chrono::hours age = std::chrono::hours(1)) {
    MarketPrice p;
    p.price = price;
    p.source = source;
    p.rarity = rarity;
    p.recorded_at = k_now - age;
    return p;
}

/// Fee 5, one quality component x2 priced at 10 for Rare
CatalogSnapshot sample_snapshot() {
    CatalogSnapshot snapshot(k_now);
    snapshot.add_item(make_item(k_output, "Iron Blade"));
    snapshot.add_item(make_item(k_component, "Iron Ingot"));

    Recipe recipe;
    recipe.output_item_id = k_output;
    recipe.profession = "Blacksmith";
    recipe.base_crafting_fee = 5.0;
    recipe.components.push_back(RecipeComponent{k_component, 2, ComponentType::Quality, false});
    snapshot.add_recipe(recipe);

    snapshot.add_price(k_component, make_price(10.0, "market", Rarity::Rare));
    return snapshot;
}

CostRequest sample_request() {
    CostRequest request;
    request.output_item_id = k_output;
    request.target_rarity = Rarity::Rare;
    request.quantity = 3;
    request.tax_rate = 0.15;
    return request;
}

} // anonymous namespace

// =============================================================================
// Aggregation
// =============================================================================

TEST_CASE("compute_cost itemizes a priced recipe", "[crafting][cost]") {
    auto snapshot = sample_snapshot();
    auto result = compute_cost(sample_request(), snapshot);
    REQUIRE(result.is_ok());

    const auto& breakdown = result.value();
    REQUIRE(breakdown.output_item_id == k_output);
    REQUIRE(breakdown.quantity == 3);
    REQUIRE(breakdown.components.size() == 1);

    const auto& line = breakdown.components.front();
    REQUIRE(line.name == "Iron Ingot");
    REQUIRE(line.required_rarity == Rarity::Rare);
    REQUIRE(line.quantity_needed == 6);
    REQUIRE(line.unit_price == Approx(10.0));
    REQUIRE(line.price_source == "market_market");
    REQUIRE(line.total_cost == Approx(60.0));
    REQUIRE(line.key == ItemKey(k_component, Rarity::Rare));

    REQUIRE(breakdown.material_cost == Approx(60.0));
    REQUIRE(breakdown.base_fee_total == Approx(15.0));
    REQUIRE(breakdown.tax_amount == Approx(2.25));
    REQUIRE(breakdown.total_cost == Approx(77.25));
    REQUIRE(breakdown.cost_per_unit == Approx(25.75));
    REQUIRE_FALSE(breakdown.has_unpriced_components());
}

TEST_CASE("compute_cost applies overrides", "[crafting][cost]") {
    auto snapshot = sample_snapshot();
    auto request = sample_request();
    request.overrides[ItemKey(k_component, Rarity::Rare).encode()] = 7.0;

    auto result = compute_cost(request, snapshot);
    REQUIRE(result.is_ok());
    REQUIRE(result->components.front().price_source == "custom");
    REQUIRE(result->components.front().source_kind == PriceSource::Custom);
    REQUIRE(result->material_cost == Approx(42.0));
    REQUIRE(result->total_cost == Approx(59.25));
}

TEST_CASE("compute_cost keeps unpriced components", "[crafting][cost]") {
    auto snapshot = sample_snapshot();
    auto request = sample_request();
    request.target_rarity = Rarity::Epic;

    auto result = compute_cost(request, snapshot);
    REQUIRE(result.is_ok());
    REQUIRE(result->components.size() == 1);
    REQUIRE(result->components.front().unit_price == 0.0);
    REQUIRE(result->components.front().price_source == "no_data");
    REQUIRE(result->material_cost == 0.0);
    REQUIRE(result->total_cost == Approx(17.25));
    REQUIRE(result->unpriced_count() == 1);
}

TEST_CASE("compute_cost required rarity follows component type", "[crafting][cost]") {
    CatalogSnapshot snapshot(k_now);
    snapshot.add_item(make_item(k_output, "Tome"));
    snapshot.add_item(make_item(k_component, "Vellum", Rarity::Uncommon));
    snapshot.add_item(make_item(k_reagent, "Ink"));

    Recipe recipe;
    recipe.output_item_id = k_output;
    recipe.components.push_back(RecipeComponent{k_component, 1, ComponentType::Basic, false});
    recipe.components.push_back(RecipeComponent{k_reagent, 4, ComponentType::Quality, false});
    snapshot.add_recipe(recipe);

    snapshot.add_price(k_component, make_price(3.0, "vendor", Rarity::Uncommon));
    snapshot.add_price(k_reagent, make_price(2.5, "auction", Rarity::Heroic));

    CostRequest request;
    request.output_item_id = k_output;
    request.target_rarity = Rarity::Heroic;
    request.quantity = 2;

    auto result = compute_cost(request, snapshot);
    REQUIRE(result.is_ok());
    REQUIRE(result->components.size() == 2);

    SECTION("basic component keeps its base rarity") {
        const auto& basic = result->components[0];
        REQUIRE(basic.required_rarity == Rarity::Uncommon);
        REQUIRE(basic.price_source == "market_vendor");
        REQUIRE(basic.total_cost == Approx(6.0));
    }

    SECTION("quality component uses the target rarity") {
        const auto& quality = result->components[1];
        REQUIRE(quality.required_rarity == Rarity::Heroic);
        REQUIRE(quality.quantity_needed == 8);
        REQUIRE(quality.total_cost == Approx(20.0));
    }

    SECTION("totals") {
        REQUIRE(result->material_cost == Approx(26.0));
        REQUIRE(result->base_fee_total == 0.0);
        REQUIRE(result->tax_amount == 0.0);
        REQUIRE(result->cost_per_unit == Approx(13.0));
    }
}

TEST_CASE("compute_cost ignores prices outside the lookback window", "[crafting][cost]") {
    auto snapshot = sample_snapshot();
    snapshot.add_price(k_component, make_price(99.0, "auction", Rarity::Epic, std::chrono::hours(24 * 10)));

    auto request = sample_request();
    request.target_rarity = Rarity::Epic;
    request.lookback_days = 7;

    auto result = compute_cost(request, snapshot);
    REQUIRE(result.is_ok());
    REQUIRE(result->components.front().price_source == "no_data");

    request.lookback_days = 14;
    auto wider = compute_cost(request, snapshot);
    REQUIRE(wider.is_ok());
    REQUIRE(wider->components.front().unit_price == Approx(99.0));
}

TEST_CASE("compute_cost uses the most recent observation", "[crafting][cost]") {
    auto snapshot = sample_snapshot();
    snapshot.add_price(k_component, make_price(12.0, "auction", Rarity::Rare, std::chrono::hours(0)));

    auto result = compute_cost(sample_request(), snapshot);
    REQUIRE(result.is_ok());
    REQUIRE(result->components.front().unit_price == Approx(12.0));
    REQUIRE(result->components.front().price_source == "market_auction");
}

// =============================================================================
// Failures
// =============================================================================

TEST_CASE("compute_cost reports missing catalog data", "[crafting][cost]") {
    SECTION("no recipe") {
        CatalogSnapshot snapshot(k_now);
        auto result = compute_cost(sample_request(), snapshot);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::NotFound);
        REQUIRE(result.error().is<artisan_core::CraftingError>());
    }

    SECTION("empty recipe") {
        auto result = compute_cost(sample_request(), Recipe{}, nullptr, nullptr);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::NotFound);
    }

    SECTION("component missing from the catalog") {
        CatalogSnapshot snapshot(k_now);
        Recipe recipe;
        recipe.output_item_id = k_output;
        recipe.components.push_back(RecipeComponent{k_reagent, 1, ComponentType::Quality, false});
        snapshot.add_recipe(recipe);

        auto result = compute_cost(sample_request(), snapshot);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::NotFound);
        const auto* context = result.error().get_context("output_item_id");
        REQUIRE(context != nullptr);
        REQUIRE(*context == "100");
    }
}

TEST_CASE("compute_cost validates the request", "[crafting][cost]") {
    auto snapshot = sample_snapshot();
    auto request = sample_request();

    SECTION("quantity below one") {
        request.quantity = 0;
        auto result = compute_cost(request, snapshot);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::InvalidInput);
        REQUIRE(result.error().as<artisan_core::CraftingError>()->kind ==
                artisan_core::CraftingError::Kind::InvalidQuantity);
    }

    SECTION("tax rate out of range") {
        request.tax_rate = 1.5;
        REQUIRE(compute_cost(request, snapshot).error().code() == ErrorCode::InvalidInput);
        request.tax_rate = -0.01;
        REQUIRE(compute_cost(request, snapshot).error().code() == ErrorCode::InvalidInput);
    }

    SECTION("tax rate bounds are inclusive") {
        request.tax_rate = 1.0;
        auto result = compute_cost(request, snapshot);
        REQUIRE(result.is_ok());
        REQUIRE(result->tax_amount == Approx(15.0));
    }

    SECTION("negative quality rating") {
        request.quality_rating = -1;
        REQUIRE(compute_cost(request, snapshot).error().code() == ErrorCode::InvalidInput);
    }

    SECTION("quality rating has no effect") {
        request.quality_rating = 400;
        auto result = compute_cost(request, snapshot);
        REQUIRE(result.is_ok());
        REQUIRE(result->total_cost == Approx(77.25));
        REQUIRE(result->quality_rating == 400);
    }

    SECTION("malformed override key") {
        request.overrides["200-3"] = 7.0;
        auto result = compute_cost(request, snapshot);
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<artisan_core::CraftingError>()->kind ==
                artisan_core::CraftingError::Kind::InvalidOverride);
    }

    SECTION("negative override price") {
        request.overrides["200_3"] = -1.0;
        REQUIRE(compute_cost(request, snapshot).error().code() == ErrorCode::InvalidInput);
    }

    SECTION("bad input is reported ahead of a missing recipe") {
        CatalogSnapshot empty(k_now);
        request.quantity = 0;
        REQUIRE(compute_cost(request, empty).error().code() == ErrorCode::InvalidInput);
    }
}

TEST_CASE("validate_request decodes overrides", "[crafting][cost]") {
    CostRequest request;
    request.overrides["200_3"] = 7.0;
    request.overrides["201_1"] = 0.0;

    auto overrides = validate_request(request);
    REQUIRE(overrides.is_ok());
    REQUIRE(overrides->size() == 2);
    REQUIRE(overrides->at(ItemKey(200, Rarity::Rare)) == 7.0);
    REQUIRE(overrides->at(ItemKey(201, Rarity::Common)) == 0.0);
}

TEST_CASE("compute_cost scales linearly with quantity", "[crafting][cost]") {
    auto snapshot = sample_snapshot();
    auto request = sample_request();

    request.quantity = 1;
    auto single = compute_cost(request, snapshot);
    REQUIRE(single.is_ok());

    double previous_total = 0.0;
    for (std::int32_t quantity = 1; quantity <= 50; ++quantity) {
        request.quantity = quantity;
        auto result = compute_cost(request, snapshot);
        REQUIRE(result.is_ok());
        REQUIRE(result->total_cost >= previous_total);
        REQUIRE(result->cost_per_unit == Approx(single->cost_per_unit));
        previous_total = result->total_cost;
    }
}
