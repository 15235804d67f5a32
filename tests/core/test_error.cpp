// artisan_core Error and Result tests

#include <catch2/catch_test_macros.hpp>
#include <artisan/core/error.hpp>
#include <string>
#include <vector>

using namespace artisan_core;

// =============================================================================
// Error Tests
// =============================================================================

TEST_CASE("Error construction", "[core][error]") {
    SECTION("from string") {
        Error err("Test error");
        REQUIRE(err.message() == "Test error");
        REQUIRE(err.code() == ErrorCode::Unknown);
    }

    SECTION("from code and message") {
        Error err(ErrorCode::InvalidInput, "Bad argument");
        REQUIRE(err.code() == ErrorCode::InvalidInput);
        REQUIRE(err.message() == "Bad argument");
    }

    SECTION("with context") {
        Error err = Error("Base error").with_context("key", "value");
        auto* ctx = err.get_context("key");
        REQUIRE(ctx != nullptr);
        REQUIRE(*ctx == "value");
        REQUIRE(err.get_context("missing") == nullptr);
    }
}

TEST_CASE("Error factory methods", "[core][error]") {
    SECTION("CraftingError::recipe_not_found") {
        Error err = CraftingError::recipe_not_found(1042);
        REQUIRE(err.code() == ErrorCode::NotFound);
        REQUIRE(err.is<CraftingError>());
        REQUIRE(err.as<CraftingError>()->kind == CraftingError::Kind::RecipeNotFound);
        REQUIRE(err.message().find("1042") != std::string::npos);
    }

    SECTION("CraftingError::item_not_found") {
        Error err = CraftingError::item_not_found(7);
        REQUIRE(err.code() == ErrorCode::NotFound);
    }

    SECTION("CraftingError input kinds") {
        REQUIRE(Error(CraftingError::invalid_quantity(0)).code() == ErrorCode::InvalidInput);
        REQUIRE(Error(CraftingError::invalid_tax_rate(1.5)).code() == ErrorCode::InvalidInput);
        REQUIRE(Error(CraftingError::invalid_override("x", "bad")).code() == ErrorCode::InvalidInput);
        REQUIRE(Error(CraftingError::invalid_quality(-1)).code() == ErrorCode::InvalidInput);
    }

    SECTION("StorageError kinds") {
        REQUIRE(Error(StorageError::open_failed("a.db", "denied")).code() == ErrorCode::IOError);
        REQUIRE(Error(StorageError::query_failed("SELECT", "syntax")).code() == ErrorCode::IOError);
        REQUIRE(Error(StorageError::constraint("INSERT", "unique")).code() == ErrorCode::ValidationError);
        REQUIRE(Error(StorageError::not_found("item 1")).code() == ErrorCode::NotFound);
        REQUIRE(Error(StorageError::migration_failed(2, "x")).code() == ErrorCode::IncompatibleVersion);
    }

    SECTION("ImportError kinds") {
        REQUIRE(Error(ImportError::invalid_document("eof")).code() == ErrorCode::ParseError);
        REQUIRE(Error(ImportError::missing_field("id")).code() == ErrorCode::ValidationError);
        REQUIRE(Error(ImportError::invalid_field("data", "an array")).code() == ErrorCode::ValidationError);
        REQUIRE(Error(ImportError::read_failed("p.json")).code() == ErrorCode::IOError);
    }

    SECTION("ConfigError kinds") {
        REQUIRE(Error(ConfigError::file_not_found("a.json")).code() == ErrorCode::NotFound);
        REQUIRE(Error(ConfigError::parse_failed("a.json", "eof")).code() == ErrorCode::ParseError);
        REQUIRE(Error(ConfigError::unknown_key("x.y")).code() == ErrorCode::NotFound);
        REQUIRE(Error(ConfigError::invalid_value("x.y", "range")).code() == ErrorCode::InvalidInput);
        REQUIRE(Error(ConfigError::write_failed("a.json")).code() == ErrorCode::IOError);
    }
}

TEST_CASE("Error chain formatting", "[core][error]") {
    Error err = StorageError::query_failed("SELECT * FROM nowhere", "no such table");
    err.with_context("item_id", "12");

    const std::string chain = build_error_chain(err);
    REQUIRE(chain.find("[IOError]") != std::string::npos);
    REQUIRE(chain.find("no such table") != std::string::npos);
    REQUIRE(chain.find("SELECT * FROM nowhere") != std::string::npos);
    REQUIRE(chain.find("{item_id=12}") != std::string::npos);
}

// =============================================================================
// Result<T> Tests
// =============================================================================

TEST_CASE("Result construction", "[core][result]") {
    SECTION("Ok with value") {
        Result<int> r = Ok(42);
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
        REQUIRE(r.value() == 42);
    }

    SECTION("Ok void") {
        Result<void> r = Ok();
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
    }

    SECTION("Err with message") {
        Result<int> r = Err<int>(Error("Something failed"));
        REQUIRE(r.is_err());
        REQUIRE(r.error().message() == "Something failed");
    }

    SECTION("Err with typed error") {
        Result<void> r = Err(CraftingError::recipe_not_found(3));
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::NotFound);
    }
}

TEST_CASE("Result value access", "[core][result]") {
    SECTION("value_or on Ok") {
        Result<int> r = Ok(42);
        REQUIRE(r.value_or(0) == 42);
    }

    SECTION("value_or on Err") {
        Result<int> r = Err<int>(Error("error"));
        REQUIRE(r.value_or(0) == 0);
    }

    SECTION("unwrap on Ok") {
        Result<int> r = Ok(42);
        REQUIRE(r.unwrap() == 42);
    }

    SECTION("unwrap on Err throws") {
        Result<int> r = Err<int>(Error("error"));
        REQUIRE_THROWS_AS(r.unwrap(), std::runtime_error);
    }

    SECTION("move value out") {
        Result<std::string> r = Ok(std::string("hello"));
        std::string s = std::move(r).value();
        REQUIRE(s == "hello");
    }
}

TEST_CASE("Result map operations", "[core][result]") {
    SECTION("map on Ok") {
        Result<int> r = Ok(21);
        auto r2 = r.map([](int x) { return x * 2; });
        REQUIRE(r2.is_ok());
        REQUIRE(r2.value() == 42);
    }

    SECTION("map on Err keeps the error") {
        Result<int> r = Err<int>(Error(ErrorCode::ParseError, "bad"));
        auto r2 = r.map([](int x) { return x * 2; });
        REQUIRE(r2.is_err());
        REQUIRE(r2.error().code() == ErrorCode::ParseError);
    }

    SECTION("and_then on Ok") {
        Result<int> r = Ok(42);
        auto r2 = r.and_then([](int x) -> Result<std::string> {
            return Ok(std::to_string(x));
        });
        REQUIRE(r2.is_ok());
        REQUIRE(r2.value() == "42");
    }

    SECTION("and_then on Err") {
        Result<int> r = Err<int>(Error("error"));
        auto r2 = r.and_then([](int x) -> Result<std::string> {
            return Ok(std::to_string(x));
        });
        REQUIRE(r2.is_err());
    }
}

TEST_CASE("Result with complex types", "[core][result]") {
    Result<std::vector<int>> r = Ok(std::vector<int>{1, 2, 3});
    REQUIRE(r.is_ok());
    REQUIRE(r->size() == 3);
    REQUIRE(static_cast<bool>(r));
}
