// mcv_core Error and Result tests

#include <catch2/catch_test_macros.hpp>
#include <mcvillage/core/error.hpp>
#include <string>

using namespace mcv_core;

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
        Error err(ErrorCode::InvalidArgument, "Bad argument");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
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
    SECTION("GridError::missing_template") {
        Error err = GridError::missing_template("Farm");
        REQUIRE(err.code() == ErrorCode::MissingTemplate);
        REQUIRE(err.is<GridError>());
        REQUIRE(err.as<GridError>()->generator == "Farm");
        REQUIRE(err.message().find("Farm") != std::string::npos);
    }

    SECTION("GridError::no_enabled_types") {
        Error err = GridError::no_enabled_types("Garden");
        REQUIRE(err.code() == ErrorCode::NoEnabledTypes);
    }

    SECTION("GridError::invalid_spec") {
        Error err = GridError::invalid_spec("Garden", "spacing must be positive");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.message().find("spacing") != std::string::npos);
    }

    SECTION("TeleportError kinds") {
        REQUIRE(Error(TeleportError::no_destination("ChestA", "teleChest")).code() == ErrorCode::NoDestination);
        REQUIRE(Error(TeleportError::no_actor("ChestA")).code() == ErrorCode::NoActor);
        REQUIRE(Error(TeleportError::missing_node("ChestA", "TeleportVolume")).code() == ErrorCode::NotFound);
    }

    SECTION("ConfigError kinds") {
        REQUIRE(Error(ConfigError::file_not_found("x.json")).code() == ErrorCode::IOError);
        REQUIRE(Error(ConfigError::malformed("x.json", "eof")).code() == ErrorCode::ParseError);
        REQUIRE(Error(ConfigError::wrong_type("spacing", "a number")).code() == ErrorCode::ParseError);
        REQUIRE(Error(ConfigError::unknown_reference("template", "Wheat")).code() == ErrorCode::NotFound);
    }
}

TEST_CASE("build_error_chain", "[core][error]") {
    Error err = GridError::missing_template("Farm");
    err.with_context("owner", "Farm");

    std::string chain = build_error_chain(err);
    REQUIRE(chain.find("[MissingTemplate]") == 0);
    REQUIRE(chain.find("[GridError]") != std::string::npos);
    REQUIRE(chain.find("(generator: Farm)") != std::string::npos);
    REQUIRE(chain.find("{owner=Farm}") != std::string::npos);
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
        REQUIRE(*r == 42);
    }

    SECTION("Ok void") {
        Result<void> r = Ok();
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
    }

    SECTION("Err with message") {
        Result<int> r = Err<int>(Error("Something went wrong"));
        REQUIRE(r.is_err());
        REQUIRE(r.error().message() == "Something went wrong");
        REQUIRE(r.value_or(7) == 7);
    }

    SECTION("Err from kind") {
        Result<void> r = Err(GridError::no_enabled_types("Garden"));
        REQUIRE_FALSE(r);
        REQUIRE(r.error().code() == ErrorCode::NoEnabledTypes);
    }
}

TEST_CASE("Result and_then", "[core][result]") {
    Result<int> r = Ok(20);
    auto doubled = r.and_then([](int v) { return Ok(v * 2); });
    REQUIRE(doubled.value() == 40);

    Result<int> failed = Err<int>(Error("nope"));
    auto chained = failed.and_then([](int v) { return Ok(v * 2); });
    REQUIRE(chained.is_err());
    REQUIRE(chained.error().message() == "nope");
}
