// slate_core Error and Result tests

#include <catch2/catch_test_macros.hpp>
#include <slate/core/error.hpp>
#include <string>
#include <vector>

using namespace slate_core;

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

TEST_CASE("ContentError factory methods", "[core][error]") {
    SECTION("grammar errors map to ParseError") {
        Error err = ContentError::invalid_header("text name=a]");
        REQUIRE(err.code() == ErrorCode::ParseError);
        REQUIRE(err.is<ContentError>());
        REQUIRE(err.as<ContentError>()->context == "text name=a]");
    }

    SECTION("missing name") {
        Error err = ContentError::missing_name("text[x=1]:");
        REQUIRE(err.code() == ErrorCode::ParseError);
        REQUIRE(err.message().find("name=") != std::string::npos);
    }

    SECTION("legacy camera params name the offending keys") {
        Error err = ContentError::legacy_camera_params({"cx", "cy", "zoom"});
        REQUIRE(err.code() == ErrorCode::ValidationError);
        REQUIRE(err.message().find("Legacy view camera params") != std::string::npos);
        REQUIRE(err.message().find("cx, cy, zoom") != std::string::npos);
    }

    SECTION("unknown refView lists known views") {
        Error err = ContentError::unknown_ref_view("nope", {"home", "v2"});
        REQUIRE(err.message().find("nope") != std::string::npos);
        REQUIRE(err.message().find("[home, v2]") != std::string::npos);
    }

    SECTION("missing file maps to NotFound") {
        Error err = ContentError::missing_file("deck/geometries.csv");
        REQUIRE(err.code() == ErrorCode::NotFound);
        REQUIRE(err.as<ContentError>()->source == "deck/geometries.csv");
    }

    SECTION("io failure maps to IOError") {
        Error err = ContentError::io_failure("deck/x", "denied");
        REQUIRE(err.code() == ErrorCode::IOError);
    }

    SECTION("unsupported node maps to NotSupported") {
        Error err = ContentError::unsupported_node("n1", "hologram");
        REQUIRE(err.code() == ErrorCode::NotSupported);
        REQUIRE(err.message().find("hologram") != std::string::npos);
    }
}

TEST_CASE("ContentError location", "[core][error]") {
    ContentError err = ContentError::outside_view("text[name=a]:");
    err.at("deck/presentation.pr", 7);
    REQUIRE(err.source == "deck/presentation.pr");
    REQUIRE(err.line == 7);

    std::string chain = build_error_chain(Error(err));
    REQUIRE(chain.find("[ParseError]") != std::string::npos);
    REQUIRE(chain.find("ContentError:Grammar") != std::string::npos);
    REQUIRE(chain.find("deck/presentation.pr:7") != std::string::npos);
}

TEST_CASE("Error chain includes context", "[core][error]") {
    Error err(ErrorCode::IOError, "write failed");
    err.with_context("file", "geometries.csv");
    std::string chain = build_error_chain(err);
    REQUIRE(chain.find("[IOError] write failed") != std::string::npos);
    REQUIRE(chain.find("file: geometries.csv") != std::string::npos);
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
        REQUIRE_FALSE(r.is_ok());
        REQUIRE(r.error().message() == "Something failed");
    }

    SECTION("Err with content error") {
        Result<int> r = Err<int>(ContentError::missing_loc("v2"));
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::ValidationError);
    }
}

TEST_CASE("Result value access", "[core][result]") {
    SECTION("value on Ok") {
        Result<std::string> r = Ok(std::string("hello"));
        REQUIRE(r.value() == "hello");
    }

    SECTION("value_or on Err") {
        Result<int> r = Err<int>(Error("error"));
        REQUIRE(r.value_or(0) == 0);
    }

    SECTION("unwrap on Err throws") {
        Result<int> r = Err<int>(Error("error"));
        REQUIRE_THROWS(static_cast<void>(r.unwrap()));
    }

    SECTION("move value out") {
        Result<std::string> r = Ok(std::string("hello"));
        std::string s = std::move(r).value();
        REQUIRE(s == "hello");
    }
}

TEST_CASE("Result with container values", "[core][result]") {
    SECTION("vector in result") {
        Result<std::vector<int>> r = Ok(std::vector<int>{1, 2, 3});
        REQUIRE(r.is_ok());
        REQUIRE(r.value().size() == 3);
    }
}
