// slate_core logging tests

#include <catch2/catch_test_macros.hpp>
#include <slate/core/log.hpp>

#include "content/temp_dir.hpp"

#include <string>

using namespace slate_core;

TEST_CASE("Log level parsing", "[core][log]") {
    REQUIRE(parse_log_level("trace") == spdlog::level::trace);
    REQUIRE(parse_log_level("debug") == spdlog::level::debug);
    REQUIRE(parse_log_level("warning") == spdlog::level::warn);
    REQUIRE(parse_log_level("warn") == spdlog::level::warn);
    REQUIRE(parse_log_level("err") == spdlog::level::err);
    REQUIRE(parse_log_level("fatal") == spdlog::level::critical);
    REQUIRE(parse_log_level("off") == spdlog::level::off);
    REQUIRE_FALSE(parse_log_level("loud").has_value());
    REQUIRE_FALSE(parse_log_level("").has_value());
}

TEST_CASE("Content logger", "[core][log]") {
    REQUIRE(content_logger()->name() == "slate");
    REQUIRE(content_logger() == content_logger());

    SECTION("configured level") {
        LogConfig config;
        config.level = spdlog::level::err;
        configure_logging(config);
        REQUIRE(content_logger()->level() == spdlog::level::err);
        REQUIRE(content_logger()->sinks().size() == 1);
    }

    configure_logging(LogConfig{});
    REQUIRE(content_logger()->level() == spdlog::level::info);
}

TEST_CASE("Log file sink", "[core][log]") {
    slate_test::TempDir dir;

    SECTION("messages reach slate.log") {
        LogConfig config;
        config.log_directory = dir.path();
        configure_logging(config);
        REQUIRE(content_logger()->sinks().size() == 2);

        SLATE_LOG_WARN("written to {}", "file");
        flush_logging();
        REQUIRE(dir.read("slate.log").find("written to file") != std::string::npos);
    }

    SECTION("unusable directory keeps stderr only") {
        dir.write("taken", "not a directory");
        LogConfig config;
        config.log_directory = dir.path() / "taken";
        configure_logging(config);
        REQUIRE(content_logger()->sinks().size() == 1);
    }

    configure_logging(LogConfig{});
}

TEST_CASE("Log scope", "[core][log]") {
    LogConfig config;
    config.level = spdlog::level::trace;
    configure_logging(config);
    {
        SLATE_LOG_SCOPE("outer scope");
        SLATE_LOG_SCOPE("inner scope");
        SLATE_LOG_DEBUG("inside {}", "scope");
    }
    configure_logging(LogConfig{});
    SUCCEED();
}
