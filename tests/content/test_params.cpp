/// @file test_params.cpp
/// @brief Tests for the header scanner and parameter splitter

#include <catch2/catch_test_macros.hpp>

#include <slate/content/params.hpp>

using namespace slate_content;

// =============================================================================
// Splitting
// =============================================================================

TEST_CASE("split_top_level respects quotes and brackets", "[content][params]") {
    SECTION("braces keep their commas") {
        auto parts = split_top_level("choices={A:red,B:blue},type=pie");
        REQUIRE(parts.size() == 2);
        REQUIRE(parts[0] == "choices={A:red,B:blue}");
        REQUIRE(parts[1] == "type=pie");
    }

    SECTION("quoted commas") {
        auto parts = split_top_level("name=a, label=\"x, y\", z=1");
        REQUIRE(parts.size() == 3);
        REQUIRE(parts[1] == "label=\"x, y\"");
    }

    SECTION("parentheses") {
        auto parts = split_top_level("from=(0,0),to=(1.05,0)");
        REQUIRE(parts.size() == 2);
        REQUIRE(parts[0] == "from=(0,0)");
    }

    SECTION("brackets ignored when not tracked") {
        auto parts = split_top_level("A:red,B:blue", false);
        REQUIRE(parts.size() == 2);
    }
}

TEST_CASE("split_params", "[content][params]") {
    ParamMap params = split_params(" name = title , label=\"a, b\", flag , bg= ");

    REQUIRE(params.size() == 3);
    REQUIRE(params.get("name") == "title");
    REQUIRE(params.get("label") == "a, b");
    REQUIRE_FALSE(params.contains("flag"));

    SECTION("blank values fall back to the default") {
        REQUIRE(params.contains("bg"));
        REQUIRE(params.get_or("bg", "none") == "none");
    }

    SECTION("later keys overwrite in place") {
        ParamMap again = split_params("a=1,b=2,a=3");
        REQUIRE(again.size() == 2);
        REQUIRE(again.entries()[0].first == "a");
        REQUIRE(again.entries()[0].second == "3");
    }

    SECTION("first_of picks the first non-blank alias") {
        ParamMap aliases = split_params("name=x,src=,file=a.png");
        REQUIRE(aliases.first_of({"src", "file"}) == "a.png");
        REQUIRE_FALSE(aliases.first_of({"url"}).has_value());
    }
}

// =============================================================================
// Header scanning
// =============================================================================

TEST_CASE("scan_header", "[content][params]") {
    SECTION("block header with trailing colon") {
        auto header = scan_header("bullets[name=list,type=1]:");
        REQUIRE(header.has_value());
        REQUIRE(header->keyword == "bullets");
        REQUIRE(header->has_colon);
        REQUIRE(header->inline_text.empty());
        REQUIRE(header->params.get("type") == "1");
    }

    SECTION("inline content") {
        auto header = scan_header("text[name=t1]: Hello world");
        REQUIRE(header.has_value());
        REQUIRE_FALSE(header->has_colon);
        REQUIRE(header->inline_text == "Hello world");
    }

    SECTION("no colon") {
        auto header = scan_header("qr[name=q]");
        REQUIRE(header.has_value());
        REQUIRE_FALSE(header->has_colon);
    }

    SECTION("bracket inside a quoted value") {
        auto header = scan_header("text[name=t,label=\"a]b\"]:");
        REQUIRE(header.has_value());
        REQUIRE(header->params.get("label") == "a]b");
    }

    SECTION("unquoted '[' inside a value does not nest") {
        auto header = scan_header("image[name=img,file=/media/shot[1.png]");
        REQUIRE(header.has_value());
        REQUIRE(header->keyword == "image");
        REQUIRE(header->params.get("file") == "/media/shot[1.png");
        REQUIRE(header->inline_text.empty());
    }

    SECTION("non-headers") {
        REQUIRE_FALSE(scan_header("- just a bullet").has_value());
        REQUIRE_FALSE(scan_header("text name=t").has_value());
        REQUIRE_FALSE(scan_header("text[]").has_value());
        REQUIRE_FALSE(scan_header("text[name=t").has_value());
        REQUIRE_FALSE(is_header_line("a;b;c"));
    }
}

TEST_CASE("parse_header errors", "[content][params]") {
    SECTION("invalid line") {
        auto header = parse_header("not a header", "deck.pr", 4);
        REQUIRE(header.is_err());
        const auto* err = header.error().as<slate_core::ContentError>();
        REQUIRE(err != nullptr);
        REQUIRE(err->kind == slate_core::ContentError::Kind::Grammar);
        REQUIRE(err->line == 4);
        REQUIRE(err->source == "deck.pr");
    }

    SECTION("missing name") {
        auto header = parse_header("text[size=3]: Hi", "deck.pr", 2);
        REQUIRE(header.is_err());
        REQUIRE(header.error().message().find("name=") != std::string::npos);
    }

    SECTION("leading whitespace is accepted") {
        auto header = parse_header("   text[name=a]: x");
        REQUIRE(header.is_ok());
        REQUIRE(header->params.get_or("name", "") == "a");
    }
}
