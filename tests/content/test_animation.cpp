/// @file test_animation.cpp
/// @brief Tests for the animation overlay

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <slate/content/animation.hpp>
#include <slate/content/csv.hpp>

using namespace slate_content;
using Catch::Approx;

TEST_CASE("split_from", "[content][animation]") {
    SECTION("direction and border fraction") {
        AnimationSpec spec;
        split_from("left:0.2", spec);
        REQUIRE(spec.from == "left");
        REQUIRE(spec.border_frac.value() == Approx(0.2));
    }

    SECTION("direction only") {
        AnimationSpec spec;
        split_from(" top ", spec);
        REQUIRE(spec.from == "top");
        REQUIRE_FALSE(spec.border_frac.has_value());
    }

    SECTION("fraction only") {
        AnimationSpec spec;
        split_from(":0.5", spec);
        REQUIRE_FALSE(spec.from.has_value());
        REQUIRE(spec.border_frac.value() == Approx(0.5));
    }

    SECTION("empty") {
        AnimationSpec spec;
        split_from("", spec);
        REQUIRE_FALSE(spec.from.has_value());
    }
}

TEST_CASE("AnimationResolver reads rows in cue order", "[content][animation]") {
    auto table = CsvTable::parse(
        "id,when,how,from,durationMs,delayMs\n"
        "title,enter,fade,left:0.3,600,100\n"
        "pic,enter,pixelate,,400,\n"
        "title,exit,appear,,,\n"
        "skip,enter,none,,,\n"
        "odd,sometime,fade,,,\n");

    AnimationResolver resolver;
    REQUIRE(resolver.read(table).is_ok());

    const auto& cues = resolver.cues();
    REQUIRE(cues.size() == 3);
    REQUIRE(cues[0] == AnimationCue{"title", CueWhen::Enter});
    REQUIRE(cues[1] == AnimationCue{"pic", CueWhen::Enter});
    REQUIRE(cues[2] == AnimationCue{"title", CueWhen::Exit});

    const auto& title = resolver.animations().at("title");
    REQUIRE(title.appear->kind == AnimationKind::Fade);
    REQUIRE(title.appear->duration_ms == 600);
    REQUIRE(title.appear->delay_ms == 100);
    REQUIRE(title.appear->from == "left");
    REQUIRE(title.appear->border_frac.value() == Approx(0.3));
    REQUIRE(title.disappear->kind == AnimationKind::Appear);
    REQUIRE(resolver.animations().count("skip") == 0);

    SECTION("apply copies specs onto nodes") {
        std::vector<Node> nodes(2);
        nodes[0].id = "title";
        nodes[1].id = "other";
        resolver.apply(nodes);
        REQUIRE(nodes[0].appear.has_value());
        REQUIRE(nodes[0].disappear.has_value());
        REQUIRE_FALSE(nodes[1].appear.has_value());
    }
}

TEST_CASE("AnimationResolver keeps border fractions for fades only", "[content][animation]") {
    auto table = CsvTable::parse(
        "id,when,how,from,durationMs\n"
        "a,enter,pixelate,left:0.4,250.9\n"
        "b,enter,fade,left:0.4,\n");
    AnimationResolver resolver;
    REQUIRE(resolver.read(table).is_ok());

    const auto& a = *resolver.animations().at("a").appear;
    REQUIRE(a.from == "left");
    REQUIRE_FALSE(a.border_frac.has_value());
    REQUIRE(a.duration_ms == 250);
    REQUIRE(resolver.animations().at("b").appear->border_frac.value() == Approx(0.4));
}

TEST_CASE("AnimationResolver case-insensitive keywords", "[content][animation]") {
    auto table = CsvTable::parse("id,when,how\na,ENTER,Sudden\n");
    AnimationResolver resolver;
    REQUIRE(resolver.read(table).is_ok());
    REQUIRE(resolver.animations().at("a").appear->kind == AnimationKind::Sudden);
}

TEST_CASE("AnimationResolver errors", "[content][animation]") {
    AnimationResolver resolver;

    SECTION("direct is rejected") {
        auto table = CsvTable::parse("id,when,how\na,enter,direct\n");
        auto read = resolver.read(table, "deck/animations.csv");
        REQUIRE(read.is_err());
        REQUIRE(read.error().message().find("how=sudden") != std::string::npos);
        REQUIRE(read.error().as<slate_core::ContentError>()->line == 2);
    }

    SECTION("unknown how") {
        auto table = CsvTable::parse("id,when,how\na,enter,wobble\n");
        auto read = resolver.read(table);
        REQUIRE(read.is_err());
        REQUIRE(read.error().message().find("wobble") != std::string::npos);
    }

    SECTION("durations outside the int range") {
        for (const char* cell : {"1e20", "-1e20", "inf", "nan"}) {
            auto table = CsvTable::parse(std::string("id,when,how,durationMs\na,enter,fade,") + cell + "\n");
            auto read = AnimationResolver().read(table);
            REQUIRE(read.is_err());
            REQUIRE(read.error().code() == slate_core::ErrorCode::ParseError);
        }
    }

    SECTION("non-numeric duration") {
        auto table = CsvTable::parse("id,when,how,durationMs\na,enter,fade,slow\n");
        auto read = resolver.read(table);
        REQUIRE(read.is_err());
        REQUIRE(read.error().code() == slate_core::ErrorCode::ParseError);
    }
}
