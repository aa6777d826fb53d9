/// @file test_loader.cpp
/// @brief Tests for loading and saving presentation folders

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <slate/content/loader.hpp>

#include "temp_dir.hpp"

using namespace slate_content;
using Catch::Approx;

namespace {

void write_minimal_deck(const slate_test::TempDir& dir) {
    dir.write("presentation.pr",
        "view[name=home]:\n"
        "text[name=t1]: Hello\n"
        "view[name=v2,refView=home,loc=right]:\n"
        "text[name=t2]: World\n");
    dir.write("geometries.csv",
        "id,view,x,y,w,h,rotationDeg,anchor,parent\n"
        "t1,home,0,0,0.1,0.05,0,topLeft,\n"
        "t2,v2,0,0,0.1,0.05,0,topLeft,\n");
    dir.write("animations.csv",
        "id,when,how,from,durationMs,delayMs\n"
        "t2,enter,fade,,300,\n");
    dir.write("defaults.json", R"({"designHeight": 1000})");
}

} // anonymous namespace

TEST_CASE("End to end compile from strings", "[content][loader]") {
    Defaults defaults;
    defaults.design_height = 1000.0;

    auto graph = load_from_strings(
        "view[name=home]:\ntext[name=t1]: Hello",
        "id,view,x,y,w,h,rotationDeg,anchor,parent\nt1,home,0,0,0.1,0.05,0,topLeft,\n",
        "id,when,how,from,durationMs,delayMs\n",
        defaults);
    REQUIRE(graph.is_ok());
    REQUIRE(graph->id == "default");
    REQUIRE(graph->initial_view_id == "home");

    const Node* t1 = graph->find_node("t1");
    REQUIRE(t1 != nullptr);
    REQUIRE(t1->transform.x == Approx(0.0));
    REQUIRE(t1->transform.y == Approx(0.0));
    REQUIRE(t1->transform.w == Approx(100.0));
    REQUIRE(t1->transform.h == Approx(50.0));
    REQUIRE(t1->visible);
    REQUIRE(graph->animation_cues.empty());
}

TEST_CASE("Loading a presentation folder", "[content][loader]") {
    slate_test::TempDir dir;
    write_minimal_deck(dir);

    auto graph = load(dir.path());
    REQUIRE(graph.is_ok());
    REQUIRE(graph->defaults.design_height == Approx(1000.0));
    REQUIRE(graph->views.size() == 2);
    REQUIRE(graph->find_view("v2")->camera.cx == Approx(1920.0));

    const Node* t2 = graph->find_node("t2");
    REQUIRE(t2->transform.x == Approx(1920.0));
    REQUIRE_FALSE(t2->visible);
    REQUIRE(t2->appear->kind == AnimationKind::Fade);
    REQUIRE(graph->animation_cues.size() == 1);
    REQUIRE(graph->find_node("t1")->visible);
}

TEST_CASE("Loader file rules", "[content][loader]") {
    slate_test::TempDir dir;
    write_minimal_deck(dir);

    SECTION("geometries.csv is mandatory") {
        std::filesystem::remove(dir.path() / "geometries.csv");
        auto graph = load(dir.path());
        REQUIRE(graph.is_err());
        REQUIRE(graph.error().code() == slate_core::ErrorCode::NotFound);
        REQUIRE(graph.error().message().find("geometries.csv") != std::string::npos);
        REQUIRE(*graph.error().get_context("stage") == "geometries");
        REQUIRE(*graph.error().get_context("presentation") == dir.path().string());
    }

    SECTION("animations.csv is mandatory") {
        std::filesystem::remove(dir.path() / "animations.csv");
        auto graph = load(dir.path());
        REQUIRE(graph.is_err());
        REQUIRE(graph.error().message().find("animations.csv") != std::string::npos);
    }

    SECTION("presentation.txt is the fallback DSL") {
        std::filesystem::rename(dir.path() / "presentation.pr", dir.path() / "presentation.txt");
        REQUIRE(dsl_path(dir.path()).filename() == "presentation.txt");
        auto graph = load(dir.path());
        REQUIRE(graph.is_ok());
        REQUIRE(graph->nodes.size() == 2);
    }

    SECTION("presentation.pr wins over presentation.txt") {
        dir.write("presentation.txt", "view[name=other]:\n");
        REQUIRE(dsl_path(dir.path()).filename() == "presentation.pr");
    }

    SECTION("malformed defaults fall back") {
        dir.write("defaults.json", "not json");
        auto graph = load(dir.path());
        REQUIRE(graph.is_ok());
        REQUIRE(graph->defaults.design_height == Approx(1080.0));
    }

    SECTION("grammar errors carry the file and line") {
        dir.write("presentation.pr", "view[name=home]:\nqr[name=q]\nbroken line\n");
        auto graph = load(dir.path());
        REQUIRE(graph.is_err());
        const auto* err = graph.error().as<slate_core::ContentError>();
        REQUIRE(err->line == 3);
        REQUIRE(err->source.find("presentation.pr") != std::string::npos);
        REQUIRE(*graph.error().get_context("stage") == "dsl");
    }

    SECTION("overlay errors name their stage") {
        dir.write("animations.csv", "id,when,how\nt1,enter,wobble\n");
        auto graph = load(dir.path());
        REQUIRE(graph.is_err());
        REQUIRE(*graph.error().get_context("stage") == "animations");
        REQUIRE(slate_core::build_error_chain(graph.error()).find("stage: animations") != std::string::npos);
    }
}

TEST_CASE("Loading materializes composite folders", "[content][loader]") {
    slate_test::TempDir dir;
    dir.write("presentation.pr", "view[name=home]:\ntimer[name=race,min=0,max=60,binSize=5]\n");
    dir.write("geometries.csv", "id,view,x,y,w,h\nrace,home,0,0,0.5,0.5\n");
    dir.write("animations.csv", "id,when,how\n");

    auto graph = load(dir.path());
    REQUIRE(graph.is_ok());
    REQUIRE(dir.exists("groups/race/elements.txt"));
    REQUIRE(graph->find_node("race")->as<TimerPayload>()->composite.elements_text.has_value());
}

TEST_CASE("Edit, save and reload", "[content][loader]") {
    slate_test::TempDir dir;
    write_minimal_deck(dir);

    auto graph = load(dir.path());
    REQUIRE(graph.is_ok());

    Node* t1 = graph->find_node("t1");
    t1->transform.x = 250.0;
    t1->as<TextPayload>()->text = "Hello, again";
    t1->font_px = 40.0;

    REQUIRE(save(*graph, dir.path()).is_ok());
    REQUIRE_FALSE(dir.exists("presentation.pr.tmp"));
    REQUIRE(dir.read("presentation.pr").find("Hello, again") != std::string::npos);

    auto reloaded = load(dir.path());
    REQUIRE(reloaded.is_ok());
    const Node* back = reloaded->find_node("t1");
    REQUIRE(back->transform.x == Approx(250.0));
    REQUIRE(back->font_px.value() == Approx(40.0));
    REQUIRE(back->as<TextPayload>()->text == "Hello, again");
    REQUIRE(reloaded->find_view("v2")->camera == graph->find_view("v2")->camera);
    REQUIRE(reloaded->animation_cues == graph->animation_cues);

    SECTION("defaults.json is written only on request") {
        std::filesystem::remove(dir.path() / "defaults.json");
        REQUIRE(save(*graph, dir.path()).is_ok());
        REQUIRE_FALSE(dir.exists("defaults.json"));

        SaveOptions options;
        options.write_defaults = true;
        REQUIRE(save(*graph, dir.path(), options).is_ok());
        REQUIRE(dir.exists("defaults.json"));
    }
}
