/// @file test_json.cpp
/// @brief Tests for the scene graph JSON payload

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <slate/content/json.hpp>
#include <slate/content/loader.hpp>

using namespace slate_content;
using Catch::Approx;
using nlohmann::json;

namespace {

Presentation load_sample() {
    Defaults defaults;
    defaults.design_height = 1000.0;
    auto graph = load_from_strings(
        "view[name=home]:\n"
        "text[name=title,bg=#222,rounded=8]: Hello\n"
        "bullets[name=list,type=i]:\n"
        "- alpha\n"
        "- beta\n"
        "timer[name=tm,min=0,max=10,binSize=2,showTime=true]\n"
        "choices[name=poll,choices={Yes,No}]: Ready?\n"
        "view[name=v2,refView=home,loc=down,durationMs=600]:\n"
        "qr[name=q]\n",
        "id,view,x,y,w,h,rotationDeg,anchor\n"
        "title,home,0,0,0.5,0.25,30,topLeft\n"
        "q,v2,0,0,0.25,0.25,,center\n",
        "id,when,how,from,durationMs,delayMs\n"
        "title,enter,fade,top:0.5,300,50\n"
        "q,exit,pixelate,,,\n",
        defaults);
    REQUIRE(graph.is_ok());
    return std::move(graph).value();
}

} // anonymous namespace

TEST_CASE("Scene graph JSON fields", "[content][json]") {
    json j = to_json(load_sample());

    REQUIRE(j["id"] == "default");
    REQUIRE(j["initialViewId"] == "home");
    REQUIRE(j["views"].size() == 2);
    REQUIRE(j["views"][1]["cameraSpec"]["refView"] == "home");
    REQUIRE(j["views"][1]["cameraSpec"]["loc"] == "down");
    REQUIRE(j["defaults"]["designHeight"].get<double>() == Approx(1000.0));

    const json& title = j["nodes"][0];
    REQUIRE(title["type"] == "text");
    REQUIRE(title["text"] == "Hello");
    REQUIRE(title["visible"] == true);
    REQUIRE(title["bgColor"] == "#222");
    REQUIRE(title["transform"]["w"].get<double>() == Approx(500.0));
    REQUIRE(title["transform"]["rotationDeg"].get<double>() == Approx(30.0));
    REQUIRE(title["appear"]["kind"] == "fade");
    REQUIRE(title["appear"]["from"] == "top");
    REQUIRE(title["appear"]["borderFrac"].get<double>() == Approx(0.5));

    const json& list = j["nodes"][1];
    REQUIRE(list["items"] == json::array({"alpha", "beta"}));
    REQUIRE(list["bullets"] == "i");

    const json& timer = j["nodes"][2];
    REQUIRE(timer["type"] == "timer");
    REQUIRE(timer["showTime"] == true);
    REQUIRE(timer["binSizeS"].get<double>() == Approx(2.0));

    const json& poll = j["nodes"][3];
    REQUIRE(poll["question"] == "Ready?");
    REQUIRE(poll["options"].size() == 2);
    REQUIRE(poll["options"][0]["id"] == "Yes");

    REQUIRE(j["animationCues"] == json::array({
        {{"id", "title"}, {"when", "enter"}},
        {{"id", "q"}, {"when", "exit"}},
    }));
}

TEST_CASE("Scene graph JSON import", "[content][json]") {
    Presentation original = load_sample();
    json exported = to_json(original);

    auto imported = presentation_from_json(exported);
    REQUIRE(imported.is_ok());
    REQUIRE(to_json(*imported) == exported);

    REQUIRE(imported->nodes.size() == original.nodes.size());
    REQUIRE(imported->find_view("v2")->camera == original.find_view("v2")->camera);
    REQUIRE(imported->find_node("q")->disappear->kind == AnimationKind::Pixelate);
    REQUIRE(imported->animation_cues == original.animation_cues);

    SECTION("payload text") {
        auto parsed = presentation_from_json_string(exported.dump());
        REQUIRE(parsed.is_ok());
        REQUIRE(parsed->find_node("title")->as<TextPayload>()->text == "Hello");
    }
}

TEST_CASE("Scene graph JSON import errors", "[content][json]") {
    SECTION("unknown node type") {
        json j = {{"nodes", json::array({{{"id", "x"}, {"type", "hologram"}}})}};
        auto graph = presentation_from_json(j);
        REQUIRE(graph.is_err());
        REQUIRE(graph.error().code() == slate_core::ErrorCode::NotSupported);
        REQUIRE(graph.error().message().find("hologram") != std::string::npos);
    }

    SECTION("node without id") {
        json j = {{"nodes", json::array({{{"type", "text"}}})}};
        auto graph = presentation_from_json(j);
        REQUIRE(graph.is_err());
        REQUIRE(graph.error().code() == slate_core::ErrorCode::InvalidArgument);
    }

    SECTION("field of the wrong type") {
        json j = {{"nodes", json::array({{{"id", "t"}, {"type", "text"}, {"text", 42}}})}};
        auto graph = presentation_from_json(j);
        REQUIRE(graph.is_err());
        REQUIRE(graph.error().code() == slate_core::ErrorCode::ParseError);
    }

    SECTION("non-object payload") {
        REQUIRE(presentation_from_json(json::array()).error().code() == slate_core::ErrorCode::ParseError);
    }

    SECTION("malformed text") {
        auto graph = presentation_from_json_string("{\"nodes\": [");
        REQUIRE(graph.is_err());
        REQUIRE(graph.error().code() == slate_core::ErrorCode::ParseError);
    }
}
