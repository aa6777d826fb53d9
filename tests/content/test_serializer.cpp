/// @file test_serializer.cpp
/// @brief Tests for the content serializer

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <slate/content/csv.hpp>
#include <slate/content/loader.hpp>
#include <slate/content/serializer.hpp>

using namespace slate_content;
using Catch::Approx;

namespace {

Defaults test_defaults() {
    Defaults d;
    d.design_height = 1000.0;
    return d;
}

constexpr const char* k_deck =
    "view[name=home]:\n"
    "text[name=title,bg=#111]: Welcome\n"
    "bullets[name=list,type=1]:\n"
    "- one\n"
    "- two\n"
    "table[name=tb]:\n"
    "a;b\n"
    "c;d\n"
    "qr[name=q]\n"
    "image[name=logo,space=screen]\n"
    "timer[name=tm,min=0,max=10,binSize=2,label=Seconds]\n"
    "choices[name=poll,choices={Yes:green,No:red}]: Ready?\n"
    "view[name=v2,refView=home,loc=right,durationMs=800]:\n"
    "group[name=g]\n"
    "screen[name=hud]:\n"
    "text[name=clock]: 12:00\n";

constexpr const char* k_deck_geometries =
    "id,view,x,y,w,h,rotationDeg,anchor,align,vAlign,fontH,parent\n"
    "title,home,-0.5,-0.25,0.5,0.125,,topLeft,center,,0.0625,\n"
    "list,home,0,0,0.5,0.25,,topLeft,,,,\n"
    "tb,home,0,0.25,0.5,0.25,,topLeft,,,,\n"
    "q,home,0.5,0,0.25,0.25,,center,,,,\n"
    "logo,home,0.0625,0.0625,0.125,0.125,,topLeft,,,,\n"
    "tm,home,-0.5,0.25,0.25,0.25,,topLeft,,,,\n"
    "poll,home,0.25,0.25,0.25,0.25,15,topLeft,,,,\n"
    "g,v2,0.125,0,0.5,0.5,,topLeft,,,,\n"
    "clock,hud,0.5,0.0625,0.125,0.0625,,topRight,right,,,\n";

constexpr const char* k_deck_animations =
    "id,when,how,from,durationMs,delayMs\n"
    "title,enter,fade,left:0.25,500,\n"
    "g,exit,pixelate,,400,100\n";

Presentation load_deck() {
    auto graph = load_from_strings(k_deck, k_deck_geometries, k_deck_animations, test_defaults());
    REQUIRE(graph.is_ok());
    return std::move(graph).value();
}

} // anonymous namespace

// =============================================================================
// Formatting
// =============================================================================

TEST_CASE("Header values are quoted only when needed", "[content][serializer]") {
    REQUIRE(ContentSerializer::quote_value("plain") == "plain");
    REQUIRE(ContentSerializer::quote_value("a,b") == "\"a,b\"");
    REQUIRE(ContentSerializer::quote_value("x]") == "\"x]\"");
    REQUIRE(ContentSerializer::quote_value("shot[1.png") == "\"shot[1.png\"");
    REQUIRE(ContentSerializer::quote_value("say \"hi\"") == "say 'hi'");

    ContentSerializer::Params params = {{"name", "t"}, {"choices", "{A:red,B:blue}"}};
    REQUIRE(ContentSerializer::format_header("choices", params) == "choices[name=t,choices=\"{A:red,B:blue}\"]");
}

// =============================================================================
// DSL output
// =============================================================================

TEST_CASE("Canonical DSL output", "[content][serializer]") {
    auto graph = load_from_strings("view[name=home]:\ntext[name=t1]: Hello\n",
                                   "id,view,x,y,w,h\nt1,home,0,0,0.1,0.05\n",
                                   "id,when,how\n");
    REQUIRE(graph.is_ok());

    auto dsl = ContentSerializer().write_dsl(*graph);
    REQUIRE(dsl.is_ok());
    REQUIRE(*dsl ==
            "# presentation.pr (canonical)\n"
            "\n"
            "view[name=home]:\n"
            "text[name=t1]:\n"
            "Hello\n");
}

TEST_CASE("DSL output per node kind", "[content][serializer]") {
    Presentation graph = load_deck();
    auto dsl = ContentSerializer().write_dsl(graph);
    REQUIRE(dsl.is_ok());
    const std::string& text = *dsl;

    REQUIRE(text.find("text[name=title,bgColor=#111]:\nWelcome\n") != std::string::npos);
    REQUIRE(text.find("bullets[name=list,type=1]:\none\ntwo\n") != std::string::npos);
    REQUIRE(text.find("table[name=tb]:\na;b\nc;d\n") != std::string::npos);
    REQUIRE(text.find("qr[name=q]\n") != std::string::npos);
    REQUIRE(text.find("image[name=logo,space=screen]\n") != std::string::npos);
    REQUIRE(text.find("timer[name=tm,min=0,max=10,binSize=2,label=Seconds]\n") != std::string::npos);
    REQUIRE(text.find("choices[name=poll,type=pie,choices=\"{Yes:green,No:red}\"]:\nReady?\n") != std::string::npos);
    REQUIRE(text.find("view[name=v2,refView=home,loc=right,durationMs=800]:\n") != std::string::npos);
    REQUIRE(text.find("screen[name=hud]:\ntext[name=clock]:\n12:00\n") != std::string::npos);
}

TEST_CASE("DSL output rejects unrepresentable graphs", "[content][serializer]") {
    Presentation graph = load_deck();

    SECTION("node shown by no view") {
        Node stray;
        stray.id = "stray";
        stray.payload = TextPayload{"?"};
        graph.nodes.push_back(stray);
        auto dsl = ContentSerializer().write_dsl(graph);
        REQUIRE(dsl.is_err());
        REQUIRE(dsl.error().code() == slate_core::ErrorCode::NotSupported);
        REQUIRE(dsl.error().message().find("stray") != std::string::npos);
    }

    SECTION("node without a kind") {
        graph.find_node("title")->payload = std::monostate{};
        auto dsl = ContentSerializer().write_dsl(graph);
        REQUIRE(dsl.is_err());
        REQUIRE(dsl.error().message().find("Unsupported node type") != std::string::npos);
    }
}

TEST_CASE("Values with brackets survive a reload", "[content][serializer]") {
    auto graph = load_from_strings("view[name=home]:\ntext[name=t]: hi\n", "id,view,x,y,w,h\n", "id,when,how\n");
    REQUIRE(graph.is_ok());

    Node image;
    image.id = "img";
    image.payload = ImagePayload{"/media/shot[1.png"};
    graph->nodes.push_back(image);
    graph->views[0].show.push_back("img");

    auto dsl = ContentSerializer().write_dsl(*graph);
    REQUIRE(dsl.is_ok());

    auto reloaded = load_from_strings(*dsl, "id,view,x,y,w,h\n", "id,when,how\n");
    REQUIRE(reloaded.is_ok());
    REQUIRE(reloaded->nodes.size() == 2);
    REQUIRE(reloaded->find_node("t")->as<TextPayload>()->text == "hi");
    REQUIRE(reloaded->find_node("img")->as<ImagePayload>()->src == "/media/shot[1.png");
}

// =============================================================================
// Overlays
// =============================================================================

TEST_CASE("Geometry output is normalized", "[content][serializer]") {
    Presentation graph = load_deck();
    auto table = CsvTable::parse(ContentSerializer().write_geometries(graph));

    REQUIRE(table.row_count() == graph.nodes.size());
    for (std::size_t row = 0; row < table.row_count(); ++row) {
        std::string id = table.field(row, "id");
        if (id == "title") {
            REQUIRE(table.field(row, "view") == "home");
            REQUIRE(table.field(row, "x") == "-0.5");
            REQUIRE(table.field(row, "fontH") == "0.0625");
            REQUIRE(table.field(row, "align") == "center");
        } else if (id == "g") {
            REQUIRE(table.field(row, "view") == "v2");
            REQUIRE(table.field(row, "x") == "0.125");
        } else if (id == "clock") {
            REQUIRE(table.field(row, "view") == "hud");
            REQUIRE(table.field(row, "x") == "0.5");
        } else if (id == "poll") {
            REQUIRE(table.field(row, "rotationDeg") == "15");
        }
    }
}

TEST_CASE("Animation output follows cue order", "[content][serializer]") {
    Presentation graph = load_deck();
    std::string csv = ContentSerializer().write_animations(graph);
    REQUIRE(csv ==
            "id,when,how,from,durationMs,delayMs\n"
            "title,enter,fade,left:0.25,500,\n"
            "g,exit,pixelate,,400,100\n");

    SECTION("specs without a cue are appended") {
        AnimationSpec spec;
        spec.kind = AnimationKind::Appear;
        graph.find_node("q")->appear = spec;
        auto table = CsvTable::parse(ContentSerializer().write_animations(graph));
        REQUIRE(table.row_count() == 3);
        REQUIRE(table.field(2, "id") == "q");
        REQUIRE(table.field(2, "how") == "appear");
    }
}

TEST_CASE("Serialized output is stable across reloads", "[content][serializer]") {
    ContentSerializer serializer;
    Presentation first = load_deck();

    auto dsl = serializer.write_dsl(first);
    REQUIRE(dsl.is_ok());
    std::string geometries = serializer.write_geometries(first);
    std::string animations = serializer.write_animations(first);

    auto second = load_from_strings(*dsl, geometries, animations, test_defaults());
    REQUIRE(second.is_ok());

    auto dsl_again = serializer.write_dsl(*second);
    REQUIRE(dsl_again.is_ok());
    REQUIRE(*dsl_again == *dsl);
    REQUIRE(serializer.write_geometries(*second) == geometries);
    REQUIRE(serializer.write_animations(*second) == animations);

    REQUIRE(second->nodes.size() == first.nodes.size());
    REQUIRE(second->find_view("v2")->camera == first.find_view("v2")->camera);
    REQUIRE(second->find_node("title")->transform.x == Approx(first.find_node("title")->transform.x));
}
