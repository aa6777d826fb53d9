/// @file loader.cpp
/// @brief Presentation loading pipeline

#include <slate/content/loader.hpp>
#include <slate/content/animation.hpp>
#include <slate/content/csv.hpp>
#include <slate/content/defaults.hpp>
#include <slate/content/dsl_parser.hpp>
#include <slate/content/geometry.hpp>
#include <slate/core/log.hpp>

#include <system_error>

namespace slate_content {

namespace fs = std::filesystem;

namespace {

/// Tag a failure with the pipeline stage that produced it
slate_core::Error at_stage(slate_core::Error error, const char* stage) {
    error.with_context("stage", stage);
    return error;
}

/// Overlays, visibility and assembly shared by both entry points
slate_core::Result<Presentation> assemble(
    ParsedDocument doc,
    const CsvTable& geometries,
    const CsvTable& animations,
    const Defaults& defaults,
    const std::string& geometry_source,
    const std::string& animation_source)
{
    Presentation graph;
    graph.defaults = defaults;
    graph.initial_view_id = doc.initial_view_id;
    graph.views = std::move(doc.views);
    graph.nodes = std::move(doc.nodes);

    GeometryResolver geometry(graph.views, defaults);
    auto placed = geometry.apply(geometries, graph.nodes, geometry_source);
    if (!placed) {
        return slate_core::Err<Presentation>(at_stage(placed.error(), "geometries"));
    }

    AnimationResolver animation;
    auto animated = animation.read(animations, animation_source);
    if (!animated) {
        return slate_core::Err<Presentation>(at_stage(animated.error(), "animations"));
    }
    animation.apply(graph.nodes);
    graph.animation_cues = animation.cues();

    GeometryResolver::apply_visibility(graph.nodes, graph.views, graph.initial_view_id);
    return slate_core::Ok(std::move(graph));
}

} // anonymous namespace

fs::path dsl_path(const fs::path& presentation_dir) {
    fs::path pr = presentation_dir / "presentation.pr";
    std::error_code ec;
    if (fs::exists(pr, ec)) {
        return pr;
    }
    return presentation_dir / "presentation.txt";
}

slate_core::Result<Presentation> load(const fs::path& presentation_dir) {
    SLATE_LOG_SCOPE("load " + presentation_dir.string());

    Defaults defaults = load_defaults(presentation_dir);

    ParseOptions options;
    options.defaults = defaults;
    options.presentation_dir = presentation_dir;
    auto failed = [&presentation_dir](slate_core::Error error) {
        error.with_context("presentation", presentation_dir.string());
        return slate_core::Err<Presentation>(std::move(error));
    };

    auto doc = DslParser(options).parse_file(dsl_path(presentation_dir));
    if (!doc) {
        return failed(at_stage(doc.error(), "dsl"));
    }

    fs::path geometry_path = presentation_dir / "geometries.csv";
    auto geometries = CsvTable::read_file(geometry_path);
    if (!geometries) {
        return failed(at_stage(geometries.error(), "geometries"));
    }

    fs::path animation_path = presentation_dir / "animations.csv";
    auto animations = CsvTable::read_file(animation_path);
    if (!animations) {
        return failed(at_stage(animations.error(), "animations"));
    }

    auto graph = assemble(std::move(*doc), *geometries, *animations, defaults,
                          geometry_path.string(), animation_path.string());
    if (!graph) {
        return failed(graph.error());
    }
    SLATE_LOG_INFO("loaded {} ({} views, {} nodes, {} cues)", presentation_dir.string(),
                   graph->views.size(), graph->nodes.size(), graph->animation_cues.size());
    return graph;
}

slate_core::Result<Presentation> load_from_strings(
    std::string_view dsl,
    std::string_view geometries_csv,
    std::string_view animations_csv,
    const Defaults& defaults)
{
    ParseOptions options;
    options.defaults = defaults;
    auto doc = DslParser(options).parse(dsl);
    if (!doc) {
        return slate_core::Err<Presentation>(at_stage(doc.error(), "dsl"));
    }
    return assemble(std::move(*doc), CsvTable::parse(geometries_csv), CsvTable::parse(animations_csv),
                    defaults, "geometries.csv", "animations.csv");
}

slate_core::Result<void> save(
    const Presentation& graph,
    const fs::path& presentation_dir,
    const SaveOptions& options)
{
    SLATE_LOG_SCOPE("save " + presentation_dir.string());
    return ContentSerializer().save(graph, presentation_dir, options);
}

} // namespace slate_content
