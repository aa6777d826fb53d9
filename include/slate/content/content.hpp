#pragma once

/// @file content.hpp
/// @brief Main include file for slate_content module
///
/// This header includes all slate_content components in dependency order.

#include "fwd.hpp"

// Scene graph model
#include "types.hpp"

// Text utilities and tokenizer
#include "strings.hpp"
#include "params.hpp"
#include "csv.hpp"
#include "files.hpp"

// Compiler stages
#include "camera.hpp"
#include "composite.hpp"
#include "dsl_parser.hpp"
#include "geometry.hpp"
#include "animation.hpp"
#include "defaults.hpp"

// Output and entry points
#include "serializer.hpp"
#include "json.hpp"
#include "loader.hpp"

/// @namespace slate_content
/// @brief Presentation content compiler
///
/// Compiles a presentation folder (DSL, geometries.csv, animations.csv,
/// defaults.json and composite sub-folders) into a scene graph, and writes
/// an edited scene graph back. Key components include:
///
/// - **DslParser**: node blocks, views and screens
/// - **ViewResolver**: camera algebra relative to earlier views
/// - **GeometryResolver**: normalized layout rows to design pixels
/// - **AnimationResolver**: enter/exit animations and cue order
/// - **CompositeMaterializer**: timer and choices sub-folders
/// - **ContentSerializer**: canonical DSL and overlay output
///
/// Example usage:
/// @code
/// #include <slate/content/content.hpp>
///
/// auto graph = slate_content::load("presentations/demo");
/// if (!graph) {
///     SLATE_LOG_ERROR("{}", slate_core::build_error_chain(graph.error()));
/// }
/// @endcode
