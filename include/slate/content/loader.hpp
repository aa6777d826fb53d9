#pragma once

/// @file loader.hpp
/// @brief Presentation folder loading and saving

#include "types.hpp"
#include "serializer.hpp"

#include <slate/core/error.hpp>

#include <filesystem>
#include <string_view>

namespace slate_content {

/// DSL file of a presentation folder: presentation.pr, else presentation.txt
[[nodiscard]] std::filesystem::path dsl_path(const std::filesystem::path& presentation_dir);

/// Compile a presentation folder into a scene graph.
///
/// Reads defaults.json (optional), the DSL, then the mandatory
/// geometries.csv and animations.csv overlays. Composite folders of timer
/// and choices nodes are created on demand.
[[nodiscard]] slate_core::Result<Presentation> load(const std::filesystem::path& presentation_dir);

/// Compile in-memory sources (no composite folders are touched)
[[nodiscard]] slate_core::Result<Presentation> load_from_strings(
    std::string_view dsl,
    std::string_view geometries_csv,
    std::string_view animations_csv,
    const Defaults& defaults = {});

/// Write a scene graph back into a presentation folder
[[nodiscard]] slate_core::Result<void> save(
    const Presentation& graph,
    const std::filesystem::path& presentation_dir,
    const SaveOptions& options = {});

} // namespace slate_content
