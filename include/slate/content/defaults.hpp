#pragma once

/// @file defaults.hpp
/// @brief defaults.json: design frame and playback defaults

#include "types.hpp"

#include <slate/core/error.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>

namespace slate_content {

/// {designWidth, designHeight, viewTransitionMs, pixelateSteps}; missing keys keep their defaults.
/// Fails on a non-object document or a field of the wrong type.
[[nodiscard]] slate_core::Result<Defaults> defaults_from_json(const nlohmann::json& j);

[[nodiscard]] nlohmann::json defaults_to_json(const Defaults& defaults);

/// Read `path`; nullopt when the file is absent or unusable
[[nodiscard]] std::optional<Defaults> read_defaults_file(const std::filesystem::path& path);

/// defaults.json of a presentation folder, or the built-in defaults
[[nodiscard]] Defaults load_defaults(const std::filesystem::path& presentation_dir);

/// Write defaults.json into a presentation folder
[[nodiscard]] slate_core::Result<void> save_defaults(
    const std::filesystem::path& presentation_dir, const Defaults& defaults);

} // namespace slate_content
