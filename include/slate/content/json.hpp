#pragma once

/// @file json.hpp
/// @brief Scene graph JSON payload exchanged with the viewer and the editor

#include "types.hpp"

#include <slate/core/error.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace slate_content {

/// Full payload: id, initialViewId, views, nodes, animationCues, defaults
[[nodiscard]] nlohmann::json to_json(const Presentation& graph);

/// Rebuild a scene graph from a payload. An unknown node type is an
/// unsupported-node error; malformed fields are parse errors.
[[nodiscard]] slate_core::Result<Presentation> presentation_from_json(const nlohmann::json& j);

/// Parse payload text
[[nodiscard]] slate_core::Result<Presentation> presentation_from_json_string(const std::string& text);

} // namespace slate_content
