#pragma once

/// @file camera.hpp
/// @brief View camera algebra: reference views and symbolic placement

#include "types.hpp"
#include "params.hpp"

#include <slate/core/error.hpp>

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace slate_content {

// =============================================================================
// Camera helpers
// =============================================================================

/// Half of the visible design frame at the camera zoom: (width/2/zoom, height/2/zoom)
[[nodiscard]] std::pair<double, double> half_extents(const Camera& camera, const Defaults& defaults);

/// Normalize a loc token: drop '_' and '-', lower-case
[[nodiscard]] std::string normalize_loc(const std::string& loc);

/// Place a camera one full frame away from `base` in the direction named by `loc`.
///
/// Tokens compose per axis: right/left on x, bottom|down / top|up on y.
/// "center" and "origin" keep the base position. Zoom is inherited unchanged.
/// Returns nullopt when `loc` names no direction at all.
[[nodiscard]] std::optional<Camera> resolve_loc(const Camera& base, const std::string& loc, const Defaults& defaults);

// =============================================================================
// ViewResolver
// =============================================================================

/// Resolves `view[...]` headers into cameras, in authoring order.
///
/// The first view is the origin and takes no camera parameters. Every later
/// view names a known `refView` and a `loc`. Absolute camera parameters from
/// the old syntax (cx, cy, zoom, ref) are rejected outright.
class ViewResolver {
public:
    enum class State {
        NoViewsYet,
        FirstViewDefined,
        SubsequentViews,
    };

    /// Outcome of resolving one view header
    struct Resolved {
        std::string id;
        Camera camera;
        std::optional<CameraSpec> spec;
        std::optional<int> transition_ms;
        bool revisit = false;  // Name already defined; camera left as it was
    };

    explicit ViewResolver(Defaults defaults = {});

    /// Resolve a view header. `params` must contain name=.
    [[nodiscard]] slate_core::Result<Resolved> resolve(const ParamMap& params);

    [[nodiscard]] State state() const noexcept { return m_state; }

    /// Camera of a defined world view
    [[nodiscard]] std::optional<Camera> camera_of(const std::string& view_id) const;

    /// Defined world view ids, sorted
    [[nodiscard]] std::vector<std::string> known_views() const;

private:
    [[nodiscard]] slate_core::Result<Resolved> resolve_first(const std::string& name, const ParamMap& params);
    [[nodiscard]] slate_core::Result<Resolved> resolve_subsequent(const std::string& name, const ParamMap& params);

    Defaults m_defaults;
    State m_state = State::NoViewsYet;
    std::map<std::string, Camera> m_cameras;
};

/// Legacy camera params present (non-empty) in a view header
[[nodiscard]] std::vector<std::string> legacy_camera_keys(const ParamMap& params);

} // namespace slate_content
