/// @file camera.cpp
/// @brief View camera algebra implementation

#include <slate/content/camera.hpp>
#include <slate/content/strings.hpp>
#include <slate/core/log.hpp>

#include <algorithm>

namespace slate_content {

// =============================================================================
// Camera helpers
// =============================================================================

std::pair<double, double> half_extents(const Camera& camera, const Defaults& defaults) {
    double zoom = camera.zoom != 0.0 ? camera.zoom : 1.0;
    return {defaults.design_width / 2.0 / zoom, defaults.design_height / 2.0 / zoom};
}

std::string normalize_loc(const std::string& loc) {
    std::string out;
    out.reserve(loc.size());
    for (char c : trim(loc)) {
        if (c == '_' || c == '-') continue;
        out.push_back(c);
    }
    return to_lower(out);
}

std::optional<Camera> resolve_loc(const Camera& base, const std::string& loc, const Defaults& defaults) {
    std::string norm = normalize_loc(loc);
    if (norm == "center" || norm == "origin") {
        return base;
    }

    auto contains = [&norm](const char* token) {
        return norm.find(token) != std::string::npos;
    };

    auto [hw, hh] = half_extents(base, defaults);
    bool matched = false;
    double dx = 0.0;
    double dy = 0.0;

    if (contains("right")) { dx += 2.0 * hw; matched = true; }
    if (contains("left")) { dx -= 2.0 * hw; matched = true; }
    if (contains("bottom") || contains("down")) { dy += 2.0 * hh; matched = true; }
    if (contains("top") || contains("up")) { dy -= 2.0 * hh; matched = true; }

    if (!matched) {
        return std::nullopt;
    }

    Camera cam = base;
    cam.cx += dx;
    cam.cy += dy;
    return cam;
}

std::vector<std::string> legacy_camera_keys(const ParamMap& params) {
    std::vector<std::string> keys;
    for (const char* key : {"cx", "cy", "zoom", "ref"}) {
        auto value = params.get(key);
        if (value && !trim(*value).empty()) {
            keys.emplace_back(key);
        }
    }
    return keys;
}

// =============================================================================
// ViewResolver
// =============================================================================

ViewResolver::ViewResolver(Defaults defaults)
    : m_defaults(defaults) {}

std::optional<Camera> ViewResolver::camera_of(const std::string& view_id) const {
    auto it = m_cameras.find(view_id);
    if (it == m_cameras.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> ViewResolver::known_views() const {
    std::vector<std::string> ids;
    ids.reserve(m_cameras.size());
    for (const auto& [id, cam] : m_cameras) {
        ids.push_back(id);
    }
    return ids;
}

slate_core::Result<ViewResolver::Resolved> ViewResolver::resolve(const ParamMap& params) {
    std::string name = params.get_or("name", "");

    auto legacy = legacy_camera_keys(params);
    if (!legacy.empty()) {
        return slate_core::Err<Resolved>(slate_core::ContentError::legacy_camera_params(legacy));
    }

    if (auto existing = camera_of(name)) {
        Resolved r;
        r.id = name;
        r.camera = *existing;
        r.revisit = true;
        return slate_core::Ok(std::move(r));
    }

    auto result = m_state == State::NoViewsYet
        ? resolve_first(name, params)
        : resolve_subsequent(name, params);
    if (!result) {
        return result;
    }

    m_cameras[name] = result->camera;
    m_state = m_state == State::NoViewsYet ? State::FirstViewDefined : State::SubsequentViews;
    SLATE_LOG_DEBUG("view '{}' camera=({}, {}, {})",
                    name, result->camera.cx, result->camera.cy, result->camera.zoom);
    return result;
}

slate_core::Result<ViewResolver::Resolved> ViewResolver::resolve_first(
    const std::string& name, const ParamMap& params)
{
    std::vector<std::string> extra;
    for (const auto& [key, value] : params) {
        if (key != "name" && !trim(value).empty()) {
            extra.push_back(key);
        }
    }
    if (!extra.empty()) {
        std::sort(extra.begin(), extra.end());
        return slate_core::Err<Resolved>(slate_core::ContentError::first_view_params(extra));
    }

    Resolved r;
    r.id = name;
    r.camera = Camera{0.0, 0.0, 1.0};
    return slate_core::Ok(std::move(r));
}

slate_core::Result<ViewResolver::Resolved> ViewResolver::resolve_subsequent(
    const std::string& name, const ParamMap& params)
{
    std::string ref_view = params.get_or("refView", "");
    if (ref_view.empty()) {
        return slate_core::Err<Resolved>(slate_core::ContentError::missing_ref_view(name));
    }

    auto base = camera_of(ref_view);
    if (!base) {
        return slate_core::Err<Resolved>(slate_core::ContentError::unknown_ref_view(ref_view, known_views()));
    }

    std::string loc = params.get_or("loc", "");
    if (loc.empty()) {
        return slate_core::Err<Resolved>(slate_core::ContentError::missing_loc(name));
    }

    auto camera = resolve_loc(*base, loc, m_defaults);
    if (!camera) {
        return slate_core::Err<Resolved>(slate_core::ContentError::unknown_loc(name, loc));
    }

    Resolved r;
    r.id = name;
    r.camera = *camera;

    CameraSpec spec;
    spec.ref_view = ref_view;
    spec.loc = loc;
    spec.duration_ms = params.first_of({"durationMs", "duration"});
    if (spec.duration_ms) {
        if (auto value = parse_number(*spec.duration_ms)) {
            auto ms = truncate_to_int(*value);
            if (!ms) {
                return slate_core::Err<Resolved>(slate_core::ContentError::bad_number("durationMs", *spec.duration_ms));
            }
            r.transition_ms = *ms;
        }
    }
    r.spec = std::move(spec);
    return slate_core::Ok(std::move(r));
}

} // namespace slate_content
