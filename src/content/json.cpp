/// @file json.cpp
/// @brief Scene graph JSON conversion

#include <slate/content/json.hpp>
#include <slate/content/defaults.hpp>

#include <type_traits>

namespace slate_content {

using nlohmann::json;

namespace {

// =============================================================================
// Export helpers
// =============================================================================

template<typename T>
void put_optional(json& j, const char* key, const std::optional<T>& value) {
    if (value) j[key] = *value;
}

json animation_to_json(const AnimationSpec& spec) {
    json j = {{"kind", animation_kind_name(spec.kind)}};
    put_optional(j, "durationMs", spec.duration_ms);
    put_optional(j, "delayMs", spec.delay_ms);
    put_optional(j, "from", spec.from);
    put_optional(j, "borderFrac", spec.border_frac);
    return j;
}

json composite_geometries_to_json(const std::vector<CompositeGeometry>& geometries) {
    json out = json::object();
    for (const auto& g : geometries) {
        out[g.id] = {
            {"x", g.x}, {"y", g.y}, {"w", g.w}, {"h", g.h},
            {"rotationDeg", g.rotation_deg},
            {"anchor", g.anchor},
            {"align", g.align},
            {"parent", g.parent},
        };
    }
    return out;
}

json params_to_json(const std::vector<std::pair<std::string, std::string>>& params) {
    json out = json::object();
    for (const auto& [key, value] : params) {
        out[key] = value;
    }
    return out;
}

void payload_to_json(json& j, const Node& node) {
    std::visit([&j](const auto& p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, TextPayload>) {
            j["text"] = p.text;
        } else if constexpr (std::is_same_v<T, QrPayload>) {
            j["url"] = p.url;
        } else if constexpr (std::is_same_v<T, ImagePayload> || std::is_same_v<T, HtmlFramePayload>
                             || std::is_same_v<T, VideoPayload>) {
            j["src"] = p.src;
        } else if constexpr (std::is_same_v<T, BulletsPayload>) {
            j["items"] = p.items;
            j["bullets"] = p.style;
        } else if constexpr (std::is_same_v<T, TablePayload>) {
            j["rows"] = p.rows;
            j["delimiter"] = p.delimiter;
            put_optional(j, "hstyle", p.hstyle);
            put_optional(j, "vstyle", p.vstyle);
        } else if constexpr (std::is_same_v<T, TimerPayload>) {
            j["showTime"] = p.show_time;
            j["barColor"] = p.bar_color;
            j["lineColor"] = p.line_color;
            j["lineWidth"] = p.line_width ? json(*p.line_width) : json(nullptr);
            j["stat"] = p.stat;
            j["minS"] = p.min_s ? json(*p.min_s) : json(nullptr);
            j["maxS"] = p.max_s ? json(*p.max_s) : json(nullptr);
            j["binSizeS"] = p.bin_size_s ? json(*p.bin_size_s) : json(nullptr);
            j["args"] = params_to_json(p.args);
            j["compositeDir"] = p.composite.dir;
            put_optional(j, "elementsText", p.composite.elements_text);
            auto top = p.composite.geometries.find("");
            if (top != p.composite.geometries.end()) {
                j["compositeGeometries"] = composite_geometries_to_json(top->second);
            }
        } else if constexpr (std::is_same_v<T, ChoicesPayload>) {
            j["question"] = p.question;
            j["chart"] = p.chart;
            j["bullets"] = p.bullets;
            json options = json::array();
            for (const auto& option : p.options) {
                options.push_back({{"id", option.id}, {"label", option.label}, {"color", option.color}});
            }
            j["options"] = std::move(options);
            j["compositeDir"] = p.composite.dir;
            put_optional(j, "elementsText", p.composite.elements_text);
            json by_path = json::object();
            for (const auto& [path, geometries] : p.composite.geometries) {
                by_path[path] = composite_geometries_to_json(geometries);
            }
            j["compositeGeometriesByPath"] = std::move(by_path);
        } else if constexpr (std::is_same_v<T, SoundPayload> || std::is_same_v<T, GraphPayload>) {
            j["params"] = params_to_json(p.params);
        } else if constexpr (std::is_same_v<T, ArrowPayload> || std::is_same_v<T, LinePayload>) {
            j["from"] = p.from;
            j["to"] = p.to;
            j["color"] = p.color;
            put_optional(j, "width", p.width);
        }
    }, node.payload);
}

json node_to_json(const Node& node) {
    auto type = node.type();
    json j = {
        {"id", node.id},
        {"type", type ? node_type_name(*type) : "none"},
        {"space", space_name(node.space)},
        {"visible", node.visible},
    };

    const Transform& t = node.transform;
    json transform = {{"x", t.x}, {"y", t.y}, {"w", t.w}, {"h", t.h}, {"anchor", t.anchor}};
    put_optional(transform, "rotationDeg", t.rotation_deg);
    j["transform"] = std::move(transform);

    put_optional(j, "align", t.align);
    put_optional(j, "vAlign", t.v_align);
    put_optional(j, "parentId", node.parent_id);
    put_optional(j, "fontPx", node.font_px);
    put_optional(j, "bgColor", node.style.bg_color);
    put_optional(j, "bgAlpha", node.style.bg_alpha);
    put_optional(j, "borderRadius", node.style.border_radius);
    if (node.appear) j["appear"] = animation_to_json(*node.appear);
    if (node.disappear) j["disappear"] = animation_to_json(*node.disappear);

    payload_to_json(j, node);
    return j;
}

json view_to_json(const View& view) {
    json j = {
        {"id", view.id},
        {"camera", {{"cx", view.camera.cx}, {"cy", view.camera.cy}, {"zoom", view.camera.zoom}}},
        {"show", view.show},
    };
    if (view.screen) j["screen"] = true;
    if (view.camera_spec) {
        json spec = {{"refView", view.camera_spec->ref_view}, {"loc", view.camera_spec->loc}};
        put_optional(spec, "durationMs", view.camera_spec->duration_ms);
        j["cameraSpec"] = std::move(spec);
    }
    put_optional(j, "transitionMs", view.transition_ms);
    return j;
}

// =============================================================================
// Import helpers (throw nlohmann::json::exception on type mismatch)
// =============================================================================

template<typename T>
std::optional<T> get_optional(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return j.at(key).get<T>();
}

std::string get_text(const json& j, const char* key, const std::string& def) {
    return get_optional<std::string>(j, key).value_or(def);
}

AnimationSpec animation_from_json(const json& j) {
    AnimationSpec spec;
    std::string kind = get_text(j, "kind", "sudden");
    spec.kind = animation_kind_from_string(kind).value_or(AnimationKind::Sudden);
    spec.duration_ms = get_optional<int>(j, "durationMs");
    spec.delay_ms = get_optional<int>(j, "delayMs");
    spec.from = get_optional<std::string>(j, "from");
    spec.border_frac = get_optional<double>(j, "borderFrac");
    return spec;
}

std::vector<CompositeGeometry> composite_geometries_from_json(const json& j) {
    std::vector<CompositeGeometry> out;
    for (const auto& [id, g] : j.items()) {
        CompositeGeometry geometry;
        geometry.id = id;
        geometry.x = g.value("x", 0.0);
        geometry.y = g.value("y", 0.0);
        geometry.w = g.value("w", 1.0);
        geometry.h = g.value("h", 1.0);
        geometry.rotation_deg = g.value("rotationDeg", 0.0);
        geometry.anchor = g.value("anchor", std::string("topLeft"));
        geometry.align = g.value("align", std::string());
        geometry.parent = g.value("parent", std::string());
        out.push_back(std::move(geometry));
    }
    return out;
}

std::vector<std::pair<std::string, std::string>> params_from_json(const json& j) {
    std::vector<std::pair<std::string, std::string>> out;
    if (!j.is_object()) return out;
    for (const auto& [key, value] : j.items()) {
        out.emplace_back(key, value.is_string() ? value.get<std::string>() : value.dump());
    }
    return out;
}

Composite composite_from_json(const json& j) {
    Composite composite;
    composite.dir = get_text(j, "compositeDir", get_text(j, "id", ""));
    composite.elements_text = get_optional<std::string>(j, "elementsText");
    if (j.contains("compositeGeometriesByPath")) {
        for (const auto& [path, geometries] : j.at("compositeGeometriesByPath").items()) {
            composite.geometries[path] = composite_geometries_from_json(geometries);
        }
    } else if (j.contains("compositeGeometries")) {
        composite.geometries[""] = composite_geometries_from_json(j.at("compositeGeometries"));
    }
    return composite;
}

slate_core::Result<NodePayload> payload_from_json(const json& j, const std::string& id) {
    std::string type_name = get_text(j, "type", "");
    auto type = node_type_from_string(type_name);
    if (!type) {
        return slate_core::Err<NodePayload>(slate_core::ContentError::unsupported_node(id, type_name));
    }

    switch (*type) {
        case NodeType::Text:
            return slate_core::Ok(NodePayload(TextPayload{get_text(j, "text", "")}));
        case NodeType::Qr:
            return slate_core::Ok(NodePayload(QrPayload{get_text(j, "url", "/join")}));
        case NodeType::Image:
            return slate_core::Ok(NodePayload(ImagePayload{get_text(j, "src", "/media/" + id + ".png")}));
        case NodeType::HtmlFrame:
            return slate_core::Ok(NodePayload(HtmlFramePayload{get_text(j, "src", "")}));
        case NodeType::Video:
            return slate_core::Ok(NodePayload(VideoPayload{get_text(j, "src", "")}));
        case NodeType::Bullets: {
            BulletsPayload p;
            p.items = j.value("items", std::vector<std::string>{});
            p.style = get_text(j, "bullets", "A");
            return slate_core::Ok(NodePayload(std::move(p)));
        }
        case NodeType::Table: {
            TablePayload p;
            p.rows = j.value("rows", std::vector<std::vector<std::string>>{});
            p.delimiter = get_text(j, "delimiter", ";");
            p.hstyle = get_optional<std::string>(j, "hstyle");
            p.vstyle = get_optional<std::string>(j, "vstyle");
            return slate_core::Ok(NodePayload(std::move(p)));
        }
        case NodeType::Group:
            return slate_core::Ok(NodePayload(GroupPayload{}));
        case NodeType::Timer: {
            TimerPayload p;
            p.show_time = j.value("showTime", false);
            p.bar_color = get_text(j, "barColor", "orange");
            p.line_color = get_text(j, "lineColor", "green");
            p.line_width = get_optional<double>(j, "lineWidth");
            p.stat = get_text(j, "stat", "gaussian");
            p.min_s = get_optional<double>(j, "minS");
            p.max_s = get_optional<double>(j, "maxS");
            p.bin_size_s = get_optional<double>(j, "binSizeS");
            if (j.contains("args")) p.args = params_from_json(j.at("args"));
            p.composite = composite_from_json(j);
            return slate_core::Ok(NodePayload(std::move(p)));
        }
        case NodeType::Choices: {
            ChoicesPayload p;
            p.question = get_text(j, "question", "");
            p.chart = get_text(j, "chart", "pie");
            p.bullets = get_text(j, "bullets", "A");
            if (j.contains("options")) {
                for (const auto& o : j.at("options")) {
                    p.options.push_back(ChoiceOption{
                        get_text(o, "id", ""), get_text(o, "label", ""), get_text(o, "color", "")});
                }
            }
            p.composite = composite_from_json(j);
            return slate_core::Ok(NodePayload(std::move(p)));
        }
        case NodeType::Sound:
            return slate_core::Ok(NodePayload(SoundPayload{
                j.contains("params") ? params_from_json(j.at("params")) : decltype(SoundPayload::params){}}));
        case NodeType::Graph:
            return slate_core::Ok(NodePayload(GraphPayload{
                j.contains("params") ? params_from_json(j.at("params")) : decltype(GraphPayload::params){}}));
        case NodeType::Arrow:
        case NodeType::Line: {
            std::string from = get_text(j, "from", "(0,0)");
            std::string to = get_text(j, "to", "(1,0)");
            std::string color = get_text(j, "color", "white");
            auto width = get_optional<double>(j, "width");
            if (*type == NodeType::Arrow) {
                return slate_core::Ok(NodePayload(ArrowPayload{from, to, color, width}));
            }
            return slate_core::Ok(NodePayload(LinePayload{from, to, color, width}));
        }
    }
    return slate_core::Err<NodePayload>(slate_core::ContentError::unsupported_node(id, type_name));
}

slate_core::Result<Node> node_from_json(const json& j) {
    Node node;
    node.id = get_text(j, "id", "");
    if (node.id.empty()) {
        return slate_core::Err<Node>(
            slate_core::Error(slate_core::ErrorCode::InvalidArgument, "node without id in payload"));
    }

    auto payload = payload_from_json(j, node.id);
    if (!payload) {
        return slate_core::Err<Node>(payload.error());
    }
    node.payload = std::move(*payload);

    node.space = space_from_string(get_text(j, "space", "world")).value_or(Space::World);
    node.visible = j.value("visible", false);

    if (j.contains("transform")) {
        const json& t = j.at("transform");
        node.transform.x = t.value("x", 0.0);
        node.transform.y = t.value("y", 0.0);
        node.transform.w = t.value("w", 100.0);
        node.transform.h = t.value("h", 50.0);
        node.transform.rotation_deg = get_optional<double>(t, "rotationDeg");
        node.transform.anchor = get_text(t, "anchor", "topLeft");
    }
    node.transform.align = get_optional<std::string>(j, "align");
    node.transform.v_align = get_optional<std::string>(j, "vAlign");
    node.parent_id = get_optional<std::string>(j, "parentId");
    node.font_px = get_optional<double>(j, "fontPx");
    node.style.bg_color = get_optional<std::string>(j, "bgColor");
    node.style.bg_alpha = get_optional<double>(j, "bgAlpha");
    node.style.border_radius = get_optional<double>(j, "borderRadius");
    if (j.contains("appear") && j.at("appear").is_object()) node.appear = animation_from_json(j.at("appear"));
    if (j.contains("disappear") && j.at("disappear").is_object()) node.disappear = animation_from_json(j.at("disappear"));
    return slate_core::Ok(std::move(node));
}

View view_from_json(const json& j) {
    View view;
    view.id = get_text(j, "id", "home");
    if (j.contains("camera")) {
        const json& c = j.at("camera");
        view.camera.cx = c.value("cx", 0.0);
        view.camera.cy = c.value("cy", 0.0);
        view.camera.zoom = c.value("zoom", 1.0);
    }
    view.show = j.value("show", std::vector<std::string>{});
    view.screen = j.value("screen", false);
    if (j.contains("cameraSpec") && j.at("cameraSpec").is_object()) {
        const json& s = j.at("cameraSpec");
        CameraSpec spec;
        spec.ref_view = get_text(s, "refView", "");
        spec.loc = get_text(s, "loc", "");
        if (s.contains("durationMs") && !s.at("durationMs").is_null()) {
            const json& d = s.at("durationMs");
            spec.duration_ms = d.is_string() ? d.get<std::string>() : d.dump();
        }
        view.camera_spec = std::move(spec);
    }
    view.transition_ms = get_optional<int>(j, "transitionMs");
    return view;
}

} // anonymous namespace

// =============================================================================
// Public API
// =============================================================================

json to_json(const Presentation& graph) {
    json views = json::array();
    for (const auto& view : graph.views) {
        views.push_back(view_to_json(view));
    }
    json nodes = json::array();
    for (const auto& node : graph.nodes) {
        nodes.push_back(node_to_json(node));
    }
    json cues = json::array();
    for (const auto& cue : graph.animation_cues) {
        cues.push_back({{"id", cue.id}, {"when", cue.when == CueWhen::Enter ? "enter" : "exit"}});
    }

    return json{
        {"id", graph.id},
        {"initialViewId", graph.initial_view_id},
        {"views", std::move(views)},
        {"nodes", std::move(nodes)},
        {"animationCues", std::move(cues)},
        {"defaults", defaults_to_json(graph.defaults)},
    };
}

slate_core::Result<Presentation> presentation_from_json(const json& j) {
    if (!j.is_object()) {
        return slate_core::Err<Presentation>(
            slate_core::Error(slate_core::ErrorCode::ParseError, "payload must be a JSON object"));
    }

    try {
        Presentation graph;
        graph.id = get_text(j, "id", "default");
        graph.initial_view_id = get_text(j, "initialViewId", "home");

        if (j.contains("defaults")) {
            auto defaults = defaults_from_json(j.at("defaults"));
            if (!defaults) {
                return slate_core::Err<Presentation>(defaults.error());
            }
            graph.defaults = *defaults;
        }

        for (const auto& v : j.value("views", json::array())) {
            graph.views.push_back(view_from_json(v));
        }

        for (const auto& n : j.value("nodes", json::array())) {
            auto node = node_from_json(n);
            if (!node) {
                return slate_core::Err<Presentation>(node.error());
            }
            graph.nodes.push_back(std::move(*node));
        }

        for (const auto& c : j.value("animationCues", json::array())) {
            std::string when = get_text(c, "when", "");
            if (when != "enter" && when != "exit") continue;
            graph.animation_cues.push_back(
                AnimationCue{get_text(c, "id", ""), when == "enter" ? CueWhen::Enter : CueWhen::Exit});
        }
        return slate_core::Ok(std::move(graph));
    } catch (const json::exception& e) {
        return slate_core::Err<Presentation>(
            slate_core::Error(slate_core::ErrorCode::ParseError, std::string("JSON payload error: ") + e.what()));
    }
}

slate_core::Result<Presentation> presentation_from_json_string(const std::string& text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        return slate_core::Err<Presentation>(
            slate_core::Error(slate_core::ErrorCode::ParseError, "payload is not valid JSON"));
    }
    return presentation_from_json(j);
}

} // namespace slate_content
