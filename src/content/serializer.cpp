/// @file serializer.cpp
/// @brief Content serializer implementation

#include <slate/content/serializer.hpp>
#include <slate/content/animation.hpp>
#include <slate/content/csv.hpp>
#include <slate/content/defaults.hpp>
#include <slate/content/files.hpp>
#include <slate/content/geometry.hpp>
#include <slate/content/strings.hpp>
#include <slate/core/log.hpp>

#include <algorithm>
#include <set>
#include <type_traits>

namespace slate_content {

namespace fs = std::filesystem;

namespace {

bool is_style_key(const std::string& key) {
    return key == "bgColor" || key == "bg" || key == "bgAlpha" || key == "borderRadius" || key == "rounded";
}

bool is_timer_field(const std::string& key) {
    static const std::set<std::string> fields = {
        "showTime", "barColor", "lineColor", "lineWidth", "stat", "min", "max", "binSize",
    };
    return fields.count(key) > 0;
}

std::vector<std::string> split_text(const std::string& text) {
    if (text.empty()) return {};
    return split_lines(text);
}

} // anonymous namespace

// =============================================================================
// Formatting
// =============================================================================

std::string ContentSerializer::quote_value(std::string_view value) {
    std::string safe(value);
    std::replace(safe.begin(), safe.end(), '"', '\'');
    if (safe.find_first_of(",[]\n\r") != std::string::npos) {
        return "\"" + safe + "\"";
    }
    return safe;
}

std::string ContentSerializer::format_header(std::string_view keyword, const Params& params) {
    std::string out(keyword);
    out += '[';
    for (std::size_t i = 0; i < params.size(); ++i) {
        if (i > 0) out += ',';
        out += params[i].first;
        out += '=';
        out += quote_value(params[i].second);
    }
    out += ']';
    return out;
}

void ContentSerializer::append_style(Params& params, const NodeStyle& style) {
    if (style.bg_color) params.emplace_back("bgColor", *style.bg_color);
    if (style.bg_alpha) params.emplace_back("bgAlpha", format_number(*style.bg_alpha));
    if (style.border_radius) params.emplace_back("borderRadius", format_number(*style.border_radius));
}

void ContentSerializer::write_body(std::ostringstream& ss, const std::vector<std::string>& lines) {
    for (const auto& line : lines) {
        ss << line << '\n';
    }
    ss << '\n';
}

ContentSerializer::Params ContentSerializer::timer_params(const TimerPayload& timer) {
    std::vector<std::pair<std::string, std::optional<std::string>>> typed = {
        {"showTime", timer.show_time ? std::optional<std::string>("1") : std::nullopt},
        {"barColor", timer.bar_color != "orange" ? std::optional<std::string>(timer.bar_color) : std::nullopt},
        {"lineColor", timer.line_color != "green" ? std::optional<std::string>(timer.line_color) : std::nullopt},
        {"lineWidth", timer.line_width ? std::optional<std::string>(format_number(*timer.line_width)) : std::nullopt},
        {"stat", timer.stat != "gaussian" ? std::optional<std::string>(timer.stat) : std::nullopt},
        {"min", timer.min_s ? std::optional<std::string>(format_number(*timer.min_s)) : std::nullopt},
        {"max", timer.max_s ? std::optional<std::string>(format_number(*timer.max_s)) : std::nullopt},
        {"binSize", timer.bin_size_s ? std::optional<std::string>(format_number(*timer.bin_size_s)) : std::nullopt},
    };
    auto typed_value = [&typed](const std::string& key) -> const std::optional<std::string>* {
        for (const auto& [k, v] : typed) {
            if (k == key) return &v;
        }
        return nullptr;
    };

    Params params;
    std::set<std::string> written;
    // Authoring order first; typed fields carry their current value
    for (const auto& [key, value] : timer.args) {
        if (key == "name" || is_style_key(key) || written.count(key) > 0) continue;
        if (is_timer_field(key)) {
            if (const auto* v = typed_value(key); v && *v) {
                params.emplace_back(key, **v);
            }
        } else {
            params.emplace_back(key, value);
        }
        written.insert(key);
    }
    for (const auto& [key, value] : typed) {
        if (value && written.count(key) == 0) {
            params.emplace_back(key, *value);
        }
    }
    return params;
}

// =============================================================================
// DSL
// =============================================================================

void ContentSerializer::serialize_view(std::ostringstream& ss, const View& view) {
    Params params = {{"name", view.id}};
    if (view.screen) {
        ss << format_header("screen", params) << ":\n";
        return;
    }
    if (view.camera_spec) {
        const auto& spec = *view.camera_spec;
        if (!spec.ref_view.empty()) params.emplace_back("refView", spec.ref_view);
        if (!spec.loc.empty()) params.emplace_back("loc", spec.loc);
        if (spec.duration_ms && !spec.duration_ms->empty()) params.emplace_back("durationMs", *spec.duration_ms);
    }
    ss << format_header("view", params) << ":\n";
}

slate_core::Result<void> ContentSerializer::serialize_node(
    std::ostringstream& ss, const Node& node, const View& view) const
{
    Params params = {{"name", node.id}};
    const NodeStyle& style = node.style;

    return std::visit([&](const auto& p) -> slate_core::Result<void> {
        using T = std::decay_t<decltype(p)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            return slate_core::Err(slate_core::ContentError::unsupported_node(node.id, "none"));
        } else if constexpr (std::is_same_v<T, TextPayload>) {
            append_style(params, style);
            ss << format_header("text", params) << ":\n";
            write_body(ss, split_text(p.text));
        } else if constexpr (std::is_same_v<T, QrPayload>) {
            if (p.url != "/join") params.emplace_back("url", p.url);
            append_style(params, style);
            ss << format_header("qr", params) << "\n";
        } else if constexpr (std::is_same_v<T, ImagePayload>) {
            if (p.src != "/media/" + node.id + ".png") params.emplace_back("file", p.src);
            if (node.space == Space::Screen && !view.screen) params.emplace_back("space", "screen");
            append_style(params, style);
            ss << format_header("image", params) << "\n";
        } else if constexpr (std::is_same_v<T, HtmlFramePayload>) {
            params.emplace_back("src", p.src);
            append_style(params, style);
            ss << format_header("iframe", params) << "\n";
        } else if constexpr (std::is_same_v<T, BulletsPayload>) {
            std::string type = p.style == "X" ? "I" : p.style;
            if (type != "A") params.emplace_back("type", type);
            append_style(params, style);
            ss << format_header("bullets", params) << ":\n";
            write_body(ss, p.items);
        } else if constexpr (std::is_same_v<T, TablePayload>) {
            if (p.delimiter != ";") params.emplace_back("delim", p.delimiter);
            if (p.hstyle) params.emplace_back("hstyle", *p.hstyle);
            if (p.vstyle) params.emplace_back("vstyle", *p.vstyle);
            append_style(params, style);
            ss << format_header("table", params) << ":\n";
            std::vector<std::string> rows;
            rows.reserve(p.rows.size());
            for (const auto& row : p.rows) {
                rows.push_back(join(row, p.delimiter));
            }
            write_body(ss, rows);
        } else if constexpr (std::is_same_v<T, GroupPayload>) {
            append_style(params, style);
            ss << format_header("group", params) << "\n";
        } else if constexpr (std::is_same_v<T, TimerPayload>) {
            for (auto& entry : timer_params(p)) {
                params.push_back(std::move(entry));
            }
            append_style(params, style);
            ss << format_header("timer", params) << "\n";
        } else if constexpr (std::is_same_v<T, ChoicesPayload>) {
            params.emplace_back("type", p.chart);
            if (p.bullets != "A") params.emplace_back("bullets", p.bullets);
            if (!p.options.empty()) {
                std::vector<std::string> parts;
                for (const auto& option : p.options) {
                    parts.push_back(option.label + ":" + option.color);
                }
                params.emplace_back("choices", "{" + join(parts, ",") + "}");
            }
            append_style(params, style);
            ss << format_header("choices", params) << ":\n";
            write_body(ss, split_text(p.question));
        } else if constexpr (std::is_same_v<T, VideoPayload>) {
            params.emplace_back("src", p.src);
            append_style(params, style);
            ss << format_header("video", params) << "\n";
        } else if constexpr (std::is_same_v<T, SoundPayload> || std::is_same_v<T, GraphPayload>) {
            for (const auto& [key, value] : p.params) {
                if (key != "name") params.emplace_back(key, value);
            }
            append_style(params, style);
            ss << format_header(std::is_same_v<T, SoundPayload> ? "sound" : "graph", params) << "\n";
        } else if constexpr (std::is_same_v<T, ArrowPayload> || std::is_same_v<T, LinePayload>) {
            params.emplace_back("from", p.from);
            params.emplace_back("to", p.to);
            params.emplace_back("color", p.color);
            if (p.width) params.emplace_back("width", format_number(*p.width));
            append_style(params, style);
            ss << format_header(std::is_same_v<T, ArrowPayload> ? "arrow" : "line", params) << "\n";
        }
        return slate_core::Ok();
    }, node.payload);
}

slate_core::Result<std::string> ContentSerializer::write_dsl(const Presentation& graph) const {
    for (const auto& node : graph.nodes) {
        if (!graph.owning_view(node.id)) {
            return slate_core::Err<std::string>(slate_core::ContentError::orphan_node(node.id));
        }
    }

    std::ostringstream ss;
    ss << "# presentation.pr (canonical)\n\n";

    std::set<std::string> emitted;
    for (const auto& view : graph.views) {
        serialize_view(ss, view);
        for (const auto& id : view.show) {
            if (!emitted.insert(id).second) {
                continue;
            }
            const Node* node = graph.find_node(id);
            if (!node) {
                SLATE_LOG_WARN("view '{}' shows unknown node '{}', skipped", view.id, id);
                continue;
            }
            auto written = serialize_node(ss, *node, view);
            if (!written) {
                return slate_core::Err<std::string>(written.error());
            }
        }
        ss << '\n';
    }

    std::string text = ss.str();
    while (!text.empty() && (text.back() == '\n' || text.back() == ' ')) {
        text.pop_back();
    }
    text += '\n';
    return slate_core::Ok(std::move(text));
}

// =============================================================================
// Overlays
// =============================================================================

std::string ContentSerializer::write_geometries(const Presentation& graph) const {
    CsvTable table(CsvTable::Record(std::begin(k_geometry_columns), std::end(k_geometry_columns)));
    const double design_h = graph.defaults.design_height;

    for (const auto& node : graph.nodes) {
        const View* view = graph.owning_view(node.id);
        std::string view_id = view ? view->id : "home";
        if (!view) {
            view = graph.find_view("home");
        }
        Camera center = view ? view->camera : Camera{};
        const Transform& t = node.transform;

        double x = 0.0;
        double y = 0.0;
        double w = 0.0;
        double h = 0.0;
        if (node.parent_id) {
            x = t.x; y = t.y; w = t.w; h = t.h;
        } else if (node.space == Space::Screen) {
            x = t.x / design_h;
            y = t.y / design_h;
            w = t.w / design_h;
            h = t.h / design_h;
        } else {
            x = to_normalized(t.x, center.cx, design_h);
            y = to_normalized(t.y, center.cy, design_h);
            w = t.w / design_h;
            h = t.h / design_h;
        }

        table.add_row({
            node.id,
            view_id,
            format_number(x),
            format_number(y),
            format_number(w),
            format_number(h),
            t.rotation_deg ? format_number(*t.rotation_deg) : std::string{},
            t.anchor,
            t.align.value_or(""),
            t.v_align.value_or(""),
            node.font_px ? format_number(*node.font_px / design_h) : std::string{},
            node.parent_id.value_or(""),
        });
    }
    return table.to_string();
}

std::string ContentSerializer::write_animations(const Presentation& graph) const {
    CsvTable table(CsvTable::Record(std::begin(k_animation_columns), std::end(k_animation_columns)));

    auto add = [&table](const std::string& id, CueWhen when, const AnimationSpec& spec) {
        std::string from = spec.from.value_or("");
        if (spec.kind == AnimationKind::Fade && spec.border_frac) {
            from += ":" + format_number(*spec.border_frac);
        }
        table.add_row({
            id,
            when == CueWhen::Enter ? "enter" : "exit",
            animation_kind_name(spec.kind),
            from,
            spec.duration_ms ? std::to_string(*spec.duration_ms) : std::string{},
            spec.delay_ms ? std::to_string(*spec.delay_ms) : std::string{},
        });
    };
    auto spec_of = [](const Node& node, CueWhen when) -> const std::optional<AnimationSpec>& {
        return when == CueWhen::Enter ? node.appear : node.disappear;
    };

    std::set<std::pair<std::string, CueWhen>> covered;
    for (const auto& cue : graph.animation_cues) {
        const Node* node = graph.find_node(cue.id);
        if (!node) continue;
        const auto& spec = spec_of(*node, cue.when);
        if (!spec) continue;
        add(cue.id, cue.when, *spec);
        covered.emplace(cue.id, cue.when);
    }

    for (const auto& node : graph.nodes) {
        for (CueWhen when : {CueWhen::Enter, CueWhen::Exit}) {
            const auto& spec = spec_of(node, when);
            if (spec && covered.count({node.id, when}) == 0) {
                add(node.id, when, *spec);
            }
        }
    }
    return table.to_string();
}

// =============================================================================
// Save
// =============================================================================

slate_core::Result<void> ContentSerializer::save(
    const Presentation& graph,
    const fs::path& dir,
    const SaveOptions& options) const
{
    auto dsl = write_dsl(graph);
    if (!dsl) {
        return slate_core::Err(dsl.error());
    }

    const std::pair<const char*, std::string> files[] = {
        {"presentation.pr", std::move(*dsl)},
        {"geometries.csv", write_geometries(graph)},
        {"animations.csv", write_animations(graph)},
    };
    for (const auto& [name, content] : files) {
        auto written = replace_file_atomically(dir / name, content);
        if (!written) {
            return written;
        }
    }

    if (options.write_defaults) {
        auto written = save_defaults(dir, graph.defaults);
        if (!written) {
            return written;
        }
    }

    SLATE_LOG_INFO("saved {} ({} views, {} nodes)", dir.string(), graph.views.size(), graph.nodes.size());
    return slate_core::Ok();
}

} // namespace slate_content
