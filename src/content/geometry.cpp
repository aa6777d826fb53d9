/// @file geometry.cpp
/// @brief Geometry overlay implementation

#include <slate/content/geometry.hpp>
#include <slate/content/csv.hpp>
#include <slate/content/strings.hpp>
#include <slate/core/log.hpp>

#include <algorithm>
#include <set>

namespace slate_content {

Transform default_transform(const Node& node) {
    Transform t;
    if (node.space == Space::Screen) {
        t.x = 16.0; t.y = 16.0; t.w = 220.0; t.h = 90.0;
        t.anchor = "topLeft";
        return t;
    }
    switch (node.type().value_or(NodeType::Group)) {
        case NodeType::Text:
            t.x = 24.0; t.y = 18.0; t.w = 900.0; t.h = 60.0;
            t.anchor = "topLeft";
            break;
        case NodeType::Qr:
            t.x = 0.0; t.y = 0.0; t.w = 280.0; t.h = 280.0;
            t.anchor = "center";
            break;
        default:
            t.x = 0.0; t.y = 0.0; t.w = 100.0; t.h = 50.0;
            t.anchor = "topLeft";
            break;
    }
    return t;
}

// =============================================================================
// GeometryResolver
// =============================================================================

GeometryResolver::GeometryResolver(const std::vector<View>& views, Defaults defaults)
    : m_views(views)
    , m_defaults(defaults)
{
    for (const auto& view : m_views) {
        for (const auto& id : view.show) {
            m_view_hint.emplace(id, view.id);
        }
    }
}

std::string GeometryResolver::view_for(const std::string& node_id, const std::string& column) const {
    if (!column.empty()) {
        return column;
    }
    auto it = m_view_hint.find(node_id);
    return it != m_view_hint.end() ? it->second : "home";
}

const View* GeometryResolver::find_view(const std::string& view_id) const {
    auto by_id = [this](const std::string& id) -> const View* {
        auto it = std::find_if(m_views.begin(), m_views.end(),
            [&id](const View& v) { return v.id == id; });
        return it != m_views.end() ? &*it : nullptr;
    };
    if (const View* view = by_id(view_id)) {
        return view;
    }
    return by_id("home");
}

slate_core::Result<void> GeometryResolver::apply(
    const CsvTable& table,
    std::vector<Node>& nodes,
    const std::string& source) const
{
    const double design_h = m_defaults.design_height;
    std::set<std::string> placed;

    for (std::size_t row = 0; row < table.row_count(); ++row) {
        std::string id = table.field(row, "id");
        if (id.empty() || id.front() == '#') {
            continue;
        }

        auto number = [&](const char* column, double def) -> slate_core::Result<double> {
            std::string raw = table.field(row, column);
            if (raw.empty()) {
                return slate_core::Ok(def);
            }
            auto value = parse_number(raw);
            if (!value) {
                return slate_core::Err<double>(
                    slate_core::ContentError::bad_number(column, raw).at(source, table.line_of(row)));
            }
            return slate_core::Ok(*value);
        };

        auto x = number("x", 0.0);
        if (!x) return slate_core::Err(x.error());
        auto y = number("y", 0.0);
        if (!y) return slate_core::Err(y.error());
        auto w = number("w", 0.2);
        if (!w) return slate_core::Err(w.error());
        auto h = number("h", 0.1);
        if (!h) return slate_core::Err(h.error());
        auto font_h = number("fontH", -1.0);
        if (!font_h) return slate_core::Err(font_h.error());

        std::optional<double> rotation;
        if (!table.field(row, "rotationDeg").empty()) {
            auto rot = number("rotationDeg", 0.0);
            if (!rot) return slate_core::Err(rot.error());
            rotation = *rot;
        }

        auto node = std::find_if(nodes.begin(), nodes.end(),
            [&id](const Node& n) { return n.id == id; });
        if (node == nodes.end()) {
            SLATE_LOG_DEBUG("{}:{}: no node '{}' for geometry row", source, table.line_of(row), id);
            continue;
        }

        std::string view_id = view_for(id, table.field(row, "view"));
        std::string parent = table.field(row, "parent");
        const View* view = find_view(view_id);
        bool screen = node->space == Space::Screen || (view && view->screen);
        // Screen boxes are relative to the viewport origin
        Camera center = view && !screen ? view->camera : Camera{};

        Transform t;
        if (!parent.empty()) {
            t.x = *x;
            t.y = *y;
            t.w = *w;
            t.h = *h;
            node->parent_id = parent;
        } else {
            t.x = to_world(*x, center.cx, design_h);
            t.y = to_world(*y, center.cy, design_h);
            t.w = *w * design_h;
            t.h = *h * design_h;
            node->parent_id.reset();
        }
        t.rotation_deg = rotation;

        std::string anchor = table.field(row, "anchor");
        if (!anchor.empty()) t.anchor = anchor;
        std::string align = table.field(row, "align");
        if (!align.empty()) t.align = align;
        std::string v_align = table.field_any(row, {"vAlign", "valign"});
        if (!v_align.empty()) t.v_align = v_align;

        node->transform = std::move(t);
        node->space = screen ? Space::Screen : Space::World;
        if (*font_h >= 0.0) {
            node->font_px = *font_h * design_h;
        } else {
            node->font_px.reset();
        }
        placed.insert(id);
    }

    for (auto& node : nodes) {
        if (placed.count(node.id) == 0) {
            SLATE_LOG_WARN("{}: no geometry for '{}', using default box", source, node.id);
            node.transform = default_transform(node);
        }
    }

    SLATE_LOG_DEBUG("{}: {} geometry rows applied", source, placed.size());
    return slate_core::Ok();
}

void GeometryResolver::apply_visibility(
    std::vector<Node>& nodes,
    const std::vector<View>& views,
    const std::string& initial_view_id)
{
    auto initial = std::find_if(views.begin(), views.end(),
        [&initial_view_id](const View& v) { return v.id == initial_view_id; });

    for (auto& node : nodes) {
        if (node.space == Space::Screen) {
            node.visible = true;
            continue;
        }
        node.visible = initial != views.end()
            && std::find(initial->show.begin(), initial->show.end(), node.id) != initial->show.end();
    }
}

} // namespace slate_content
