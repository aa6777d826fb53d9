#pragma once

/// @file geometry.hpp
/// @brief geometries.csv overlay: node boxes, fonts and alignment
///
/// Columns: id,view,x,y,w,h,rotationDeg,anchor,align,vAlign,fontH,parent
///
/// Root rows are in view-height units relative to the view center and become
/// design pixels. Rows with a parent keep their parent-relative units.

#include "types.hpp"

#include <slate/core/error.hpp>

#include <map>
#include <string>
#include <vector>

namespace slate_content {

class CsvTable;

/// Canonical geometry header
inline constexpr const char* k_geometry_columns[] = {
    "id", "view", "x", "y", "w", "h", "rotationDeg", "anchor", "align", "vAlign", "fontH", "parent",
};

// =============================================================================
// Unit conversion
// =============================================================================

/// Normalized view units to design pixels: center + value * designHeight
[[nodiscard]] inline double to_world(double normalized, double center, double design_height) {
    return center + normalized * design_height;
}

/// Design pixels to normalized view units: (value - center) / designHeight
[[nodiscard]] inline double to_normalized(double world, double center, double design_height) {
    return (world - center) / design_height;
}

/// Box used when a node has no geometry row
[[nodiscard]] Transform default_transform(const Node& node);

// =============================================================================
// GeometryResolver
// =============================================================================

class GeometryResolver {
public:
    GeometryResolver(const std::vector<View>& views, Defaults defaults);

    /// View a row belongs to: the view column, else the first view showing
    /// the node, else "home"
    [[nodiscard]] std::string view_for(const std::string& node_id, const std::string& column) const;

    /// View by id, falling back to "home"; nullptr when neither exists
    [[nodiscard]] const View* find_view(const std::string& view_id) const;

    /// Merge a geometry table into `nodes`. Nodes without a row get default boxes.
    [[nodiscard]] slate_core::Result<void> apply(
        const CsvTable& table,
        std::vector<Node>& nodes,
        const std::string& source = "geometries.csv") const;

    /// Screen nodes are always visible; world nodes iff the initial view shows them
    static void apply_visibility(
        std::vector<Node>& nodes,
        const std::vector<View>& views,
        const std::string& initial_view_id);

private:
    const std::vector<View>& m_views;
    Defaults m_defaults;
    std::map<std::string, std::string> m_view_hint;  // node id -> first view showing it
};

} // namespace slate_content
