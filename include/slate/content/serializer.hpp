#pragma once

/// @file serializer.hpp
/// @brief Scene graph to presentation.pr, geometries.csv and animations.csv

#include "types.hpp"

#include <slate/core/error.hpp>

#include <filesystem>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace slate_content {

struct SaveOptions {
    /// Also write defaults.json
    bool write_defaults = false;
};

/// Serializes a presentation back into its source files.
///
/// View cameras are written from their stored camera spec, never recomputed
/// from transforms, so a save/load cycle does not drift.
class ContentSerializer {
public:
    using Params = std::vector<std::pair<std::string, std::string>>;

    ContentSerializer() = default;

    /// Write all files into a presentation folder (each file replaced atomically)
    [[nodiscard]] slate_core::Result<void> save(
        const Presentation& graph,
        const std::filesystem::path& dir,
        const SaveOptions& options = {}) const;

    /// DSL text; fails on a node without a kind or a node no view shows
    [[nodiscard]] slate_core::Result<std::string> write_dsl(const Presentation& graph) const;

    [[nodiscard]] std::string write_geometries(const Presentation& graph) const;
    [[nodiscard]] std::string write_animations(const Presentation& graph) const;

    /// Header parameter value: quoted iff it contains ',', '[', ']' or a newline; '"' becomes '\''
    [[nodiscard]] static std::string quote_value(std::string_view value);

    /// `keyword[k=v,...]`
    [[nodiscard]] static std::string format_header(std::string_view keyword, const Params& params);

private:
    [[nodiscard]] slate_core::Result<void> serialize_node(
        std::ostringstream& ss, const Node& node, const View& view) const;

    static void serialize_view(std::ostringstream& ss, const View& view);
    static void append_style(Params& params, const NodeStyle& style);
    static void write_body(std::ostringstream& ss, const std::vector<std::string>& lines);
    static Params timer_params(const TimerPayload& timer);
};

} // namespace slate_content
