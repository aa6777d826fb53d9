#pragma once

/// @file dsl_parser.hpp
/// @brief Presentation DSL parser (presentation.pr / presentation.txt)
///
/// Blocks:
///
///     view[name=home]:
///     view[name=detail,refView=home,loc=right,durationMs=800]:
///     screen[name=hud]:
///     text[name=title]: Hello
///     bullets[name=list,type=1]:
///       - first
///       - second
///     table[name=t,delim=";"]:
///       a;b;c
///     timer[name=timer1,min=0,max=10,binSize=2]
///     choices[name=poll,choices={Yes:green,No:red}]: Ready?

#include "types.hpp"
#include "params.hpp"

#include <slate/core/error.hpp>

#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace slate_content {

// =============================================================================
// Parse options and result
// =============================================================================

struct ParseOptions {
    std::string source = "<string>";
    Defaults defaults;
    /// Presentation folder; composites are materialized only when set
    std::optional<std::filesystem::path> presentation_dir;
};

/// Views and nodes of one DSL document, before overlays are applied
struct ParsedDocument {
    std::string initial_view_id = "home";
    std::vector<View> views;
    std::vector<Node> nodes;
};

// =============================================================================
// Block helpers
// =============================================================================

/// Fallback colors for choice options without one, by option index
inline constexpr std::array<const char*, 7> k_choice_palette = {
    "#4caf50", "#e53935", "#1e88e5", "#ab47bc", "#00bcd4", "#fdd835", "#8d6e63",
};

/// Option id from a label: whitespace runs become '_', other non-word characters
/// are dropped, an empty result becomes "option"
[[nodiscard]] std::string slugify(std::string_view label);

/// Parse `{Label:color,Label2,...}` into options with unique ids
[[nodiscard]] std::vector<ChoiceOption> parse_choice_options(std::string_view raw);

/// "1", "true", "yes", "on" (case-insensitive for the words)
[[nodiscard]] bool parse_flag(std::string_view value);

/// min/max/binSize must describe a whole, non-negative number of bins
[[nodiscard]] slate_core::Result<void> validate_timer_bins(
    const std::string& id,
    std::optional<double> min_s,
    std::optional<double> max_s,
    std::optional<double> bin_size_s);

/// Strip one leading list marker ("- ", "* ", "+ ")
[[nodiscard]] std::string strip_list_marker(std::string_view item);

// =============================================================================
// DslParser
// =============================================================================

class DslParser {
public:
    explicit DslParser(ParseOptions options = {});

    /// Parse DSL text
    [[nodiscard]] slate_core::Result<ParsedDocument> parse(std::string_view text) const;

    /// Parse a DSL file. A missing file yields an empty document.
    [[nodiscard]] slate_core::Result<ParsedDocument> parse_file(const std::filesystem::path& path) const;

    [[nodiscard]] const ParseOptions& options() const noexcept { return m_options; }

private:
    ParseOptions m_options;
};

} // namespace slate_content
