#pragma once

/// @file params.hpp
/// @brief Header-line scanner and parameter splitter for the presentation DSL
///
/// Header grammar:
///
///     keyword[ key=value, key="quoted, value", key={a,b}, ... ] [:] [inline content]
///
/// Commas separate fields only outside double quotes and when the {}, [] and ()
/// depth counters are all zero.

#include <slate/core/error.hpp>

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace slate_content {

// =============================================================================
// ParamMap
// =============================================================================

/// Ordered key/value parameters of one header line
class ParamMap {
public:
    using Entry = std::pair<std::string, std::string>;

    ParamMap() = default;

    /// Insert or overwrite (an overwritten key keeps its first position)
    void set(const std::string& key, std::string value);

    [[nodiscard]] bool contains(const std::string& key) const;
    [[nodiscard]] std::optional<std::string> get(const std::string& key) const;

    /// Trimmed value, or `def` when missing or blank
    [[nodiscard]] std::string get_or(const std::string& key, const std::string& def) const;

    /// First non-blank trimmed value among the given aliases
    [[nodiscard]] std::optional<std::string> first_of(std::initializer_list<const char*> keys) const;

    [[nodiscard]] std::size_t size() const noexcept { return m_entries.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_entries.empty(); }

    [[nodiscard]] const std::vector<Entry>& entries() const noexcept { return m_entries; }
    [[nodiscard]] auto begin() const noexcept { return m_entries.begin(); }
    [[nodiscard]] auto end() const noexcept { return m_entries.end(); }

private:
    std::vector<Entry> m_entries;
};

// =============================================================================
// Header lines
// =============================================================================

/// One scanned `keyword[params]:` line
struct HeaderLine {
    std::string keyword;
    ParamMap params;
    bool has_colon = false;   // Trailing ':' with nothing after it: a body follows
    std::string inline_text;  // Content after the ']' (and ':'), trimmed
    std::string raw;
};

/// Split a raw parameter region into fields (quote and bracket-depth aware)
[[nodiscard]] std::vector<std::string> split_top_level(std::string_view raw, bool track_brackets = true);

/// Parse a raw parameter region into an ordered map; fields without '=' are ignored
[[nodiscard]] ParamMap split_params(std::string_view raw);

/// Scan a trimmed line against the header grammar; nullopt when it does not match
[[nodiscard]] std::optional<HeaderLine> scan_header(std::string_view line);

/// True when the trimmed line is a header line
[[nodiscard]] bool is_header_line(std::string_view line);

/// Scan a header and require name=; grammar errors carry the raw line and position
[[nodiscard]] slate_core::Result<HeaderLine> parse_header(
    std::string_view line,
    const std::string& source = "<string>",
    std::size_t line_no = 0);

} // namespace slate_content
