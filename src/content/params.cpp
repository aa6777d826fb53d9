/// @file params.cpp
/// @brief Header scanner and parameter splitter implementation

#include <slate/content/params.hpp>
#include <slate/content/strings.hpp>

#include <algorithm>
#include <cctype>

namespace slate_content {

// =============================================================================
// ParamMap
// =============================================================================

void ParamMap::set(const std::string& key, std::string value) {
    for (auto& entry : m_entries) {
        if (entry.first == key) {
            entry.second = std::move(value);
            return;
        }
    }
    m_entries.emplace_back(key, std::move(value));
}

bool ParamMap::contains(const std::string& key) const {
    return std::any_of(m_entries.begin(), m_entries.end(),
        [&key](const Entry& e) { return e.first == key; });
}

std::optional<std::string> ParamMap::get(const std::string& key) const {
    for (const auto& entry : m_entries) {
        if (entry.first == key) {
            return entry.second;
        }
    }
    return std::nullopt;
}

std::string ParamMap::get_or(const std::string& key, const std::string& def) const {
    auto value = get(key);
    if (!value) return def;
    std::string t = trim(*value);
    return t.empty() ? def : t;
}

std::optional<std::string> ParamMap::first_of(std::initializer_list<const char*> keys) const {
    for (const char* key : keys) {
        auto value = get(key);
        if (value) {
            std::string t = trim(*value);
            if (!t.empty()) return t;
        }
    }
    return std::nullopt;
}

// =============================================================================
// Splitting
// =============================================================================

std::vector<std::string> split_top_level(std::string_view raw, bool track_brackets) {
    std::vector<std::string> parts;
    std::string buf;
    bool in_quotes = false;
    int brace_depth = 0;    // {...}
    int bracket_depth = 0;  // [...]
    int paren_depth = 0;    // (...)

    for (char ch : raw) {
        if (ch == '"') {
            in_quotes = !in_quotes;
            buf.push_back(ch);
            continue;
        }
        if (!in_quotes && track_brackets) {
            switch (ch) {
                case '{': ++brace_depth; break;
                case '}': brace_depth = std::max(0, brace_depth - 1); break;
                case '[': ++bracket_depth; break;
                case ']': bracket_depth = std::max(0, bracket_depth - 1); break;
                case '(': ++paren_depth; break;
                case ')': paren_depth = std::max(0, paren_depth - 1); break;
                default: break;
            }
        }
        if (ch == ',' && !in_quotes && brace_depth == 0 && bracket_depth == 0 && paren_depth == 0) {
            parts.push_back(trim(buf));
            buf.clear();
            continue;
        }
        buf.push_back(ch);
    }

    std::string last = trim(buf);
    if (!last.empty()) {
        parts.push_back(std::move(last));
    }
    return parts;
}

ParamMap split_params(std::string_view raw) {
    ParamMap out;
    for (const auto& part : split_top_level(raw)) {
        auto eq = part.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string key = trim(std::string_view(part).substr(0, eq));
        std::string value = trim(std::string_view(part).substr(eq + 1));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
        out.set(key, std::move(value));
    }
    return out;
}

// =============================================================================
// Header scanner
// =============================================================================

namespace {

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

/// Scanner states for one header line
enum class ScanState {
    Keyword,
    Params,
    Quoted,
    AfterParams,
};

} // anonymous namespace

std::optional<HeaderLine> scan_header(std::string_view line) {
    if (line.empty() || !is_ident_start(line.front())) {
        return std::nullopt;
    }

    HeaderLine header;
    header.raw = std::string(line);

    ScanState state = ScanState::Keyword;
    std::size_t params_begin = 0;
    std::size_t params_end = 0;
    std::size_t i = 0;

    for (; i < line.size() && state != ScanState::AfterParams; ++i) {
        char c = line[i];
        switch (state) {
            case ScanState::Keyword:
                if (c == '[') {
                    header.keyword = std::string(line.substr(0, i));
                    params_begin = i + 1;
                    state = ScanState::Params;
                } else if (!is_ident_char(c)) {
                    return std::nullopt;
                }
                break;
            case ScanState::Params:
                if (c == '"') {
                    state = ScanState::Quoted;
                } else if (c == ']') {
                    // First unquoted ']' closes the parameters; '[' does not nest
                    params_end = i;
                    state = ScanState::AfterParams;
                }
                break;
            case ScanState::Quoted:
                if (c == '"') {
                    state = ScanState::Params;
                }
                break;
            case ScanState::AfterParams:
                break;
        }
    }

    if (state != ScanState::AfterParams || params_end == params_begin) {
        return std::nullopt;
    }

    std::string_view rest = line.substr(i);
    std::size_t pos = 0;
    while (pos < rest.size() && std::isspace(static_cast<unsigned char>(rest[pos]))) ++pos;
    bool colon = pos < rest.size() && rest[pos] == ':';
    if (colon) ++pos;

    header.params = split_params(line.substr(params_begin, params_end - params_begin));
    header.inline_text = trim(rest.substr(pos));
    header.has_colon = colon && header.inline_text.empty();
    return header;
}

bool is_header_line(std::string_view line) {
    return scan_header(line).has_value();
}

slate_core::Result<HeaderLine> parse_header(
    std::string_view line,
    const std::string& source,
    std::size_t line_no)
{
    std::string stripped = trim(line);
    auto header = scan_header(stripped);
    if (!header) {
        return slate_core::Err<HeaderLine>(
            slate_core::ContentError::invalid_header(std::string(line)).at(source, line_no));
    }
    auto name = header->params.get("name");
    if (!name || trim(*name).empty()) {
        return slate_core::Err<HeaderLine>(
            slate_core::ContentError::missing_name(std::string(line)).at(source, line_no));
    }
    return slate_core::Ok(std::move(*header));
}

} // namespace slate_content
