/// @file csv.cpp
/// @brief CSV table implementation

#include <slate/content/csv.hpp>
#include <slate/content/files.hpp>
#include <slate/content/strings.hpp>

#include <algorithm>

namespace slate_content {

namespace {

/// One record with the line it started on
struct RawRecord {
    CsvTable::Record fields;
    std::size_t line = 0;
};

std::vector<RawRecord> read_records(std::string_view text) {
    std::vector<RawRecord> records;
    RawRecord current;
    std::string field;
    bool in_quotes = false;
    bool field_started = false;
    std::size_t line = 1;
    current.line = 1;

    auto end_field = [&]() {
        current.fields.push_back(std::move(field));
        field.clear();
        field_started = false;
    };
    auto end_record = [&]() {
        end_field();
        bool blank = current.fields.size() == 1 && current.fields.front().empty();
        if (!blank) {
            records.push_back(std::move(current));
        }
        current = RawRecord{};
        current.line = line;
    };

    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                if (c == '\n') ++line;
                field.push_back(c);
            }
            continue;
        }

        switch (c) {
            case '"':
                if (!field_started) {
                    in_quotes = true;
                    field_started = true;
                } else {
                    field.push_back(c);
                }
                break;
            case ',':
                end_field();
                break;
            case '\r':
                if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
                ++line;
                end_record();
                break;
            case '\n':
                ++line;
                end_record();
                break;
            default:
                field.push_back(c);
                field_started = true;
                break;
        }
    }

    if (field_started || !field.empty() || !current.fields.empty()) {
        end_record();
    }
    return records;
}

} // anonymous namespace

// =============================================================================
// Reading
// =============================================================================

CsvTable CsvTable::parse(std::string_view text) {
    CsvTable table;
    auto records = read_records(text);
    if (records.empty()) {
        return table;
    }

    table.m_header = std::move(records.front().fields);
    for (auto& name : table.m_header) {
        name = trim(name);
    }
    for (std::size_t i = 1; i < records.size(); ++i) {
        table.m_rows.push_back(std::move(records[i].fields));
        table.m_lines.push_back(records[i].line);
    }
    return table;
}

slate_core::Result<CsvTable> CsvTable::read_file(const std::filesystem::path& path) {
    auto text = read_text_file(path);
    if (!text) {
        return slate_core::Err<CsvTable>(text.error());
    }
    return slate_core::Ok(parse(*text));
}

// =============================================================================
// Access
// =============================================================================

std::ptrdiff_t CsvTable::column_index(std::string_view column) const {
    auto it = std::find(m_header.begin(), m_header.end(), column);
    if (it == m_header.end()) return -1;
    return it - m_header.begin();
}

bool CsvTable::has_column(std::string_view column) const {
    return column_index(column) >= 0;
}

std::string CsvTable::cell(std::size_t row, std::string_view column) const {
    if (row >= m_rows.size()) return {};
    auto index = column_index(column);
    if (index < 0) return {};
    const auto& record = m_rows[row];
    auto i = static_cast<std::size_t>(index);
    return i < record.size() ? record[i] : std::string{};
}

std::string CsvTable::field(std::size_t row, std::string_view column) const {
    return trim(cell(row, column));
}

std::string CsvTable::field_any(std::size_t row, std::initializer_list<std::string_view> columns) const {
    for (auto column : columns) {
        std::string value = field(row, column);
        if (!value.empty()) return value;
    }
    return {};
}

std::size_t CsvTable::line_of(std::size_t row) const {
    return row < m_lines.size() ? m_lines[row] : 0;
}

// =============================================================================
// Writing
// =============================================================================

void CsvTable::add_row(Record row) {
    m_rows.push_back(std::move(row));
    m_lines.push_back(0);
}

std::string csv_escape(std::string_view field) {
    bool needs_quotes = field.find_first_of(",\"\r\n") != std::string_view::npos;
    if (!needs_quotes) {
        return std::string(field);
    }
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += "\"\"";
        else out.push_back(c);
    }
    out += '"';
    return out;
}

std::string CsvTable::to_string() const {
    std::string out;
    auto write_record = [&out](const Record& record) {
        for (std::size_t i = 0; i < record.size(); ++i) {
            if (i > 0) out += ',';
            out += csv_escape(record[i]);
        }
        out += '\n';
    };
    write_record(m_header);
    for (const auto& row : m_rows) {
        write_record(row);
    }
    return out;
}

} // namespace slate_content
