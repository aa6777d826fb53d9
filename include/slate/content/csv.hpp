#pragma once

/// @file csv.hpp
/// @brief Header-driven CSV tables for the geometry and animation overlays

#include <slate/core/error.hpp>

#include <cstddef>
#include <filesystem>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace slate_content {

/// A CSV document with a header row.
///
/// Reading follows RFC 4180 quoting (doubled quotes, embedded separators and
/// newlines inside quotes). Blank records are skipped. Cells are addressed by
/// column name; a missing column or a short row reads as an empty cell.
class CsvTable {
public:
    using Record = std::vector<std::string>;

    CsvTable() = default;
    explicit CsvTable(Record header) : m_header(std::move(header)) {}

    /// Parse a whole document; the first non-blank record is the header
    [[nodiscard]] static CsvTable parse(std::string_view text);

    /// Read a file; a missing file is a MissingFile error
    [[nodiscard]] static slate_core::Result<CsvTable> read_file(const std::filesystem::path& path);

    // -------------------------------------------------------------------------
    // Access
    // -------------------------------------------------------------------------

    [[nodiscard]] const Record& header() const noexcept { return m_header; }
    [[nodiscard]] std::size_t row_count() const noexcept { return m_rows.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_rows.empty(); }

    [[nodiscard]] bool has_column(std::string_view column) const;

    /// Raw cell text ("" when the column or cell is absent)
    [[nodiscard]] std::string cell(std::size_t row, std::string_view column) const;

    /// Trimmed cell text
    [[nodiscard]] std::string field(std::size_t row, std::string_view column) const;

    /// Trimmed text of the first present, non-blank column among aliases
    [[nodiscard]] std::string field_any(std::size_t row, std::initializer_list<std::string_view> columns) const;

    /// 1-based source line where the row starts (0 for built rows)
    [[nodiscard]] std::size_t line_of(std::size_t row) const;

    // -------------------------------------------------------------------------
    // Building
    // -------------------------------------------------------------------------

    void add_row(Record row);

    /// Serialize with '\n' record terminators
    [[nodiscard]] std::string to_string() const;

private:
    [[nodiscard]] std::ptrdiff_t column_index(std::string_view column) const;

    Record m_header;
    std::vector<Record> m_rows;
    std::vector<std::size_t> m_lines;
};

/// Quote a field when it contains a separator, a quote or a line break
[[nodiscard]] std::string csv_escape(std::string_view field);

} // namespace slate_content
