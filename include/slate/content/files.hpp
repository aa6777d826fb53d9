#pragma once

/// @file files.hpp
/// @brief File access used by the loader, the serializer and composites

#include <slate/core/error.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace slate_content {

/// Read a whole file. A missing file is a MissingFile error, anything else Io.
[[nodiscard]] slate_core::Result<std::string> read_text_file(const std::filesystem::path& path);

/// Write a whole file, creating parent directories
[[nodiscard]] slate_core::Result<void> write_text_file(
    const std::filesystem::path& path, std::string_view content);

/// Write to a sibling temporary file, then rename it over `path`
[[nodiscard]] slate_core::Result<void> replace_file_atomically(
    const std::filesystem::path& path, std::string_view content);

/// Write only when `path` does not exist yet. Returns true when written.
[[nodiscard]] slate_core::Result<bool> write_file_if_missing(
    const std::filesystem::path& path, std::string_view content);

} // namespace slate_content
