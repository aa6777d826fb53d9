#pragma once

/// @file strings.hpp
/// @brief Small text helpers shared by the content readers and writers

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace slate_content {

/// Strip ASCII whitespace on both ends
[[nodiscard]] std::string trim(std::string_view s);

[[nodiscard]] std::string to_lower(std::string_view s);

/// Split text into lines (\n, \r\n and \r terminators), without terminators
[[nodiscard]] std::vector<std::string> split_lines(std::string_view text);

/// Parse a whole (trimmed) string as a floating point number
[[nodiscard]] std::optional<double> parse_number(std::string_view s);

/// Truncate toward zero; nullopt when non-finite or outside the int range
[[nodiscard]] std::optional<int> truncate_to_int(double value);

/// Shortest text that parses back to the same double
[[nodiscard]] std::string format_number(double value);

/// "a, b, c"
[[nodiscard]] std::string join(const std::vector<std::string>& parts, std::string_view sep);

} // namespace slate_content
