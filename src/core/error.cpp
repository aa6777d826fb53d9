/// @file error.cpp
/// @brief Error handling implementation for slate_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Error formatting utilities
/// - Explicit template instantiations for common Result types

#include <slate/core/error.hpp>
#include <sstream>
#include <vector>

namespace slate_core {

// =============================================================================
// Error Message Formatting (Out-of-line for complex cases)
// =============================================================================

namespace detail {

/// Format content error with location and offending input
std::string format_content_error(const ContentError& err) {
    std::ostringstream oss;
    oss << "[ContentError:" << content_error_kind_name(err.kind) << "] " << err.message;

    if (!err.source.empty()) {
        oss << " (at " << err.source;
        if (err.line > 0) {
            oss << ":" << err.line;
        }
        oss << ")";
    } else if (err.line > 0) {
        oss << " (line " << err.line << ")";
    }

    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

/// Build a full error message with context chain
std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    // Error code
    oss << "[" << error_code_name(error.code()) << "] ";

    // Main message based on variant type
    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, ContentError>) {
            oss << detail::format_content_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << "\n  " << key << ": " << value;
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::string, Error>;

} // namespace slate_core
