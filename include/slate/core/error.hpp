#pragma once

/// @file error.hpp
/// @brief Error handling types for slate_core

#include "fwd.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace slate_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    ValidationError,
    NotSupported,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::NotSupported: return "NotSupported";
        default: return "Unknown";
    }
}

namespace detail {

inline std::string join_names(const std::vector<std::string>& names) {
    std::string out;
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += ", ";
        out += names[i];
    }
    return out;
}

inline std::string number_text(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Kinds
// =============================================================================

/// Presentation content errors (DSL, overlays, composites, serialization)
struct ContentError {
    enum class Kind : std::uint8_t {
        Grammar,      // Malformed line, missing name=, unknown keyword
        Semantic,     // Well-formed but rejected (camera algebra, timer bins, animations)
        MissingFile,  // Mandatory overlay file absent
        Io,           // Read/write failure
        Unsupported,  // Serializer cannot represent a node
    };

    Kind kind;
    std::string message;
    std::string source;   // File path or "<string>"
    std::size_t line = 0; // 1-based, 0 when not line-bound
    std::string context;  // Offending raw line or value

    /// Attach source location
    ContentError& at(std::string src, std::size_t line_no) {
        source = std::move(src);
        line = line_no;
        return *this;
    }

    // Grammar -----------------------------------------------------------------

    [[nodiscard]] static ContentError invalid_header(const std::string& raw) {
        return ContentError{Kind::Grammar, "Invalid line (expected keyword[...]): " + raw, {}, 0, raw};
    }

    [[nodiscard]] static ContentError missing_name(const std::string& raw) {
        return ContentError{Kind::Grammar, "Missing required name= in: " + raw, {}, 0, raw};
    }

    [[nodiscard]] static ContentError unknown_keyword(const std::string& keyword, const std::string& raw) {
        return ContentError{Kind::Grammar, "Unknown keyword: " + keyword, {}, 0, raw};
    }

    [[nodiscard]] static ContentError outside_view(const std::string& raw) {
        return ContentError{Kind::Grammar, "Block outside of any view: " + raw, {}, 0, raw};
    }

    [[nodiscard]] static ContentError duplicate_node(const std::string& id, const std::string& raw) {
        return ContentError{Kind::Grammar, "Duplicate node id '" + id + "'", {}, 0, raw};
    }

    [[nodiscard]] static ContentError bad_number(const std::string& column, const std::string& value) {
        return ContentError{Kind::Grammar,
            "Column '" + column + "' expects a number, got '" + value + "'", {}, 0, value};
    }

    // Semantic ----------------------------------------------------------------

    [[nodiscard]] static ContentError legacy_camera_params(const std::vector<std::string>& keys) {
        return ContentError{Kind::Semantic,
            "Legacy view camera params are no longer supported (" + detail::join_names(keys) + "). "
            "Use view[name=...,refView=<id>,loc=<right|left|up|down|topRight|topLeft|bottomRight|bottomLeft>] "
            "and omit zoom/cx/cy/ref.",
            {}, 0, detail::join_names(keys)};
    }

    [[nodiscard]] static ContentError first_view_params(const std::vector<std::string>& keys) {
        return ContentError{Kind::Semantic,
            "First view must not specify camera params. Remove: " + detail::join_names(keys),
            {}, 0, detail::join_names(keys)};
    }

    [[nodiscard]] static ContentError missing_ref_view(const std::string& view) {
        return ContentError{Kind::Semantic,
            "View '" + view + "': views after the first must include refView=<id>.", {}, 0, view};
    }

    [[nodiscard]] static ContentError unknown_ref_view(const std::string& ref, const std::vector<std::string>& known) {
        return ContentError{Kind::Semantic,
            "Unknown refView='" + ref + "'. Known: [" + detail::join_names(known) + "]", {}, 0, ref};
    }

    [[nodiscard]] static ContentError missing_loc(const std::string& view) {
        return ContentError{Kind::Semantic,
            "View '" + view + "': views after the first must specify refView=<id> and loc=<...>. "
            "Example: view[name=view2,refView=home,loc=right]:",
            {}, 0, view};
    }

    [[nodiscard]] static ContentError unknown_loc(const std::string& view, const std::string& loc) {
        return ContentError{Kind::Semantic,
            "View '" + view + "': unrecognized loc='" + loc +
            "' (expected center, origin, or a combination of left/right/top/up/bottom/down)",
            {}, 0, loc};
    }

    [[nodiscard]] static ContentError incompatible_timer_bins(const std::string& id, double span, double bin) {
        return ContentError{Kind::Semantic,
            "timer[" + id + "] has incompatible min/max/binSize (span=" + detail::number_text(span) +
            ", bin=" + detail::number_text(bin) + ")",
            {}, 0, id};
    }

    [[nodiscard]] static ContentError iframe_without_src(const std::string& raw) {
        return ContentError{Kind::Semantic, "iframe requires src= in: " + raw, {}, 0, raw};
    }

    [[nodiscard]] static ContentError direct_animation(const std::string& id) {
        return ContentError{Kind::Semantic,
            "animations.csv uses how=direct which is no longer supported; use how=sudden (id=" + id + ")",
            {}, 0, id};
    }

    [[nodiscard]] static ContentError unsupported_animation(const std::string& id, const std::string& how) {
        return ContentError{Kind::Semantic,
            "animations.csv has unsupported how='" + how + "' (id=" + id +
            "); allowed: [appear, fade, pixelate, sudden]",
            {}, 0, how};
    }

    // Files -------------------------------------------------------------------

    [[nodiscard]] static ContentError missing_file(const std::string& path) {
        return ContentError{Kind::MissingFile, "Missing required file: " + path, path, 0, {}};
    }

    [[nodiscard]] static ContentError io_failure(const std::string& path, const std::string& reason) {
        return ContentError{Kind::Io, "I/O failure on " + path + ": " + reason, path, 0, {}};
    }

    // Serialization -----------------------------------------------------------

    [[nodiscard]] static ContentError unsupported_node(const std::string& id, const std::string& type) {
        return ContentError{Kind::Unsupported,
            "Unsupported node type '" + type + "' (id=" + id + ")", {}, 0, id};
    }

    [[nodiscard]] static ContentError orphan_node(const std::string& id) {
        return ContentError{Kind::Unsupported,
            "Node '" + id + "' is not shown in any view and cannot be written", {}, 0, id};
    }
};

/// Get content error kind name
[[nodiscard]] inline const char* content_error_kind_name(ContentError::Kind kind) {
    switch (kind) {
        case ContentError::Kind::Grammar: return "Grammar";
        case ContentError::Kind::Semantic: return "Semantic";
        case ContentError::Kind::MissingFile: return "MissingFile";
        case ContentError::Kind::Io: return "Io";
        case ContentError::Kind::Unsupported: return "Unsupported";
        default: return "Unknown";
    }
}

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        ContentError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(ContentError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}
    Error(ErrorCode code, const char* msg) : m_code(code), m_error(std::string(msg)) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    /// All context entries
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    static ErrorCode to_error_code(ContentError::Kind kind) {
        switch (kind) {
            case ContentError::Kind::Grammar: return ErrorCode::ParseError;
            case ContentError::Kind::Semantic: return ErrorCode::ValidationError;
            case ContentError::Kind::MissingFile: return ErrorCode::NotFound;
            case ContentError::Kind::Io: return ErrorCode::IOError;
            case ContentError::Kind::Unsupported: return ErrorCode::NotSupported;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type (similar to Rust's Result<T, E>)
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Get value or default
    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    /// Operator bool (true if ok)
    explicit operator bool() const noexcept { return m_value.has_value(); }

    /// Dereference operator (returns value)
    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    /// Arrow operator
    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::move(*m_value);
    }

private:
    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    /// Success constructor
    Result() : m_has_value(true) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    /// Static factory for success
    [[nodiscard]] static Result ok() { return Result(); }

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    /// Get error
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Operator bool
    explicit operator bool() const noexcept { return m_has_value; }

    /// Unwrap
    void unwrap() const {
        if (!m_has_value) {
            throw std::runtime_error("Result contains error");
        }
    }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with kind, location and context chain
std::string build_error_chain(const Error& error);

} // namespace slate_core
