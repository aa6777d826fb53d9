#pragma once

/// @file log.hpp
/// @brief Compiler diagnostics through the shared "slate" spdlog logger
///
/// Diagnostics always go to stderr so that stdout stays free for payload
/// output. `configure_logging` can add a rotating slate.log file.

#include <spdlog/spdlog.h>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#define SLATE_LOG_TRACE(...) ::slate_core::content_logger()->trace(__VA_ARGS__)
#define SLATE_LOG_DEBUG(...) ::slate_core::content_logger()->debug(__VA_ARGS__)
#define SLATE_LOG_INFO(...) ::slate_core::content_logger()->info(__VA_ARGS__)
#define SLATE_LOG_WARN(...) ::slate_core::content_logger()->warn(__VA_ARGS__)
#define SLATE_LOG_ERROR(...) ::slate_core::content_logger()->error(__VA_ARGS__)

namespace slate_core {

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    /// Directory receiving slate.log; empty means stderr only
    std::filesystem::path log_directory;
    std::size_t max_file_size = 5 * 1024 * 1024;
    std::size_t max_files = 3;
};

/// Replace the slate logger with one built from `config`.
/// A log file that cannot be opened is reported on stderr and skipped.
void configure_logging(const LogConfig& config);

/// The "slate" logger; created with a stderr sink at info level on first use
[[nodiscard]] std::shared_ptr<spdlog::logger> content_logger();

/// spdlog level names plus the "fatal" alias; nullopt for anything else
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

/// Traces entry and exit of a load or save with its duration
class LogScope {
public:
    explicit LogScope(std::string name);
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;

private:
    std::string m_name;
    std::chrono::steady_clock::time_point m_start;
};

#define SLATE_LOG_CONCAT_IMPL(a, b) a##b
#define SLATE_LOG_CONCAT(a, b) SLATE_LOG_CONCAT_IMPL(a, b)
#define SLATE_LOG_SCOPE(name) ::slate_core::LogScope SLATE_LOG_CONCAT(slate_log_scope_, __LINE__)(name)

void flush_logging();

/// Flush and drop the logger; the next log call starts over on stderr
void shutdown_logging();

} // namespace slate_core
