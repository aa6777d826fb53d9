/// @file log.cpp
/// @brief slate logger setup

#include <slate/core/log.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>
#include <utility>
#include <vector>

namespace slate_core {

namespace {

constexpr const char* k_logger_name = "slate";

std::mutex& logger_mutex() {
    static std::mutex mutex;
    return mutex;
}

std::shared_ptr<spdlog::logger>& current_logger() {
    static std::shared_ptr<spdlog::logger> logger;
    return logger;
}

spdlog::sink_ptr make_stderr_sink() {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    return sink;
}

} // anonymous namespace

std::shared_ptr<spdlog::logger> content_logger() {
    std::lock_guard<std::mutex> lock(logger_mutex());
    auto& logger = current_logger();
    if (!logger) {
        logger = std::make_shared<spdlog::logger>(k_logger_name, make_stderr_sink());
        logger->set_level(spdlog::level::info);
    }
    return logger;
}

void configure_logging(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks{make_stderr_sink()};
    std::string file_error;

    if (!config.log_directory.empty()) {
        auto path = config.log_directory / "slate.log";
        try {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path.string(), config.max_file_size, config.max_files);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
            sinks.push_back(std::move(file_sink));
        } catch (const spdlog::spdlog_ex& ex) {
            file_error = path.string() + ": " + ex.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>(k_logger_name, sinks.begin(), sinks.end());
    logger->set_level(config.level);
    logger->flush_on(spdlog::level::warn);
    {
        std::lock_guard<std::mutex> lock(logger_mutex());
        current_logger() = logger;
    }

    if (!file_error.empty()) {
        logger->warn("cannot open log file {}", file_error);
    }
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    if (str == "fatal") {
        return spdlog::level::critical;
    }
    // from_str maps unknown names to off
    auto level = spdlog::level::from_str(str);
    if (level == spdlog::level::off && str != "off") {
        return std::nullopt;
    }
    return level;
}

LogScope::LogScope(std::string name)
    : m_name(std::move(name))
    , m_start(std::chrono::steady_clock::now())
{
    SLATE_LOG_TRACE(">>> {}", m_name);
}

LogScope::~LogScope() {
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - m_start);
    SLATE_LOG_TRACE("<<< {} ({}us)", m_name, elapsed.count());
}

void flush_logging() {
    content_logger()->flush();
}

void shutdown_logging() {
    flush_logging();
    {
        std::lock_guard<std::mutex> lock(logger_mutex());
        current_logger().reset();
    }
    spdlog::shutdown();
}

} // namespace slate_core
