#pragma once

/// @file logging.h
/// @brief rcache logging utilities wrapping spdlog

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace rcache {

/// @brief Log levels matching spdlog levels
enum class LogLevel {
    kTrace = spdlog::level::trace,
    kDebug = spdlog::level::debug,
    kInfo = spdlog::level::info,
    kWarn = spdlog::level::warn,
    kError = spdlog::level::err,
    kCritical = spdlog::level::critical,
    kOff = spdlog::level::off
};

/// @brief Logging configuration
struct LogConfig {
    std::string name = "rcache";
    LogLevel level = LogLevel::kWarn;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [pid %P] %v";

    // File logging (optional)
    bool enable_file = false;
    std::string file_path = "rcache.log";
    size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    size_t max_files = 3;
};

/// @brief Initialize the library logger. Only the first call takes effect.
void InitLogging(const LogConfig& config = {});

/// @brief Get the library logger, initializing it with defaults if needed
std::shared_ptr<spdlog::logger> GetLogger();

/// @brief Set the library log level
void SetLogLevel(LogLevel level);

/// @brief Parse "trace", "debug", "info", "warn", "error", "critical" or "off"
std::optional<LogLevel> ParseLogLevel(std::string_view name);

/// @brief Flush all log messages
void FlushLogs();

/// @brief Shutdown the logging system
void ShutdownLogging();

// Convenience macros for logging
#define RCACHE_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::rcache::GetLogger(), __VA_ARGS__)
#define RCACHE_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::rcache::GetLogger(), __VA_ARGS__)
#define RCACHE_LOG_INFO(...) SPDLOG_LOGGER_INFO(::rcache::GetLogger(), __VA_ARGS__)
#define RCACHE_LOG_WARN(...) SPDLOG_LOGGER_WARN(::rcache::GetLogger(), __VA_ARGS__)
#define RCACHE_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::rcache::GetLogger(), __VA_ARGS__)
#define RCACHE_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(::rcache::GetLogger(), __VA_ARGS__)

}  // namespace rcache
