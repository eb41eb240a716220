#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/format.h>

/**
 * Log Manager - centralized logging using spdlog
 * One logger ("PlaylistMirror") with a stderr console sink and a rotating file sink.
 * Sink levels and patterns can be overridden from a log.properties file.
 */
class LogManager
{
public:
    enum class LogLevel {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Critical = 5
    };

    static LogManager& instance();

    // Initialize logging system
    void initialize(const std::string& logDirectory = "log");
    void shutdown();
    bool isInitialized() const { return m_initialized; }

    // Log level management
    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;

    // Accepts trace/debug/info/warn/warning/error/critical (any case); unknown names map to Info
    static LogLevel parseLogLevel(const std::string& name);

    void flush();

private:
    LogManager() = default;
    ~LogManager() = default;
    LogManager(const LogManager&) = delete;
    LogManager& operator=(const LogManager&) = delete;

    std::shared_ptr<spdlog::logger> m_logger;
    std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> m_consoleSink;
    std::string m_logDirectory;
    bool m_initialized = false;
};

// Convenience macros for easy logging. These forward source location to spdlog so
// sink patterns using [%s:%#] get populated.
#define LOG_TRACE(...) do { auto _lg = spdlog::get("PlaylistMirror"); if (_lg) _lg->log(spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION}, spdlog::level::trace, __VA_ARGS__); } while(0)
#define LOG_DEBUG(...) do { auto _lg = spdlog::get("PlaylistMirror"); if (_lg) _lg->log(spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION}, spdlog::level::debug, __VA_ARGS__); } while(0)
#define LOG_INFO(...)  do { auto _lg = spdlog::get("PlaylistMirror"); if (_lg) _lg->log(spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION}, spdlog::level::info, __VA_ARGS__); } while(0)
#define LOG_WARN(...)  do { auto _lg = spdlog::get("PlaylistMirror"); if (_lg) _lg->log(spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION}, spdlog::level::warn,  __VA_ARGS__); } while(0)
#define LOG_ERROR(...) do { auto _lg = spdlog::get("PlaylistMirror"); if (_lg) _lg->log(spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION}, spdlog::level::err, __VA_ARGS__); } while(0)
#define LOG_CRITICAL(...) do { auto _lg = spdlog::get("PlaylistMirror"); if (_lg) _lg->log(spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION}, spdlog::level::critical, __VA_ARGS__); } while(0)
