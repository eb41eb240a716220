#include "log_manager.h"
#include <spdlog/sinks/rotating_file_sink.h>
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <fstream>
#include <unordered_map>
#include <vector>

namespace
{
    spdlog::level::level_enum toSpdLevel(LogManager::LogLevel level)
    {
        switch (level) {
            case LogManager::LogLevel::Trace:    return spdlog::level::trace;
            case LogManager::LogLevel::Debug:    return spdlog::level::debug;
            case LogManager::LogLevel::Info:     return spdlog::level::info;
            case LogManager::LogLevel::Warn:     return spdlog::level::warn;
            case LogManager::LogLevel::Error:    return spdlog::level::err;
            case LogManager::LogLevel::Critical: return spdlog::level::critical;
        }
        return spdlog::level::info;
    }

    // Reads key=value lines, '#' comments, keys lowercased
    std::unordered_map<std::string, std::string> readProperties(const std::filesystem::path& path)
    {
        std::unordered_map<std::string, std::string> props;
        std::ifstream ifs(path);
        std::string line;
        while (std::getline(ifs, line)) {
            auto start = line.find_first_not_of(" \t\r\n");
            if (start == std::string::npos) continue;
            if (line[start] == '#') continue;
            auto eq = line.find('=', start);
            if (eq == std::string::npos) continue;
            std::string key = line.substr(start, eq - start);
            std::string val = line.substr(eq + 1);
            auto end = val.find_last_not_of(" \t\r\n");
            val = (end == std::string::npos) ? std::string() : val.substr(0, end + 1);
            auto keyEnd = key.find_last_not_of(" \t");
            if (keyEnd != std::string::npos) key = key.substr(0, keyEnd + 1);
            for (auto &c : key) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
            props[key] = val;
        }
        return props;
    }

    size_t parseSize(const std::string& text, size_t fallback)
    {
        try {
            return static_cast<size_t>(std::stoull(text));
        } catch (const std::exception& e) {
            std::cerr << "log.properties: ignoring invalid number '" << text << "': " << e.what() << std::endl;
            return fallback;
        }
    }
}

LogManager& LogManager::instance()
{
    static LogManager instance;
    return instance;
}

LogManager::LogLevel LogManager::parseLogLevel(const std::string& name)
{
    std::string lvl = name;
    for (auto &c : lvl) c = static_cast<char>(::toupper(static_cast<unsigned char>(c)));
    if (lvl == "TRACE") return LogLevel::Trace;
    if (lvl == "DEBUG") return LogLevel::Debug;
    if (lvl == "WARN" || lvl == "WARNING") return LogLevel::Warn;
    if (lvl == "ERROR") return LogLevel::Error;
    if (lvl == "CRITICAL") return LogLevel::Critical;
    return LogLevel::Info;
}

void LogManager::initialize(const std::string& logDirectory)
{
    if (m_initialized) {
        return;
    }

    try {
        m_logDirectory = logDirectory;

        // Search order: ./config/log.properties, <logDirectory>/log.properties, ./log.properties
        std::unordered_map<std::string, std::string> props;
        std::vector<std::filesystem::path> candidates = {
            std::filesystem::current_path() / "config" / "log.properties",
            std::filesystem::path(logDirectory) / "log.properties",
            std::filesystem::current_path() / "log.properties"
        };
        for (const auto &p : candidates) {
            if (std::filesystem::exists(p)) {
                props = readProperties(p);
                break; // use first found properties file
            }
        }

        std::filesystem::create_directories(logDirectory);

        std::vector<spdlog::sink_ptr> sinks;

        m_consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        m_consoleSink->set_level(props.count("console_level")
            ? toSpdLevel(parseLogLevel(props["console_level"]))
            : spdlog::level::info);
        m_consoleSink->set_pattern(props.count("console_pattern")
            ? props["console_pattern"]
            : "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(m_consoleSink);

        std::string fileName = props.count("file") ? props["file"] : "playlist_mirror.log";
        std::string logFilePath = (std::filesystem::path(logDirectory) / fileName).string();
        size_t maxFileSize = 1024ULL * 1024ULL * 10ULL; // default 10MB
        size_t maxFiles = 5;
        if (props.count("max_size")) maxFileSize = parseSize(props["max_size"], maxFileSize);
        if (props.count("max_files")) maxFiles = parseSize(props["max_files"], maxFiles);

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFilePath, maxFileSize, maxFiles);
        file_sink->set_level(props.count("file_level")
            ? toSpdLevel(parseLogLevel(props["file_level"]))
            : spdlog::level::trace);
        file_sink->set_pattern(props.count("file_pattern")
            ? props["file_pattern"]
            : "[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%#] %v");
        sinks.push_back(file_sink);

        m_logger = std::make_shared<spdlog::logger>("PlaylistMirror", sinks.begin(), sinks.end());
        m_logger->set_level(spdlog::level::debug);
        m_logger->flush_on(spdlog::level::warn);

        spdlog::register_logger(m_logger);
        spdlog::set_default_logger(m_logger);

        m_initialized = true;

        LOG_DEBUG("LogManager initialized, log directory: {}", logDirectory);

    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize LogManager: " << e.what() << std::endl;
        m_initialized = false;
    }
}

void LogManager::shutdown()
{
    if (!m_initialized) {
        return;
    }

    LOG_DEBUG("LogManager shutting down...");

    if (m_logger) {
        m_logger->flush();
        spdlog::drop_all();
        m_logger.reset();
        m_consoleSink.reset();
    }

    m_initialized = false;
}

void LogManager::setLogLevel(LogLevel level)
{
    if (!m_logger) return;

    auto spdLevel = toSpdLevel(level);
    // The console follows the requested level; the file sink keeps its own threshold
    m_logger->set_level(std::min(spdLevel, spdlog::level::debug));
    if (m_consoleSink) {
        m_consoleSink->set_level(spdLevel);
    }
    LOG_DEBUG("Log level changed to: {}", static_cast<int>(level));
}

LogManager::LogLevel LogManager::getLogLevel() const
{
    if (!m_consoleSink) return LogLevel::Info;

    switch (m_consoleSink->level()) {
        case spdlog::level::trace:    return LogLevel::Trace;
        case spdlog::level::debug:    return LogLevel::Debug;
        case spdlog::level::info:     return LogLevel::Info;
        case spdlog::level::warn:     return LogLevel::Warn;
        case spdlog::level::err:      return LogLevel::Error;
        case spdlog::level::critical: return LogLevel::Critical;
        default:                      return LogLevel::Info;
    }
}

void LogManager::flush()
{
    if (m_logger) {
        m_logger->flush();
    }
}
