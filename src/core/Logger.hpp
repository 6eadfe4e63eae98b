#pragma once

/**
 * Logger.hpp
 *
 * Process-wide logging for the download service, built on spdlog.
 */

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace reelq::core {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/**
 * Sink configuration. An empty directory means console only.
 */
struct LogSettings {
    LogLevel level{LogLevel::Info};
    std::string directory;
    size_t maxFileSize{10 * 1024 * 1024};
    size_t maxFiles{5};
};

/**
 * Logger - singleton front for spdlog
 *
 * Until configure() is called every message is dropped, so library code
 * and tests run without any sink set up. configure() may be called again
 * to switch sinks, but only before worker threads start logging.
 */
class Logger {
public:
    static Logger& instance() {
        static Logger instance;
        return instance;
    }

    void configure(const LogSettings& settings) {
        std::vector<spdlog::sink_ptr> sinks;

        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_level(toSpdlogLevel(settings.level));
        console->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console);

        std::string fileError;
        if (!settings.directory.empty()) {
            try {
                std::filesystem::path logPath = std::filesystem::path(settings.directory) / "reelq.log";
                std::filesystem::create_directories(logPath.parent_path());

                auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    logPath.string(), settings.maxFileSize, settings.maxFiles);
                file->set_level(spdlog::level::trace);
                file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
                sinks.push_back(file);
            } catch (const std::exception& ex) {
                fileError = ex.what();
            }
        }

        auto logger = std::make_shared<spdlog::logger>("reelq", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::trace);
        logger->flush_on(spdlog::level::warn);

        m_logger = logger;
        spdlog::set_default_logger(logger);
        spdlog::flush_every(std::chrono::seconds(3));

        if (!fileError.empty()) {
            m_logger->error("File logging disabled, cannot open {}: {}", settings.directory, fileError);
        }
    }

    template<typename... Args>
    void log(LogLevel level, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->log(toSpdlogLevel(level), fmt, std::forward<Args>(args)...);
        }
    }

    void flush() {
        if (m_logger) {
            m_logger->flush();
        }
    }

    /**
     * Level from its config name; unknown names map to Info
     */
    static LogLevel parseLevel(const std::string& name) {
        if (name == "trace") return LogLevel::Trace;
        if (name == "debug") return LogLevel::Debug;
        if (name == "warn" || name == "warning") return LogLevel::Warn;
        if (name == "error") return LogLevel::Error;
        if (name == "critical") return LogLevel::Critical;
        if (name == "off") return LogLevel::Off;
        return LogLevel::Info;
    }

private:
    Logger() = default;
    ~Logger() {
        flush();
        spdlog::shutdown();
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:    return spdlog::level::trace;
            case LogLevel::Debug:    return spdlog::level::debug;
            case LogLevel::Info:     return spdlog::level::info;
            case LogLevel::Warn:     return spdlog::level::warn;
            case LogLevel::Error:    return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
            case LogLevel::Off:      return spdlog::level::off;
        }
        return spdlog::level::info;
    }

private:
    std::shared_ptr<spdlog::logger> m_logger;
};

} // namespace reelq::core

#define LOG_TRACE(...)    ::reelq::core::Logger::instance().log(::reelq::core::LogLevel::Trace, __VA_ARGS__)
#define LOG_DEBUG(...)    ::reelq::core::Logger::instance().log(::reelq::core::LogLevel::Debug, __VA_ARGS__)
#define LOG_INFO(...)     ::reelq::core::Logger::instance().log(::reelq::core::LogLevel::Info, __VA_ARGS__)
#define LOG_WARN(...)     ::reelq::core::Logger::instance().log(::reelq::core::LogLevel::Warn, __VA_ARGS__)
#define LOG_ERROR(...)    ::reelq::core::Logger::instance().log(::reelq::core::LogLevel::Error, __VA_ARGS__)
#define LOG_CRITICAL(...) ::reelq::core::Logger::instance().log(::reelq::core::LogLevel::Critical, __VA_ARGS__)
