/**
 * @file Logger.hpp
 * @brief Logging infrastructure for Pichuka diagnostics
 * @author Pichuka Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Pichuka. All rights reserved.
 *
 * One process-wide spdlog logger writing to the console, a rotating file,
 * or both. The game core logs session transitions, high score changes and
 * storage problems through the PICHUKA_LOG_* macros below.
 */

#pragma once

#ifndef PICHUKA_CORE_LOGGER_HPP
#define PICHUKA_CORE_LOGGER_HPP

#include <cstdint>
#include <cstdio>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace spdlog {
class logger;
}

namespace Pichuka {
namespace Core {

enum class LogLevel : uint8_t {
    Trace = 0,      ///< Per-frame detail (gate spawns)
    Debug = 1,
    Info = 2,       ///< Session start/end, new high scores
    Warning = 3,    ///< Rejected stored values
    Error = 4,      ///< Failed file I/O
    Critical = 5,   ///< Startup failures
    Off = 255
};

enum class LogOutput : uint8_t {
    None = 0,
    Console = 1 << 0,
    File = 1 << 1,
    All = Console | File
};

inline LogOutput operator|(LogOutput a, LogOutput b) {
    return static_cast<LogOutput>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

inline bool hasFlag(LogOutput value, LogOutput flag) {
    return (static_cast<uint8_t>(value) & static_cast<uint8_t>(flag)) != 0;
}

/**
 * @brief Map a lowercase configuration name ("trace" .. "critical", "off")
 *        to its level. Leaves @p level untouched and returns false otherwise.
 */
bool ParseLogLevel(std::string_view name, LogLevel& level);

/**
 * @brief Process-wide logger
 *
 * Until Initialize() succeeds, and again after Shutdown(), every message
 * is discarded. Safe to call from the high score writer thread.
 */
class Logger {
public:
    static Logger& Instance();

    /**
     * @brief Create the sinks
     * @param minLevel Messages below this level are discarded
     * @param outputs Console, File or both; None falls back to Console
     * @param logFilePath Rotating log file, used when File is requested
     * @param maxFileSizeMB Size at which the log file rotates
     * @return false if already initialized or a sink could not be created
     */
    bool Initialize(LogLevel minLevel = LogLevel::Info,
                    LogOutput outputs = LogOutput::Console,
                    const std::string& logFilePath = "",
                    size_t maxFileSizeMB = 10);

    /**
     * @brief Flush and release the sinks
     */
    void Shutdown();

    bool IsLevelEnabled(LogLevel level) const;

    /**
     * @brief Write one message; @p file and @p line prefix it when given
     */
    void Log(LogLevel level, std::string_view message,
             const char* file = nullptr, int line = 0);

    /**
     * @brief printf-style variant of Log()
     */
    template<typename... Args>
    void LogFormat(LogLevel level, const char* format, Args&&... args) {
        if (!IsLevelEnabled(level)) {
            return;
        }

        char buffer[512];
        int length = std::snprintf(buffer, sizeof(buffer), format, std::forward<Args>(args)...);
        if (length < 0) {
            return;
        }

        if (static_cast<size_t>(length) < sizeof(buffer)) {
            Log(level, std::string_view(buffer, static_cast<size_t>(length)));
            return;
        }

        std::string text(static_cast<size_t>(length) + 1, '\0');
        std::snprintf(text.data(), text.size(), format, std::forward<Args>(args)...);
        text.resize(static_cast<size_t>(length));
        Log(level, text);
    }

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex mutex_;
    std::shared_ptr<spdlog::logger> spdlogger_;
    LogLevel minLevel_ = LogLevel::Info;
    bool initialized_ = false;
};

} // namespace Core
} // namespace Pichuka

#ifndef PICHUKA_DISABLE_LOGGING

#define PICHUKA_LOG_INFO(msg) \
    ::Pichuka::Core::Logger::Instance().Log(::Pichuka::Core::LogLevel::Info, msg, __FILE__, __LINE__)

#define PICHUKA_LOG_CRITICAL(msg) \
    ::Pichuka::Core::Logger::Instance().Log(::Pichuka::Core::LogLevel::Critical, msg, __FILE__, __LINE__)

#define PICHUKA_LOG_TRACE_F(fmt, ...) \
    ::Pichuka::Core::Logger::Instance().LogFormat(::Pichuka::Core::LogLevel::Trace, fmt, __VA_ARGS__)

#define PICHUKA_LOG_DEBUG_F(fmt, ...) \
    ::Pichuka::Core::Logger::Instance().LogFormat(::Pichuka::Core::LogLevel::Debug, fmt, __VA_ARGS__)

#define PICHUKA_LOG_INFO_F(fmt, ...) \
    ::Pichuka::Core::Logger::Instance().LogFormat(::Pichuka::Core::LogLevel::Info, fmt, __VA_ARGS__)

#define PICHUKA_LOG_WARNING_F(fmt, ...) \
    ::Pichuka::Core::Logger::Instance().LogFormat(::Pichuka::Core::LogLevel::Warning, fmt, __VA_ARGS__)

#define PICHUKA_LOG_ERROR_F(fmt, ...) \
    ::Pichuka::Core::Logger::Instance().LogFormat(::Pichuka::Core::LogLevel::Error, fmt, __VA_ARGS__)

#else
#define PICHUKA_LOG_INFO(msg) ((void)0)
#define PICHUKA_LOG_CRITICAL(msg) ((void)0)
#define PICHUKA_LOG_TRACE_F(fmt, ...) ((void)0)
#define PICHUKA_LOG_DEBUG_F(fmt, ...) ((void)0)
#define PICHUKA_LOG_INFO_F(fmt, ...) ((void)0)
#define PICHUKA_LOG_WARNING_F(fmt, ...) ((void)0)
#define PICHUKA_LOG_ERROR_F(fmt, ...) ((void)0)
#endif // PICHUKA_DISABLE_LOGGING

#endif // PICHUKA_CORE_LOGGER_HPP
