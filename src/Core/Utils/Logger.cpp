/**
 * @file Logger.cpp
 * @brief Implementation of the logging infrastructure
 * @author Pichuka Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Pichuka. All rights reserved.
 *
 * Synchronous spdlog logger with a colour console sink and a rotating
 * file sink. Level filtering happens here before spdlog sees a message.
 */

#include "Pichuka/Core/Logger.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>
#include <iostream>
#include <vector>

namespace Pichuka {
namespace Core {

namespace {

constexpr size_t ROTATED_FILES = 3;
constexpr const char* PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

spdlog::level::level_enum ToSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return spdlog::level::trace;
        case LogLevel::Debug:    return spdlog::level::debug;
        case LogLevel::Info:     return spdlog::level::info;
        case LogLevel::Warning:  return spdlog::level::warn;
        case LogLevel::Error:    return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off:      return spdlog::level::off;
    }
    return spdlog::level::info;
}

// "src/Game/Session.cpp" -> "Session.cpp"
std::string_view FileName(const char* path) {
    std::string_view view(path);
    auto slash = view.find_last_of("/\\");
    return slash == std::string_view::npos ? view : view.substr(slash + 1);
}

} // namespace

bool ParseLogLevel(std::string_view name, LogLevel& level) {
    struct Named { std::string_view name; LogLevel level; };
    static constexpr Named LEVELS[] = {
        {"trace", LogLevel::Trace}, {"debug", LogLevel::Debug},
        {"info", LogLevel::Info}, {"warning", LogLevel::Warning},
        {"error", LogLevel::Error}, {"critical", LogLevel::Critical},
        {"off", LogLevel::Off},
    };

    for (const auto& entry : LEVELS) {
        if (entry.name == name) {
            level = entry.level;
            return true;
        }
    }
    return false;
}

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    Shutdown();
}

bool Logger::Initialize(LogLevel minLevel, LogOutput outputs,
                        const std::string& logFilePath, size_t maxFileSizeMB) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_) {
        return false;
    }

    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (hasFlag(outputs, LogOutput::File) && !logFilePath.empty()) {
            std::filesystem::path parent = std::filesystem::path(logFilePath).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFilePath, maxFileSizeMB * 1024 * 1024, ROTATED_FILES));
        }

        if (hasFlag(outputs, LogOutput::Console) || sinks.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        }

        spdlogger_ = std::make_shared<spdlog::logger>("pichuka", sinks.begin(), sinks.end());
        spdlogger_->set_pattern(PATTERN);
        spdlogger_->set_level(ToSpdlogLevel(minLevel));
        spdlogger_->flush_on(spdlog::level::warn);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        spdlogger_.reset();
        return false;
    }

    minLevel_ = minLevel;
    initialized_ = true;
    return true;
}

void Logger::Shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (spdlogger_) {
        spdlogger_->flush();
        spdlogger_.reset();
    }
    initialized_ = false;
}

bool Logger::IsLevelEnabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_ && level != LogLevel::Off && level >= minLevel_;
}

void Logger::Log(LogLevel level, std::string_view message, const char* file, int line) {
    if (!IsLevelEnabled(level)) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!spdlogger_) {
        return;
    }

    if (file && line > 0) {
        spdlogger_->log(ToSpdlogLevel(level), "({}:{}) {}", FileName(file), line, message);
    } else {
        spdlogger_->log(ToSpdlogLevel(level), "{}", message);
    }
}

} // namespace Core
} // namespace Pichuka
