/**
 * @file ConfigLoader.cpp
 * @brief Implementation of JSON configuration loading
 * @author Pichuka Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Pichuka. All rights reserved.
 */

#include <Pichuka/Core/Config.hpp>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>

namespace Pichuka::Config {

using json = nlohmann::json;

namespace {

template<typename T>
void Overlay(const json& section, const char* key, T& target) {
    auto it = section.find(key);
    if (it != section.end()) {
        target = it->get<T>();
    }
}

} // namespace

VoidResult Validate(const GameConfig& config) {
    const auto& p = config.physics;
    const auto& g = config.gates;
    const auto& f = config.flyer;
    const auto& field = config.field;

    if (p.gravity <= 0.0f || p.impulse >= 0.0f ||
        p.maxStepSeconds <= 0.0f || p.referenceRate <= 0.0f) {
        return ErrorCode::ConfigInvalid;
    }

    if (g.speed <= 0.0f || g.width <= 0.0f || g.gapSize <= 0.0f ||
        g.spawnIntervalMs <= 0.0 || g.minSegmentHeight < 0.0f ||
        g.evictionMargin < 0.0f) {
        return ErrorCode::ConfigInvalid;
    }

    if (f.x < 0.0f || f.width <= 0.0f || f.height <= 0.0f) {
        return ErrorCode::ConfigInvalid;
    }

    if (field.width <= 0 || field.height <= 0 || field.groundHeight < 0.0f) {
        return ErrorCode::ConfigInvalid;
    }

    float available = static_cast<float>(field.height) - field.groundHeight;
    if (available - g.gapSize - 2.0f * g.minSegmentHeight < 0.0f) {
        return ErrorCode::ConfigInvalid;
    }

    if (config.storage.highScorePath.empty()) {
        return ErrorCode::ConfigMissing;
    }

    return VoidResult();
}

class ConfigLoader::Impl {
public:
    Options options;

    explicit Impl(const Options& opts) : options(opts) {}

    Result<std::string> readFile(const std::string& path) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            return ErrorCode::ConfigFileNotFound;
        }

        auto size = std::filesystem::file_size(path, ec);
        if (ec) {
            return ErrorCode::IOError;
        }
        if (size > options.max_file_size) {
            return ErrorCode::FileTooLarge;
        }

        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            return ErrorCode::IOError;
        }

        std::string content((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());
        if (file.bad()) {
            return ErrorCode::IOError;
        }
        return content;
    }

    Result<GameConfig> parseConfig(std::string_view document) {
        json root = json::parse(document.begin(), document.end(), nullptr, false);
        if (root.is_discarded() || !root.is_object()) {
            return ErrorCode::ConfigParseFailed;
        }

        GameConfig config;
        try {
            if (auto it = root.find("physics"); it != root.end()) {
                Overlay(*it, "gravity", config.physics.gravity);
                Overlay(*it, "impulse", config.physics.impulse);
                Overlay(*it, "max_step_seconds", config.physics.maxStepSeconds);
                Overlay(*it, "reference_rate", config.physics.referenceRate);
            }
            if (auto it = root.find("gates"); it != root.end()) {
                Overlay(*it, "speed", config.gates.speed);
                Overlay(*it, "width", config.gates.width);
                Overlay(*it, "gap", config.gates.gapSize);
                Overlay(*it, "spawn_interval_ms", config.gates.spawnIntervalMs);
                Overlay(*it, "min_segment_height", config.gates.minSegmentHeight);
                Overlay(*it, "eviction_margin", config.gates.evictionMargin);
            }
            if (auto it = root.find("flyer"); it != root.end()) {
                Overlay(*it, "x", config.flyer.x);
                Overlay(*it, "width", config.flyer.width);
                Overlay(*it, "height", config.flyer.height);
            }
            if (auto it = root.find("field"); it != root.end()) {
                Overlay(*it, "width", config.field.width);
                Overlay(*it, "height", config.field.height);
                Overlay(*it, "ground_height", config.field.groundHeight);
            }
            if (auto it = root.find("storage"); it != root.end()) {
                Overlay(*it, "high_score_path", config.storage.highScorePath);
            }
            if (auto it = root.find("logging"); it != root.end()) {
                std::string level;
                Overlay(*it, "level", level);
                if (!level.empty() && !Core::ParseLogLevel(level, config.logging.level)) {
                    return ErrorCode::ConfigInvalid;
                }
                Overlay(*it, "file", config.logging.filePath);
            }
        } catch (const json::exception& e) {
            PICHUKA_LOG_ERROR_F("Configuration value has the wrong type: %s", e.what());
            return ErrorCode::ConfigInvalid;
        }

        PICHUKA_TRY(Validate(config));
        return config;
    }
};

ConfigLoader::ConfigLoader() : ConfigLoader(Options{}) {}

ConfigLoader::ConfigLoader(const Options& options)
    : m_impl(std::make_unique<Impl>(options)) {}

ConfigLoader::~ConfigLoader() = default;

Result<GameConfig> ConfigLoader::load(const std::string& path) {
    auto dataResult = m_impl->readFile(path);
    if (dataResult.isFailure()) {
        PICHUKA_LOG_ERROR_F("Cannot read configuration %s: %s", path.c_str(),
                            describeError(dataResult.error()).c_str());
        return dataResult.error();
    }

    auto config = loadFromString(dataResult.value());
    if (config.isSuccess()) {
        PICHUKA_LOG_INFO_F("Loaded configuration from %s", path.c_str());
    }
    return config;
}

Result<GameConfig> ConfigLoader::loadFromString(std::string_view document) {
    auto config = m_impl->parseConfig(document);
    if (config.isFailure()) {
        PICHUKA_LOG_ERROR_F("Rejected configuration: %s",
                            describeError(config.error()).c_str());
    }
    return config;
}

} // namespace Pichuka::Config
