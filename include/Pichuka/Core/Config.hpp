/**
 * @file Config.hpp
 * @brief Game configuration and its JSON loader
 * @author Pichuka Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Pichuka. All rights reserved.
 *
 * Every tuning constant of the simulation lives in GameConfig. The defaults
 * reproduce the reference game; a JSON file may override any subset of them.
 */

#pragma once

#ifndef PICHUKA_CORE_CONFIG_HPP
#define PICHUKA_CORE_CONFIG_HPP

#include <Pichuka/Core/ErrorCodes.hpp>
#include <Pichuka/Core/Logger.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace Pichuka::Config {

struct PhysicsSettings {
    float gravity = 0.45f;          ///< Added to velocity per reference frame
    float impulse = -8.5f;          ///< Velocity set by a jump (negative is up)
    float maxStepSeconds = 0.05f;   ///< Clamp for the elapsed time of one frame
    float referenceRate = 60.0f;    ///< Rate the constants were tuned at (Hz)
};

struct GateSettings {
    float speed = 2.4f;                 ///< Scroll distance per reference frame
    float width = 68.0f;
    float gapSize = 170.0f;
    double spawnIntervalMs = 1550.0;
    float minSegmentHeight = 70.0f;
    float evictionMargin = 10.0f;       ///< Distance past the left edge before eviction
};

struct FlyerSettings {
    float x = 90.0f;
    float width = 38.0f;
    float height = 28.0f;
};

struct FieldSettings {
    int width = 480;
    int height = 640;
    float groundHeight = 50.0f;
};

struct StorageSettings {
    std::string highScorePath = "pichuka_high_score.json";
};

struct LoggingSettings {
    Core::LogLevel level = Core::LogLevel::Info;
    std::string filePath;               ///< Empty disables file output
};

struct GameConfig {
    PhysicsSettings physics;
    GateSettings gates;
    FlyerSettings flyer;
    FieldSettings field;
    StorageSettings storage;
    LoggingSettings logging;
};

/**
 * @brief Check a configuration for out-of-range or inconsistent values
 *
 * Besides per-value ranges this rejects a field that cannot hold a gate:
 * the playable height must fit the gap plus two minimum-height segments.
 */
VoidResult Validate(const GameConfig& config);

/**
 * @brief JSON configuration loader
 *
 * Keys missing from the document keep their default value. Recognised
 * sections: physics, gates, flyer, field, storage, logging.
 */
class ConfigLoader {
public:
    struct Options {
        size_t max_file_size = 64 * 1024;
    };

    ConfigLoader();
    explicit ConfigLoader(const Options& options);
    ~ConfigLoader();

    /**
     * @brief Load configuration from file
     * @param path Path to a JSON configuration file
     * @return Validated configuration or error
     */
    Result<GameConfig> load(const std::string& path);

    /**
     * @brief Load configuration from a JSON document held in memory
     */
    Result<GameConfig> loadFromString(std::string_view document);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace Pichuka::Config

#endif // PICHUKA_CORE_CONFIG_HPP
