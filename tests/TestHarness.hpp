// tests/TestHarness.hpp
#pragma once

#include <Pichuka/Core/Config.hpp>
#include <Pichuka/Game/GateManager.hpp>
#include <Pichuka/Game/Geometry.hpp>
#include <Pichuka/Game/HighScoreStore.hpp>
#include <Pichuka/Game/RandomSource.hpp>
#include <gtest/gtest.h>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace Pichuka::Testing {

// ============================================================================
// Collaborator Fakes
// ============================================================================

/**
 * Geometry provider backed by a mutable struct, so tests can "resize"
 * the field between frames.
 */
class FixedGeometry : public Game::GeometryProvider {
public:
    explicit FixedGeometry(const Game::FieldGeometry& geometry) : geometry(geometry) {}

    Game::FieldGeometry Query() const override { return geometry; }

    Game::FieldGeometry geometry;
};

/**
 * Returns the scripted values in order, then repeats the last one.
 */
class ScriptedRandom : public Game::RandomSource {
public:
    explicit ScriptedRandom(std::vector<float> values);

    float NextUnit() override;

    size_t CallCount() const { return m_calls; }

private:
    std::vector<float> m_values;
    size_t m_calls = 0;
};

/**
 * High score store that records every save.
 */
class MemoryHighScoreStore : public Game::HighScoreStore {
public:
    explicit MemoryHighScoreStore(uint32_t stored = 0) : stored(stored) {}

    uint32_t Load() override { loads++; return stored; }
    void Save(uint32_t highScore) override { stored = highScore; saves.push_back(highScore); }

    uint32_t stored;
    int loads = 0;
    std::vector<uint32_t> saves;
};

/**
 * Store whose Save() parks the calling thread until Release(), standing in
 * for a stalled disk.
 */
class BlockingHighScoreStore : public Game::HighScoreStore {
public:
    uint32_t Load() override { return 0; }
    void Save(uint32_t highScore) override;

    void Release();

    // Waits until Save() has been entered count times
    bool WaitForEntered(size_t count, std::chrono::milliseconds timeout);

    size_t EnteredCount() const;
    std::vector<uint32_t> Saves() const;

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_released = false;
    size_t m_entered = 0;
    std::vector<uint32_t> m_saves;
};

// ============================================================================
// Fixtures
// ============================================================================

/**
 * 500 tall field with a 50 ground strip and a 38x28 flyer, so the flyer
 * starts at y = (500 - 50 - 28) / 2 = 211.
 */
Game::FieldGeometry MakeFieldGeometry(float width = 400.0f);

/**
 * Asserts that the field can hold a gate (gap plus two minimum segments).
 */
void ExpectGateFits(const Game::FieldGeometry& geometry, const Config::GateSettings& gates);

/**
 * Path under the system temp directory, unique per test.
 */
std::string TempPath(const std::string& name);

} // namespace Pichuka::Testing
