#pragma once

#include "Pichuka/Core/ErrorCodes.hpp"
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace Pichuka::Game {

// Persistence for the best score across process runs. Neither call may
// throw; failures are logged and absorbed.
class HighScoreStore {
public:
    virtual ~HighScoreStore() = default;

    // Stored high score, or 0 when absent or invalid
    virtual uint32_t Load() = 0;

    // Called only when a new high score is set
    virtual void Save(uint32_t highScore) = 0;
};

// Converts a stored number to a high score. Non-finite and non-positive
// values yield 0; fractions are truncated and huge values saturate.
uint32_t HighScoreFromNumber(double value);

// Parses stored text the way a numeric field would be read: surrounding
// whitespace, a sign and exponent notation are accepted. Empty or
// non-numeric text yields 0, otherwise HighScoreFromNumber() applies.
uint32_t ParseHighScore(std::string_view text);

// Keeps {"high_score": N} in a JSON file
class JsonHighScoreStore : public HighScoreStore {
public:
    explicit JsonHighScoreStore(std::string path);

    uint32_t Load() override;
    void Save(uint32_t highScore) override;

    // Save() with the failure reported instead of logged
    VoidResult Write(uint32_t highScore);

    const std::string& GetPath() const { return m_path; }

private:
    std::string m_path;
};

/**
 * Moves Save() of another store onto a worker thread so the frame that set
 * the record never waits for the file system. Only the newest pending value
 * is kept: a burst of records while a write is in flight ends in one more
 * write of the latest score. Load() runs on the caller's thread.
 *
 * Destruction writes any pending value before joining the worker.
 */
class AsyncHighScoreStore : public HighScoreStore {
public:
    explicit AsyncHighScoreStore(HighScoreStore& target);
    ~AsyncHighScoreStore() override;

    AsyncHighScoreStore(const AsyncHighScoreStore&) = delete;
    AsyncHighScoreStore& operator=(const AsyncHighScoreStore&) = delete;

    uint32_t Load() override;
    void Save(uint32_t highScore) override;

    // Blocks until nothing is pending or being written
    void Flush();

private:
    void WriterLoop();

    HighScoreStore& m_target;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::optional<uint32_t> m_pending;
    bool m_writing = false;
    bool m_running = true;
    std::thread m_thread;
};

} // namespace Pichuka::Game
