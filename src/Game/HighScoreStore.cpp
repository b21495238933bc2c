#include "Pichuka/Game/HighScoreStore.hpp"
#include "Pichuka/Core/Logger.hpp"
#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <system_error>
#include <utility>

namespace Pichuka::Game {

using json = nlohmann::json;

namespace {

constexpr const char* HIGH_SCORE_KEY = "high_score";

} // namespace

uint32_t HighScoreFromNumber(double value) {
    if (!std::isfinite(value) || value < 1.0) {
        return 0;
    }
    if (value >= static_cast<double>(std::numeric_limits<uint32_t>::max())) {
        return std::numeric_limits<uint32_t>::max();
    }
    return static_cast<uint32_t>(value);
}

uint32_t ParseHighScore(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return 0;
    }
    const auto last = text.find_last_not_of(" \t\r\n");

    // strtod needs a terminated buffer
    const std::string trimmed(text.substr(first, last - first + 1));
    char* end = nullptr;
    const double value = std::strtod(trimmed.c_str(), &end);
    if (end != trimmed.c_str() + trimmed.size()) {
        return 0;
    }
    return HighScoreFromNumber(value);
}

JsonHighScoreStore::JsonHighScoreStore(std::string path)
    : m_path(std::move(path)) {
}

uint32_t JsonHighScoreStore::Load() {
    std::ifstream file(m_path);
    if (!file.is_open()) {
        PICHUKA_LOG_DEBUG_F("No stored high score at %s", m_path.c_str());
        return 0;
    }

    json document = json::parse(file, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        PICHUKA_LOG_WARNING_F("Ignoring malformed high score file %s", m_path.c_str());
        return 0;
    }

    auto it = document.find(HIGH_SCORE_KEY);
    if (it == document.end()) {
        PICHUKA_LOG_WARNING_F("High score file %s has no %s entry", m_path.c_str(), HIGH_SCORE_KEY);
        return 0;
    }

    uint32_t value = 0;
    if (it->is_number()) {
        value = HighScoreFromNumber(it->get<double>());
    } else if (it->is_string()) {
        value = ParseHighScore(it->get<std::string>());
    }

    if (value == 0) {
        PICHUKA_LOG_WARNING_F("Stored high score in %s is not a positive number, using 0",
                              m_path.c_str());
    }
    return value;
}

void JsonHighScoreStore::Save(uint32_t highScore) {
    auto result = Write(highScore);
    if (result.isFailure()) {
        PICHUKA_LOG_ERROR_F("Could not save high score %u to %s: %s", highScore, m_path.c_str(),
                            describeError(result.error()).c_str());
    }
}

VoidResult JsonHighScoreStore::Write(uint32_t highScore) {
    namespace fs = std::filesystem;

    json document;
    document[HIGH_SCORE_KEY] = highScore;

    // Write beside the target and rename so a crash never leaves a torn file
    const std::string tempPath = m_path + ".tmp";
    {
        std::ofstream file(tempPath, std::ios::trunc);
        if (!file.is_open()) {
            return ErrorCode::FileWriteFailed;
        }
        file << document.dump() << '\n';
        if (!file.good()) {
            return ErrorCode::FileWriteFailed;
        }
    }

    std::error_code ec;
    fs::rename(tempPath, m_path, ec);
    if (ec) {
        fs::remove(tempPath, ec);
        return ErrorCode::FileWriteFailed;
    }
    return VoidResult();
}

// ============================================================================
// AsyncHighScoreStore
// ============================================================================

AsyncHighScoreStore::AsyncHighScoreStore(HighScoreStore& target)
    : m_target(target) {
    m_thread = std::thread(&AsyncHighScoreStore::WriterLoop, this);
}

AsyncHighScoreStore::~AsyncHighScoreStore() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_running = false;
    }
    m_cv.notify_all();

    if (m_thread.joinable()) {
        m_thread.join();
    }
}

uint32_t AsyncHighScoreStore::Load() {
    return m_target.Load();
}

void AsyncHighScoreStore::Save(uint32_t highScore) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_pending = highScore;
    }
    m_cv.notify_all();
}

void AsyncHighScoreStore::Flush() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait(lock, [this] { return !m_pending && !m_writing; });
}

void AsyncHighScoreStore::WriterLoop() {
    std::unique_lock<std::mutex> lock(m_mutex);
    while (true) {
        m_cv.wait(lock, [this] { return m_pending.has_value() || !m_running; });
        if (!m_pending) {
            break;   // stopped with nothing left to write
        }

        const uint32_t value = *m_pending;
        m_pending.reset();
        m_writing = true;

        lock.unlock();
        m_target.Save(value);
        lock.lock();

        m_writing = false;
        m_cv.notify_all();
    }
}

} // namespace Pichuka::Game
