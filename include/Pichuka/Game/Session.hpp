#pragma once

#include "Pichuka/Core/Config.hpp"
#include "Pichuka/Game/CollisionEvaluator.hpp"
#include "Pichuka/Game/Flyer.hpp"
#include "Pichuka/Game/GateManager.hpp"
#include "Pichuka/Game/Geometry.hpp"
#include "Pichuka/Game/HighScoreStore.hpp"
#include "Pichuka/Game/RandomSource.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Pichuka::Game {

enum class SessionState {
    Start,
    Playing,
    GameOver
};

const char* ToString(SessionState state);

// Everything a renderer needs after a cycle
struct GateView {
    float x;
    float width;
    float topHeight;
    float bottomY;
    float bottomHeight;
};

struct FrameView {
    SessionState state;
    float flyerX;
    float flyerY;
    float flyerWidth;
    float flyerHeight;
    float flyerRotation;        // Degrees, display only
    std::vector<GateView> gates;
    float groundY;
    uint32_t score;
    uint32_t highScore;
    std::string scoreText;
    std::string message;
    bool messageVisible;
};

/**
 * Owns one flyer and its gates and runs the Start / Playing / GameOver
 * state machine. Single-threaded: Activate(), Update() and OnFieldResized()
 * must be called from the same thread, never concurrently.
 *
 * The collaborators are borrowed and must outlive the session.
 */
class Session {
public:
    Session(const Config::GameConfig& config,
            const GeometryProvider& geometry,
            HighScoreStore& store,
            RandomSource& random);

    // The single input entry point (key, pointer and touch all map here).
    // Starts or restarts a session, or jumps while playing.
    void Activate();

    // One frame at a monotonic timestamp in milliseconds. No-op unless Playing.
    void Update(double nowMs);

    // True while Playing; the driver stops calling Update() once this is false
    bool WantsNextFrame() const { return m_state == SessionState::Playing; }

    // Re-centres the flyer for the new field size. Ignored while Playing.
    void OnFieldResized();

    SessionState GetState() const { return m_state; }
    uint32_t GetScore() const { return m_scoreBoard.score; }
    uint32_t GetHighScore() const { return m_scoreBoard.highScore; }
    const Flyer& GetFlyer() const { return m_flyer; }
    const std::deque<Gate>& GetGates() const { return m_gates.GetGates(); }
    const std::optional<double>& GetLastFrameTime() const { return m_lastFrameTime; }

    const std::string& GetMessage() const { return m_message; }
    bool IsMessageVisible() const { return m_messageVisible; }
    std::string GetScoreText() const;

    FrameView GetView() const;

private:
    void ResetGameState();
    void CenterFlyer(const FieldGeometry& geometry);
    void EndSession();
    void SetMessage(std::string message, bool visible);

    Config::GameConfig m_config;
    const GeometryProvider& m_geometry;
    HighScoreStore& m_store;
    RandomSource& m_random;

    SessionState m_state;
    Flyer m_flyer;
    GateManager m_gates;
    CollisionEvaluator m_evaluator;
    ScoreBoard m_scoreBoard;
    std::optional<double> m_lastFrameTime;
    std::string m_message;
    bool m_messageVisible;
};

} // namespace Pichuka::Game
