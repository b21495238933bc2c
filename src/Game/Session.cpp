#include "Pichuka/Game/Session.hpp"
#include "Pichuka/Core/Logger.hpp"
#include <algorithm>
#include <sstream>
#include <utility>

namespace Pichuka::Game {

namespace {

constexpr const char* START_MESSAGE = "PICHUKA - Press Space to Start";

} // namespace

const char* ToString(SessionState state) {
    switch (state) {
        case SessionState::Start:    return "Start";
        case SessionState::Playing:  return "Playing";
        case SessionState::GameOver: return "GameOver";
    }
    return "Unknown";
}

Session::Session(const Config::GameConfig& config,
                 const GeometryProvider& geometry,
                 HighScoreStore& store,
                 RandomSource& random)
    : m_config(config)
    , m_geometry(geometry)
    , m_store(store)
    , m_random(random)
    , m_state(SessionState::Start)
    , m_flyer(config.physics, config.flyer.x)
    , m_gates(config.gates)
    , m_messageVisible(false) {
    m_scoreBoard.highScore = m_store.Load();
    ResetGameState();
    SetMessage(START_MESSAGE, true);
    PICHUKA_LOG_INFO_F("Session ready, high score %u", m_scoreBoard.highScore);
}

void Session::Activate() {
    if (m_state == SessionState::Playing) {
        m_flyer.ApplyImpulse();
        return;
    }

    // Start or GameOver
    ResetGameState();
    m_state = SessionState::Playing;
    SetMessage("", false);
    m_flyer.ApplyImpulse();
    PICHUKA_LOG_INFO("Session started");
}

void Session::Update(double nowMs) {
    if (m_state != SessionState::Playing) {
        return;
    }

    if (!m_lastFrameTime) {
        m_lastFrameTime = nowMs;
    }

    float deltaSeconds = static_cast<float>((nowMs - *m_lastFrameTime) / 1000.0);
    deltaSeconds = std::min(deltaSeconds, m_config.physics.maxStepSeconds);
    m_lastFrameTime = nowMs;

    const FieldGeometry geometry = m_geometry.Query();
    const float referenceRate = m_config.physics.referenceRate;

    m_flyer.Integrate(deltaSeconds);

    m_gates.MaybeSpawn(nowMs, geometry, m_random);
    m_gates.Advance(deltaSeconds, referenceRate);
    m_gates.Evict();

    const AABB flyerBounds = m_flyer.GetBoundingBox(geometry.flyerWidth, geometry.flyerHeight);
    Evaluation evaluation = m_evaluator.Evaluate(flyerBounds, geometry, m_gates.GetGates(),
                                                 m_gates.GetGateWidth(), m_scoreBoard);

    if (evaluation.gatesPassed > 0) {
        PICHUKA_LOG_DEBUG_F("Score %u", m_scoreBoard.score);
    }
    if (evaluation.newHighScore) {
        PICHUKA_LOG_INFO_F("New high score %u", m_scoreBoard.highScore);
        m_store.Save(m_scoreBoard.highScore);
    }

    if (evaluation.outcome == Outcome::Collision) {
        EndSession();
    }
}

void Session::OnFieldResized() {
    if (m_state == SessionState::Playing) {
        return;
    }
    CenterFlyer(m_geometry.Query());
}

std::string Session::GetScoreText() const {
    std::ostringstream text;
    text << "Score: " << m_scoreBoard.score << " | High: " << m_scoreBoard.highScore;
    return text.str();
}

FrameView Session::GetView() const {
    const FieldGeometry geometry = m_geometry.Query();
    const float gateWidth = m_gates.GetGateWidth();

    FrameView view;
    view.state = m_state;
    view.flyerX = m_flyer.GetPosition().x;
    view.flyerY = m_flyer.GetPosition().y;
    view.flyerWidth = geometry.flyerWidth;
    view.flyerHeight = geometry.flyerHeight;
    view.flyerRotation = m_flyer.GetRotationDegrees();
    view.groundY = geometry.PlayableHeight();
    view.score = m_scoreBoard.score;
    view.highScore = m_scoreBoard.highScore;
    view.scoreText = GetScoreText();
    view.message = m_message;
    view.messageVisible = m_messageVisible;

    view.gates.reserve(m_gates.GetGates().size());
    for (const auto& gate : m_gates.GetGates()) {
        view.gates.push_back(GateView{gate.x, gateWidth, gate.topHeight, gate.GapEnd(), gate.bottomHeight});
    }
    return view;
}

void Session::ResetGameState() {
    m_scoreBoard.score = 0;
    m_lastFrameTime.reset();
    m_gates.Reset();
    CenterFlyer(m_geometry.Query());
}

void Session::CenterFlyer(const FieldGeometry& geometry) {
    m_flyer.Reset((geometry.PlayableHeight() - geometry.flyerHeight) / 2.0f);
}

void Session::EndSession() {
    m_state = SessionState::GameOver;

    std::ostringstream message;
    message << "Game Over - PICHUKA\n"
            << "Score: " << m_scoreBoard.score << "\n"
            << "High Score: " << m_scoreBoard.highScore << "\n"
            << "Press Space to Restart";
    SetMessage(message.str(), true);

    PICHUKA_LOG_INFO_F("Session over, score %u, high score %u",
                       m_scoreBoard.score, m_scoreBoard.highScore);
}

void Session::SetMessage(std::string message, bool visible) {
    m_message = std::move(message);
    m_messageVisible = visible;
}

} // namespace Pichuka::Game
