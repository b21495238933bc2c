#include "Game.hpp"
#include <Pichuka/Core/Logger.hpp>
#include <Pichuka/Game/GateManager.hpp>

namespace PichukaGL {

using Pichuka::Game::FieldGeometry;
using Pichuka::Game::SessionState;

WindowGeometry::WindowGeometry(GLFWwindow* window, const Pichuka::Config::GameConfig& config)
    : m_window(window)
    , m_groundHeight(config.field.groundHeight)
    , m_flyerWidth(config.flyer.width)
    , m_flyerHeight(config.flyer.height) {
}

FieldGeometry WindowGeometry::Query() const {
    int width = 0;
    int height = 0;
    glfwGetWindowSize(m_window, &width, &height);

    FieldGeometry geometry;
    geometry.fieldWidth = static_cast<float>(width);
    geometry.fieldHeight = static_cast<float>(height);
    geometry.groundHeight = m_groundHeight;
    geometry.flyerWidth = m_flyerWidth;
    geometry.flyerHeight = m_flyerHeight;
    return geometry;
}

Game::Game(const Pichuka::Config::GameConfig& config)
    : m_config(config)
    , m_window(nullptr)
    , m_glfwReady(false)
    , m_store(config.storage.highScorePath)
    , m_storeWriter(m_store) {
}

Game::~Game() {
    Shutdown();
}

bool Game::Initialize() {
    glfwSetErrorCallback(ErrorCallback);

    if (!glfwInit()) {
        PICHUKA_LOG_CRITICAL("Failed to initialize GLFW");
        return false;
    }
    m_glfwReady = true;

    // Legacy context for the immediate-mode renderer
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 2);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 1);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);

    m_window = glfwCreateWindow(m_config.field.width, m_config.field.height,
                                "PICHUKA", nullptr, nullptr);
    if (!m_window) {
        PICHUKA_LOG_CRITICAL("Failed to create GLFW window");
        return false;
    }

    glfwMakeContextCurrent(m_window);
    glfwSwapInterval(1);

    glfwSetWindowUserPointer(m_window, this);
    glfwSetFramebufferSizeCallback(m_window, FramebufferSizeCallback);

    if (!m_renderer.Initialize(m_window)) {
        PICHUKA_LOG_CRITICAL("Failed to initialize renderer");
        return false;
    }

    m_input.Initialize(m_window);

    m_geometry = std::make_unique<WindowGeometry>(m_window, m_config);
    m_session = std::make_unique<Pichuka::Game::Session>(m_config, *m_geometry, m_storeWriter, m_random);
    UpdateTitle();

    PICHUKA_LOG_INFO("Press SPACE or click to flap, ESC to quit");
    return true;
}

void Game::Shutdown() {
    m_session.reset();
    m_geometry.reset();
    m_renderer.Shutdown();

    if (m_window) {
        glfwDestroyWindow(m_window);
        m_window = nullptr;
    }

    if (m_glfwReady) {
        glfwTerminate();
        m_glfwReady = false;
    }
}

void Game::Run() {
    while (!ShouldQuit()) {
        glfwPollEvents();

        m_input.Update();

        Update();

        Render();
    }
}

bool Game::ShouldQuit() const {
    return glfwWindowShouldClose(m_window) || m_input.IsEscapeJustPressed();
}

void Game::Update() {
    if (m_input.IsActivateJustPressed()) {
        m_session->Activate();
    }

    // The session asks for frames only while Playing
    if (m_session->WantsNextFrame() && FieldIsUsable()) {
        m_session->Update(glfwGetTime() * 1000.0);
    }

    UpdateTitle();
}

void Game::Render() {
    m_renderer.Clear();
    m_renderer.RenderFrame(m_session->GetView());
    m_renderer.Present();
}

void Game::UpdateTitle() {
    std::string title = "PICHUKA - " + m_session->GetScoreText();
    if (m_session->IsMessageVisible()) {
        title = m_session->GetState() == SessionState::GameOver
            ? title + " - Game Over, press Space to restart"
            : m_session->GetMessage();
    }

    if (title != m_title) {
        m_title = title;
        glfwSetWindowTitle(m_window, m_title.c_str());
    }
}

void Game::OnResize() {
    m_renderer.Resize();
    if (FieldIsUsable()) {
        m_session->OnFieldResized();
    }
}

bool Game::FieldIsUsable() const {
    if (glfwGetWindowAttrib(m_window, GLFW_ICONIFIED) == GLFW_TRUE) {
        return false;
    }
    return Pichuka::Game::FieldFitsGate(m_geometry->Query(), m_config.gates);
}

void Game::ErrorCallback(int error, const char* description) {
    PICHUKA_LOG_ERROR_F("GLFW Error %d: %s", error, description);
}

void Game::FramebufferSizeCallback(GLFWwindow* window, int width, int height) {
    (void)width;
    (void)height;

    auto* game = static_cast<Game*>(glfwGetWindowUserPointer(window));
    if (game && game->m_session) {
        game->OnResize();
    }
}

} // namespace PichukaGL
