#pragma once

#include <GLFW/glfw3.h>
#include <Pichuka/Core/Config.hpp>
#include <Pichuka/Game/Geometry.hpp>
#include <Pichuka/Game/HighScoreStore.hpp>
#include <Pichuka/Game/RandomSource.hpp>
#include <Pichuka/Game/Session.hpp>
#include "Renderer.hpp"
#include "Input.hpp"
#include <memory>
#include <string>

namespace PichukaGL {

// Field geometry read from the window on every query
class WindowGeometry : public Pichuka::Game::GeometryProvider {
public:
    WindowGeometry(GLFWwindow* window, const Pichuka::Config::GameConfig& config);

    Pichuka::Game::FieldGeometry Query() const override;

private:
    GLFWwindow* m_window;
    float m_groundHeight;
    float m_flyerWidth;
    float m_flyerHeight;
};

class Game {
public:
    explicit Game(const Pichuka::Config::GameConfig& config);
    ~Game();

    // Initialize game systems
    bool Initialize();

    // Shutdown game systems
    void Shutdown();

    // Main game loop
    void Run();

    // Check if game should quit
    bool ShouldQuit() const;

private:
    Pichuka::Config::GameConfig m_config;

    // Systems
    GLFWwindow* m_window;
    bool m_glfwReady;
    Renderer m_renderer;
    Input m_input;
    std::unique_ptr<WindowGeometry> m_geometry;
    Pichuka::Game::JsonHighScoreStore m_store;
    Pichuka::Game::AsyncHighScoreStore m_storeWriter;   // Writes m_store off the frame thread
    Pichuka::Game::MersenneRandomSource m_random;
    std::unique_ptr<Pichuka::Game::Session> m_session;
    std::string m_title;

    // Game logic
    void Update();
    void Render();
    void UpdateTitle();
    void OnResize();

    // False while minimized or too small for a gate; the session is not
    // stepped or re-centred until the field is usable again
    bool FieldIsUsable() const;

    // GLFW callbacks
    static void ErrorCallback(int error, const char* description);
    static void FramebufferSizeCallback(GLFWwindow* window, int width, int height);
};

} // namespace PichukaGL
