#pragma once

#include <GLFW/glfw3.h>
#include <Pichuka/Game/Session.hpp>
#include <string_view>

namespace PichukaGL {

class Renderer {
public:
    Renderer();
    ~Renderer();

    // Initialize renderer
    bool Initialize(GLFWwindow* window);

    // Shutdown renderer
    void Shutdown();

    // Rebuild viewport and projection after the window changed size
    void Resize();

    // Clear screen
    void Clear();

    // Present frame
    void Present();

    // Draw everything a session exposes after a cycle
    void RenderFrame(const Pichuka::Game::FrameView& view);

private:
    GLFWwindow* m_window;
    float m_screenWidth;
    float m_screenHeight;

    void RenderGates(const Pichuka::Game::FrameView& view);
    void RenderGround(float groundY);
    void RenderFlyer(const Pichuka::Game::FrameView& view);
    void RenderScore(const Pichuka::Game::FrameView& view);
    void RenderOverlay(const Pichuka::Game::FrameView& view);

    // Helper to render a rectangle from its top-left corner
    void RenderRect(float x, float y, float width, float height,
                    float r, float g, float b, float a = 1.0f);

    // Draw one line of bitmap text centred on centerX, top edge at y
    void RenderText(std::string_view line, float centerX, float y, float pixel,
                    float r, float g, float b);

    // Largest pixel size up to preferred at which the line fits the window
    float FitPixel(std::string_view line, float preferred) const;
};

} // namespace PichukaGL
