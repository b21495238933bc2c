#include "Renderer.hpp"
#include <Pichuka/Game/PixelFont.hpp>
#include <algorithm>
#include <cmath>

namespace PichukaGL {

using Pichuka::Game::FrameView;
using Pichuka::Game::FindGlyph;
using Pichuka::Game::GLYPH_COLUMNS;
using Pichuka::Game::GLYPH_ROWS;
using Pichuka::Game::MeasureLine;
using Pichuka::Game::SplitLines;
using Pichuka::Game::SessionState;

Renderer::Renderer()
    : m_window(nullptr)
    , m_screenWidth(480.0f)
    , m_screenHeight(640.0f) {
}

Renderer::~Renderer() {
    Shutdown();
}

bool Renderer::Initialize(GLFWwindow* window) {
    m_window = window;

    Resize();

    // Enable blending for the overlay
    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);

    return true;
}

void Renderer::Shutdown() {
    m_window = nullptr;
}

void Renderer::Resize() {
    int framebufferWidth = 0;
    int framebufferHeight = 0;
    int windowWidth = 0;
    int windowHeight = 0;
    glfwGetFramebufferSize(m_window, &framebufferWidth, &framebufferHeight);
    glfwGetWindowSize(m_window, &windowWidth, &windowHeight);

    // Field units are window coordinates; the framebuffer may be denser
    m_screenWidth = static_cast<float>(windowWidth);
    m_screenHeight = static_cast<float>(windowHeight);

    glViewport(0, 0, framebufferWidth, framebufferHeight);

    // Orthographic projection with y growing downward
    glMatrixMode(GL_PROJECTION);
    glLoadIdentity();
    glOrtho(0.0, m_screenWidth, m_screenHeight, 0.0, -1.0, 1.0);
    glMatrixMode(GL_MODELVIEW);
    glLoadIdentity();
}

void Renderer::Clear() {
    // Sky blue background
    glClearColor(0.44f, 0.77f, 0.81f, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);
}

void Renderer::Present() {
    glfwSwapBuffers(m_window);
}

void Renderer::RenderFrame(const FrameView& view) {
    RenderGates(view);
    RenderGround(view.groundY);
    RenderFlyer(view);
    RenderScore(view);

    if (view.messageVisible) {
        RenderOverlay(view);
    }
}

void Renderer::RenderGates(const FrameView& view) {
    for (const auto& gate : view.gates) {
        RenderRect(gate.x, 0.0f, gate.width, gate.topHeight, 0.32f, 0.75f, 0.18f);
        RenderRect(gate.x, gate.bottomY, gate.width, gate.bottomHeight, 0.32f, 0.75f, 0.18f);
    }
}

void Renderer::RenderGround(float groundY) {
    RenderRect(0.0f, groundY, m_screenWidth, m_screenHeight - groundY, 0.87f, 0.82f, 0.55f);
}

void Renderer::RenderFlyer(const FrameView& view) {
    const float halfW = view.flyerWidth * 0.5f;
    const float halfH = view.flyerHeight * 0.5f;

    glPushMatrix();
    glTranslatef(view.flyerX + halfW, view.flyerY + halfH, 0.0f);
    glRotatef(view.flyerRotation, 0.0f, 0.0f, 1.0f);

    // Red when the session ended
    if (view.state == SessionState::GameOver) {
        RenderRect(-halfW, -halfH, view.flyerWidth, view.flyerHeight, 1.0f, 0.0f, 0.0f);
    } else {
        RenderRect(-halfW, -halfH, view.flyerWidth, view.flyerHeight, 1.0f, 0.8f, 0.0f);
    }

    glPopMatrix();
}

void Renderer::RenderScore(const FrameView& view) {
    float pixel = FitPixel(view.scoreText, 4.0f);
    RenderText(view.scoreText, m_screenWidth * 0.5f, 20.0f, pixel, 1.0f, 1.0f, 1.0f);
}

void Renderer::RenderOverlay(const FrameView& view) {
    RenderRect(0.0f, 0.0f, m_screenWidth, m_screenHeight, 0.0f, 0.0f, 0.0f, 0.5f);

    // Size the panel to the message; the widest line decides the pixel size
    const auto lines = SplitLines(view.message);
    std::string_view widest;
    for (const auto& line : lines) {
        if (line.size() > widest.size()) {
            widest = line;
        }
    }

    const float pixel = FitPixel(widest, 4.0f);
    const float lineHeight = (GLYPH_ROWS + 2) * pixel;
    const float padding = 4.0f * pixel;
    const float panelWidth = MeasureLine(widest, pixel) + 2.0f * padding;
    const float panelHeight = lines.size() * lineHeight - 2.0f * pixel + 2.0f * padding;
    const float x = (m_screenWidth - panelWidth) * 0.5f;
    const float y = (m_screenHeight - panelHeight) * 0.5f;

    if (view.state == SessionState::GameOver) {
        RenderRect(x, y, panelWidth, panelHeight, 0.6f, 0.1f, 0.1f, 0.9f);
    } else {
        RenderRect(x, y, panelWidth, panelHeight, 0.9f, 0.6f, 0.0f, 0.9f);
    }

    float lineY = y + padding;
    for (const auto& line : lines) {
        RenderText(line, m_screenWidth * 0.5f, lineY, pixel, 1.0f, 1.0f, 1.0f);
        lineY += lineHeight;
    }
}

void Renderer::RenderRect(float x, float y, float width, float height,
                          float r, float g, float b, float a) {
    glBegin(GL_QUADS);
    glColor4f(r, g, b, a);
    glVertex2f(x, y);
    glVertex2f(x + width, y);
    glVertex2f(x + width, y + height);
    glVertex2f(x, y + height);
    glEnd();
}

void Renderer::RenderText(std::string_view line, float centerX, float y, float pixel,
                          float r, float g, float b) {
    float x = centerX - MeasureLine(line, pixel) * 0.5f;
    for (char c : line) {
        // Characters the font lacks still take up a cell
        if (auto glyph = FindGlyph(c)) {
            for (int row = 0; row < GLYPH_ROWS; ++row) {
                for (int column = 0; column < GLYPH_COLUMNS; ++column) {
                    if (glyph->Lit(column, row)) {
                        RenderRect(x + column * pixel, y + row * pixel, pixel, pixel, r, g, b);
                    }
                }
            }
        }
        x += (GLYPH_COLUMNS + 1) * pixel;
    }
}

float Renderer::FitPixel(std::string_view line, float preferred) const {
    const float width = MeasureLine(line, 1.0f);
    if (width <= 0.0f) {
        return preferred;
    }
    const float fit = std::floor((m_screenWidth - 40.0f) / width);
    return std::clamp(fit, 1.0f, preferred);
}

} // namespace PichukaGL
