#pragma once

#include <GLFW/glfw3.h>

namespace PichukaGL {

class Input {
public:
    Input() = default;

    // Initialize input system with GLFW window
    void Initialize(GLFWwindow* window);

    // Update input state (call once per frame)
    void Update();

    // Space or a left click inside the window, on the press edge only
    bool IsActivateJustPressed() const { return m_spaceJustPressed || m_clickJustPressed; }

    // Check if escape key was just pressed (for quitting)
    bool IsEscapeJustPressed() const { return m_escapeJustPressed; }

private:
    bool IsCursorInsideWindow() const;

    GLFWwindow* m_window = nullptr;
    bool m_spacePressed = false;
    bool m_spaceJustPressed = false;
    bool m_clickPressed = false;
    bool m_clickJustPressed = false;
    bool m_escapePressed = false;
    bool m_escapeJustPressed = false;
};

} // namespace PichukaGL
