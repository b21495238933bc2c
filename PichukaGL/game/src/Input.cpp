#include "Input.hpp"

namespace PichukaGL {

void Input::Initialize(GLFWwindow* window) {
    m_window = window;
    m_spacePressed = false;
    m_spaceJustPressed = false;
    m_clickPressed = false;
    m_clickJustPressed = false;
    m_escapePressed = false;
    m_escapeJustPressed = false;
}

void Input::Update() {
    bool spaceCurrentlyPressed = (glfwGetKey(m_window, GLFW_KEY_SPACE) == GLFW_PRESS);
    m_spaceJustPressed = spaceCurrentlyPressed && !m_spacePressed;
    m_spacePressed = spaceCurrentlyPressed;

    bool clickCurrentlyPressed =
        (glfwGetMouseButton(m_window, GLFW_MOUSE_BUTTON_LEFT) == GLFW_PRESS);
    m_clickJustPressed = clickCurrentlyPressed && !m_clickPressed && IsCursorInsideWindow();
    m_clickPressed = clickCurrentlyPressed;

    bool escapeCurrentlyPressed = (glfwGetKey(m_window, GLFW_KEY_ESCAPE) == GLFW_PRESS);
    m_escapeJustPressed = escapeCurrentlyPressed && !m_escapePressed;
    m_escapePressed = escapeCurrentlyPressed;
}

bool Input::IsCursorInsideWindow() const {
    double x = 0.0;
    double y = 0.0;
    int width = 0;
    int height = 0;
    glfwGetCursorPos(m_window, &x, &y);
    glfwGetWindowSize(m_window, &width, &height);
    return x >= 0.0 && y >= 0.0 && x < width && y < height;
}

} // namespace PichukaGL
