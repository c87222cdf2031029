#pragma once
#include "interfaces/window_i.h"
#include "GLFW/glfw3.h"
#include <cstdint>

struct WindowSpecification {
    uint32_t width = 1280;
    uint32_t height = 720;
};

// Input-only window: no client API, nothing is presented
class GlfwWindow final : public IWindow {
public:
    GlfwWindow(const WindowSpecification& spec, const std::string& title);
    ~GlfwWindow();

    GlfwWindow(const GlfwWindow&) = delete;
    GlfwWindow& operator=(const GlfwWindow&) = delete;

    // -------- Window --------
    void pollEvents() override;
    bool isWindowShouldClose() const override;
    void requestWindowClose() override;
    void getFramebufferSize(int& width, int& height) const override;
    void setTitle(const std::string& title) override;

    // -------- Input --------
    bool isKeyPressed(DriveKey key) const override;
    bool isMouseButtonPressed(DriveMouseButton button) const override;
    glm::vec2 getCursorPosition() const override;
    void setKeyCallback(DriveKeyCallback callback) override;

private:
    void initGLFW(const WindowSpecification& spec, const std::string& title);

    static void framebufferResizeCallback(GLFWwindow* window, int w, int h);
    static void keyCallback(GLFWwindow* window, int key, int scancode, int action, int mods);

private:
    GLFWwindow* m_window = nullptr;

    uint32_t m_width = 0;
    uint32_t m_height = 0;

    DriveKeyCallback m_keyCallback;
};
