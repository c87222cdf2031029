#include "common/app_pch.h"
#include "common/glfw_window.h"


GlfwWindow::GlfwWindow(const WindowSpecification& spec, const std::string& title)
{
    initGLFW(spec, title);
}

GlfwWindow::~GlfwWindow()
{
    if (m_window) {
        glfwDestroyWindow(m_window);
        m_window = nullptr;
    }
    glfwTerminate();
}

void GlfwWindow::initGLFW(const WindowSpecification& spec, const std::string& title)
{
    if (!glfwInit())
        throw std::runtime_error("Failed to initialize GLFW");

    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);

    m_window = glfwCreateWindow(
        static_cast<int>(spec.width),
        static_cast<int>(spec.height),
        title.c_str(),
        nullptr,
        nullptr
    );

    if (!m_window) {
        glfwTerminate();
        throw std::runtime_error("Failed to create GLFW window");
    }

    m_width = spec.width;
    m_height = spec.height;

    glfwSetWindowUserPointer(m_window, this);

    glfwSetFramebufferSizeCallback(m_window, framebufferResizeCallback);
    glfwSetKeyCallback(m_window, keyCallback);
}

// Window API
void GlfwWindow::pollEvents() {
    glfwPollEvents();
}

bool GlfwWindow::isWindowShouldClose() const {
    return glfwWindowShouldClose(m_window);
}

void GlfwWindow::requestWindowClose() {
    glfwSetWindowShouldClose(m_window, GLFW_TRUE);
}

void GlfwWindow::getFramebufferSize(int& width, int& height) const {
    glfwGetFramebufferSize(m_window, &width, &height);
}

void GlfwWindow::setTitle(const std::string& title) {
    glfwSetWindowTitle(m_window, title.c_str());
}


// Input API
bool GlfwWindow::isKeyPressed(DriveKey key) const {
    if (key == DriveKey::UNKNOWN) return false;
    return glfwGetKey(m_window, static_cast<int>(key)) == GLFW_PRESS;
}

bool GlfwWindow::isMouseButtonPressed(DriveMouseButton button) const {
    return glfwGetMouseButton(m_window, static_cast<int>(button)) == GLFW_PRESS;
}

glm::vec2 GlfwWindow::getCursorPosition() const {
    double x = 0.0, y = 0.0;
    glfwGetCursorPos(m_window, &x, &y);
    return { static_cast<float>(x), static_cast<float>(y) };
}


// Callbacks

void GlfwWindow::setKeyCallback(DriveKeyCallback callback) {
    m_keyCallback = std::move(callback);
}

void GlfwWindow::framebufferResizeCallback(GLFWwindow* window, int w, int h) {
    auto* self = static_cast<GlfwWindow*>(glfwGetWindowUserPointer(window));
    if (!self) return;

    self->m_width = static_cast<uint32_t>(w);
    self->m_height = static_cast<uint32_t>(h);
}

void GlfwWindow::keyCallback(
    GLFWwindow* window,
    int key,
    int scancode,
    int action,
    int mods)
{
    auto* self = static_cast<GlfwWindow*>(glfwGetWindowUserPointer(window));
    if (!self || !self->m_keyCallback) return;

    DriveKey driveKey = static_cast<DriveKey>(key);
    KeyAction driveAction =
        action == GLFW_PRESS ? KeyAction::PRESS :
        action == GLFW_RELEASE ? KeyAction::RELEASE :
        KeyAction::REPEAT;

    self->m_keyCallback(driveKey, scancode, driveAction, mods);
}
