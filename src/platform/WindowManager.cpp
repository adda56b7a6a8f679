#include "uistate/platform/WindowManager.hpp"

#include <iostream>
#include <stdexcept>

namespace uistate::platform {

namespace {
constexpr int toGlfwBool(bool value) noexcept { return value ? GLFW_TRUE : GLFW_FALSE; }

void errorCallback(int code, const char* description)
{
    std::cerr << "GLFW error " << code << ": " << (description != nullptr ? description : "unknown") << '\n';
}
}

WindowManager::~WindowManager()
{
    destroy();
}

void WindowManager::applyHints() const
{
    glfwDefaultWindowHints();
    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_RESIZABLE, toGlfwBool(config.resizable));
    glfwWindowHint(GLFW_VISIBLE, toGlfwBool(!config.headless));
}

GLFWwindow* WindowManager::createWindow()
{
    if (!glfwInitialized) {
        glfwSetErrorCallback(errorCallback);
        if (!glfwInit()) {
            throw std::runtime_error("Failed to initialize GLFW");
        }
        glfwInitialized = true;
    }

    if (window != nullptr) {
        return window;
    }

    applyHints();

    window = glfwCreateWindow(static_cast<int>(config.width), static_cast<int>(config.height),
                              config.title.c_str(), nullptr, nullptr);
    if (!window) {
        destroy();
        throw std::runtime_error("Failed to create GLFW window");
    }

    return window;
}

void WindowManager::destroy()
{
    if (window != nullptr) {
        glfwDestroyWindow(window);
        window = nullptr;
    }
    if (glfwInitialized) {
        glfwTerminate();
        glfwInitialized = false;
    }
}

bool WindowManager::shouldClose() const
{
    if (window == nullptr) {
        return true;
    }
    return glfwWindowShouldClose(window) == GLFW_TRUE;
}

void WindowManager::requestClose() const
{
    if (window != nullptr) {
        glfwSetWindowShouldClose(window, GLFW_TRUE);
    }
}

void WindowManager::waitEvents(double timeoutSeconds) const
{
    glfwWaitEventsTimeout(timeoutSeconds);
}

} // namespace uistate::platform
