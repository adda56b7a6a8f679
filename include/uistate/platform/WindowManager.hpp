#pragma once

#include <GLFW/glfw3.h>

#include <cstdint>
#include <string>
#include <utility>

namespace uistate::platform {

struct WindowConfig {
    uint32_t width{800};
    uint32_t height{600};
    std::string title{"Input Monitor"};
    bool headless{false};
    bool resizable{true};
};

class WindowManager {
public:
    WindowManager() = default;
    ~WindowManager();

    WindowManager(const WindowManager&) = delete;
    WindowManager& operator=(const WindowManager&) = delete;

    void setConfig(WindowConfig cfg) noexcept { config = std::move(cfg); }

    GLFWwindow* createWindow();
    void destroy();
    [[nodiscard]] bool shouldClose() const;
    void requestClose() const;
    void waitEvents(double timeoutSeconds) const;

private:
    void applyHints() const;

private:
    WindowConfig config{};
    GLFWwindow* window{nullptr};
    bool glfwInitialized{false};
};

} // namespace uistate::platform
