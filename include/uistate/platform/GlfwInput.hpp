#pragma once

#include "uistate/input/UiEvent.hpp"

#include <GLFW/glfw3.h>

#include <functional>
#include <optional>

namespace uistate::platform {

enum class CursorOrigin {
    TopLeft,
    Center
};

struct GlfwInputConfig {
    // Where (0, 0) lies in the window. GLFW reports from the top-left corner.
    CursorOrigin origin{CursorOrigin::TopLeft};
    // Makes y grow upwards. With TopLeft the origin moves to the bottom-left corner.
    bool flipY{false};
    bool keyRepeatAsPress{true};
};

// Unmapped GLFW codes become Key::Unknown / MouseButton::Unknown.
[[nodiscard]] Key keyFromGlfw(int key) noexcept;
[[nodiscard]] MouseButton mouseButtonFromGlfw(int button) noexcept;

// Turns raw GLFW callback arguments into toolkit events.
class GlfwEventTranslator {
public:
    GlfwEventTranslator() = default;
    explicit GlfwEventTranslator(GlfwInputConfig cfg) noexcept : config(cfg) {}

    void setConfig(GlfwInputConfig cfg) noexcept { config = cfg; }
    [[nodiscard]] const GlfwInputConfig& getConfig() const noexcept { return config; }

    void setWindowSize(int width, int height) noexcept;
    [[nodiscard]] Point windowSize() const noexcept { return size; }

    [[nodiscard]] std::optional<UiEvent> translateKey(int key, int action) const;
    [[nodiscard]] std::optional<UiEvent> translateMouseButton(int button, int action) const;
    [[nodiscard]] UiEvent translateCursorPosition(double xpos, double ypos) const;
    [[nodiscard]] UiEvent translateScroll(double xoffset, double yoffset) const;
    [[nodiscard]] UiEvent translateChar(unsigned int codepoint) const;
    [[nodiscard]] UiEvent translateFocus(int focused) const;
    // Also records the new size for later cursor conversions.
    UiEvent translateResize(int width, int height);

    [[nodiscard]] Point toToolkitCoordinates(double xpos, double ypos) const noexcept;

private:
    GlfwInputConfig config{};
    Point size{0.0, 0.0};
};

using UiEventSink = std::function<void(const UiEvent&)>;

// Installs GLFW callbacks on a window and forwards every translated event to
// a sink. Uses the window user pointer, so a window carries at most one bridge.
class GlfwInputBridge {
public:
    GlfwInputBridge() = default;
    explicit GlfwInputBridge(GlfwInputConfig cfg) noexcept : eventTranslator(cfg) {}
    ~GlfwInputBridge();

    GlfwInputBridge(const GlfwInputBridge&) = delete;
    GlfwInputBridge& operator=(const GlfwInputBridge&) = delete;
    GlfwInputBridge(GlfwInputBridge&&) = delete;
    GlfwInputBridge& operator=(GlfwInputBridge&&) = delete;

    void attach(GLFWwindow* window, UiEventSink sink);
    void detach();
    [[nodiscard]] bool isAttached() const noexcept { return windowHandle != nullptr; }

    // Forwards an event to the sink as if GLFW had reported it. No-op when detached.
    void inject(const UiEvent& event) const;

private:
    static GlfwInputBridge* fromWindow(GLFWwindow* window);
    static void keyCallback(GLFWwindow* window, int key, int scancode, int action, int mods);
    static void mouseButtonCallback(GLFWwindow* window, int button, int action, int mods);
    static void cursorPositionCallback(GLFWwindow* window, double xpos, double ypos);
    static void scrollCallback(GLFWwindow* window, double xoffset, double yoffset);
    static void charCallback(GLFWwindow* window, unsigned int codepoint);
    static void windowSizeCallback(GLFWwindow* window, int width, int height);
    static void focusCallback(GLFWwindow* window, int focused);

    void emit(const std::optional<UiEvent>& event) const;

    GLFWwindow* windowHandle{nullptr};
    UiEventSink eventSink;
    GlfwEventTranslator eventTranslator;
};

} // namespace uistate::platform
