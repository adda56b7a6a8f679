#include "uistate/platform/GlfwInput.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace uistate::platform {

namespace {

Key offsetKey(Key first, int offset) noexcept
{
    return static_cast<Key>(static_cast<int>(first) + offset);
}

std::string encodeUtf8(unsigned int codepoint)
{
    std::string out;
    if (codepoint < 0x80) {
        out += static_cast<char>(codepoint);
    } else if (codepoint < 0x800) {
        out += static_cast<char>(0xC0 | (codepoint >> 6));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint < 0x10000) {
        out += static_cast<char>(0xE0 | (codepoint >> 12));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint < 0x110000) {
        out += static_cast<char>(0xF0 | (codepoint >> 18));
        out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    }
    return out;
}

} // namespace

Key keyFromGlfw(int key) noexcept
{
    if (key >= GLFW_KEY_A && key <= GLFW_KEY_Z) {
        return offsetKey(Key::A, key - GLFW_KEY_A);
    }
    if (key >= GLFW_KEY_0 && key <= GLFW_KEY_9) {
        return offsetKey(Key::D0, key - GLFW_KEY_0);
    }
    if (key >= GLFW_KEY_F1 && key <= GLFW_KEY_F12) {
        return offsetKey(Key::F1, key - GLFW_KEY_F1);
    }

    switch (key) {
    case GLFW_KEY_SPACE:
        return Key::Space;
    case GLFW_KEY_APOSTROPHE:
        return Key::Apostrophe;
    case GLFW_KEY_COMMA:
        return Key::Comma;
    case GLFW_KEY_MINUS:
        return Key::Minus;
    case GLFW_KEY_PERIOD:
        return Key::Period;
    case GLFW_KEY_SLASH:
        return Key::Slash;
    case GLFW_KEY_SEMICOLON:
        return Key::Semicolon;
    case GLFW_KEY_EQUAL:
        return Key::Equals;
    case GLFW_KEY_LEFT_BRACKET:
        return Key::LeftBracket;
    case GLFW_KEY_BACKSLASH:
        return Key::Backslash;
    case GLFW_KEY_RIGHT_BRACKET:
        return Key::RightBracket;
    case GLFW_KEY_GRAVE_ACCENT:
        return Key::Grave;
    case GLFW_KEY_ESCAPE:
        return Key::Escape;
    case GLFW_KEY_ENTER:
        return Key::Return;
    case GLFW_KEY_TAB:
        return Key::Tab;
    case GLFW_KEY_BACKSPACE:
        return Key::Backspace;
    case GLFW_KEY_INSERT:
        return Key::Insert;
    case GLFW_KEY_DELETE:
        return Key::Delete;
    case GLFW_KEY_HOME:
        return Key::Home;
    case GLFW_KEY_END:
        return Key::End;
    case GLFW_KEY_PAGE_UP:
        return Key::PageUp;
    case GLFW_KEY_PAGE_DOWN:
        return Key::PageDown;
    case GLFW_KEY_LEFT:
        return Key::Left;
    case GLFW_KEY_RIGHT:
        return Key::Right;
    case GLFW_KEY_UP:
        return Key::Up;
    case GLFW_KEY_DOWN:
        return Key::Down;
    case GLFW_KEY_CAPS_LOCK:
        return Key::CapsLock;
    case GLFW_KEY_SCROLL_LOCK:
        return Key::ScrollLock;
    case GLFW_KEY_NUM_LOCK:
        return Key::NumLock;
    case GLFW_KEY_PRINT_SCREEN:
        return Key::PrintScreen;
    case GLFW_KEY_PAUSE:
        return Key::Pause;
    case GLFW_KEY_MENU:
        return Key::Menu;
    case GLFW_KEY_LEFT_CONTROL:
        return Key::LCtrl;
    case GLFW_KEY_RIGHT_CONTROL:
        return Key::RCtrl;
    case GLFW_KEY_LEFT_SHIFT:
        return Key::LShift;
    case GLFW_KEY_RIGHT_SHIFT:
        return Key::RShift;
    case GLFW_KEY_LEFT_ALT:
        return Key::LAlt;
    case GLFW_KEY_RIGHT_ALT:
        return Key::RAlt;
    case GLFW_KEY_LEFT_SUPER:
        return Key::LGui;
    case GLFW_KEY_RIGHT_SUPER:
        return Key::RGui;
    default:
        return Key::Unknown;
    }
}

MouseButton mouseButtonFromGlfw(int button) noexcept
{
    // GLFW numbers buttons from 0 (left); index 0 is reserved for Unknown here.
    if (button < GLFW_MOUSE_BUTTON_1 || button > GLFW_MOUSE_BUTTON_LAST) {
        return MouseButton::Unknown;
    }
    return mouseButtonFromIndex(static_cast<std::size_t>(button - GLFW_MOUSE_BUTTON_1) + 1);
}

void GlfwEventTranslator::setWindowSize(int width, int height) noexcept
{
    size = Point{static_cast<double>(width), static_cast<double>(height)};
}

std::optional<UiEvent> GlfwEventTranslator::translateKey(int key, int action) const
{
    const Key mapped = keyFromGlfw(key);
    if (action == GLFW_PRESS || (action == GLFW_REPEAT && config.keyRepeatAsPress)) {
        return UiEvent::keyPress(mapped);
    }
    if (action == GLFW_RELEASE) {
        return UiEvent::keyRelease(mapped);
    }
    return std::nullopt;
}

std::optional<UiEvent> GlfwEventTranslator::translateMouseButton(int button, int action) const
{
    const MouseButton mapped = mouseButtonFromGlfw(button);
    if (action == GLFW_PRESS) {
        return UiEvent::mousePress(mapped);
    }
    if (action == GLFW_RELEASE) {
        return UiEvent::mouseRelease(mapped);
    }
    return std::nullopt;
}

UiEvent GlfwEventTranslator::translateCursorPosition(double xpos, double ypos) const
{
    return UiEvent::mouseMove(toToolkitCoordinates(xpos, ypos));
}

UiEvent GlfwEventTranslator::translateScroll(double xoffset, double yoffset) const
{
    return UiEvent::mouseScroll(Point{xoffset, yoffset});
}

UiEvent GlfwEventTranslator::translateChar(unsigned int codepoint) const
{
    return UiEvent::text(encodeUtf8(codepoint));
}

UiEvent GlfwEventTranslator::translateFocus(int focused) const
{
    return UiEvent::focus(focused == GLFW_TRUE);
}

UiEvent GlfwEventTranslator::translateResize(int width, int height)
{
    setWindowSize(width, height);
    return UiEvent::resize(size.x, size.y);
}

Point GlfwEventTranslator::toToolkitCoordinates(double xpos, double ypos) const noexcept
{
    Point point{xpos, ypos};
    if (config.origin == CursorOrigin::Center) {
        point -= size * 0.5;
    }
    if (config.flipY) {
        point.y = config.origin == CursorOrigin::Center ? -point.y : size.y - point.y;
    }
    return point;
}

GlfwInputBridge::~GlfwInputBridge()
{
    detach();
}

void GlfwInputBridge::attach(GLFWwindow* window, UiEventSink sink)
{
    if (window == nullptr) {
        throw std::runtime_error("GlfwInputBridge: cannot attach to a null window");
    }
    if (windowHandle != nullptr) {
        throw std::runtime_error("GlfwInputBridge: already attached to a window");
    }
    if (glfwGetWindowUserPointer(window) != nullptr) {
        throw std::runtime_error("GlfwInputBridge: window user pointer is already in use");
    }

    windowHandle = window;
    eventSink = std::move(sink);

    int width = 0;
    int height = 0;
    glfwGetWindowSize(window, &width, &height);
    eventTranslator.setWindowSize(width, height);

    glfwSetWindowUserPointer(window, this);
    glfwSetKeyCallback(window, keyCallback);
    glfwSetMouseButtonCallback(window, mouseButtonCallback);
    glfwSetCursorPosCallback(window, cursorPositionCallback);
    glfwSetScrollCallback(window, scrollCallback);
    glfwSetCharCallback(window, charCallback);
    glfwSetWindowSizeCallback(window, windowSizeCallback);
    glfwSetWindowFocusCallback(window, focusCallback);
}

void GlfwInputBridge::detach()
{
    if (windowHandle == nullptr) {
        return;
    }

    glfwSetKeyCallback(windowHandle, nullptr);
    glfwSetMouseButtonCallback(windowHandle, nullptr);
    glfwSetCursorPosCallback(windowHandle, nullptr);
    glfwSetScrollCallback(windowHandle, nullptr);
    glfwSetCharCallback(windowHandle, nullptr);
    glfwSetWindowSizeCallback(windowHandle, nullptr);
    glfwSetWindowFocusCallback(windowHandle, nullptr);
    glfwSetWindowUserPointer(windowHandle, nullptr);

    windowHandle = nullptr;
    eventSink = nullptr;
}

GlfwInputBridge* GlfwInputBridge::fromWindow(GLFWwindow* window)
{
    return static_cast<GlfwInputBridge*>(glfwGetWindowUserPointer(window));
}

void GlfwInputBridge::emit(const std::optional<UiEvent>& event) const
{
    if (event && eventSink) {
        // The sink may detach this bridge, which resets eventSink.
        const UiEventSink sink = eventSink;
        sink(*event);
    }
}

void GlfwInputBridge::inject(const UiEvent& event) const
{
    if (windowHandle == nullptr) {
        return;
    }
    emit(event);
}

void GlfwInputBridge::keyCallback(GLFWwindow* window, int key, int /*scancode*/, int action, int /*mods*/)
{
    auto* bridge = fromWindow(window);
    if (bridge == nullptr) {
        return;
    }
    bridge->emit(bridge->eventTranslator.translateKey(key, action));
}

void GlfwInputBridge::mouseButtonCallback(GLFWwindow* window, int button, int action, int /*mods*/)
{
    auto* bridge = fromWindow(window);
    if (bridge == nullptr) {
        return;
    }
    bridge->emit(bridge->eventTranslator.translateMouseButton(button, action));
}

void GlfwInputBridge::cursorPositionCallback(GLFWwindow* window, double xpos, double ypos)
{
    auto* bridge = fromWindow(window);
    if (bridge == nullptr) {
        return;
    }
    bridge->emit(bridge->eventTranslator.translateCursorPosition(xpos, ypos));
}

void GlfwInputBridge::scrollCallback(GLFWwindow* window, double xoffset, double yoffset)
{
    auto* bridge = fromWindow(window);
    if (bridge == nullptr) {
        return;
    }
    bridge->emit(bridge->eventTranslator.translateScroll(xoffset, yoffset));
}

void GlfwInputBridge::charCallback(GLFWwindow* window, unsigned int codepoint)
{
    auto* bridge = fromWindow(window);
    if (bridge == nullptr) {
        return;
    }
    bridge->emit(bridge->eventTranslator.translateChar(codepoint));
}

void GlfwInputBridge::windowSizeCallback(GLFWwindow* window, int width, int height)
{
    auto* bridge = fromWindow(window);
    if (bridge == nullptr) {
        return;
    }
    bridge->emit(bridge->eventTranslator.translateResize(width, height));
}

void GlfwInputBridge::focusCallback(GLFWwindow* window, int focused)
{
    auto* bridge = fromWindow(window);
    if (bridge == nullptr) {
        return;
    }
    bridge->emit(bridge->eventTranslator.translateFocus(focused));
}

} // namespace uistate::platform
