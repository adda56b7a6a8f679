#include "uistate/input/InputState.hpp"
#include "uistate/platform/GlfwInput.hpp"
#include "uistate/platform/WindowManager.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <string>

using namespace uistate;

namespace {

bool parseFlag(int argc, char** argv, const char* flag)
{
    for (int i = 1; i < argc; ++i) {
        if (std::string{argv[i]} == flag) {
            return true;
        }
    }
    return false;
}

int parseFrames(int argc, char** argv)
{
    const std::string prefix = "--frames=";
    for (int i = 1; i < argc; ++i) {
        std::string arg{argv[i]};
        if (arg.rfind(prefix, 0) == 0) {
            try {
                return std::max(0, std::stoi(arg.substr(prefix.size())));
            } catch (const std::exception&) {
                std::cerr << "Ignoring invalid frame count '" << arg << "'\n";
                return 0;
            }
        }
    }
    return 0; // run until the window closes
}

void printHelp()
{
    std::cout << "Input Monitor\n"
              << "  Press keys and mouse buttons inside the window to see the tracked state.\n"
              << "  C     : toggle a keyboard capture by widget #1\n"
              << "  Esc   : exit\n"
              << "  CLI   : --headless --frames=<n> --center-origin --flip-y\n";
}

std::string summarize(const InputState& state)
{
    std::string summary = "mouse=(" + std::to_string(state.mousePosition.x) + ", " + std::to_string(state.mousePosition.y) + ")";
    summary += " modifiers=" + toString(state.modifiers);
    if (const auto pressed = state.mouseButtons.pressedButton()) {
        summary += " pressed=" + std::string(toString(pressed->button));
    }
    if (state.widgetCapturingKeyboard) {
        summary += " keyboard=#" + std::to_string(state.widgetCapturingKeyboard->index);
    }
    if (state.widgetCapturingMouse) {
        summary += " mouse=#" + std::to_string(state.widgetCapturingMouse->index);
    }
    return summary;
}

} // namespace

int main(int argc, char** argv)
{
    try {
        printHelp();

        platform::WindowConfig windowConfig{};
        windowConfig.headless = parseFlag(argc, argv, "--headless");

        platform::GlfwInputConfig inputConfig{};
        inputConfig.origin = parseFlag(argc, argv, "--center-origin") ? platform::CursorOrigin::Center : platform::CursorOrigin::TopLeft;
        inputConfig.flipY = parseFlag(argc, argv, "--flip-y");

        const int maxFrames = parseFrames(argc, argv);

        platform::WindowManager windowManager;
        windowManager.setConfig(windowConfig);
        GLFWwindow* window = windowManager.createWindow();

        InputState state{};
        const WidgetId textBox{1};

        platform::GlfwInputBridge bridge(inputConfig);
        bridge.attach(window, [&](const UiEvent& event) {
            const InputState before = state;
            state.update(event);

            if (event.type() == UiEventType::KeyPress && event.key() == Key::C) {
                state.update(state.isCapturingKeyboard(textBox) ? UiEvent::widgetUncapturesKeyboard(textBox)
                                                                : UiEvent::widgetCapturesKeyboard(textBox));
            }
            if (event.type() == UiEventType::KeyPress && event.key() == Key::Escape) {
                windowManager.requestClose();
            }

            if (state != before) {
                std::cout << describe(event) << " -> " << summarize(state) << '\n';
            }
        });

        int frame = 0;
        while (!windowManager.shouldClose()) {
            windowManager.waitEvents(0.016);
            if (maxFrames > 0 && ++frame >= maxFrames) {
                break;
            }
        }

        bridge.detach();
        std::cout << "Final state: " << summarize(state) << '\n';
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
