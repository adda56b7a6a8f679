#include <gtest/gtest.h>

#include <GLFW/glfw3.h>

#include "uistate/input/InputState.hpp"
#include "uistate/platform/GlfwInput.hpp"
#include "uistate/platform/WindowManager.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace {

using namespace uistate;
using namespace uistate::platform;

TEST(GlfwInputTests, LettersDigitsAndFunctionKeysMap)
{
    EXPECT_EQ(keyFromGlfw(GLFW_KEY_A), Key::A);
    EXPECT_EQ(keyFromGlfw(GLFW_KEY_M), Key::M);
    EXPECT_EQ(keyFromGlfw(GLFW_KEY_Z), Key::Z);
    EXPECT_EQ(keyFromGlfw(GLFW_KEY_0), Key::D0);
    EXPECT_EQ(keyFromGlfw(GLFW_KEY_9), Key::D9);
    EXPECT_EQ(keyFromGlfw(GLFW_KEY_F1), Key::F1);
    EXPECT_EQ(keyFromGlfw(GLFW_KEY_F12), Key::F12);
    EXPECT_EQ(keyFromGlfw(GLFW_KEY_ENTER), Key::Return);
    EXPECT_EQ(keyFromGlfw(GLFW_KEY_PAGE_UP), Key::PageUp);
}

TEST(GlfwInputTests, AllModifierKeysMap)
{
    EXPECT_EQ(keyFromGlfw(GLFW_KEY_LEFT_CONTROL), Key::LCtrl);
    EXPECT_EQ(keyFromGlfw(GLFW_KEY_RIGHT_CONTROL), Key::RCtrl);
    EXPECT_EQ(keyFromGlfw(GLFW_KEY_LEFT_SHIFT), Key::LShift);
    EXPECT_EQ(keyFromGlfw(GLFW_KEY_RIGHT_SHIFT), Key::RShift);
    EXPECT_EQ(keyFromGlfw(GLFW_KEY_LEFT_ALT), Key::LAlt);
    EXPECT_EQ(keyFromGlfw(GLFW_KEY_RIGHT_ALT), Key::RAlt);
    EXPECT_EQ(keyFromGlfw(GLFW_KEY_LEFT_SUPER), Key::LGui);
    EXPECT_EQ(keyFromGlfw(GLFW_KEY_RIGHT_SUPER), Key::RGui);
}

TEST(GlfwInputTests, UnmappedKeysAreUnknown)
{
    EXPECT_EQ(keyFromGlfw(GLFW_KEY_UNKNOWN), Key::Unknown);
    EXPECT_EQ(keyFromGlfw(GLFW_KEY_KP_5), Key::Unknown);
    EXPECT_EQ(keyFromGlfw(GLFW_KEY_F25), Key::Unknown);
}

TEST(GlfwInputTests, MouseButtonsMapInOrder)
{
    EXPECT_EQ(mouseButtonFromGlfw(GLFW_MOUSE_BUTTON_LEFT), MouseButton::Left);
    EXPECT_EQ(mouseButtonFromGlfw(GLFW_MOUSE_BUTTON_RIGHT), MouseButton::Right);
    EXPECT_EQ(mouseButtonFromGlfw(GLFW_MOUSE_BUTTON_MIDDLE), MouseButton::Middle);
    EXPECT_EQ(mouseButtonFromGlfw(GLFW_MOUSE_BUTTON_4), MouseButton::X1);
    EXPECT_EQ(mouseButtonFromGlfw(GLFW_MOUSE_BUTTON_5), MouseButton::X2);
    EXPECT_EQ(mouseButtonFromGlfw(GLFW_MOUSE_BUTTON_8), MouseButton::Button8);
    EXPECT_EQ(mouseButtonFromGlfw(-1), MouseButton::Unknown);
    EXPECT_EQ(mouseButtonFromGlfw(GLFW_MOUSE_BUTTON_LAST + 1), MouseButton::Unknown);
}

TEST(GlfwInputTests, KeyActionsBecomePressAndRelease)
{
    const GlfwEventTranslator translator;

    const auto press = translator.translateKey(GLFW_KEY_LEFT_SHIFT, GLFW_PRESS);
    const auto release = translator.translateKey(GLFW_KEY_LEFT_SHIFT, GLFW_RELEASE);
    const auto repeat = translator.translateKey(GLFW_KEY_A, GLFW_REPEAT);

    ASSERT_TRUE(press.has_value());
    EXPECT_EQ(press->type(), UiEventType::KeyPress);
    EXPECT_EQ(press->key(), Key::LShift);
    ASSERT_TRUE(release.has_value());
    EXPECT_EQ(release->type(), UiEventType::KeyRelease);
    ASSERT_TRUE(repeat.has_value());
    EXPECT_EQ(repeat->type(), UiEventType::KeyPress);
}

TEST(GlfwInputTests, KeyRepeatCanBeDropped)
{
    GlfwInputConfig config{};
    config.keyRepeatAsPress = false;
    const GlfwEventTranslator translator(config);

    EXPECT_FALSE(translator.translateKey(GLFW_KEY_A, GLFW_REPEAT).has_value());
    EXPECT_TRUE(translator.translateKey(GLFW_KEY_A, GLFW_PRESS).has_value());
}

TEST(GlfwInputTests, MouseButtonActions)
{
    const GlfwEventTranslator translator;

    const auto press = translator.translateMouseButton(GLFW_MOUSE_BUTTON_RIGHT, GLFW_PRESS);
    const auto release = translator.translateMouseButton(GLFW_MOUSE_BUTTON_RIGHT, GLFW_RELEASE);

    ASSERT_TRUE(press.has_value());
    EXPECT_EQ(press->type(), UiEventType::MousePress);
    EXPECT_EQ(press->mouseButton(), MouseButton::Right);
    ASSERT_TRUE(release.has_value());
    EXPECT_EQ(release->type(), UiEventType::MouseRelease);
    EXPECT_FALSE(translator.translateMouseButton(GLFW_MOUSE_BUTTON_RIGHT, GLFW_REPEAT).has_value());
}

TEST(GlfwInputTests, CursorDefaultsToWindowCoordinates)
{
    GlfwEventTranslator translator;
    translator.setWindowSize(200, 100);

    const UiEvent event = translator.translateCursorPosition(30.0, 40.0);

    EXPECT_EQ(event.type(), UiEventType::MouseMove);
    EXPECT_EQ(event.point(), Point(30.0, 40.0));
}

TEST(GlfwInputTests, CursorFlipYFromBottomLeft)
{
    GlfwInputConfig config{};
    config.flipY = true;
    GlfwEventTranslator translator(config);
    translator.setWindowSize(200, 100);

    EXPECT_EQ(translator.toToolkitCoordinates(30.0, 40.0), Point(30.0, 60.0));
}

TEST(GlfwInputTests, CursorCenteredOrigin)
{
    GlfwInputConfig config{};
    config.origin = CursorOrigin::Center;
    GlfwEventTranslator translator(config);
    translator.setWindowSize(200, 100);

    EXPECT_EQ(translator.toToolkitCoordinates(100.0, 50.0), Point(0.0, 0.0));
    EXPECT_EQ(translator.toToolkitCoordinates(130.0, 40.0), Point(30.0, -10.0));

    config.flipY = true;
    translator.setConfig(config);
    EXPECT_EQ(translator.getConfig().origin, CursorOrigin::Center);
    EXPECT_TRUE(translator.getConfig().flipY);
    EXPECT_EQ(translator.toToolkitCoordinates(130.0, 40.0), Point(30.0, 10.0));
}

TEST(GlfwInputTests, ResizeUpdatesCursorMapping)
{
    GlfwInputConfig config{};
    config.origin = CursorOrigin::Center;
    GlfwEventTranslator translator(config);

    const UiEvent resize = translator.translateResize(400, 300);

    EXPECT_EQ(resize.type(), UiEventType::Resize);
    EXPECT_EQ(resize.point(), Point(400.0, 300.0));
    EXPECT_EQ(translator.windowSize(), Point(400.0, 300.0));
    EXPECT_EQ(translator.toToolkitCoordinates(200.0, 150.0), Point(0.0, 0.0));
}

TEST(GlfwInputTests, CharactersAreUtf8Encoded)
{
    const GlfwEventTranslator translator;

    EXPECT_EQ(translator.translateChar('a').textValue(), "a");
    EXPECT_EQ(translator.translateChar(0x00E9).textValue(), "\xC3\xA9");
    EXPECT_EQ(translator.translateChar(0x20AC).textValue(), "\xE2\x82\xAC");
    EXPECT_EQ(translator.translateChar(0x1F600).textValue(), "\xF0\x9F\x98\x80");
}

TEST(GlfwInputTests, TranslatedSequenceDrivesInputState)
{
    const GlfwEventTranslator translator;
    InputState state{};

    std::vector<std::optional<UiEvent>> events{
        translator.translateCursorPosition(15.0, 25.0),
        translator.translateMouseButton(GLFW_MOUSE_BUTTON_LEFT, GLFW_PRESS),
        translator.translateCursorPosition(80.0, 90.0),
        translator.translateKey(GLFW_KEY_RIGHT_CONTROL, GLFW_PRESS),
        translator.translateKey(GLFW_KEY_Q, GLFW_PRESS),
        translator.translateScroll(0.0, 1.0),
        translator.translateFocus(GLFW_FALSE)
    };
    for (const auto& event : events) {
        ASSERT_TRUE(event.has_value());
        state.update(*event);
    }

    EXPECT_EQ(state.mousePosition, Point(80.0, 90.0));
    EXPECT_EQ(state.mouseButtonDown(MouseButton::Left), ButtonDownPosition(Point{15.0, 25.0}));
    EXPECT_EQ(state.modifiers, kCtrl);
}

TEST(GlfwInputTests, BridgeRejectsNullWindow)
{
    GlfwInputBridge bridge;

    EXPECT_THROW(bridge.attach(nullptr, [](const UiEvent&) {}), std::runtime_error);
    EXPECT_FALSE(bridge.isAttached());
}

TEST(GlfwInputTests, InjectWithoutWindowIsDropped)
{
    GlfwInputBridge bridge;

    EXPECT_NO_THROW(bridge.inject(UiEvent::focus(true)));
    EXPECT_FALSE(bridge.isAttached());
}

TEST(GlfwInputTests, SinkMayDetachBridge)
{
    WindowConfig windowConfig{};
    windowConfig.headless = true;
    WindowManager windows;
    windows.setConfig(windowConfig);

    GLFWwindow* window = nullptr;
    try {
        window = windows.createWindow();
    } catch (const std::runtime_error& e) {
        GTEST_SKIP() << "No display available: " << e.what();
    }

    GlfwInputBridge bridge;
    int delivered = 0;
    std::string seenTag;
    const std::string tag = "captured by the sink";
    bridge.attach(window, [&bridge, &delivered, &seenTag, tag](const UiEvent& event) {
        ++delivered;
        bridge.detach();
        // Captures must stay valid after detach resets the bridge's sink.
        seenTag = tag + " " + std::string(toString(event.type()));
    });
    ASSERT_TRUE(bridge.isAttached());

    bridge.inject(UiEvent::mousePress(MouseButton::Left));
    bridge.inject(UiEvent::mousePress(MouseButton::Right));

    EXPECT_FALSE(bridge.isAttached());
    EXPECT_EQ(delivered, 1);
    EXPECT_EQ(seenTag, "captured by the sink MousePress");
    EXPECT_EQ(glfwGetWindowUserPointer(window), nullptr);
}

} // namespace
