#pragma once

#include "uistate/input/InputTypes.hpp"
#include "uistate/input/Keyboard.hpp"
#include "uistate/input/WidgetId.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace uistate {

enum class UiEventType : std::uint8_t {
    None,
    MousePress,
    MouseRelease,
    MouseMove,
    MouseScroll,
    KeyPress,
    KeyRelease,
    Text,
    Resize,
    Focus,
    WidgetCapturesKeyboard,
    WidgetUncapturesKeyboard,
    WidgetCapturesMouse,
    WidgetUncapturesMouse
};

// Payload per event type:
//   None                              -> std::monostate
//   MousePress, MouseRelease          -> MouseButton
//   KeyPress, KeyRelease              -> Key
//   MouseMove                         -> Point (absolute)
//   MouseScroll                       -> Point (delta)
//   Resize                            -> Point (width, height)
//   Text                              -> std::string
//   Focus                             -> bool
//   Widget(Un)Captures(Keyboard|Mouse) -> WidgetId
using UiEventData = std::variant<std::monostate, MouseButton, Key, Point, std::string, bool, WidgetId>;

// Built only through the factories, so the payload always matches the type.
// A default-constructed event is None and carries no input.
class UiEvent {
public:
    UiEvent() = default;

    static UiEvent mousePress(MouseButton button) { return {UiEventType::MousePress, button}; }
    static UiEvent mouseRelease(MouseButton button) { return {UiEventType::MouseRelease, button}; }
    static UiEvent mouseMove(const Point& position) { return {UiEventType::MouseMove, position}; }
    static UiEvent mouseScroll(const Point& delta) { return {UiEventType::MouseScroll, delta}; }
    static UiEvent keyPress(Key key) { return {UiEventType::KeyPress, key}; }
    static UiEvent keyRelease(Key key) { return {UiEventType::KeyRelease, key}; }
    static UiEvent text(std::string value) { return {UiEventType::Text, std::move(value)}; }
    static UiEvent resize(double width, double height) { return {UiEventType::Resize, Point{width, height}}; }
    static UiEvent focus(bool focused) { return {UiEventType::Focus, focused}; }
    static UiEvent widgetCapturesKeyboard(WidgetId id) { return {UiEventType::WidgetCapturesKeyboard, id}; }
    static UiEvent widgetUncapturesKeyboard(WidgetId id) { return {UiEventType::WidgetUncapturesKeyboard, id}; }
    static UiEvent widgetCapturesMouse(WidgetId id) { return {UiEventType::WidgetCapturesMouse, id}; }
    static UiEvent widgetUncapturesMouse(WidgetId id) { return {UiEventType::WidgetUncapturesMouse, id}; }

    [[nodiscard]] UiEventType type() const noexcept { return eventType; }
    [[nodiscard]] const UiEventData& data() const noexcept { return payload; }

    // Accessors throw std::bad_variant_access when asked for another type's payload.
    [[nodiscard]] MouseButton mouseButton() const { return std::get<MouseButton>(payload); }
    [[nodiscard]] Key key() const { return std::get<Key>(payload); }
    [[nodiscard]] const Point& point() const { return std::get<Point>(payload); }
    [[nodiscard]] const std::string& textValue() const { return std::get<std::string>(payload); }
    [[nodiscard]] bool flag() const { return std::get<bool>(payload); }
    [[nodiscard]] WidgetId widget() const { return std::get<WidgetId>(payload); }

private:
    UiEvent(UiEventType type, UiEventData data) : eventType(type), payload(std::move(data)) {}

    UiEventType eventType{UiEventType::None};
    UiEventData payload{};
};

std::string_view toString(UiEventType type);

// One-line description such as "MousePress(Left)" or "MouseMove(12.0, 4.5)".
std::string describe(const UiEvent& event);

} // namespace uistate
