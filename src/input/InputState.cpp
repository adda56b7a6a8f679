#include "uistate/input/InputState.hpp"

namespace uistate {

void InputState::update(const UiEvent& event)
{
    const UiEventData& data = event.data();

    switch (event.type()) {
    case UiEventType::MousePress:
        if (const auto* button = std::get_if<MouseButton>(&data)) {
            mouseButtons.set(*button, mousePosition);
        }
        break;
    case UiEventType::MouseRelease:
        if (const auto* button = std::get_if<MouseButton>(&data)) {
            mouseButtons.set(*button, std::nullopt);
        }
        break;
    case UiEventType::MouseMove:
        if (const auto* position = std::get_if<Point>(&data)) {
            mousePosition = *position;
        }
        break;
    case UiEventType::KeyPress:
        if (const auto* key = std::get_if<Key>(&data)) {
            modifiers.insert(modifierForKey(*key));
        }
        break;
    case UiEventType::KeyRelease:
        if (const auto* key = std::get_if<Key>(&data)) {
            modifiers.remove(modifierForKey(*key));
        }
        break;
    case UiEventType::WidgetCapturesKeyboard:
        if (const auto* widget = std::get_if<WidgetId>(&data)) {
            widgetCapturingKeyboard = *widget;
        }
        break;
    case UiEventType::WidgetUncapturesKeyboard:
        // Cleared whichever widget asks.
        widgetCapturingKeyboard.reset();
        break;
    case UiEventType::WidgetCapturesMouse:
        if (const auto* widget = std::get_if<WidgetId>(&data)) {
            widgetCapturingMouse = *widget;
        }
        break;
    case UiEventType::WidgetUncapturesMouse:
        widgetCapturingMouse.reset();
        break;
    default:
        break;
    }
}

InputState InputState::relativeTo(const Point& origin) const
{
    InputState relative = *this;
    relative.mousePosition = mousePosition - origin;
    return relative;
}

bool operator==(const InputState& lhs, const InputState& rhs)
{
    return lhs.mouseButtons == rhs.mouseButtons &&
           lhs.mousePosition == rhs.mousePosition &&
           lhs.widgetCapturingKeyboard == rhs.widgetCapturingKeyboard &&
           lhs.widgetCapturingMouse == rhs.widgetCapturingMouse &&
           lhs.modifiers == rhs.modifiers;
}

} // namespace uistate
