#include "uistate/input/UiEvent.hpp"

#include <iomanip>
#include <sstream>

namespace uistate {

std::string_view toString(UiEventType type)
{
    switch (type) {
    case UiEventType::None:
        return "None";
    case UiEventType::MousePress:
        return "MousePress";
    case UiEventType::MouseRelease:
        return "MouseRelease";
    case UiEventType::MouseMove:
        return "MouseMove";
    case UiEventType::MouseScroll:
        return "MouseScroll";
    case UiEventType::KeyPress:
        return "KeyPress";
    case UiEventType::KeyRelease:
        return "KeyRelease";
    case UiEventType::Text:
        return "Text";
    case UiEventType::Resize:
        return "Resize";
    case UiEventType::Focus:
        return "Focus";
    case UiEventType::WidgetCapturesKeyboard:
        return "WidgetCapturesKeyboard";
    case UiEventType::WidgetUncapturesKeyboard:
        return "WidgetUncapturesKeyboard";
    case UiEventType::WidgetCapturesMouse:
        return "WidgetCapturesMouse";
    case UiEventType::WidgetUncapturesMouse:
        return "WidgetUncapturesMouse";
    }
    return "Unknown";
}

std::string describe(const UiEvent& event)
{
    std::ostringstream oss;
    oss << toString(event.type()) << '(';

    if (const auto* button = std::get_if<MouseButton>(&event.data())) {
        oss << toString(*button);
    } else if (const auto* key = std::get_if<Key>(&event.data())) {
        oss << toString(*key);
    } else if (const auto* point = std::get_if<Point>(&event.data())) {
        oss << std::fixed << std::setprecision(1) << point->x << ", " << point->y;
    } else if (const auto* text = std::get_if<std::string>(&event.data())) {
        oss << std::quoted(*text);
    } else if (const auto* flag = std::get_if<bool>(&event.data())) {
        oss << (*flag ? "true" : "false");
    } else if (const auto* widget = std::get_if<WidgetId>(&event.data())) {
        oss << '#' << widget->index;
    }

    oss << ')';
    return oss.str();
}

} // namespace uistate
