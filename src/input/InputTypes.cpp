#include "uistate/input/InputTypes.hpp"

namespace uistate {

std::string_view toString(MouseButton button)
{
    switch (button) {
    case MouseButton::Left:
        return "Left";
    case MouseButton::Right:
        return "Right";
    case MouseButton::Middle:
        return "Middle";
    case MouseButton::X1:
        return "X1";
    case MouseButton::X2:
        return "X2";
    case MouseButton::Button6:
        return "Button6";
    case MouseButton::Button7:
        return "Button7";
    case MouseButton::Button8:
        return "Button8";
    default:
        return "Unknown";
    }
}

} // namespace uistate
