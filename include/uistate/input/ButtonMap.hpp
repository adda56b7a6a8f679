#pragma once

#include "uistate/input/InputTypes.hpp"

#include <array>
#include <optional>

namespace uistate {

struct PressedButton {
    MouseButton button{MouseButton::Unknown};
    Point position{0.0};

    friend bool operator==(const PressedButton& lhs, const PressedButton& rhs)
    {
        return lhs.button == rhs.button && lhs.position == rhs.position;
    }
    friend bool operator!=(const PressedButton& lhs, const PressedButton& rhs) { return !(lhs == rhs); }
};

// Up/down state of every mouse button. A down button stores the mouse
// position at the moment it was pressed.
class ButtonMap {
public:
    ButtonMap() = default;

    // Overwrites the slot; no check that a down button is being pressed again.
    void set(MouseButton button, ButtonDownPosition position);
    [[nodiscard]] ButtonDownPosition get(MouseButton button) const;
    // Returns the current state and leaves the button up.
    ButtonDownPosition take(MouseButton button);

    // First down button by ascending index, if any.
    [[nodiscard]] std::optional<PressedButton> pressedButton() const;

    [[nodiscard]] bool anyPressed() const;
    void clear();

    friend bool operator==(const ButtonMap& lhs, const ButtonMap& rhs) { return lhs.buttonStates == rhs.buttonStates; }
    friend bool operator!=(const ButtonMap& lhs, const ButtonMap& rhs) { return !(lhs == rhs); }

private:
    std::array<ButtonDownPosition, kNumMouseButtons> buttonStates{};
};

} // namespace uistate
