#pragma once

#include "uistate/input/ButtonMap.hpp"
#include "uistate/input/InputTypes.hpp"
#include "uistate/input/Keyboard.hpp"
#include "uistate/input/UiEvent.hpp"
#include "uistate/input/WidgetId.hpp"

#include <optional>

namespace uistate {

// Current state of user input: mouse buttons and position, held modifier
// keys, and which widgets capture the keyboard and the mouse.
//
// Plain value type owned by the event-dispatch thread. Other threads take a
// copy rather than sharing a reference.
struct InputState {
    ButtonMap mouseButtons{};
    Point mousePosition{0.0, 0.0};
    std::optional<WidgetId> widgetCapturingKeyboard{};
    std::optional<WidgetId> widgetCapturingMouse{};
    ModifierKey modifiers{kNoModifier};

    // Applies one event. Events that carry no input state are ignored.
    void update(const UiEvent& event);

    // Copy with the mouse position translated so that origin becomes (0, 0).
    // Button-down positions keep their original coordinates.
    [[nodiscard]] InputState relativeTo(const Point& origin) const;

    [[nodiscard]] ButtonDownPosition mouseButtonDown(MouseButton button) const { return mouseButtons.get(button); }
    [[nodiscard]] bool isModifierHeld(ModifierKey modifier) const noexcept { return modifiers.contains(modifier); }
    [[nodiscard]] bool isCapturingKeyboard(WidgetId id) const noexcept { return widgetCapturingKeyboard == id; }
    [[nodiscard]] bool isCapturingMouse(WidgetId id) const noexcept { return widgetCapturingMouse == id; }

    friend bool operator==(const InputState& lhs, const InputState& rhs);
    friend bool operator!=(const InputState& lhs, const InputState& rhs) { return !(lhs == rhs); }
};

} // namespace uistate
