#include "uistate/input/ButtonMap.hpp"

#include <algorithm>

namespace uistate {

void ButtonMap::set(MouseButton button, ButtonDownPosition position)
{
    buttonStates[mouseButtonIndex(button)] = position;
}

ButtonDownPosition ButtonMap::get(MouseButton button) const
{
    return buttonStates[mouseButtonIndex(button)];
}

ButtonDownPosition ButtonMap::take(MouseButton button)
{
    auto& slot = buttonStates[mouseButtonIndex(button)];
    ButtonDownPosition previous = slot;
    slot.reset();
    return previous;
}

std::optional<PressedButton> ButtonMap::pressedButton() const
{
    for (std::size_t index = 0; index < buttonStates.size(); ++index) {
        if (buttonStates[index]) {
            return PressedButton{mouseButtonFromIndex(index), *buttonStates[index]};
        }
    }
    return std::nullopt;
}

bool ButtonMap::anyPressed() const
{
    return std::any_of(buttonStates.begin(), buttonStates.end(),
                       [](const ButtonDownPosition& state) { return state.has_value(); });
}

void ButtonMap::clear()
{
    buttonStates.fill(std::nullopt);
}

} // namespace uistate
