#include "uistate/ui/InputInspector.hpp"
#include "uistate/ui/Ui.hpp"

#include <cstdio>

namespace uistate::ui {

std::string formatPoint(const Point& point)
{
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "(%.1f, %.1f)", point.x, point.y);
    return buffer;
}

std::string describeCapture(const std::optional<WidgetId>& widget, const WidgetNameLookup& lookup)
{
    if (!widget) {
        return "none";
    }
    if (lookup) {
        std::string name = lookup(*widget);
        if (!name.empty()) {
            return name;
        }
    }
    return "#" + std::to_string(widget->index);
}

bool drawInputInspector(const InputState& state, InspectorConfig& config)
{
    if (!config.open || !HasContext()) {
        return false;
    }

    const bool expanded = BeginWindow(config.title.c_str(), &config.open, ImGuiWindowFlags_AlwaysAutoResize);
    WindowGuard guard(true);
    if (!expanded) {
        return false;
    }

    LabelText("Mouse", formatPoint(state.mousePosition));
    LabelText("Modifiers", toString(state.modifiers));

    Separator();
    for (std::size_t index = 0; index < kNumMouseButtons; ++index) {
        const MouseButton button = mouseButtonFromIndex(index);
        if (const auto pressedAt = state.mouseButtons.get(button)) {
            LabelText(std::string(toString(button)).c_str(), "down at " + formatPoint(*pressedAt));
        }
    }
    if (!state.mouseButtons.anyPressed()) {
        TextUnformatted("No mouse buttons down");
    }

    Separator();
    LabelText("Keyboard capture", describeCapture(state.widgetCapturingKeyboard, config.widgetName));
    LabelText("Mouse capture", describeCapture(state.widgetCapturingMouse, config.widgetName));
    return true;
}

} // namespace uistate::ui
