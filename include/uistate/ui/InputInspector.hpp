#pragma once

#include "uistate/input/InputState.hpp"

#include <functional>
#include <optional>
#include <string>

namespace uistate::ui {

// Resolves a captured widget to a readable label through the widget tree.
using WidgetNameLookup = std::function<std::string(WidgetId)>;

struct InspectorConfig {
    std::string title{"Input State"};
    bool open{true};
    WidgetNameLookup widgetName{};
};

[[nodiscard]] std::string formatPoint(const Point& point);

// "none", the looked-up name, or "#<index>" when no lookup is set or it returns nothing.
[[nodiscard]] std::string describeCapture(const std::optional<WidgetId>& widget, const WidgetNameLookup& lookup);

// Draws an ImGui window showing the state. Returns true when the window
// contents were emitted this frame; false without a context, when closed,
// or when collapsed.
bool drawInputInspector(const InputState& state, InspectorConfig& config);

} // namespace uistate::ui
