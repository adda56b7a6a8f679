#pragma once

#include <cstdint>

namespace uistate {

// Handle to a widget in a tree owned elsewhere. Identity only; never owns the widget.
struct WidgetId {
    std::uint32_t index{0};

    friend constexpr bool operator==(WidgetId lhs, WidgetId rhs) noexcept { return lhs.index == rhs.index; }
    friend constexpr bool operator!=(WidgetId lhs, WidgetId rhs) noexcept { return !(lhs == rhs); }
};

} // namespace uistate
