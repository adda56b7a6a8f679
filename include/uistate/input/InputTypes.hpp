#pragma once

#include <glm/glm.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace uistate {

using Point = glm::dvec2;

// Position of the mouse when a button went down. Empty while the button is up.
using ButtonDownPosition = std::optional<Point>;

enum class MouseButton : std::uint8_t {
    Unknown,
    Left,
    Right,
    Middle,
    X1,
    X2,
    Button6,
    Button7,
    Button8
};

inline constexpr std::size_t kNumMouseButtons = 9;

[[nodiscard]] constexpr std::size_t mouseButtonIndex(MouseButton button) noexcept
{
    return static_cast<std::size_t>(button);
}

// Indices past the last button map to Unknown.
[[nodiscard]] constexpr MouseButton mouseButtonFromIndex(std::size_t index) noexcept
{
    return index < kNumMouseButtons ? static_cast<MouseButton>(index) : MouseButton::Unknown;
}

std::string_view toString(MouseButton button);

} // namespace uistate
