#pragma once

#include <cstdint>
#include <string>

namespace uistate {

enum class Key : std::uint16_t {
    Unknown,

    A, B, C, D, E, F, G, H, I, J, K, L, M,
    N, O, P, Q, R, S, T, U, V, W, X, Y, Z,

    D0, D1, D2, D3, D4, D5, D6, D7, D8, D9,

    F1, F2, F3, F4, F5, F6, F7, F8, F9, F10, F11, F12,

    Space,
    Apostrophe,
    Comma,
    Minus,
    Period,
    Slash,
    Semicolon,
    Equals,
    LeftBracket,
    Backslash,
    RightBracket,
    Grave,

    Escape,
    Return,
    Tab,
    Backspace,
    Insert,
    Delete,
    Home,
    End,
    PageUp,
    PageDown,
    Left,
    Right,
    Up,
    Down,
    CapsLock,
    ScrollLock,
    NumLock,
    PrintScreen,
    Pause,
    Menu,

    LCtrl,
    RCtrl,
    LShift,
    RShift,
    LAlt,
    RAlt,
    LGui,
    RGui
};

// Set of held modifier keys. Left and right variants share one bit.
class ModifierKey {
public:
    constexpr ModifierKey() noexcept = default;
    explicit constexpr ModifierKey(std::uint8_t bits) noexcept : bits_(bits) {}

    [[nodiscard]] constexpr std::uint8_t bits() const noexcept { return bits_; }
    [[nodiscard]] constexpr bool empty() const noexcept { return bits_ == 0; }
    [[nodiscard]] constexpr bool contains(ModifierKey other) const noexcept
    {
        return other.bits_ != 0 && (bits_ & other.bits_) == other.bits_;
    }

    constexpr void insert(ModifierKey other) noexcept { bits_ = static_cast<std::uint8_t>(bits_ | other.bits_); }
    constexpr void remove(ModifierKey other) noexcept { bits_ = static_cast<std::uint8_t>(bits_ & ~other.bits_); }

    friend constexpr ModifierKey operator|(ModifierKey lhs, ModifierKey rhs) noexcept
    {
        return ModifierKey{static_cast<std::uint8_t>(lhs.bits_ | rhs.bits_)};
    }
    friend constexpr ModifierKey operator&(ModifierKey lhs, ModifierKey rhs) noexcept
    {
        return ModifierKey{static_cast<std::uint8_t>(lhs.bits_ & rhs.bits_)};
    }
    friend constexpr bool operator==(ModifierKey lhs, ModifierKey rhs) noexcept { return lhs.bits_ == rhs.bits_; }
    friend constexpr bool operator!=(ModifierKey lhs, ModifierKey rhs) noexcept { return !(lhs == rhs); }

private:
    std::uint8_t bits_{0};
};

inline constexpr ModifierKey kNoModifier{0x0};
inline constexpr ModifierKey kCtrl{0x1};
inline constexpr ModifierKey kShift{0x2};
inline constexpr ModifierKey kAlt{0x4};
inline constexpr ModifierKey kGui{0x8};

// Returns kNoModifier for keys that are not modifiers.
[[nodiscard]] ModifierKey modifierForKey(Key key) noexcept;

std::string toString(Key key);

// "Ctrl+Shift" style, or "None".
std::string toString(ModifierKey modifiers);

} // namespace uistate
