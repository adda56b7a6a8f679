#include "uistate/input/Keyboard.hpp"

namespace uistate {
namespace {

bool inRange(Key key, Key first, Key last) noexcept
{
    const auto value = static_cast<std::uint16_t>(key);
    return value >= static_cast<std::uint16_t>(first) && value <= static_cast<std::uint16_t>(last);
}

int offsetFrom(Key key, Key first) noexcept
{
    return static_cast<int>(key) - static_cast<int>(first);
}

const char* namedKey(Key key)
{
    switch (key) {
    case Key::Space:
        return "Space";
    case Key::Apostrophe:
        return "'";
    case Key::Comma:
        return ",";
    case Key::Minus:
        return "-";
    case Key::Period:
        return ".";
    case Key::Slash:
        return "/";
    case Key::Semicolon:
        return ";";
    case Key::Equals:
        return "=";
    case Key::LeftBracket:
        return "[";
    case Key::Backslash:
        return "\\";
    case Key::RightBracket:
        return "]";
    case Key::Grave:
        return "`";
    case Key::Escape:
        return "Escape";
    case Key::Return:
        return "Return";
    case Key::Tab:
        return "Tab";
    case Key::Backspace:
        return "Backspace";
    case Key::Insert:
        return "Insert";
    case Key::Delete:
        return "Delete";
    case Key::Home:
        return "Home";
    case Key::End:
        return "End";
    case Key::PageUp:
        return "PageUp";
    case Key::PageDown:
        return "PageDown";
    case Key::Left:
        return "Left";
    case Key::Right:
        return "Right";
    case Key::Up:
        return "Up";
    case Key::Down:
        return "Down";
    case Key::CapsLock:
        return "CapsLock";
    case Key::ScrollLock:
        return "ScrollLock";
    case Key::NumLock:
        return "NumLock";
    case Key::PrintScreen:
        return "PrintScreen";
    case Key::Pause:
        return "Pause";
    case Key::Menu:
        return "Menu";
    case Key::LCtrl:
        return "LCtrl";
    case Key::RCtrl:
        return "RCtrl";
    case Key::LShift:
        return "LShift";
    case Key::RShift:
        return "RShift";
    case Key::LAlt:
        return "LAlt";
    case Key::RAlt:
        return "RAlt";
    case Key::LGui:
        return "LGui";
    case Key::RGui:
        return "RGui";
    default:
        return "Unknown";
    }
}

} // namespace

ModifierKey modifierForKey(Key key) noexcept
{
    switch (key) {
    case Key::LCtrl:
    case Key::RCtrl:
        return kCtrl;
    case Key::LShift:
    case Key::RShift:
        return kShift;
    case Key::LAlt:
    case Key::RAlt:
        return kAlt;
    case Key::LGui:
    case Key::RGui:
        return kGui;
    default:
        return kNoModifier;
    }
}

std::string toString(Key key)
{
    if (inRange(key, Key::A, Key::Z)) {
        return std::string(1, static_cast<char>('A' + offsetFrom(key, Key::A)));
    }
    if (inRange(key, Key::D0, Key::D9)) {
        return std::string(1, static_cast<char>('0' + offsetFrom(key, Key::D0)));
    }
    if (inRange(key, Key::F1, Key::F12)) {
        return "F" + std::to_string(offsetFrom(key, Key::F1) + 1);
    }
    return namedKey(key);
}

std::string toString(ModifierKey modifiers)
{
    if (modifiers.empty()) {
        return "None";
    }

    struct Named {
        ModifierKey modifier;
        const char* label;
    };
    static constexpr Named kNames[] = {
        {kCtrl, "Ctrl"},
        {kShift, "Shift"},
        {kAlt, "Alt"},
        {kGui, "Gui"}
    };

    std::string result;
    for (const auto& entry : kNames) {
        if (!modifiers.contains(entry.modifier)) {
            continue;
        }
        if (!result.empty()) {
            result += '+';
        }
        result += entry.label;
    }
    return result;
}

} // namespace uistate
