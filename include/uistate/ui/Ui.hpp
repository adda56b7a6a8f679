#pragma once

#include <imgui.h>
#include <string>

namespace uistate::ui {

// RAII helper that calls EndWindow for a BeginWindow made with a live context.
// ImGui requires the End whatever Begin returned.
class WindowGuard {
public:
    explicit WindowGuard(bool active) : active_(active) {}
    ~WindowGuard();
    WindowGuard(const WindowGuard&) = delete;
    WindowGuard& operator=(const WindowGuard&) = delete;
    WindowGuard(WindowGuard&&) = delete;
    WindowGuard& operator=(WindowGuard&&) = delete;
private:
    bool active_{false};
};

[[nodiscard]] bool HasContext();

// Window helpers
bool BeginWindow(const char* title, bool* open = nullptr, ImGuiWindowFlags flags = 0);
void EndWindow();

// Basic widgets
void TextUnformatted(const char* text);
void LabelText(const char* label, const std::string& value);
void Separator();

} // namespace uistate::ui
