#include "uistate/ui/Ui.hpp"

namespace uistate::ui {

WindowGuard::~WindowGuard()
{
    if (active_) {
        EndWindow();
    }
}

bool HasContext()
{
    return ImGui::GetCurrentContext() != nullptr;
}

bool BeginWindow(const char* title, bool* open, ImGuiWindowFlags flags)
{
    if (!HasContext()) {
        return false;
    }
    return ImGui::Begin(title, open, flags);
}

void EndWindow()
{
    if (!HasContext()) {
        return;
    }
    ImGui::End();
}

void TextUnformatted(const char* text)
{
    if (!HasContext()) {
        return;
    }
    ImGui::TextUnformatted(text);
}

void LabelText(const char* label, const std::string& value)
{
    if (!HasContext()) {
        return;
    }
    ImGui::LabelText(label, "%s", value.c_str());
}

void Separator()
{
    if (!HasContext()) {
        return;
    }
    ImGui::Separator();
}

} // namespace uistate::ui
