#pragma once

#include <hilite/editor/text_surface.hpp>
#include <hilite/ui/imgui_style.hpp>

#include <imgui.h>

#include <deque>
#include <optional>
#include <string>

namespace hilite::ui {

// Text surface drawn with Dear ImGui: a multi-line input for editing and a
// styled preview of the current runs. Offsets are UTF-8 bytes, as in ImGui.
// Only the primary selection range is applied to the input.
class ImGuiTextSurface : public editor::TextSurface {
public:
    explicit ImGuiTextSurface(ImGuiSurfaceConfig config = {});

    [[nodiscard]] std::string text() const override { return styled_.text(); }
    void set_text(std::string_view text) override;

    [[nodiscard]] highlight::StyledText styled_text() const override { return styled_; }
    void set_styled_text(const highlight::StyledText& styled) override;

    [[nodiscard]] editor::SelectionState selection() const override { return selection_; }
    void set_selection(const editor::SelectionState& selection) override;

    [[nodiscard]] highlight::AttributeSet typing_attributes() const override { return typing_attributes_; }
    void set_typing_attributes(const highlight::AttributeSet& attributes) override;

    // Queued until the start of the next render()
    void post(Task task) override;

    // Render the input (and preview); call once per frame
    void render(const char* label);

    // Runs queued tasks and returns how many ran
    std::size_t run_pending();

    [[nodiscard]] ImGuiSurfaceConfig& config() { return config_; }
    [[nodiscard]] const ImGuiSurfaceConfig& config() const { return config_; }

    [[nodiscard]] bool active() const noexcept { return active_; }

private:
    static int input_callback(ImGuiInputTextCallbackData* data);

    void render_preview();

    ImGuiSurfaceConfig config_;
    std::string buffer_;    // edited in place by ImGui
    highlight::StyledText styled_;
    editor::SelectionState selection_;
    std::optional<editor::SelectionState> pending_selection_;
    highlight::AttributeSet typing_attributes_;
    std::deque<Task> tasks_;
    bool active_{false};
};

// Selection reported by an input callback. SelectionStart is the anchor and
// SelectionEnd the cursor side, so a backward drag reads as reversed.
[[nodiscard]] editor::SelectionState read_selection(const ImGuiInputTextCallbackData& data);

// Applies the primary range, clamped to the buffer, keeping its direction
void write_selection(ImGuiInputTextCallbackData& data, const editor::SelectionState& selection);

} // namespace hilite::ui
