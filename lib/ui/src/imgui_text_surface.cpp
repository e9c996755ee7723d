#include <hilite/ui/imgui_text_surface.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace hilite::ui {

ImGuiTextSurface::ImGuiTextSurface(ImGuiSurfaceConfig config)
    : config_(config)
    , selection_(editor::SelectionState::caret(0))
{}

void ImGuiTextSurface::set_text(std::string_view text) {
    buffer_.assign(text);
    styled_ = highlight::StyledText(buffer_, typing_attributes_);
    selection_ = selection_.clamped_to(buffer_.size());
    notify_text_changed();
}

void ImGuiTextSurface::set_styled_text(const highlight::StyledText& styled) {
    buffer_ = styled.text();
    styled_ = styled;
    selection_ = selection_.clamped_to(buffer_.size());
}

void ImGuiTextSurface::set_selection(const editor::SelectionState& selection) {
    if (selection.ranges.size() > 1) {
        spdlog::trace("imgui surface: keeping primary of {} selection ranges", selection.ranges.size());
    }
    selection_ = selection.clamped_to(buffer_.size());
    pending_selection_ = selection_;
}

void ImGuiTextSurface::set_typing_attributes(const highlight::AttributeSet& attributes) {
    typing_attributes_ = attributes;
}

void ImGuiTextSurface::post(Task task) {
    tasks_.push_back(std::move(task));
}

std::size_t ImGuiTextSurface::run_pending() {
    // Tasks posted while running wait for the next frame
    std::deque<Task> tasks;
    tasks.swap(tasks_);
    for (auto& task : tasks) {
        if (task) task();
    }
    return tasks.size();
}

int ImGuiTextSurface::input_callback(ImGuiInputTextCallbackData* data) {
    auto* self = static_cast<ImGuiTextSurface*>(data->UserData);

    if (data->EventFlag == ImGuiInputTextFlags_CallbackResize) {
        self->buffer_.resize(static_cast<std::size_t>(data->BufTextLen));
        data->Buf = self->buffer_.data();
        return 0;
    }

    if (data->EventFlag == ImGuiInputTextFlags_CallbackAlways) {
        if (self->pending_selection_) {
            write_selection(*data, *self->pending_selection_);
            self->pending_selection_.reset();
        }
        self->selection_ = read_selection(*data);
    }
    return 0;
}

editor::SelectionState read_selection(const ImGuiInputTextCallbackData& data) {
    if (data.SelectionStart == data.SelectionEnd) {
        return editor::SelectionState::caret(static_cast<TextOffset>(std::max(data.CursorPos, 0)));
    }
    return editor::SelectionState::from_anchor(static_cast<TextOffset>(data.SelectionStart),
                                               static_cast<TextOffset>(data.SelectionEnd));
}

void write_selection(ImGuiInputTextCallbackData& data, const editor::SelectionState& selection) {
    const auto limit = static_cast<TextOffset>(std::max(data.BufTextLen, 0));
    const editor::SelectionState clamped = selection.clamped_to(limit);
    data.SelectionStart = static_cast<int>(clamped.anchor());
    data.SelectionEnd = static_cast<int>(clamped.cursor());
    data.CursorPos = static_cast<int>(clamped.cursor());
}

void ImGuiTextSurface::render(const char* label) {
    run_pending();

    const editor::SelectionState before = selection_;
    const ImGuiInputTextFlags flags = ImGuiInputTextFlags_CallbackResize | ImGuiInputTextFlags_CallbackAlways;
    const ImVec2 size(-1.0f, ImGui::GetTextLineHeight() * config_.input_height_lines);

    const bool edited = ImGui::InputTextMultiline(label, buffer_.data(), buffer_.capacity() + 1,
                                                  size, flags, &ImGuiTextSurface::input_callback, this);

    if (ImGui::IsItemActivated()) {
        active_ = true;
        notify_editing_began();
    }

    if (edited) {
        styled_ = highlight::StyledText(buffer_, typing_attributes_);
        notify_text_changed();
    }

    if (selection_ != before) {
        notify_selection_changed(selection_);
    }

    if (ImGui::IsItemDeactivated()) {
        active_ = false;
        notify_editing_ended();
    }

    if (config_.show_preview) {
        render_preview();
    }
}

void ImGuiTextSurface::render_preview() {
    ImGuiWindowFlags flags = ImGuiWindowFlags_HorizontalScrollbar;
    if (ImGui::BeginChild("StyledPreview", ImVec2(0, 0), ImGuiChildFlags_None, flags)) {
        ImDrawList* draw_list = ImGui::GetWindowDrawList();
        const float line_height = ImGui::GetTextLineHeight();

        for (const auto& span : layout_preview(styled_, config_)) {
            if (!span.text.empty()) {
                const char* begin = span.text.data();
                const char* end = begin + span.text.size();
                const ImVec2 pos = ImGui::GetCursorScreenPos();
                const ImVec2 extent = ImGui::CalcTextSize(begin, end);

                if (span.background) {
                    draw_list->AddRectFilled(pos, ImVec2(pos.x + extent.x, pos.y + line_height), *span.background);
                }

                ImGui::PushStyleColor(ImGuiCol_Text, span.color);
                ImGui::TextUnformatted(begin, end);
                ImGui::PopStyleColor();

                if (span.underline) {
                    const float y = pos.y + line_height;
                    draw_list->AddLine(ImVec2(pos.x, y), ImVec2(pos.x + extent.x, y), span.color,
                                       config_.underline_thickness);
                }
                if (span.strikethrough) {
                    const float y = pos.y + line_height * 0.5f;
                    draw_list->AddLine(ImVec2(pos.x, y), ImVec2(pos.x + extent.x, y), span.color,
                                       config_.underline_thickness);
                }
            }

            if (span.line_break_after) {
                ImGui::NewLine();
            } else {
                ImGui::SameLine(0, 0);
            }
        }
        ImGui::NewLine();
    }
    ImGui::EndChild();
}

} // namespace hilite::ui
