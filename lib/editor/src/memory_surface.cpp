#include <hilite/editor/memory_surface.hpp>

#include <spdlog/spdlog.h>

namespace hilite::editor {

namespace {

bool is_continuation_byte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

} // namespace

MemoryTextSurface::MemoryTextSurface(std::string text)
    : styled_(std::move(text), {})
    , selection_(SelectionState::caret(styled_.length()))
{}

void MemoryTextSurface::set_text(std::string_view text) {
    styled_ = highlight::StyledText(std::string(text), typing_attributes_);
    selection_ = selection_.clamped_to(styled_.length());
    notify_text_changed();
}

void MemoryTextSurface::set_styled_text(const highlight::StyledText& styled) {
    styled_ = styled;
    ++styled_installs_;

    if (restyle_resets_selection_) {
        typing_attributes_ = styled_.base_attributes();
        selection_ = SelectionState::caret(styled_.length());
    } else {
        selection_ = selection_.clamped_to(styled_.length());
    }

    // Rich text hosts report attribute changes as edits and re-announce the
    // selection after replacing their content
    notify_text_changed();
    notify_selection_changed(selection_);
}

void MemoryTextSurface::set_selection(const SelectionState& selection) {
    selection_ = selection.clamped_to(styled_.length());
    ++selection_sets_;
    notify_selection_changed(selection_);
}

void MemoryTextSurface::set_typing_attributes(const highlight::AttributeSet& attributes) {
    typing_attributes_ = attributes;
}

void MemoryTextSurface::post(Task task) {
    tasks_.push_back(std::move(task));
}

std::size_t MemoryTextSurface::run_pending() {
    std::size_t ran = 0;
    while (!tasks_.empty()) {
        Task task = std::move(tasks_.front());
        tasks_.pop_front();
        if (task) {
            task();
        }
        ++ran;
    }
    return ran;
}

void MemoryTextSurface::replace(TextRange range, std::string_view replacement) {
    std::string text = styled_.text();
    range = range.clamped_to(text.size());
    text.replace(range.start, range.length, replacement);
    styled_ = highlight::StyledText(std::move(text), typing_attributes_);
    selection_ = SelectionState::caret(range.start + replacement.size());
}

void MemoryTextSurface::type_text(std::string_view text) {
    replace(selection_.primary(), text);
    notify_text_changed();
    notify_selection_changed(selection_);
}

void MemoryTextSurface::erase_backward() {
    TextRange target = selection_.primary();
    if (target.empty()) {
        if (target.start == 0) {
            return;
        }
        const std::string& text = styled_.text();
        TextOffset begin = target.start - 1;
        while (begin > 0 && is_continuation_byte(text[begin])) {
            --begin;
        }
        target = TextRange::from_bounds(begin, target.start);
    }

    replace(target, {});
    notify_text_changed();
    notify_selection_changed(selection_);
}

void MemoryTextSurface::select(TextRange range) {
    select(SelectionState::single(range));
}

void MemoryTextSurface::select(SelectionState selection) {
    selection_ = selection.clamped_to(styled_.length());
    notify_selection_changed(selection_);
}

void MemoryTextSurface::begin_editing() {
    if (editing_) return;
    editing_ = true;
    spdlog::trace("memory surface: editing began");
    notify_editing_began();
}

void MemoryTextSurface::end_editing() {
    if (!editing_) return;
    editing_ = false;
    spdlog::trace("memory surface: editing ended");
    notify_editing_ended();
}

} // namespace hilite::editor
