#pragma once

#include <hilite/editor/text_surface.hpp>

#include <cstdint>
#include <deque>
#include <string>

namespace hilite::editor {

// Headless text surface. Holds text, styling and selection in memory, queues
// posted tasks until run_pending() and simulates user input. Used by tests
// and by embedders that render text themselves.
class MemoryTextSurface : public TextSurface {
public:
    explicit MemoryTextSurface(std::string text = {});

    [[nodiscard]] std::string text() const override { return styled_.text(); }
    void set_text(std::string_view text) override;

    [[nodiscard]] highlight::StyledText styled_text() const override { return styled_; }
    void set_styled_text(const highlight::StyledText& styled) override;

    [[nodiscard]] SelectionState selection() const override { return selection_; }
    void set_selection(const SelectionState& selection) override;

    [[nodiscard]] highlight::AttributeSet typing_attributes() const override { return typing_attributes_; }
    void set_typing_attributes(const highlight::AttributeSet& attributes) override;

    void post(Task task) override;

    // Runs queued tasks, including ones they post, and returns how many ran
    std::size_t run_pending();
    [[nodiscard]] std::size_t pending_tasks() const noexcept { return tasks_.size(); }

    // User input: replaces the primary selection with text and places the
    // caret after it
    void type_text(std::string_view text);

    // User input: deletes the primary selection, or the code point before
    // the caret
    void erase_backward();

    // User input: moves the selection
    void select(TextRange range);
    void select(SelectionState selection);

    void begin_editing();
    void end_editing();
    [[nodiscard]] bool editing() const noexcept { return editing_; }

    // Emulates hosts whose styled-text install moves the caret to the end
    // and resets typing attributes
    void set_restyle_resets_selection(bool enabled) noexcept { restyle_resets_selection_ = enabled; }

    [[nodiscard]] std::uint64_t styled_installs() const noexcept { return styled_installs_; }
    [[nodiscard]] std::uint64_t selection_sets() const noexcept { return selection_sets_; }

private:
    // Raw edit: text changes, styling of the new text is the typing attributes
    void replace(TextRange range, std::string_view replacement);

    highlight::StyledText styled_;
    SelectionState selection_;
    highlight::AttributeSet typing_attributes_;
    std::deque<Task> tasks_;
    bool editing_{false};
    bool restyle_resets_selection_{false};
    std::uint64_t styled_installs_{0};
    std::uint64_t selection_sets_{0};
};

} // namespace hilite::editor
