#pragma once

#include <hilite/editor/events.hpp>
#include <hilite/editor/selection.hpp>
#include <hilite/highlight/style.hpp>
#include <hilite/highlight/styled_text.hpp>

#include <functional>
#include <string>
#include <string_view>

namespace hilite::editor {

// Host text widget as seen by the updater. Offsets are UTF-8 byte offsets
// into text(); adapters translate to their native positions.
//
// set_styled_text() replaces the text and all styling. Hosts may fire
// text-changed and selection-changed while doing so; listeners are called
// synchronously from inside the setter.
class TextSurface {
public:
    using Task = std::function<void()>;
    using SelectionListener = std::function<void(const SelectionState&)>;

    virtual ~TextSurface() = default;

    [[nodiscard]] virtual std::string text() const = 0;
    virtual void set_text(std::string_view text) = 0;

    [[nodiscard]] virtual highlight::StyledText styled_text() const = 0;
    virtual void set_styled_text(const highlight::StyledText& styled) = 0;

    [[nodiscard]] virtual SelectionState selection() const = 0;
    virtual void set_selection(const SelectionState& selection) = 0;

    // Attributes given to newly typed text
    [[nodiscard]] virtual highlight::AttributeSet typing_attributes() const = 0;
    virtual void set_typing_attributes(const highlight::AttributeSet& attributes) = 0;

    // Runs task on the host's next event loop turn
    virtual void post(Task task) = 0;

    [[nodiscard]] Subscription on_text_changed(std::function<void()> listener) {
        return text_changed_.subscribe(std::move(listener));
    }

    [[nodiscard]] Subscription on_selection_changed(SelectionListener listener) {
        return selection_changed_.subscribe(std::move(listener));
    }

    [[nodiscard]] Subscription on_editing_began(std::function<void()> listener) {
        return editing_began_.subscribe(std::move(listener));
    }

    [[nodiscard]] Subscription on_editing_ended(std::function<void()> listener) {
        return editing_ended_.subscribe(std::move(listener));
    }

protected:
    TextSurface() = default;

    void notify_text_changed() const { text_changed_.emit(); }
    void notify_selection_changed(const SelectionState& selection) const { selection_changed_.emit(selection); }
    void notify_editing_began() const { editing_began_.emit(); }
    void notify_editing_ended() const { editing_ended_.emit(); }

private:
    Event<> text_changed_;
    Event<const SelectionState&> selection_changed_;
    Event<> editing_began_;
    Event<> editing_ended_;
};

} // namespace hilite::editor
