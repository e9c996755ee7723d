#pragma once

#include <hilite/editor/text_surface.hpp>
#include <hilite/editor/updater.hpp>
#include <hilite/highlight/engine.hpp>
#include <hilite/highlight/rule.hpp>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace hilite::editor {

// Two-way text value owned by the embedder
class TextBinding {
public:
    using Getter = std::function<std::string()>;
    using Setter = std::function<void(std::string)>;

    TextBinding(Getter getter, Setter setter);

    // Reads and writes storage, which must outlive the binding
    [[nodiscard]] static TextBinding bound_to(std::string& storage);

    [[nodiscard]] std::string get() const { return getter_(); }
    void set(std::string value) const { setter_(std::move(value)); }

private:
    Getter getter_;
    Setter setter_;
};

// Embedder callbacks; any may be left empty
struct EditorCallbacks {
    std::function<void(const std::string&)> on_text_change;
    std::function<void(const std::vector<TextRange>&)> on_selection_change;
    std::function<void()> on_editing_began;
    std::function<void()> on_editing_ended;
    // Called after each styled-text install with the host surface
    std::function<void(TextSurface&)> introspect;
};

struct EditorConfig {
    highlight::EngineConfig engine;
    // Deliver selection changes on the host's next loop turn via post()
    bool async_selection_notifications{true};
};

// Binds a text surface to a text value and a rule set. User edits flow into
// the binding and restyle the surface; refresh() pushes the binding's value
// into the surface. The surface must outlive the editor.
class HighlightedEditor {
public:
    HighlightedEditor(TextSurface& surface, TextBinding binding, highlight::RuleSet rules,
                      EditorCallbacks callbacks = {}, EditorConfig config = {});
    ~HighlightedEditor();

    HighlightedEditor(const HighlightedEditor&) = delete;
    HighlightedEditor& operator=(const HighlightedEditor&) = delete;

    // Restyles the surface from the binding's current value
    UpdateResult refresh();

    // Replaces the rule set and restyles
    UpdateResult set_rules(highlight::RuleSet rules);
    [[nodiscard]] const highlight::RuleSet& rules() const noexcept { return rules_; }

    void set_callbacks(EditorCallbacks callbacks) { callbacks_ = std::move(callbacks); }
    [[nodiscard]] EditorCallbacks& callbacks() noexcept { return callbacks_; }

    // Selection callback that only receives the primary range
    HighlightedEditor& on_first_selection_change(std::function<void(TextRange)> callback);

    [[nodiscard]] TextSurface& surface() noexcept { return surface_; }
    [[nodiscard]] const UpdateState& update_state() const noexcept { return state_; }
    [[nodiscard]] const UpdateResult& last_update() const noexcept { return last_update_; }
    [[nodiscard]] const highlight::Highlighter& highlighter() const noexcept { return updater_.highlighter(); }

private:
    void handle_text_changed();
    void handle_selection_changed(const SelectionState& selection);
    void handle_editing_began();
    void handle_editing_ended();

    TextSurface& surface_;
    TextBinding binding_;
    highlight::RuleSet rules_;
    EditorCallbacks callbacks_;
    EditorConfig config_;

    SelectionPreservingUpdater updater_;
    UpdateState state_;
    UpdateResult last_update_;

    // Posted tasks hold a weak reference and do nothing once the editor is gone
    std::shared_ptr<HighlightedEditor*> alive_;

    Subscription text_changed_;
    Subscription selection_changed_;
    Subscription editing_began_;
    Subscription editing_ended_;
};

} // namespace hilite::editor
