#include <hilite/editor/binding.hpp>

#include <spdlog/spdlog.h>

namespace hilite::editor {

TextBinding::TextBinding(Getter getter, Setter setter)
    : getter_(std::move(getter))
    , setter_(std::move(setter))
{}

TextBinding TextBinding::bound_to(std::string& storage) {
    return TextBinding(
        [&storage] { return storage; },
        [&storage](std::string value) { storage = std::move(value); });
}

HighlightedEditor::HighlightedEditor(TextSurface& surface, TextBinding binding,
                                     highlight::RuleSet rules, EditorCallbacks callbacks,
                                     EditorConfig config)
    : surface_(surface)
    , binding_(std::move(binding))
    , rules_(std::move(rules))
    , callbacks_(std::move(callbacks))
    , config_(std::move(config))
    , updater_(config_.engine)
    , alive_(std::make_shared<HighlightedEditor*>(this))
{
    text_changed_ = surface_.on_text_changed([this] { handle_text_changed(); });
    selection_changed_ = surface_.on_selection_changed(
        [this](const SelectionState& selection) { handle_selection_changed(selection); });
    editing_began_ = surface_.on_editing_began([this] { handle_editing_began(); });
    editing_ended_ = surface_.on_editing_ended([this] { handle_editing_ended(); });

    spdlog::debug("editor: bound with rule set '{}' ({} rules)", rules_.name(), rules_.size());
    refresh();
}

HighlightedEditor::~HighlightedEditor() = default;

UpdateResult HighlightedEditor::refresh() {
    const std::string text = binding_.get();
    UpdateResult result = updater_.apply_update(surface_, text, rules_, state_);
    if (!result.applied) {
        return result;
    }
    last_update_ = result;

    if (callbacks_.introspect) {
        callbacks_.introspect(surface_);
    }
    return result;
}

UpdateResult HighlightedEditor::set_rules(highlight::RuleSet rules) {
    rules_ = std::move(rules);
    spdlog::debug("editor: switched to rule set '{}' ({} rules)", rules_.name(), rules_.size());
    return refresh();
}

HighlightedEditor& HighlightedEditor::on_first_selection_change(std::function<void(TextRange)> callback) {
    if (!callback) {
        callbacks_.on_selection_change = nullptr;
        return *this;
    }
    callbacks_.on_selection_change = [callback = std::move(callback)](const std::vector<TextRange>& ranges) {
        if (!ranges.empty()) {
            callback(ranges.front());
        }
    };
    return *this;
}

void HighlightedEditor::handle_text_changed() {
    if (state_.updating) return;

    std::string text = surface_.text();
    binding_.set(text);
    if (callbacks_.on_text_change) {
        callbacks_.on_text_change(text);
    }
    refresh();
}

void HighlightedEditor::handle_selection_changed(const SelectionState& selection) {
    if (state_.updating || !callbacks_.on_selection_change) return;

    if (!config_.async_selection_notifications) {
        callbacks_.on_selection_change(selection.ranges);
        return;
    }

    std::weak_ptr<HighlightedEditor*> weak = alive_;
    surface_.post([weak, ranges = selection.ranges] {
        auto alive = weak.lock();
        if (!alive) return;
        HighlightedEditor& editor = **alive;
        if (editor.callbacks_.on_selection_change) {
            editor.callbacks_.on_selection_change(ranges);
        }
    });
}

void HighlightedEditor::handle_editing_began() {
    binding_.set(surface_.text());
    if (callbacks_.on_editing_began) {
        callbacks_.on_editing_began();
    }
}

void HighlightedEditor::handle_editing_ended() {
    binding_.set(surface_.text());
    if (callbacks_.on_editing_ended) {
        callbacks_.on_editing_ended();
    }
}

} // namespace hilite::editor
