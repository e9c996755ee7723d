#pragma once

#include <hilite/editor/binding.hpp>
#include <hilite/highlight/presets.hpp>
#include <hilite/highlight/rule.hpp>
#include <hilite/ui-qt/qt_text_surface.hpp>

#include <QTextEdit>
#include <QWidget>

#include <memory>
#include <string>

namespace hilite::ui {

// Text edit restyled by a rule set as the user types
class HighlightedTextEdit : public QWidget {
    Q_OBJECT

public:
    explicit HighlightedTextEdit(highlight::RuleSet rules, QWidget* parent = nullptr,
                                 editor::EditorConfig config = {});
    ~HighlightedTextEdit() override;

    // Text
    QString text() const;
    void setText(const QString& text);

    // Rules
    void setRules(highlight::RuleSet rules);
    const highlight::RuleSet& rules() const;

    // Canvas and default text colors. Rule sets built for another theme
    // keep their own colors.
    void setTheme(const highlight::presets::PresetTheme& theme);

    // Runs after every restyle with the underlying QTextEdit
    void setIntrospect(std::function<void(QTextEdit*)> introspect);

    QTextEdit* textEdit() const { return text_edit_; }
    QtTextSurface* surface() const { return surface_; }
    editor::HighlightedEditor& editor() { return *editor_; }

signals:
    void textEdited(const QString& text);
    // Primary selection in UTF-16 positions
    void selectionRangeChanged(int start, int length);
    void editingStarted();
    void editingFinished();

private:
    void setupUI();
    void onSurfaceSelectionChanged();

    QTextEdit* text_edit_;
    QtTextSurface* surface_;
    bool async_selection_;
    std::string text_;
    std::unique_ptr<editor::HighlightedEditor> editor_;
    editor::Subscription selection_changed_;
};

} // namespace hilite::ui
