#include <hilite/ui-qt/highlighted_text_edit.hpp>
#include <hilite/ui-qt/qt_style.hpp>

#include <QFrame>
#include <QMetaObject>
#include <QPalette>
#include <QTextCursor>
#include <QVBoxLayout>

namespace hilite::ui {

HighlightedTextEdit::HighlightedTextEdit(highlight::RuleSet rules, QWidget* parent,
                                         editor::EditorConfig config)
    : QWidget(parent)
    , text_edit_(new QTextEdit(this))
    , surface_(new QtTextSurface(text_edit_, this))
    , async_selection_(config.async_selection_notifications)
{
    setupUI();
    setTheme(highlight::presets::PresetTheme::light());

    editor::EditorCallbacks callbacks;
    callbacks.on_text_change = [this](const std::string& text) {
        emit textEdited(QString::fromStdString(text));
    };
    callbacks.on_editing_began = [this] { emit editingStarted(); };
    callbacks.on_editing_ended = [this] { emit editingFinished(); };

    editor_ = std::make_unique<editor::HighlightedEditor>(
        *surface_, editor::TextBinding::bound_to(text_), std::move(rules),
        std::move(callbacks), std::move(config));

    selection_changed_ = surface_->on_selection_changed(
        [this](const editor::SelectionState&) { onSurfaceSelectionChanged(); });
}

HighlightedTextEdit::~HighlightedTextEdit() = default;

void HighlightedTextEdit::setupUI() {
    auto* layout = new QVBoxLayout(this);
    layout->setContentsMargins(0, 0, 0, 0);

    text_edit_->setAcceptRichText(false);
    text_edit_->setLineWrapMode(QTextEdit::WidgetWidth);
    text_edit_->setFrameStyle(QFrame::NoFrame);
    layout->addWidget(text_edit_);
}

void HighlightedTextEdit::setTheme(const highlight::presets::PresetTheme& theme) {
    QPalette palette = text_edit_->palette();
    palette.setColor(QPalette::Base, to_qcolor(theme.background));
    palette.setColor(QPalette::Text, to_qcolor(theme.text_color));
    text_edit_->setPalette(palette);
}

void HighlightedTextEdit::onSurfaceSelectionChanged() {
    if (editor_->update_state().updating) return;

    // Positions are taken now; the text may change before a queued emit runs
    const QTextCursor cursor = text_edit_->textCursor();
    const int start = cursor.selectionStart();
    const int length = cursor.selectionEnd() - start;

    if (!async_selection_) {
        emit selectionRangeChanged(start, length);
        return;
    }
    QMetaObject::invokeMethod(this, [this, start, length] {
        emit selectionRangeChanged(start, length);
    }, Qt::QueuedConnection);
}

QString HighlightedTextEdit::text() const {
    return QString::fromStdString(text_);
}

void HighlightedTextEdit::setText(const QString& text) {
    text_ = text.toStdString();
    editor_->refresh();
}

void HighlightedTextEdit::setRules(highlight::RuleSet rules) {
    editor_->set_rules(std::move(rules));
}

const highlight::RuleSet& HighlightedTextEdit::rules() const {
    return editor_->rules();
}

void HighlightedTextEdit::setIntrospect(std::function<void(QTextEdit*)> introspect) {
    if (!introspect) {
        editor_->callbacks().introspect = nullptr;
        return;
    }
    editor_->callbacks().introspect = [introspect = std::move(introspect)](editor::TextSurface& surface) {
        if (auto* qt_surface = dynamic_cast<QtTextSurface*>(&surface)) {
            introspect(qt_surface->textEdit());
        }
    };
}

} // namespace hilite::ui
