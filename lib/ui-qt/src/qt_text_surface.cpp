#include <hilite/ui-qt/qt_text_surface.hpp>
#include <hilite/ui-qt/qt_style.hpp>

#include <QEvent>
#include <QMetaObject>
#include <QTextBlock>
#include <QTextCursor>
#include <QTextDocument>
#include <QTextLayout>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace hilite::ui {

namespace {

constexpr std::string_view PARAGRAPH_SEPARATOR = "\xE2\x80\xA9";

// Text as the document stores it after setPlainText(): "\r\n", a lone '\r'
// and U+2029 all become one block separator, read back as '\n'
struct DocumentText {
    std::string text;
    std::vector<TextOffset> dropped;   // source bytes with no counterpart, ascending

    [[nodiscard]] TextOffset map(TextOffset offset) const {
        const auto before = std::lower_bound(dropped.begin(), dropped.end(), offset) - dropped.begin();
        return offset - static_cast<TextOffset>(before);
    }
};

DocumentText to_document_text(std::string_view text) {
    DocumentText result;
    result.text.reserve(text.size());

    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r') {
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                result.dropped.push_back(i);
            } else {
                result.text.push_back('\n');
            }
        } else if (text.substr(i, PARAGRAPH_SEPARATOR.size()) == PARAGRAPH_SEPARATOR) {
            result.text.push_back('\n');
            result.dropped.push_back(i + 1);
            result.dropped.push_back(i + 2);
            i += PARAGRAPH_SEPARATOR.size() - 1;
        } else {
            result.text.push_back(text[i]);
        }
    }
    return result;
}

} // namespace

QtTextSurface::QtTextSurface(QTextEdit* edit, QObject* parent)
    : QObject(parent)
    , edit_(edit)
    , highlighter_(new StyledTextHighlighter(edit->document()))
{
    connect(edit_, &QTextEdit::textChanged, this, [this] { notify_text_changed(); });
    connect(edit_, &QTextEdit::cursorPositionChanged, this, &QtTextSurface::onCursorMoved);
    connect(edit_, &QTextEdit::selectionChanged, this, &QtTextSurface::onCursorMoved);
    edit_->installEventFilter(this);
}

QtTextSurface::~QtTextSurface() {
    delete highlighter_.data();
    if (edit_) {
        edit_->removeEventFilter(this);
    }
}

Utf16OffsetMap QtTextSurface::offsetMap() const {
    return Utf16OffsetMap(text());
}

std::string QtTextSurface::text() const {
    if (!edit_) return {};

    // toPlainText() would turn no-break spaces into plain ones
    QString raw = edit_->document()->toRawText();
    raw.replace(QChar::ParagraphSeparator, QLatin1Char('\n'));
    return raw.toStdString();
}

void QtTextSurface::set_text(std::string_view text) {
    if (!edit_) return;
    edit_->setPlainText(QString::fromUtf8(text.data(), static_cast<qsizetype>(text.size())));
}

highlight::StyledText QtTextSurface::styled_text() const {
    const std::string plain = text();
    if (!edit_) {
        return highlight::StyledText(plain, {});
    }

    const Utf16OffsetMap map(plain);
    highlight::StyleBuffer buffer(plain.size(), {});

    for (QTextBlock block = edit_->document()->begin(); block.isValid(); block = block.next()) {
        const QTextLayout* layout = block.layout();
        if (!layout) continue;

        const auto base = static_cast<std::size_t>(block.position());
        for (const QTextLayout::FormatRange& format : layout->formats()) {
            const std::size_t start = base + static_cast<std::size_t>(format.start);
            const TextRange range = map.range_to_utf8(start, start + static_cast<std::size_t>(format.length));
            for (const auto& [key, value] : from_char_format(format.format)) {
                buffer.apply(range, key, value);
            }
        }
    }

    return std::move(buffer).finish(plain);
}

void QtTextSurface::set_styled_text(const highlight::StyledText& styled) {
    if (!edit_ || !highlighter_) return;

    const DocumentText document = to_document_text(styled.text());
    if (text() != document.text) {
        set_text(document.text);
    }

    const Utf16OffsetMap map(document.text);
    std::vector<StyledTextHighlighter::FormatRun> runs;
    runs.reserve(styled.runs().size());

    for (const auto& run : styled.runs()) {
        if (run.attributes.empty()) continue;

        const auto start = static_cast<int>(map.to_utf16(document.map(run.range.start)));
        const auto end = static_cast<int>(map.to_utf16(document.map(run.range.end())));
        if (end > start) {
            runs.push_back({start, end, to_char_format(run.attributes)});
        }
    }

    highlighter_->setRuns(std::move(runs));
    spdlog::trace("qt surface: applied {} of {} runs", highlighter_->runCount(), styled.runs().size());
}

editor::SelectionState QtTextSurface::selection() const {
    if (!edit_) return {};

    const QTextCursor cursor = edit_->textCursor();
    const Utf16OffsetMap map = offsetMap();
    return editor::SelectionState::from_anchor(
        map.to_utf8(static_cast<std::size_t>(cursor.anchor())),
        map.to_utf8(static_cast<std::size_t>(cursor.position())));
}

void QtTextSurface::set_selection(const editor::SelectionState& selection) {
    if (!edit_) return;

    if (selection.ranges.size() > 1) {
        spdlog::trace("qt surface: keeping primary of {} selection ranges", selection.ranges.size());
    }

    const Utf16OffsetMap map = offsetMap();

    QTextCursor cursor = edit_->textCursor();
    cursor.setPosition(static_cast<int>(map.to_utf16(selection.anchor())));
    cursor.setPosition(static_cast<int>(map.to_utf16(selection.cursor())), QTextCursor::KeepAnchor);
    edit_->setTextCursor(cursor);
}

highlight::AttributeSet QtTextSurface::typing_attributes() const {
    return edit_ ? from_char_format(edit_->currentCharFormat()) : highlight::AttributeSet{};
}

void QtTextSurface::set_typing_attributes(const highlight::AttributeSet& attributes) {
    if (!edit_) return;
    // With a selection QTextEdit formats the selected text as an undoable edit
    if (edit_->textCursor().hasSelection()) return;
    edit_->setCurrentCharFormat(to_char_format(attributes));
}

void QtTextSurface::post(Task task) {
    QMetaObject::invokeMethod(this, [task = std::move(task)] {
        if (task) task();
    }, Qt::QueuedConnection);
}

void QtTextSurface::onCursorMoved() {
    // cursorPositionChanged and selectionChanged often fire together
    editor::SelectionState current = selection();
    if (last_selection_ && *last_selection_ == current) {
        return;
    }
    last_selection_ = current;
    notify_selection_changed(current);
}

bool QtTextSurface::eventFilter(QObject* watched, QEvent* event) {
    if (watched == edit_.data()) {
        if (event->type() == QEvent::FocusIn) {
            notify_editing_began();
        } else if (event->type() == QEvent::FocusOut) {
            notify_editing_ended();
        }
    }
    return QObject::eventFilter(watched, event);
}

} // namespace hilite::ui
