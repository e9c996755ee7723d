#pragma once

#include <hilite/core/utf16_map.hpp>
#include <hilite/editor/text_surface.hpp>
#include <hilite/ui-qt/styled_text_highlighter.hpp>

#include <QObject>
#include <QPointer>
#include <QTextEdit>

#include <optional>

namespace hilite::ui {

// Text surface over a QTextEdit. Offsets cross the boundary as UTF-8 bytes
// and are translated to the document's UTF-16 positions. Line breaks read
// back as '\n' whatever was set ("\r\n", '\r', U+2029). Styling is painted
// by a syntax highlighter and never enters the undo stack. QTextEdit holds a
// single selection: only the primary range is applied, with its direction.
class QtTextSurface : public QObject, public editor::TextSurface {
    Q_OBJECT

public:
    explicit QtTextSurface(QTextEdit* edit, QObject* parent = nullptr);
    ~QtTextSurface() override;

    [[nodiscard]] std::string text() const override;
    void set_text(std::string_view text) override;

    [[nodiscard]] highlight::StyledText styled_text() const override;
    void set_styled_text(const highlight::StyledText& styled) override;

    [[nodiscard]] editor::SelectionState selection() const override;
    void set_selection(const editor::SelectionState& selection) override;

    [[nodiscard]] highlight::AttributeSet typing_attributes() const override;
    void set_typing_attributes(const highlight::AttributeSet& attributes) override;

    void post(Task task) override;

    [[nodiscard]] QTextEdit* textEdit() const { return edit_; }

protected:
    bool eventFilter(QObject* watched, QEvent* event) override;

private:
    void onCursorMoved();

    [[nodiscard]] Utf16OffsetMap offsetMap() const;

    QPointer<QTextEdit> edit_;
    QPointer<StyledTextHighlighter> highlighter_;
    std::optional<editor::SelectionState> last_selection_;
};

} // namespace hilite::ui
