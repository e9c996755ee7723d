#pragma once

#include <QSyntaxHighlighter>
#include <QTextCharFormat>

#include <cstddef>
#include <vector>

namespace hilite::ui {

// Paints precomputed runs onto a document. The formats live in the block
// layouts only: they are not undoable and do not signal content changes.
class StyledTextHighlighter : public QSyntaxHighlighter {
    Q_OBJECT

public:
    // Half-open span of document positions (UTF-16)
    struct FormatRun {
        int start{0};
        int end{0};
        QTextCharFormat format;
    };

    explicit StyledTextHighlighter(QTextDocument* parent);

    // Runs sorted by start, laid out against the document's current content.
    // They are dropped again at the next content change.
    void setRuns(std::vector<FormatRun> runs);

    [[nodiscard]] std::size_t runCount() const { return runs_.size(); }

protected:
    void highlightBlock(const QString& text) override;

private:
    std::vector<FormatRun> runs_;
    int revision_{-1};
};

} // namespace hilite::ui
