#include <hilite/ui-qt/styled_text_highlighter.hpp>

#include <QTextBlock>
#include <QTextDocument>

#include <algorithm>
#include <utility>

namespace hilite::ui {

StyledTextHighlighter::StyledTextHighlighter(QTextDocument* parent)
    : QSyntaxHighlighter(parent)
{}

void StyledTextHighlighter::setRuns(std::vector<FormatRun> runs) {
    runs_ = std::move(runs);
    revision_ = document() ? document()->revision() : -1;
    rehighlight();
}

void StyledTextHighlighter::highlightBlock(const QString& text) {
    // Content changed since the runs were computed; leave the block plain
    // until the next setRuns()
    if (!document() || document()->revision() != revision_) {
        return;
    }

    const int block_start = currentBlock().position();
    const int block_end = block_start + static_cast<int>(text.size());

    auto it = std::upper_bound(runs_.begin(), runs_.end(), block_start,
                               [](int position, const FormatRun& run) { return position < run.end; });

    for (; it != runs_.end() && it->start < block_end; ++it) {
        const int from = std::max(it->start, block_start);
        const int to = std::min(it->end, block_end);
        if (to > from) {
            setFormat(from - block_start, to - from, it->format);
        }
    }
}

} // namespace hilite::ui
