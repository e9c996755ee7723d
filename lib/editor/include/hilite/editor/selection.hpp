#pragma once

#include <hilite/core/types.hpp>

#include <cstddef>
#include <vector>

namespace hilite::editor {

// Counts from clamping a selection to a shorter text
struct ClampReport {
    std::size_t dropped{0};     // started past the end
    std::size_t truncated{0};   // ended past the end

    [[nodiscard]] bool changed() const noexcept { return dropped != 0 || truncated != 0; }
};

// Selected ranges of a text surface. A caret is an empty range. The first
// range is the primary one; reversed means it was selected backwards, with
// the caret at its start and the anchor at its end.
struct SelectionState {
    std::vector<TextRange> ranges;
    bool reversed{false};

    [[nodiscard]] static SelectionState caret(TextOffset offset) {
        return SelectionState{{TextRange{offset, 0}}};
    }

    [[nodiscard]] static SelectionState single(TextRange range) {
        return SelectionState{{range}};
    }

    // Primary range from anchor to caret, in either order
    [[nodiscard]] static SelectionState from_anchor(TextOffset anchor, TextOffset caret) {
        if (caret < anchor) {
            return SelectionState{{TextRange::from_bounds(caret, anchor)}, true};
        }
        return single(TextRange::from_bounds(anchor, caret));
    }

    [[nodiscard]] bool empty() const noexcept { return ranges.empty(); }

    // First range, or a caret at 0 when nothing is selected
    [[nodiscard]] TextRange primary() const noexcept {
        return ranges.empty() ? TextRange{} : ranges.front();
    }

    // Insertion point: end of the primary range, or its start when reversed
    [[nodiscard]] TextOffset cursor() const noexcept {
        return reversed ? primary().start : primary().end();
    }

    // Fixed end of the primary range, opposite the cursor
    [[nodiscard]] TextOffset anchor() const noexcept {
        return reversed ? primary().end() : primary().start;
    }

    // Ranges restricted to [0, length]. Ranges starting past length are
    // dropped, ranges ending past it are truncated. If every range was
    // dropped the result is a caret at length. Direction is kept unless the
    // primary range was dropped.
    [[nodiscard]] SelectionState clamped_to(TextOffset length, ClampReport* report = nullptr) const;

    bool operator==(const SelectionState&) const = default;
};

} // namespace hilite::editor
