#include <hilite/editor/selection.hpp>

namespace hilite::editor {

SelectionState SelectionState::clamped_to(TextOffset length, ClampReport* report) const {
    ClampReport counts;
    SelectionState result;
    result.ranges.reserve(ranges.size());

    for (const auto& range : ranges) {
        if (range.start > length) {
            ++counts.dropped;
            continue;
        }
        if (range.end() > length) {
            ++counts.truncated;
            result.ranges.push_back(TextRange::from_bounds(range.start, length));
            continue;
        }
        result.ranges.push_back(range);
    }

    if (result.ranges.empty() && !ranges.empty()) {
        result.ranges.push_back(TextRange{length, 0});
    }
    result.reversed = reversed && !ranges.empty() && ranges.front().start <= length;

    if (report) {
        *report = counts;
    }
    return result;
}

} // namespace hilite::editor
