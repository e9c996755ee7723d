#include <hilite/editor/updater.hpp>

#include <spdlog/spdlog.h>

namespace hilite::editor {

SelectionPreservingUpdater::SelectionPreservingUpdater(highlight::EngineConfig config)
    : highlighter_(std::move(config))
{}

UpdateResult SelectionPreservingUpdater::apply_update(TextSurface& host, std::string_view text,
                                                      const highlight::RuleSet& rules,
                                                      UpdateState& state) {
    UpdateResult result;
    if (state.updating) {
        spdlog::debug("update: ignoring re-entrant update (generation {})", state.generation);
        result.generation = state.generation;
        return result;
    }

    UpdateScope scope(state);

    const SelectionState selection = host.selection();
    const highlight::AttributeSet typing = host.typing_attributes();

    const highlight::StyledText styled = highlighter_.highlight(text, rules);
    host.set_styled_text(styled);

    ClampReport clamp;
    const SelectionState restored = selection.clamped_to(styled.length(), &clamp);
    if (clamp.changed()) {
        spdlog::warn("update: selection clamped to {} bytes ({} ranges dropped, {} truncated)",
                     styled.length(), clamp.dropped, clamp.truncated);
    }

    host.set_selection(restored);
    host.set_typing_attributes(typing);

    result.applied = true;
    result.generation = state.generation;
    result.ranges_dropped = clamp.dropped;
    result.ranges_truncated = clamp.truncated;
    result.stats = highlighter_.last_stats();

    spdlog::trace("update #{}: {} bytes, {} runs, {} selection ranges{}",
                  result.generation, styled.length(), styled.runs().size(),
                  restored.ranges.size(), result.stats.from_cache ? " (cached)" : "");
    return result;
}

} // namespace hilite::editor
