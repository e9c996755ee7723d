#pragma once

#include <hilite/editor/text_surface.hpp>
#include <hilite/highlight/engine.hpp>
#include <hilite/highlight/rule.hpp>

#include <cstdint>
#include <string_view>

namespace hilite::editor {

// Per-surface update flag. While updating is set, listeners on the surface
// must ignore its notifications.
struct UpdateState {
    bool updating{false};
    std::uint64_t generation{0};   // completed or running updates
};

// Marks state as updating for its lifetime
class UpdateScope {
public:
    explicit UpdateScope(UpdateState& state)
        : state_(state)
    {
        state_.updating = true;
        ++state_.generation;
    }

    ~UpdateScope() { state_.updating = false; }

    UpdateScope(const UpdateScope&) = delete;
    UpdateScope& operator=(const UpdateScope&) = delete;

private:
    UpdateState& state_;
};

struct UpdateResult {
    bool applied{false};            // false for a re-entrant call
    std::uint64_t generation{0};
    std::size_t ranges_dropped{0};
    std::size_t ranges_truncated{0};
    highlight::HighlightStats stats;
};

// Restyles a surface without disturbing the user's selection or typing
// attributes:
//   1. enter updating mode
//   2. capture selection and typing attributes
//   3. highlight text with rules
//   4. install the styled text
//   5. restore selection (clamped to the new length) and typing attributes
//   6. leave updating mode
class SelectionPreservingUpdater {
public:
    explicit SelectionPreservingUpdater(highlight::EngineConfig config = {});

    UpdateResult apply_update(TextSurface& host, std::string_view text,
                              const highlight::RuleSet& rules, UpdateState& state);

    [[nodiscard]] highlight::Highlighter& highlighter() noexcept { return highlighter_; }
    [[nodiscard]] const highlight::Highlighter& highlighter() const noexcept { return highlighter_; }

private:
    highlight::Highlighter highlighter_;
};

} // namespace hilite::editor
