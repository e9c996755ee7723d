#pragma once

#include <hilite/highlight/rule.hpp>
#include <hilite/highlight/style.hpp>
#include <hilite/highlight/styled_text.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace hilite::highlight {

// Counters from one highlighting pass
struct HighlightStats {
    std::size_t rules{0};
    std::size_t matches{0};
    std::size_t empty_matches{0};        // zero-length, ignored
    std::size_t mutations_applied{0};
    std::size_t mutations_skipped{0};    // unset group or no value computed
    bool from_cache{false};
};

// Runs every rule of rules over text in order and returns the styled result.
// Pure: same inputs always give an identical StyledText.
[[nodiscard]] StyledText highlight(std::string_view text, const RuleSet& rules,
                                   const AttributeSet& base = {},
                                   HighlightStats* stats = nullptr);

struct EngineConfig {
    AttributeSet base_attributes;   // applied under every rule
    bool cache_last_result{true};   // reuse the previous result for identical input
};

// Highlighting engine with configured base attributes. Remembers the last
// (text, rule set) pair so repeated refreshes of unchanged text skip the scan;
// results are always identical to a fresh highlight() call.
class Highlighter {
public:
    explicit Highlighter(EngineConfig config = {});

    [[nodiscard]] StyledText highlight(std::string_view text, const RuleSet& rules);

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }
    void set_config(EngineConfig config);

    [[nodiscard]] const HighlightStats& last_stats() const noexcept { return last_stats_; }
    [[nodiscard]] std::uint64_t runs_performed() const noexcept { return runs_performed_; }

    void clear_cache();

private:
    struct CacheEntry {
        std::uint64_t text_hash{0};
        RuleSet rules;
        StyledText result;
    };

    EngineConfig config_;
    std::optional<CacheEntry> cache_;
    HighlightStats last_stats_;
    std::uint64_t runs_performed_{0};
};

} // namespace hilite::highlight
