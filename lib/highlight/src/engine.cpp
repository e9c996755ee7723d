#include <hilite/highlight/engine.hpp>
#include <hilite/core/hash.hpp>

#include <spdlog/spdlog.h>

namespace hilite::highlight {

StyledText highlight(std::string_view text, const RuleSet& rules, const AttributeSet& base,
                     HighlightStats* stats) {
    HighlightStats local;
    local.rules = rules.size();

    StyleBuffer buffer(text.size(), base);

    for (const auto& rule : rules) {
        for (const auto& match : rule.pattern.find_all(text)) {
            if (match.range().empty()) {
                ++local.empty_matches;
                continue;
            }
            ++local.matches;

            for (const auto& mutation : rule.mutations) {
                auto span = mutation.target_span(match);
                if (!span || span->empty()) {
                    ++local.mutations_skipped;
                    continue;
                }

                auto value = mutation.resolve(text.substr(span->start, span->length), match);
                if (!value) {
                    ++local.mutations_skipped;
                    continue;
                }

                buffer.apply(*span, mutation.key(), *value);
                ++local.mutations_applied;
            }
        }
    }

    if (stats) {
        *stats = local;
    }
    return std::move(buffer).finish(std::string(text));
}

Highlighter::Highlighter(EngineConfig config)
    : config_(std::move(config))
{}

void Highlighter::set_config(EngineConfig config) {
    config_ = std::move(config);
    clear_cache();
}

void Highlighter::clear_cache() {
    cache_.reset();
}

StyledText Highlighter::highlight(std::string_view text, const RuleSet& rules) {
    const std::uint64_t text_hash = Hash::hash64(text);

    if (config_.cache_last_result && cache_ &&
        cache_->text_hash == text_hash &&
        cache_->rules.same_rules(rules) &&
        cache_->result.text() == text) {
        last_stats_.from_cache = true;
        spdlog::trace("highlight: reused cached result for {} bytes", text.size());
        return cache_->result;
    }

    HighlightStats stats;
    StyledText result = ::hilite::highlight::highlight(text, rules, config_.base_attributes, &stats);
    ++runs_performed_;
    last_stats_ = stats;

    spdlog::trace("highlight: {} bytes, {} rules, {} matches, {} applied, {} skipped, {} runs",
                  text.size(), stats.rules, stats.matches, stats.mutations_applied,
                  stats.mutations_skipped, result.runs().size());

    if (config_.cache_last_result) {
        cache_ = CacheEntry{text_hash, rules, result};
    }
    return result;
}

} // namespace hilite::highlight
