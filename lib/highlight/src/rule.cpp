#include <hilite/highlight/rule.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace hilite::highlight {

// RuleSet

RuleSet::RuleSet()
    : rules_(std::make_shared<const std::vector<PatternRule>>())
{}

RuleSet::RuleSet(std::string name, std::vector<PatternRule> rules)
    : name_(std::move(name))
    , rules_(std::make_shared<const std::vector<PatternRule>>(std::move(rules)))
{}

RuleSet operator+(const RuleSet& lhs, const RuleSet& rhs) {
    std::vector<PatternRule> combined;
    combined.reserve(lhs.size() + rhs.size());
    combined.insert(combined.end(), lhs.begin(), lhs.end());
    combined.insert(combined.end(), rhs.begin(), rhs.end());

    std::string name;
    if (lhs.name().empty()) {
        name = rhs.name();
    } else if (rhs.name().empty()) {
        name = lhs.name();
    } else {
        name = fmt::format("{}+{}", lhs.name(), rhs.name());
    }
    return RuleSet(std::move(name), std::move(combined));
}

// RuleSetBuilder

RuleSetBuilder::RuleSetBuilder(std::string name)
    : name_(std::move(name))
{}

RuleSetBuilder& RuleSetBuilder::rule(std::string_view pattern, std::vector<StyleMutation> mutations) {
    return rule(pattern, PatternOptions::None, std::move(mutations));
}

RuleSetBuilder& RuleSetBuilder::rule(std::string_view pattern, PatternOptions options,
                                     std::vector<StyleMutation> mutations) {
    auto compiled = Pattern::compile(pattern, options);
    if (!compiled) {
        record_error(attempted_++, compiled.error());
        return *this;
    }
    return rule(std::move(*compiled), std::move(mutations));
}

RuleSetBuilder& RuleSetBuilder::rule(Pattern pattern, std::vector<StyleMutation> mutations) {
    const std::size_t index = attempted_++;

    for (const auto& mutation : mutations) {
        const auto group = mutation.target_group();
        if (group && *group > pattern.capture_count()) {
            record_error(index, rule_error(fmt::format(
                "{} targets group {} but '{}' has {} capture groups",
                to_string(mutation.key()), *group, pattern.source(), pattern.capture_count())));
            return *this;
        }
    }

    rules_.push_back(PatternRule{std::move(pattern), std::move(mutations)});
    return *this;
}

void RuleSetBuilder::record_error(std::size_t index, const Error& cause) {
    Error error = cause.with_context(fmt::format("rule set '{}', rule #{}", name_, index));
    spdlog::error("{}", error.message());
    if (!error_) {
        error_ = std::move(error);
    }
}

Result<RuleSet> RuleSetBuilder::build() && {
    if (error_) {
        return std::unexpected(*error_);
    }

    for (std::size_t i = 0; i < rules_.size(); ++i) {
        if (rules_[i].mutations.empty()) {
            spdlog::debug("Rule set '{}': rule #{} ('{}') has no mutations",
                          name_, i, rules_[i].pattern.source());
        }
    }

    const auto jitted = std::count_if(rules_.begin(), rules_.end(),
                                      [](const PatternRule& r) { return r.pattern.jit_compiled(); });
    spdlog::debug("Built rule set '{}' with {} rules ({} JIT-compiled)", name_, rules_.size(), jitted);
    return RuleSet(std::move(name_), std::move(rules_));
}

} // namespace hilite::highlight
