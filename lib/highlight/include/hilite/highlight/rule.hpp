#pragma once

#include <hilite/core/result.hpp>
#include <hilite/highlight/pattern.hpp>
#include <hilite/highlight/style.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hilite::highlight {

// A pattern and the mutations applied, in order, to each of its matches
struct PatternRule {
    Pattern pattern;
    std::vector<StyleMutation> mutations;
};

// Ordered rule collection; later rules win conflicts on the same key.
// Copies share the same immutable rule storage.
class RuleSet {
public:
    RuleSet();
    RuleSet(std::string name, std::vector<PatternRule> rules);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] std::size_t size() const noexcept { return rules_->size(); }
    [[nodiscard]] bool empty() const noexcept { return rules_->empty(); }

    [[nodiscard]] const PatternRule& operator[](std::size_t index) const { return (*rules_)[index]; }
    [[nodiscard]] auto begin() const noexcept { return rules_->cbegin(); }
    [[nodiscard]] auto end() const noexcept { return rules_->cend(); }

    // True if both refer to the same rule storage
    [[nodiscard]] bool same_rules(const RuleSet& other) const noexcept { return rules_ == other.rules_; }

private:
    std::string name_;
    std::shared_ptr<const std::vector<PatternRule>> rules_;
};

// Concatenation: all rules of lhs, then all rules of rhs
[[nodiscard]] RuleSet operator+(const RuleSet& lhs, const RuleSet& rhs);

// Collects rules and compiles their patterns. The first invalid rule (bad
// pattern, or a mutation targeting a capture group the pattern lacks) is
// remembered and reported by build(); later rules are still checked so the
// log names every broken one.
class RuleSetBuilder {
public:
    explicit RuleSetBuilder(std::string name);

    RuleSetBuilder& rule(std::string_view pattern, std::vector<StyleMutation> mutations);
    RuleSetBuilder& rule(std::string_view pattern, PatternOptions options,
                         std::vector<StyleMutation> mutations);
    RuleSetBuilder& rule(Pattern pattern, std::vector<StyleMutation> mutations);

    // Shorthand for the common single-mutation rule
    RuleSetBuilder& rule(std::string_view pattern, StyleMutation mutation) {
        return rule(pattern, PatternOptions::None, std::vector<StyleMutation>{std::move(mutation)});
    }

    RuleSetBuilder& rule(std::string_view pattern, PatternOptions options, StyleMutation mutation) {
        return rule(pattern, options, std::vector<StyleMutation>{std::move(mutation)});
    }

    [[nodiscard]] std::size_t size() const noexcept { return rules_.size(); }
    [[nodiscard]] bool has_error() const noexcept { return error_.has_value(); }

    [[nodiscard]] Result<RuleSet> build() &&;

private:
    void record_error(std::size_t index, const Error& cause);

    std::string name_;
    std::vector<PatternRule> rules_;
    std::size_t attempted_{0};
    std::optional<Error> error_;
};

} // namespace hilite::highlight
