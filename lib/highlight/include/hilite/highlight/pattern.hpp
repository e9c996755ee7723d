#pragma once

#include <hilite/core/bitflags.hpp>
#include <hilite/core/result.hpp>
#include <hilite/core/types.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hilite::highlight {

// Regex matching options
enum class PatternOptions : std::uint8_t {
    None                     = 0,
    CaseInsensitive          = 1 << 0,
    AnchorsMatchLines        = 1 << 1,  // ^ and $ match at line boundaries
    DotMatchesLineSeparators = 1 << 2,  // . also matches CR/LF
};

} // namespace hilite::highlight

namespace hilite {
template<>
struct EnableBitflags<highlight::PatternOptions> : std::true_type {};
} // namespace hilite

namespace hilite::highlight {

HILITE_USE_BITFLAG_OPERATORS;

// One match of a pattern against a subject. Group 0 is the whole match;
// groups that did not participate are nullopt.
class Match {
public:
    Match(std::string_view subject, std::vector<std::optional<TextRange>> groups)
        : subject_(subject)
        , groups_(std::move(groups))
    {}

    [[nodiscard]] TextRange range() const noexcept { return groups_.empty() ? TextRange{} : *groups_[0]; }
    [[nodiscard]] std::string_view text() const noexcept { return slice(range()); }

    // Number of groups including group 0
    [[nodiscard]] std::size_t group_count() const noexcept { return groups_.size(); }

    [[nodiscard]] std::optional<TextRange> group(std::size_t index) const noexcept {
        return index < groups_.size() ? groups_[index] : std::nullopt;
    }

    [[nodiscard]] std::optional<std::string_view> group_text(std::size_t index) const noexcept {
        auto span = group(index);
        if (!span) return std::nullopt;
        return slice(*span);
    }

    [[nodiscard]] std::string_view subject() const noexcept { return subject_; }

private:
    [[nodiscard]] std::string_view slice(TextRange span) const noexcept {
        return subject_.substr(span.start, span.length);
    }

    std::string_view subject_;
    std::vector<std::optional<TextRange>> groups_;
};

// Compiled Perl-compatible regular expression. Copies share the compiled
// program, which is never modified after compile().
class Pattern {
public:
    // Fails with ErrorCategory::Pattern on invalid syntax
    [[nodiscard]] static Result<Pattern> compile(std::string_view source,
                                                 PatternOptions options = PatternOptions::None);

    [[nodiscard]] const std::string& source() const noexcept;
    [[nodiscard]] PatternOptions options() const noexcept;

    // Number of capturing groups, not counting group 0
    [[nodiscard]] std::size_t capture_count() const noexcept;
    [[nodiscard]] bool jit_compiled() const noexcept;

    // All non-overlapping matches, leftmost first. After an empty match the
    // scan resumes one code point further.
    [[nodiscard]] std::vector<Match> find_all(std::string_view subject) const;

    [[nodiscard]] bool matches_anywhere(std::string_view subject) const;

private:
    struct Program;

    explicit Pattern(std::shared_ptr<const Program> program);

    std::shared_ptr<const Program> program_;
};

} // namespace hilite::highlight
