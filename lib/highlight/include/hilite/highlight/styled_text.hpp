#pragma once

#include <hilite/core/types.hpp>
#include <hilite/highlight/style.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace hilite::highlight {

// Maximal span of identical attributes
struct StyledRun {
    TextRange range;
    AttributeSet attributes;

    bool operator==(const StyledRun&) const = default;
};

// Text plus gap-free attribute coverage. Runs are sorted, adjacent and
// never empty; neighbouring runs always differ in attributes. Empty text
// has no runs.
class StyledText {
public:
    StyledText() = default;

    // Unstyled text: one run carrying base over the whole span
    StyledText(std::string text, AttributeSet base);

    [[nodiscard]] const std::string& text() const noexcept { return text_; }
    [[nodiscard]] std::size_t length() const noexcept { return text_.size(); }
    [[nodiscard]] const std::vector<StyledRun>& runs() const noexcept { return runs_; }
    [[nodiscard]] const AttributeSet& base_attributes() const noexcept { return base_; }

    // Attributes at offset; base attributes for offsets past the end
    [[nodiscard]] const AttributeSet& attributes_at(TextOffset offset) const;
    [[nodiscard]] const StyleValue* attribute_at(TextOffset offset, AttributeKey key) const;

    template<typename T>
    [[nodiscard]] const T* get_at(TextOffset offset, AttributeKey key) const {
        return attributes_at(offset).get<T>(key);
    }

    // Index of the run covering offset, runs().size() if none
    [[nodiscard]] std::size_t run_index_at(TextOffset offset) const;

    // xxHash digest over text, runs and base attributes
    [[nodiscard]] std::uint64_t digest() const noexcept { return digest_; }

    [[nodiscard]] bool operator==(const StyledText& other) const;

private:
    friend class StyleBuffer;

    StyledText(std::string text, std::vector<StyledRun> runs, AttributeSet base);

    void compute_digest();

    std::string text_;
    std::vector<StyledRun> runs_;
    AttributeSet base_;
    std::uint64_t digest_{0};
};

// Mutable run buffer the engine paints into. Boundaries are split on demand
// and merged again when the result is taken.
class StyleBuffer {
public:
    StyleBuffer(TextOffset length, AttributeSet base);

    // Sets key to value over range, clipped to the buffer
    void apply(TextRange range, AttributeKey key, const StyleValue& value);

    [[nodiscard]] TextOffset length() const noexcept { return length_; }

    // Coalesces equal neighbours; text must be length() bytes long
    [[nodiscard]] StyledText finish(std::string text) &&;

private:
    using RunMap = std::map<TextOffset, AttributeSet>;

    // Ensures a run starts exactly at offset and returns it
    RunMap::iterator split_at(TextOffset offset);

    TextOffset length_;
    AttributeSet base_;
    RunMap runs_;  // run start -> attributes; a run extends to the next start
};

} // namespace hilite::highlight
