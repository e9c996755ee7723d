#pragma once

#include <hilite/core/types.hpp>

#include <cstddef>
#include <string_view>
#include <vector>

namespace hilite {

// Translates between UTF-8 byte offsets and UTF-16 code unit positions of
// the same text. Offsets inside a multi-byte sequence, or between the two
// halves of a surrogate pair, snap back to the start of the code point.
// Invalid bytes count as one code unit each, like a replacement character.
class Utf16OffsetMap {
public:
    Utf16OffsetMap() = default;
    explicit Utf16OffsetMap(std::string_view utf8);

    [[nodiscard]] std::size_t utf8_length() const noexcept { return to_utf16_.empty() ? 0 : to_utf16_.size() - 1; }
    [[nodiscard]] std::size_t utf16_length() const noexcept { return to_utf8_.empty() ? 0 : to_utf8_.size() - 1; }

    // Positions past the end map to the end
    [[nodiscard]] std::size_t to_utf16(TextOffset offset) const noexcept;
    [[nodiscard]] TextOffset to_utf8(std::size_t position) const noexcept;

    [[nodiscard]] TextRange range_to_utf8(std::size_t begin, std::size_t end) const noexcept {
        return TextRange::from_bounds(to_utf8(begin), to_utf8(end));
    }

private:
    std::vector<std::size_t> to_utf16_;   // byte offset -> code unit position
    std::vector<TextOffset> to_utf8_;     // code unit position -> byte offset
};

} // namespace hilite
