#include <hilite/core/utf16_map.hpp>

namespace hilite {

namespace {

struct Sequence {
    std::size_t bytes;
    std::size_t units;
};

bool is_continuation(unsigned char byte) {
    return (byte & 0xC0) == 0x80;
}

Sequence decode(std::string_view text, std::size_t offset) {
    const auto lead = static_cast<unsigned char>(text[offset]);

    std::size_t bytes = 1;
    std::size_t units = 1;
    if (lead >= 0xF0 && lead <= 0xF4) {
        bytes = 4;
        units = 2;
    } else if (lead >= 0xE0) {
        bytes = lead <= 0xEF ? 3 : 1;
    } else if (lead >= 0xC2) {
        bytes = 2;
    }

    if (offset + bytes > text.size()) {
        return {1, 1};
    }
    for (std::size_t i = 1; i < bytes; ++i) {
        if (!is_continuation(static_cast<unsigned char>(text[offset + i]))) {
            return {1, 1};
        }
    }
    return {bytes, units};
}

} // namespace

Utf16OffsetMap::Utf16OffsetMap(std::string_view utf8) {
    to_utf16_.reserve(utf8.size() + 1);
    to_utf8_.reserve(utf8.size() + 1);

    std::size_t offset = 0;
    std::size_t position = 0;
    while (offset < utf8.size()) {
        const Sequence seq = decode(utf8, offset);
        for (std::size_t i = 0; i < seq.bytes; ++i) {
            to_utf16_.push_back(position);
        }
        for (std::size_t i = 0; i < seq.units; ++i) {
            to_utf8_.push_back(offset);
        }
        offset += seq.bytes;
        position += seq.units;
    }

    to_utf16_.push_back(position);
    to_utf8_.push_back(offset);
}

std::size_t Utf16OffsetMap::to_utf16(TextOffset offset) const noexcept {
    if (to_utf16_.empty()) return 0;
    return offset < to_utf16_.size() ? to_utf16_[offset] : to_utf16_.back();
}

TextOffset Utf16OffsetMap::to_utf8(std::size_t position) const noexcept {
    if (to_utf8_.empty()) return 0;
    return position < to_utf8_.size() ? to_utf8_[position] : to_utf8_.back();
}

} // namespace hilite
