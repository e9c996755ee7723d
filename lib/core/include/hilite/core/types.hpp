#pragma once

#include <algorithm>
#include <compare>
#include <cstddef>
#include <cstdint>

namespace hilite {

// Byte offset into UTF-8 text
using TextOffset = std::size_t;

// Half-open span [start, start + length)
struct TextRange {
    TextOffset start{0};
    TextOffset length{0};

    [[nodiscard]] static constexpr TextRange from_bounds(TextOffset begin, TextOffset end) noexcept {
        return end > begin ? TextRange{begin, end - begin} : TextRange{begin, 0};
    }

    [[nodiscard]] constexpr TextOffset end() const noexcept { return start + length; }
    [[nodiscard]] constexpr bool empty() const noexcept { return length == 0; }

    [[nodiscard]] constexpr bool contains(TextOffset offset) const noexcept {
        return offset >= start && offset < end();
    }

    [[nodiscard]] constexpr bool overlaps(const TextRange& other) const noexcept {
        return start < other.end() && other.start < end();
    }

    // Intersection with [0, limit); an empty range at limit if fully outside
    [[nodiscard]] constexpr TextRange clamped_to(TextOffset limit) const noexcept {
        const TextOffset begin = std::min(start, limit);
        const TextOffset finish = std::min(end(), limit);
        return from_bounds(begin, finish);
    }

    constexpr auto operator<=>(const TextRange&) const = default;
};

// 8-bit RGBA color
struct Color {
    std::uint8_t r{0};
    std::uint8_t g{0};
    std::uint8_t b{0};
    std::uint8_t a{255};

    [[nodiscard]] static constexpr Color rgb(std::uint8_t r, std::uint8_t g, std::uint8_t b) noexcept {
        return Color{r, g, b, 255};
    }

    [[nodiscard]] static constexpr Color rgba(std::uint8_t r, std::uint8_t g, std::uint8_t b,
                                              std::uint8_t a) noexcept {
        return Color{r, g, b, a};
    }

    // Alpha given as a fraction in [0, 1]
    [[nodiscard]] static constexpr Color with_alpha(Color base, double alpha) noexcept {
        const double clamped = std::clamp(alpha, 0.0, 1.0);
        base.a = static_cast<std::uint8_t>(clamped * 255.0 + 0.5);
        return base;
    }

    [[nodiscard]] constexpr std::uint32_t packed_rgba() const noexcept {
        return (std::uint32_t{r} << 24) | (std::uint32_t{g} << 16) | (std::uint32_t{b} << 8) | a;
    }

    constexpr auto operator<=>(const Color&) const = default;
};

// Light/dark appearance used to pick theme colors
enum class Appearance : std::uint8_t {
    Light,
    Dark
};

} // namespace hilite
