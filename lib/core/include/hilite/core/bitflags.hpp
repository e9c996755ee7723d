#pragma once

#include <type_traits>

namespace hilite {

// Opt an enum class into bitwise operators:
// template<> struct EnableBitflags<PatternOptions> : std::true_type {};
template<typename T>
struct EnableBitflags : std::false_type {};

template<typename T>
concept Bitflag = std::is_enum_v<T> && EnableBitflags<T>::value;

namespace detail {
template<Bitflag T>
[[nodiscard]] constexpr auto bits(T value) noexcept {
    return static_cast<std::underlying_type_t<T>>(value);
}
} // namespace detail

template<Bitflag T>
[[nodiscard]] constexpr T operator|(T lhs, T rhs) noexcept {
    return static_cast<T>(detail::bits(lhs) | detail::bits(rhs));
}

template<Bitflag T>
[[nodiscard]] constexpr T operator&(T lhs, T rhs) noexcept {
    return static_cast<T>(detail::bits(lhs) & detail::bits(rhs));
}

template<Bitflag T>
[[nodiscard]] constexpr T operator~(T value) noexcept {
    return static_cast<T>(~detail::bits(value));
}

template<Bitflag T>
constexpr T& operator|=(T& lhs, T rhs) noexcept {
    return lhs = lhs | rhs;
}

template<Bitflag T>
constexpr T& operator&=(T& lhs, T rhs) noexcept {
    return lhs = lhs & rhs;
}

// All bits of flag set in value
template<Bitflag T>
[[nodiscard]] constexpr bool has_flag(T value, T flag) noexcept {
    return (detail::bits(value) & detail::bits(flag)) == detail::bits(flag);
}

template<Bitflag T>
[[nodiscard]] constexpr bool has_any_flag(T value, T flags) noexcept {
    return (detail::bits(value) & detail::bits(flags)) != 0;
}

template<Bitflag T>
[[nodiscard]] constexpr bool no_flags(T value) noexcept {
    return detail::bits(value) == 0;
}

} // namespace hilite

// Re-export the operators into a nested namespace so argument-dependent
// lookup finds them for enums declared there.
#define HILITE_USE_BITFLAG_OPERATORS \
    using ::hilite::operator|;       \
    using ::hilite::operator&;       \
    using ::hilite::operator~;       \
    using ::hilite::operator|=;      \
    using ::hilite::operator&=;      \
    using ::hilite::has_flag;        \
    using ::hilite::has_any_flag;    \
    using ::hilite::no_flags
