#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <type_traits>

// XXH_STATIC_LINKING_ONLY exposes XXH3_state_t for StreamingHasher
#define XXH_STATIC_LINKING_ONLY
#include <xxhash.h>

namespace hilite {

// Fast hashing using xxHash
class Hash {
public:
    [[nodiscard]] static std::uint64_t hash64(const void* data, std::size_t len) noexcept {
        return XXH3_64bits(data, len);
    }

    [[nodiscard]] static std::uint64_t hash64(std::string_view str) noexcept {
        return XXH3_64bits(str.data(), str.size());
    }
};

// Incremental hasher, used for digests of styled text
class StreamingHasher {
public:
    StreamingHasher() noexcept {
        XXH3_64bits_reset(&state_);
    }

    void update(const void* data, std::size_t len) noexcept {
        XXH3_64bits_update(&state_, data, len);
    }

    void update(std::string_view str) noexcept {
        // Length first so ("ab","c") and ("a","bc") differ
        update_value(str.size());
        XXH3_64bits_update(&state_, str.data(), str.size());
    }

    template<typename T>
        requires std::is_trivially_copyable_v<T>
    void update_value(const T& value) noexcept {
        XXH3_64bits_update(&state_, &value, sizeof(T));
    }

    [[nodiscard]] std::uint64_t finalize() noexcept {
        return XXH3_64bits_digest(&state_);
    }

private:
    XXH3_state_t state_;
};

} // namespace hilite
