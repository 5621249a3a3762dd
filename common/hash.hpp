#pragma once

// ============================================================
// hash.hpp -- xxHash3 digests of downloaded and served files
// ============================================================

#include "platform.hpp"
#include <cstddef>
#include <array>
#include <string>

#define XXH_STATIC_LINKING_ONLY
#include "xxhash.h"

namespace hash {

using Hash128 = std::array<u8, 16>;

// xxh3_128 of a memory buffer, stored big-endian for determinism
inline Hash128 xxh3_128(const void* data, size_t len) {
    XXH128_hash_t h = XXH3_128bits(data, len);
    Hash128 result;
    for (int i = 0; i < 8; ++i) {
        result[i]     = (u8)(h.high64 >> (56 - 8 * i));
        result[8 + i] = (u8)(h.low64  >> (56 - 8 * i));
    }
    return result;
}

inline std::string to_hex(const Hash128& h) {
    static const char* digits = "0123456789abcdef";
    std::string s;
    s.reserve(32);
    for (u8 b : h) {
        s.push_back(digits[b >> 4]);
        s.push_back(digits[b & 0x0F]);
    }
    return s;
}

} // namespace hash
