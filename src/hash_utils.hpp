#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>

namespace rpds {

// Golden-ratio constant used to seed and spread combined hashes
constexpr size_t HASH_SEED = 0x9e3779b9;

// Utility functions for popcount (bit counting)
#if defined(__GNUC__) || defined(__clang__)
    inline uint32_t popcount(uint32_t x) {
        return static_cast<uint32_t>(__builtin_popcount(x));  // Compiler intrinsic
    }
#else
    // Fallback implementation
    inline uint32_t popcount(uint32_t x) {
        x = x - ((x >> 1) & 0x55555555);
        x = (x & 0x33333333) + ((x >> 2) & 0x33333333);
        return (((x + (x >> 4)) & 0x0F0F0F0F) * 0x01010101) >> 24;
    }
#endif

inline size_t hashCombine(size_t seed, size_t value) {
    return seed ^ (value + HASH_SEED + (seed << 6) + (seed >> 2));
}

/**
 * Order-sensitive hash of a sequence.
 *
 * The length is mixed into the seed so that sequences which are prefixes
 * of one another, including the empty sequence, hash apart.
 */
template <typename Hash, typename Iterator>
size_t hashSequence(Iterator first, Iterator last) {
    size_t length = static_cast<size_t>(std::distance(first, last));
    size_t seed = hashCombine(HASH_SEED, length);
    Hash hasher;
    for (; first != last; ++first) {
        seed = hashCombine(seed, hasher(*first));
    }
    return seed;
}

}  // namespace rpds
