#ifndef CANONICALIZER_H
#define CANONICALIZER_H

#include "Position.h"

#include <cstddef>
#include <utility>

namespace core
{
    /// Ordered pair with low <= high. The cache only ever stores keys in this order.
    struct CacheKey
    {
        Position low;
        Position high;

        bool operator==(const CacheKey &other) const
        {
            return low == other.low && high == other.high;
        }
    };

    struct CacheKeyHash
    {
        std::size_t operator()(const CacheKey &key) const
        {
            PositionHash hasher;
            std::size_t h = hasher(key.low);
            // order matters: (a, b) and (b, a) must not collide trivially
            h ^= hasher(key.high) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
            return h;
        }
    };

    struct CanonicalPair
    {
        Position low;
        Position high;
        bool flipped; ///< true when the caller passed (high, low)

        CacheKey key() const { return CacheKey{low, high}; }
    };

    /// @brief Order a pair so that (a, b) and (b, a) map to the same key.
    inline CanonicalPair canonicalize(const Position &a, const Position &b)
    {
        bool flipped = b < a;
        return flipped ? CanonicalPair{b, a, true} : CanonicalPair{a, b, false};
    }

} // namespace core

#endif // CANONICALIZER_H
