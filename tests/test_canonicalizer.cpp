#include <gtest/gtest.h>
#include "../src/core/Canonicalizer.h"
#include "../src/core/DistanceResult.h"

// ====================
// canonicalize
// ====================

TEST(Canonicalizer, OrderedInputIsNotFlipped)
{
    core::Position a(37.882704, -121.980713);
    core::Position b(37.883463, -121.980988);

    core::CanonicalPair pair = core::canonicalize(a, b);
    EXPECT_FALSE(pair.flipped);
    EXPECT_EQ(pair.low, a);
    EXPECT_EQ(pair.high, b);
}

TEST(Canonicalizer, ReversedInputIsFlipped)
{
    core::Position a(37.882704, -121.980713);
    core::Position b(37.883463, -121.980988);

    core::CanonicalPair pair = core::canonicalize(b, a);
    EXPECT_TRUE(pair.flipped);
    EXPECT_EQ(pair.low, a);
    EXPECT_EQ(pair.high, b);
}

TEST(Canonicalizer, BothOrdersShareOneKey)
{
    core::Position a(-33.9, 151.2);
    core::Position b(51.5, -0.12);

    core::CacheKey k1 = core::canonicalize(a, b).key();
    core::CacheKey k2 = core::canonicalize(b, a).key();
    EXPECT_EQ(k1, k2);
    EXPECT_EQ(core::CacheKeyHash()(k1), core::CacheKeyHash()(k2));
}

TEST(Canonicalizer, SamePositionIsNotFlipped)
{
    core::Position a(12.0, 34.0);
    core::CanonicalPair pair = core::canonicalize(a, a);
    EXPECT_FALSE(pair.flipped);
    EXPECT_EQ(pair.low, pair.high);
}

TEST(Canonicalizer, SignedZeroPairSharesOneKey)
{
    core::Position pos_zero(0.0, 0.0);
    core::Position neg_zero(-0.0, 0.0);

    core::CanonicalPair p1 = core::canonicalize(pos_zero, neg_zero);
    core::CanonicalPair p2 = core::canonicalize(neg_zero, pos_zero);
    EXPECT_NE(p1.flipped, p2.flipped);
    EXPECT_EQ(p1.key(), p2.key());
}

TEST(Canonicalizer, KeyHashDependsOnOrder)
{
    core::Position a(1.0, 2.0);
    core::Position b(3.0, 4.0);
    core::CacheKeyHash hasher;
    EXPECT_NE(hasher(core::CacheKey{a, b}), hasher(core::CacheKey{b, a}));
}

// ====================
// DistanceResult
// ====================

TEST(DistanceResult, SwapDirectionsExchangesAzimuthsOnly)
{
    core::DistanceResult r(1234.5, 30.0, -150.0);
    r.swapDirections();
    EXPECT_DOUBLE_EQ(r.distance, 1234.5);
    EXPECT_DOUBLE_EQ(r.forward_azimuth, -150.0);
    EXPECT_DOUBLE_EQ(r.backward_azimuth, 30.0);
}

TEST(DistanceResult, SwapTwiceRestoresOriginal)
{
    core::DistanceResult original(10.0, 1.0, 2.0);
    core::DistanceResult r = original;
    r.swapDirections();
    r.swapDirections();
    EXPECT_EQ(r, original);
}

TEST(DistanceResult, SwapDirectionsIf)
{
    core::DistanceResult r(10.0, 1.0, 2.0);
    r.swapDirectionsIf(false);
    EXPECT_DOUBLE_EQ(r.forward_azimuth, 1.0);
    r.swapDirectionsIf(true);
    EXPECT_DOUBLE_EQ(r.forward_azimuth, 2.0);
    EXPECT_DOUBLE_EQ(r.backward_azimuth, 1.0);
}
