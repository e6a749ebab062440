#include <gtest/gtest.h>
#include "../src/core/DistanceCache.h"
#include "TestSupport.h"

#include <stdexcept>

namespace core {

class DistanceCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.time_to_idle = std::chrono::seconds(90);
        config.initial_capacity = 8;
        config.max_capacity = 64;
        config.time_source = clock.source();
    }

    static CacheKey makeKey(double lat1, double lon1, double lat2, double lon2) {
        return canonicalize(Position(lat1, lon1), Position(lat2, lon2)).key();
    }

    testsupport::ManualClock clock;
    CacheConfig config;
};

TEST_F(DistanceCacheTest, DefaultConfiguration) {
    CacheConfig defaults;
    EXPECT_EQ(defaults.time_to_idle, std::chrono::seconds(90));
    EXPECT_EQ(defaults.initial_capacity, 64u);
    EXPECT_EQ(defaults.max_capacity, 65536u);
}

TEST_F(DistanceCacheTest, RejectsZeroCapacity) {
    config.max_capacity = 0;
    EXPECT_THROW(DistanceCache cache(config), std::invalid_argument);
}

TEST_F(DistanceCacheTest, RejectsNonPositiveIdleTime) {
    config.time_to_idle = std::chrono::milliseconds(0);
    EXPECT_THROW(DistanceCache cache(config), std::invalid_argument);
}

TEST_F(DistanceCacheTest, RejectsIdleTimeBeyondClockRange) {
    config.time_to_idle = maxTimeToIdle() + std::chrono::milliseconds(1);
    EXPECT_THROW(DistanceCache cache(config), std::invalid_argument);

    config.time_to_idle = std::chrono::milliseconds(10000000000000LL);
    EXPECT_THROW(DistanceCache cache(config), std::invalid_argument);
}

TEST_F(DistanceCacheTest, LongestIdleTimeKeepsEntries) {
    config.time_to_idle = maxTimeToIdle();
    DistanceCache cache(config);

    CacheKey key = makeKey(1.0, 2.0, 3.0, 4.0);
    cache.insert(key, DistanceResult(5.0, 0.0, 0.0));
    clock.advance(std::chrono::hours(24 * 365));

    EXPECT_TRUE(cache.lookup(key).has_value());
    EXPECT_EQ(cache.stats().expirations, 0u);
}

TEST_F(DistanceCacheTest, MissThenHit) {
    DistanceCache cache(config);
    CacheKey key = makeKey(0.0, 0.0, 3.0, 4.0);

    // Initial state
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_FALSE(cache.lookup(key).has_value());

    cache.insert(key, DistanceResult(5.0, 10.0, 20.0));
    EXPECT_EQ(cache.size(), 1u);

    auto hit = cache.lookup(key);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(*hit, DistanceResult(5.0, 10.0, 20.0));

    CacheStats stats = cache.stats();
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_EQ(stats.insertions, 1u);
    EXPECT_EQ(stats.entries, 1u);
}

TEST_F(DistanceCacheTest, InsertOverwritesSameKey) {
    DistanceCache cache(config);
    CacheKey key = makeKey(10.0, 10.0, 20.0, 20.0);

    cache.insert(key, DistanceResult(1.0, 2.0, 3.0));
    cache.insert(key, DistanceResult(1.0, 2.0, 3.0));
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(*cache.lookup(key), DistanceResult(1.0, 2.0, 3.0));
}

TEST_F(DistanceCacheTest, ReversedPairIsTheSameEntry) {
    DistanceCache cache(config);
    cache.insert(makeKey(10.0, 10.0, 20.0, 20.0), DistanceResult(7.0, 1.0, 2.0));

    EXPECT_TRUE(cache.contains(makeKey(20.0, 20.0, 10.0, 10.0)));
    EXPECT_EQ(cache.size(), 1u); // Stored once under (low, high)
}

TEST_F(DistanceCacheTest, EntryExpiresAfterIdleTime) {
    DistanceCache cache(config);
    CacheKey key = makeKey(1.0, 1.0, 2.0, 2.0);
    cache.insert(key, DistanceResult(1.0, 0.0, 0.0));

    clock.advance(std::chrono::seconds(89));
    EXPECT_TRUE(cache.contains(key));

    clock.advance(std::chrono::seconds(2));
    EXPECT_FALSE(cache.contains(key));
    EXPECT_FALSE(cache.lookup(key).has_value());
}

TEST_F(DistanceCacheTest, LookupRefreshesIdleTimer) {
    DistanceCache cache(config);
    CacheKey key = makeKey(1.0, 1.0, 2.0, 2.0);
    cache.insert(key, DistanceResult(1.0, 0.0, 0.0));

    for (int i = 0; i < 5; ++i) {
        clock.advance(std::chrono::seconds(60));
        ASSERT_TRUE(cache.lookup(key).has_value()) << "round " << i;
    }

    // contains() does not refresh
    clock.advance(std::chrono::seconds(60));
    EXPECT_TRUE(cache.contains(key));
    clock.advance(std::chrono::seconds(60));
    EXPECT_FALSE(cache.contains(key));
}

TEST_F(DistanceCacheTest, ExpiredEntriesAreSweptOnWrite) {
    DistanceCache cache(config);
    cache.insert(makeKey(1.0, 1.0, 2.0, 2.0), DistanceResult(1.0, 0.0, 0.0));
    cache.insert(makeKey(3.0, 3.0, 4.0, 4.0), DistanceResult(1.0, 0.0, 0.0));
    EXPECT_EQ(cache.size(), 2u);

    clock.advance(std::chrono::seconds(120));
    cache.insert(makeKey(5.0, 5.0, 6.0, 6.0), DistanceResult(1.0, 0.0, 0.0));

    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.stats().expirations, 2u);
}

TEST_F(DistanceCacheTest, CapacityBoundHolds) {
    config.max_capacity = 16;
    DistanceCache cache(config);

    for (int i = 0; i < 200; ++i) {
        clock.advance(std::chrono::milliseconds(1));
        cache.insert(makeKey(i * 0.01, 0.0, i * 0.01, 1.0), DistanceResult(i, 0.0, 0.0));
        ASSERT_LE(cache.size(), 16u);
    }
    EXPECT_GT(cache.stats().evictions, 0u);
}

TEST_F(DistanceCacheTest, EvictsLeastRecentlyUsed) {
    config.max_capacity = 4;
    DistanceCache cache(config);

    CacheKey keys[5];
    for (int i = 0; i < 5; ++i) {
        keys[i] = makeKey(i, 0.0, i, 1.0);
    }

    for (int i = 0; i < 4; ++i) {
        clock.advance(std::chrono::seconds(1));
        cache.insert(keys[i], DistanceResult(i, 0.0, 0.0));
    }

    // Touch the oldest so keys[1] becomes the least recently used
    clock.advance(std::chrono::seconds(1));
    ASSERT_TRUE(cache.lookup(keys[0]).has_value());

    clock.advance(std::chrono::seconds(1));
    cache.insert(keys[4], DistanceResult(4.0, 0.0, 0.0));

    EXPECT_EQ(cache.size(), 4u);
    EXPECT_TRUE(cache.contains(keys[0]));
    EXPECT_FALSE(cache.contains(keys[1]));
    EXPECT_TRUE(cache.contains(keys[4]));
    EXPECT_EQ(cache.stats().evictions, 1u);
}

TEST_F(DistanceCacheTest, NewestEntrySurvivesEvictionWithTiedClock) {
    config.max_capacity = 1;
    DistanceCache cache(config);

    CacheKey first = makeKey(1.0, 1.0, 2.0, 2.0);
    CacheKey second = makeKey(3.0, 3.0, 4.0, 4.0);
    cache.insert(first, DistanceResult(1.0, 0.0, 0.0));
    cache.insert(second, DistanceResult(2.0, 0.0, 0.0));

    EXPECT_EQ(cache.size(), 1u);
    EXPECT_TRUE(cache.contains(second));
}

TEST_F(DistanceCacheTest, FailedEvictionDropsTheNewEntry) {
    config.max_capacity = 2;
    testsupport::StarvedCache cache(config);

    CacheKey a = makeKey(1.0, 1.0, 2.0, 2.0);
    CacheKey b = makeKey(3.0, 3.0, 4.0, 4.0);
    CacheKey c = makeKey(5.0, 5.0, 6.0, 6.0);
    cache.insert(a, DistanceResult(1.0, 0.0, 0.0));
    cache.insert(b, DistanceResult(2.0, 0.0, 0.0));

    EXPECT_NO_THROW(cache.insert(c, DistanceResult(3.0, 0.0, 0.0)));
    EXPECT_EQ(cache.size(), 2u);
    EXPECT_TRUE(cache.contains(a));
    EXPECT_TRUE(cache.contains(b));
    EXPECT_FALSE(cache.contains(c));
    EXPECT_EQ(cache.stats().insertions, 2u);

    // Overwriting an existing key never needs eviction
    EXPECT_NO_THROW(cache.insert(a, DistanceResult(7.0, 0.0, 0.0)));
    ASSERT_TRUE(cache.lookup(a).has_value());
    EXPECT_EQ(cache.lookup(a)->distance, 7.0);

    cache.starved = false;
    cache.insert(c, DistanceResult(3.0, 0.0, 0.0));
    EXPECT_EQ(cache.size(), 2u);
    EXPECT_TRUE(cache.contains(c));
}

} // namespace core
