// File: tests/cache/ttl_cache_test.cpp
#include "cache/ttl_cache.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace apo {
namespace {

using namespace std::chrono_literals;
using StringCache = TtlCache<std::string, int>;

// ============================================================================
// Basic Operations Tests
// ============================================================================

TEST(TtlCacheTest, PutAndGet) {
    StringCache cache(10, 10s);
    cache.Put("a", 1);

    auto value = cache.Get("a");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(1, *value);
    EXPECT_EQ(1u, cache.Size());
}

TEST(TtlCacheTest, MissingKey) {
    StringCache cache(10, 10s);
    EXPECT_FALSE(cache.Get("missing").has_value());
    EXPECT_EQ(1u, cache.GetStats().misses);
}

TEST(TtlCacheTest, PutOverwrites) {
    StringCache cache(10, 10s);
    cache.Put("a", 1);
    cache.Put("a", 2);

    EXPECT_EQ(2, *cache.Get("a"));
    EXPECT_EQ(1u, cache.Size());
}

TEST(TtlCacheTest, ZeroCapacityBecomesOne) {
    StringCache cache(0, 10s);
    EXPECT_EQ(1u, cache.Capacity());
}

TEST(TtlCacheTest, RemoveEntry) {
    StringCache cache(10, 10s);
    cache.Put("a", 1);

    EXPECT_TRUE(cache.Remove("a"));
    EXPECT_FALSE(cache.Remove("a"));
    EXPECT_FALSE(cache.Get("a").has_value());
}

// ============================================================================
// Expiration Tests
// ============================================================================

TEST(TtlCacheTest, EntryExpires) {
    StringCache cache(10, 30ms);
    cache.Put("a", 1);
    ASSERT_TRUE(cache.Get("a").has_value());

    std::this_thread::sleep_for(80ms);

    EXPECT_FALSE(cache.Get("a").has_value());
    EXPECT_EQ(0u, cache.Size());
    EXPECT_EQ(1u, cache.GetStats().expirations);
}

TEST(TtlCacheTest, PerEntryTtlOverridesDefault) {
    StringCache cache(10, 10s);
    cache.Put("short", 1, 30ms);
    cache.Put("long", 2);

    std::this_thread::sleep_for(80ms);

    EXPECT_FALSE(cache.Get("short").has_value());
    EXPECT_TRUE(cache.Get("long").has_value());
}

TEST(TtlCacheTest, NonPositiveTtlStoresNothing) {
    StringCache cache(10, 10s);
    cache.Put("a", 1);

    cache.Put("a", 2, StringCache::Duration::zero());
    EXPECT_FALSE(cache.Get("a").has_value());

    cache.Put("b", 3, -5s);
    EXPECT_FALSE(cache.Get("b").has_value());
    EXPECT_EQ(0u, cache.Size());
}

TEST(TtlCacheTest, ZeroDefaultTtlDisablesCaching) {
    StringCache cache(10, StringCache::Duration::zero());
    cache.Put("a", 1);
    EXPECT_FALSE(cache.Get("a").has_value());
}

TEST(TtlCacheTest, RefreshingResetsExpiry) {
    StringCache cache(10, 200ms);
    cache.Put("a", 1);
    std::this_thread::sleep_for(120ms);
    cache.Put("a", 2);
    std::this_thread::sleep_for(120ms);

    auto value = cache.Get("a");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(2, *value);
}

TEST(TtlCacheTest, ClearExpiredSweepsOnlyExpired) {
    StringCache cache(10, 10s);
    cache.Put("a", 1, 20ms);
    cache.Put("b", 2, 20ms);
    cache.Put("c", 3);

    std::this_thread::sleep_for(60ms);

    // Expired entries still count until swept
    EXPECT_EQ(3u, cache.Size());
    EXPECT_EQ(2u, cache.ClearExpired());
    EXPECT_EQ(1u, cache.Size());
    EXPECT_EQ(0u, cache.ClearExpired());
}

// ============================================================================
// Capacity Tests
// ============================================================================

TEST(TtlCacheTest, FullCacheEvictsSoonestExpiring) {
    StringCache cache(3, 10s);
    cache.Put("a", 1, 5s);
    cache.Put("b", 2, 1s);
    cache.Put("c", 3, 8s);

    cache.Put("d", 4);

    EXPECT_EQ(3u, cache.Size());
    EXPECT_FALSE(cache.Get("b").has_value());
    EXPECT_TRUE(cache.Get("a").has_value());
    EXPECT_TRUE(cache.Get("c").has_value());
    EXPECT_TRUE(cache.Get("d").has_value());
    EXPECT_EQ(1u, cache.GetStats().evictions);
}

TEST(TtlCacheTest, FullCachePrefersSweepingExpired) {
    StringCache cache(2, 10s);
    cache.Put("stale", 1, 20ms);
    cache.Put("fresh", 2);

    std::this_thread::sleep_for(60ms);
    cache.Put("new", 3);

    EXPECT_TRUE(cache.Get("fresh").has_value());
    EXPECT_TRUE(cache.Get("new").has_value());

    StringCache::Stats stats = cache.GetStats();
    EXPECT_EQ(0u, stats.evictions);
    EXPECT_EQ(1u, stats.expirations);
}

TEST(TtlCacheTest, OverwriteAtCapacityDoesNotEvict) {
    StringCache cache(2, 10s);
    cache.Put("a", 1);
    cache.Put("b", 2);
    cache.Put("a", 3);

    EXPECT_TRUE(cache.Get("b").has_value());
    EXPECT_EQ(3, *cache.Get("a"));
    EXPECT_EQ(0u, cache.GetStats().evictions);
}

// ============================================================================
// Statistics Tests
// ============================================================================

TEST(TtlCacheTest, StatsCountHitsAndMisses) {
    StringCache cache(10, 10s);
    cache.Put("a", 1);

    cache.Get("a");
    cache.Get("a");
    cache.Get("b");

    StringCache::Stats stats = cache.GetStats();
    EXPECT_EQ(2u, stats.hits);
    EXPECT_EQ(1u, stats.misses);
    EXPECT_EQ(1u, stats.size);
    EXPECT_EQ(10u, stats.capacity);
}

TEST(TtlCacheTest, ClearResetsEverything) {
    StringCache cache(10, 10s);
    cache.Put("a", 1);
    cache.Get("a");

    cache.Clear();

    EXPECT_EQ(0u, cache.Size());
    EXPECT_EQ(0u, cache.GetStats().hits);
}

// ============================================================================
// Concurrency Tests
// ============================================================================

TEST(TtlCacheTest, ConcurrentAccess) {
    TtlCache<int, int> cache(64, 10s);
    std::atomic<int> hits{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&cache, &hits, t]() {
            for (int i = 0; i < 1000; ++i) {
                int key = (t * 1000 + i) % 128;
                cache.Put(key, i);
                if (cache.Get(key).has_value()) {
                    hits++;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_LE(cache.Size(), 64u);
    EXPECT_GT(hits.load(), 0);
}

} // namespace
} // namespace apo
