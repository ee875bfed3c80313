// File: tests/optimizer/optimization_cache_test.cpp
#include "optimizer/optimization_cache.hpp"
#include <gtest/gtest.h>

namespace apo {
namespace {

const Coordinate kBerlin(52.5200, 13.4050);
const Coordinate kMunich(48.1351, 11.5820);

Recommendation MakeRecommendation(const ModelID& model, double confidence = 0.9) {
    Recommendation rec;
    rec.model_id = model;
    rec.confidence = confidence;
    rec.source = RecommendationSource::kLearned;
    rec.total_samples = 20;
    rec.pattern_count = 2;
    rec.low_confidence = false;
    rec.computed_at = Timestamp::FromMicros(42);
    return rec;
}

// ============================================================================
// Lookup Tests
// ============================================================================

TEST(OptimizationCacheTest, EmptyCacheMisses) {
    OptimizationCache cache;
    EXPECT_FALSE(cache.Lookup(kBerlin, 10.0, 1).has_value());
    EXPECT_EQ(1u, cache.GetStats().misses);
}

TEST(OptimizationCacheTest, InsertThenLookup) {
    OptimizationCache cache;
    ASSERT_TRUE(cache.Insert(kBerlin, 10.0, 1, MakeRecommendation("lstm"), cache.Generation()));

    auto hit = cache.Lookup(kBerlin, 10.0, 1);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(MakeRecommendation("lstm"), *hit);
    EXPECT_EQ(1u, cache.GetStats().hits);
}

TEST(OptimizationCacheTest, NearbyCenterWithinEpsilonHits) {
    OptimizationCache::Config config;
    config.epsilon_km = 0.5;
    OptimizationCache cache(config);
    cache.Insert(kBerlin, 10.0, 1, MakeRecommendation("lstm"), cache.Generation());

    // ~0.2 km north
    EXPECT_TRUE(cache.Lookup(Coordinate(52.5218, 13.4050), 10.0, 1).has_value());
    // ~1.1 km north
    EXPECT_FALSE(cache.Lookup(Coordinate(52.5300, 13.4050), 10.0, 1).has_value());
}

TEST(OptimizationCacheTest, LargerCachedRadiusAnswersSmallerQuery) {
    OptimizationCache cache;
    cache.Insert(kBerlin, 10.0, 1, MakeRecommendation("lstm"), cache.Generation());

    EXPECT_TRUE(cache.Lookup(kBerlin, 5.0, 1).has_value());
    EXPECT_FALSE(cache.Lookup(kBerlin, 20.0, 1).has_value());
}

TEST(OptimizationCacheTest, MinSamplesMustMatch) {
    OptimizationCache cache;
    cache.Insert(kBerlin, 10.0, 1, MakeRecommendation("lstm"), cache.Generation());

    EXPECT_FALSE(cache.Lookup(kBerlin, 10.0, 5).has_value());
}

TEST(OptimizationCacheTest, NewestEntryWins) {
    OptimizationCache cache;
    cache.Insert(kBerlin, 20.0, 1, MakeRecommendation("old"), cache.Generation());
    cache.Insert(kBerlin, 15.0, 1, MakeRecommendation("new"), cache.Generation());

    EXPECT_EQ("new", cache.Lookup(kBerlin, 10.0, 1)->model_id);
}

TEST(OptimizationCacheTest, SameQueryReplacesEntry) {
    OptimizationCache cache;
    cache.Insert(kBerlin, 10.0, 1, MakeRecommendation("a"), cache.Generation());
    cache.Insert(kBerlin, 10.0, 1, MakeRecommendation("b"), cache.Generation());

    EXPECT_EQ(1u, cache.Size());
    EXPECT_EQ("b", cache.Lookup(kBerlin, 10.0, 1)->model_id);
}

TEST(OptimizationCacheTest, FullCacheEvictsOldest) {
    OptimizationCache::Config config;
    config.capacity = 2;
    OptimizationCache cache(config);

    cache.Insert(Coordinate(0.0, 0.0), 1.0, 1, MakeRecommendation("a"), cache.Generation());
    cache.Insert(Coordinate(10.0, 0.0), 1.0, 1, MakeRecommendation("b"), cache.Generation());
    cache.Insert(Coordinate(20.0, 0.0), 1.0, 1, MakeRecommendation("c"), cache.Generation());

    EXPECT_EQ(2u, cache.Size());
    EXPECT_FALSE(cache.Lookup(Coordinate(0.0, 0.0), 1.0, 1).has_value());
    EXPECT_TRUE(cache.Lookup(Coordinate(20.0, 0.0), 1.0, 1).has_value());
    EXPECT_EQ(1u, cache.GetStats().evictions);
}

// ============================================================================
// Invalidation Tests
// ============================================================================

TEST(OptimizationCacheTest, InvalidateCoveringRemovesOnlyCoveringEntries) {
    OptimizationCache cache;
    cache.Insert(kBerlin, 10.0, 1, MakeRecommendation("berlin"), cache.Generation());
    cache.Insert(kMunich, 10.0, 1, MakeRecommendation("munich"), cache.Generation());

    EXPECT_EQ(1u, cache.InvalidateCovering(Coordinate(52.55, 13.40)));

    EXPECT_FALSE(cache.Lookup(kBerlin, 10.0, 1).has_value());
    EXPECT_TRUE(cache.Lookup(kMunich, 10.0, 1).has_value());
    EXPECT_EQ(1u, cache.GetStats().invalidations);
}

TEST(OptimizationCacheTest, InvalidationBumpsGeneration) {
    OptimizationCache cache;
    uint64_t before = cache.Generation();

    cache.InvalidateCovering(kBerlin);

    EXPECT_GT(cache.Generation(), before);
}

TEST(OptimizationCacheTest, StaleInsertIsDropped) {
    OptimizationCache cache;
    uint64_t observed = cache.Generation();

    // An update lands near Berlin while the recommendation is computed
    cache.InvalidateCovering(Coordinate(52.51, 13.40));

    EXPECT_FALSE(cache.Insert(kBerlin, 10.0, 1, MakeRecommendation("lstm"), observed));
    EXPECT_FALSE(cache.Lookup(kBerlin, 10.0, 1).has_value());
    EXPECT_EQ(1u, cache.GetStats().stale_inserts);
}

TEST(OptimizationCacheTest, UnrelatedInvalidationDoesNotBlockInsert) {
    OptimizationCache cache;
    uint64_t observed = cache.Generation();

    cache.InvalidateCovering(kMunich);

    EXPECT_TRUE(cache.Insert(kBerlin, 10.0, 1, MakeRecommendation("lstm"), observed));
}

TEST(OptimizationCacheTest, ForgottenHistoryIsTreatedAsStale) {
    OptimizationCache::Config config;
    config.invalidation_history = 2;
    OptimizationCache cache(config);
    uint64_t observed = cache.Generation();

    for (int i = 0; i < 5; ++i) {
        cache.InvalidateCovering(kMunich);
    }

    EXPECT_FALSE(cache.Insert(kBerlin, 10.0, 1, MakeRecommendation("lstm"), observed));
}

TEST(OptimizationCacheTest, ClearDropsEverythingAndBlocksOlderInserts) {
    OptimizationCache cache;
    cache.Insert(kBerlin, 10.0, 1, MakeRecommendation("a"), cache.Generation());
    cache.Insert(kMunich, 10.0, 1, MakeRecommendation("b"), cache.Generation());
    uint64_t observed = cache.Generation();

    cache.Clear();

    EXPECT_EQ(0u, cache.Size());
    EXPECT_EQ(2u, cache.GetStats().invalidations);
    EXPECT_FALSE(cache.Insert(kBerlin, 10.0, 1, MakeRecommendation("a"), observed));
    EXPECT_TRUE(cache.Insert(kBerlin, 10.0, 1, MakeRecommendation("a"), cache.Generation()));
}

} // namespace
} // namespace apo
