// File: src/optimizer/optimization_cache.hpp
#pragma once

#include "optimizer/recommendation.hpp"
#include <atomic>
#include <cstdint>
#include <deque>
#include <list>
#include <optional>
#include <shared_mutex>

namespace apo {

/// Cache of learned recommendations keyed by query circle
///
/// An entry answers a later query whose center lies within epsilon_km of
/// the entry's center, whose radius is not larger than the entry's, and
/// whose min_samples is the same.
///
/// InvalidateCovering(location) removes every entry whose circle contains
/// location. Each invalidation bumps a generation counter; Insert() takes
/// the generation observed before the recommendation was computed and drops
/// the insert if an invalidation since then covers the new entry, so a
/// result computed from pre-update patterns is never cached after the
/// update's invalidation ran.
///
/// When full, the oldest entry is evicted. Reader-writer locked.
class OptimizationCache {
public:
    struct Config {
        Config() = default;

        /// Maximum number of entries (minimum 1)
        size_t capacity{4096};

        /// Center match tolerance in km
        double epsilon_km{0.1};

        /// Invalidations remembered for stale-insert checks
        size_t invalidation_history{1024};
    };

    struct Stats {
        size_t size{0};
        size_t capacity{0};
        uint64_t hits{0};
        uint64_t misses{0};
        uint64_t invalidations{0};    // Entries removed by InvalidateCovering
        uint64_t evictions{0};        // Entries removed to make room
        uint64_t stale_inserts{0};    // Inserts dropped by the generation check
    };

    OptimizationCache();
    explicit OptimizationCache(const Config& config);

    OptimizationCache(const OptimizationCache&) = delete;
    OptimizationCache& operator=(const OptimizationCache&) = delete;

    /// Find an entry that answers the query
    std::optional<Recommendation> Lookup(const Coordinate& center,
                                         double radius_km,
                                         uint64_t min_samples);

    /// Current invalidation generation; read before computing a result
    uint64_t Generation() const;

    /// Cache a recommendation computed after observing generation
    /// @return false if the insert was dropped as stale
    bool Insert(const Coordinate& center,
                double radius_km,
                uint64_t min_samples,
                const Recommendation& recommendation,
                uint64_t generation);

    /// Remove every entry whose query circle contains location
    /// @return Number of entries removed
    size_t InvalidateCovering(const Coordinate& location);

    /// Remove all entries and bump the generation
    void Clear();

    size_t Size() const;
    Stats GetStats() const;

    const Config& GetConfig() const { return config_; }

private:
    struct Entry {
        Coordinate center;
        double radius_km;
        uint64_t min_samples;
        Recommendation recommendation;
    };

    struct Invalidation {
        uint64_t generation;
        Coordinate location;
        bool everything;  // Clear()
    };

    /// True if an invalidation newer than generation touches the circle;
    /// lock must be held
    bool IsStaleUnlocked(const Coordinate& center, double radius_km, uint64_t generation) const;

    void RecordInvalidationUnlocked(const Coordinate& location, bool everything);

    Config config_;

    /// Oldest first
    std::list<Entry> entries_;
    std::deque<Invalidation> history_;
    uint64_t generation_{0};

    mutable std::shared_mutex mutex_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> invalidations_{0};
    std::atomic<uint64_t> evictions_{0};
    std::atomic<uint64_t> stale_inserts_{0};
};

} // namespace apo
