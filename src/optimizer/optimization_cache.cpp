// File: src/optimizer/optimization_cache.cpp
#include "optimizer/optimization_cache.hpp"
#include "core/logging.hpp"
#include "geo/geo_distance.hpp"
#include <mutex>

namespace apo {

OptimizationCache::OptimizationCache()
    : OptimizationCache(Config()) {}

OptimizationCache::OptimizationCache(const Config& config)
    : config_(config) {
    if (config_.capacity == 0) {
        config_.capacity = 1;  // Minimum capacity
    }
    if (config_.invalidation_history == 0) {
        config_.invalidation_history = 1;
    }
}

std::optional<Recommendation> OptimizationCache::Lookup(const Coordinate& center,
                                                        double radius_km,
                                                        uint64_t min_samples) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    // Newest first
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->min_samples != min_samples || it->radius_km < radius_km) {
            continue;
        }
        if (HaversineDistanceKm(it->center, center) <= config_.epsilon_km) {
            hits_.fetch_add(1, std::memory_order_relaxed);
            return it->recommendation;
        }
    }

    misses_.fetch_add(1, std::memory_order_relaxed);
    return std::nullopt;
}

uint64_t OptimizationCache::Generation() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return generation_;
}

bool OptimizationCache::Insert(const Coordinate& center,
                               double radius_km,
                               uint64_t min_samples,
                               const Recommendation& recommendation,
                               uint64_t generation) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (IsStaleUnlocked(center, radius_km, generation)) {
        stale_inserts_.fetch_add(1, std::memory_order_relaxed);
        APO_LOG(LogLevel::DEBUG, LogComponent::CACHE,
                "Dropped stale recommendation for " << center.ToString());
        return false;
    }

    // Replace an entry for the same query
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (it->center == center && it->radius_km == radius_km &&
            it->min_samples == min_samples) {
            entries_.erase(it);
            break;
        }
    }

    if (entries_.size() >= config_.capacity) {
        entries_.pop_front();
        evictions_.fetch_add(1, std::memory_order_relaxed);
    }

    entries_.push_back(Entry{center, radius_km, min_samples, recommendation});
    return true;
}

size_t OptimizationCache::InvalidateCovering(const Coordinate& location) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    RecordInvalidationUnlocked(location, false);

    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (HaversineDistanceKm(it->center, location) <= it->radius_km) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    invalidations_.fetch_add(removed, std::memory_order_relaxed);
    return removed;
}

void OptimizationCache::Clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    RecordInvalidationUnlocked(Coordinate(), true);
    invalidations_.fetch_add(entries_.size(), std::memory_order_relaxed);
    entries_.clear();
}

size_t OptimizationCache::Size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

OptimizationCache::Stats OptimizationCache::GetStats() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    Stats stats;
    stats.size = entries_.size();
    stats.capacity = config_.capacity;
    stats.hits = hits_.load(std::memory_order_relaxed);
    stats.misses = misses_.load(std::memory_order_relaxed);
    stats.invalidations = invalidations_.load(std::memory_order_relaxed);
    stats.evictions = evictions_.load(std::memory_order_relaxed);
    stats.stale_inserts = stale_inserts_.load(std::memory_order_relaxed);
    return stats;
}

// ============================================================================
// Generation tracking
// ============================================================================

void OptimizationCache::RecordInvalidationUnlocked(const Coordinate& location, bool everything) {
    ++generation_;
    history_.push_back(Invalidation{generation_, location, everything});
    while (history_.size() > config_.invalidation_history) {
        history_.pop_front();
    }
}

bool OptimizationCache::IsStaleUnlocked(const Coordinate& center,
                                        double radius_km,
                                        uint64_t generation) const {
    if (generation >= generation_) {
        return false;
    }

    // Part of the window has been forgotten; assume the worst
    if (history_.empty() || history_.front().generation > generation + 1) {
        return true;
    }

    for (const auto& invalidation : history_) {
        if (invalidation.generation <= generation) {
            continue;
        }
        if (invalidation.everything ||
            HaversineDistanceKm(center, invalidation.location) <= radius_km) {
            return true;
        }
    }
    return false;
}

} // namespace apo
