// File: src/cache/prediction_cache.hpp
#pragma once

#include "cache/ttl_cache.hpp"
#include "core/types.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace apo {

/// Identity of a cached prediction payload
///
/// issued_at is reduced to a time bucket so that predictions issued close
/// together share an entry.
struct PredictionCacheKey {
    Coordinate location;
    int64_t time_bucket{0};
    std::string model_version;

    bool operator==(const PredictionCacheKey& other) const {
        return location == other.location &&
               time_bucket == other.time_bucket &&
               model_version == other.model_version;
    }
    bool operator!=(const PredictionCacheKey& other) const { return !(*this == other); }

    std::string ToString() const;

    struct Hash {
        size_t operator()(const PredictionCacheKey& key) const;
    };
};

/// TTL cache of prediction payloads
///
/// Entries expire purely by TTL; nothing else invalidates them.
class PredictionCache {
    using CacheType = TtlCache<PredictionCacheKey, Payload, PredictionCacheKey::Hash>;

public:
    using Duration = CacheType::Duration;
    using Stats = CacheType::Stats;

    struct Config {
        /// Maximum number of cached payloads
        size_t capacity{100000};

        /// TTL applied by Put(key, payload)
        std::chrono::milliseconds default_ttl{std::chrono::seconds(300)};

        /// Width of the issued_at buckets used by MakeKey(record)
        std::chrono::milliseconds time_bucket{std::chrono::hours(1)};
    };

    explicit PredictionCache(const Config& config);

    /// Build a key from its parts
    /// @param bucket_width Non-positive widths disable bucketing (the bucket
    ///        is the exact issued_at in microseconds)
    static PredictionCacheKey MakeKey(const Coordinate& location,
                                      const Timestamp& issued_at,
                                      std::chrono::microseconds bucket_width,
                                      const std::string& model_version);

    /// Build a key for a prediction record with the configured bucket width
    PredictionCacheKey MakeKey(const PredictionRecord& record) const;

    /// Live payload for key; an expired entry is removed and reported absent
    std::optional<Payload> Get(const PredictionCacheKey& key);

    /// Store with the configured default TTL
    void Put(const PredictionCacheKey& key, const Payload& payload);

    /// Store with an explicit TTL; a non-positive TTL stores nothing
    void Put(const PredictionCacheKey& key, const Payload& payload, Duration ttl);

    /// Remove every expired entry
    /// @return Number of entries removed
    size_t ClearExpired();

    bool Remove(const PredictionCacheKey& key);
    void Clear();
    size_t Size() const;

    Stats GetStats() const;

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    CacheType cache_;
};

} // namespace apo
