// File: src/cache/prediction_cache.cpp
#include "cache/prediction_cache.hpp"
#include <sstream>

namespace apo {

std::string PredictionCacheKey::ToString() const {
    std::ostringstream oss;
    oss << "PredictionCacheKey{" << location.ToString()
        << ", bucket=" << time_bucket
        << ", version=" << model_version << "}";
    return oss.str();
}

size_t PredictionCacheKey::Hash::operator()(const PredictionCacheKey& key) const {
    size_t h = Coordinate::Hash()(key.location);
    h ^= std::hash<int64_t>()(key.time_bucket) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    h ^= std::hash<std::string>()(key.model_version) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    return h;
}

PredictionCache::PredictionCache(const Config& config)
    : config_(config),
      cache_(config.capacity, config.default_ttl) {}

PredictionCacheKey PredictionCache::MakeKey(const Coordinate& location,
                                            const Timestamp& issued_at,
                                            std::chrono::microseconds bucket_width,
                                            const std::string& model_version) {
    PredictionCacheKey key;
    key.location = location;
    key.model_version = model_version;

    int64_t micros = issued_at.ToMicros();
    int64_t width = bucket_width.count();
    if (width <= 0) {
        key.time_bucket = micros;
    } else {
        // Floor division so pre-epoch times bucket consistently
        int64_t bucket = micros / width;
        if (micros % width < 0) {
            --bucket;
        }
        key.time_bucket = bucket;
    }
    return key;
}

PredictionCacheKey PredictionCache::MakeKey(const PredictionRecord& record) const {
    return MakeKey(record.location, record.issued_at,
                   std::chrono::duration_cast<std::chrono::microseconds>(config_.time_bucket),
                   record.model_version);
}

std::optional<Payload> PredictionCache::Get(const PredictionCacheKey& key) {
    return cache_.Get(key);
}

void PredictionCache::Put(const PredictionCacheKey& key, const Payload& payload) {
    cache_.Put(key, payload);
}

void PredictionCache::Put(const PredictionCacheKey& key, const Payload& payload, Duration ttl) {
    cache_.Put(key, payload, ttl);
}

size_t PredictionCache::ClearExpired() {
    return cache_.ClearExpired();
}

bool PredictionCache::Remove(const PredictionCacheKey& key) {
    return cache_.Remove(key);
}

void PredictionCache::Clear() {
    cache_.Clear();
}

size_t PredictionCache::Size() const {
    return cache_.Size();
}

PredictionCache::Stats PredictionCache::GetStats() const {
    return cache_.GetStats();
}

} // namespace apo
