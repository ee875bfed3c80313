// File: src/cache/ttl_cache.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>

namespace apo {

/// Time-to-live cache
///
/// Every entry carries its own expiration time. Expired entries are
/// invisible to Get() and are removed lazily when Get() finds them, or in
/// bulk by ClearExpired(). When the cache is full, expired entries are swept
/// first and then the entry that expires soonest is evicted.
///
/// Thread-safe: lookups take a shared lock; mutations and lazy eviction take
/// the exclusive lock.
///
/// @tparam Key Key type (must be hashable with Hash)
/// @tparam Value Value type (must be copyable)
template<typename Key, typename Value, typename Hash = std::hash<Key>>
class TtlCache {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = Clock::duration;

    /// @param capacity Maximum number of entries (minimum 1)
    /// @param default_ttl TTL used by Put(key, value)
    TtlCache(size_t capacity, Duration default_ttl)
        : capacity_(capacity == 0 ? 1 : capacity),
          default_ttl_(default_ttl) {}

    TtlCache(const TtlCache&) = delete;
    TtlCache& operator=(const TtlCache&) = delete;

    /// Get a live value
    /// @return Value if present and not expired, std::nullopt otherwise
    std::optional<Value> Get(const Key& key) {
        TimePoint now = Clock::now();
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = entries_.find(key);
            if (it == entries_.end()) {
                misses_.fetch_add(1, std::memory_order_relaxed);
                return std::nullopt;
            }
            if (it->second.expires_at > now) {
                hits_.fetch_add(1, std::memory_order_relaxed);
                return it->second.value;
            }
        }

        // Expired: upgrade and remove, unless a writer refreshed it meanwhile
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            if (it->second.expires_at > now) {
                hits_.fetch_add(1, std::memory_order_relaxed);
                return it->second.value;
            }
            EraseUnlocked(it);
            expirations_.fetch_add(1, std::memory_order_relaxed);
        }
        misses_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }

    /// Store a value with the default TTL
    void Put(const Key& key, const Value& value) {
        Put(key, value, default_ttl_);
    }

    /// Store a value that expires ttl from now
    ///
    /// A non-positive ttl stores nothing and drops any previous entry for
    /// the key.
    void Put(const Key& key, const Value& value, Duration ttl) {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        auto existing = entries_.find(key);
        if (existing != entries_.end()) {
            EraseUnlocked(existing);
        }

        if (ttl <= Duration::zero()) {
            return;
        }

        TimePoint now = Clock::now();
        if (entries_.size() >= capacity_) {
            ClearExpiredUnlocked(now);
        }
        if (entries_.size() >= capacity_) {
            // Evict the entry closest to expiring
            auto victim = entries_.find(expiry_index_.begin()->second);
            EraseUnlocked(victim);
            evictions_.fetch_add(1, std::memory_order_relaxed);
        }

        TimePoint expires_at = now + ttl;
        auto index_it = expiry_index_.emplace(expires_at, key);
        entries_.emplace(key, Entry{value, expires_at, index_it});
    }

    /// Remove an entry
    /// @return true if an entry (live or expired) was removed
    bool Remove(const Key& key) {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return false;
        }
        EraseUnlocked(it);
        return true;
    }

    /// Remove every expired entry
    /// @return Number of entries removed
    size_t ClearExpired() {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return ClearExpiredUnlocked(Clock::now());
    }

    /// Remove all entries and reset statistics
    void Clear() {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        entries_.clear();
        expiry_index_.clear();

        hits_.store(0, std::memory_order_relaxed);
        misses_.store(0, std::memory_order_relaxed);
        evictions_.store(0, std::memory_order_relaxed);
        expirations_.store(0, std::memory_order_relaxed);
    }

    /// Number of stored entries, including expired ones not yet swept
    size_t Size() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return entries_.size();
    }

    size_t Capacity() const { return capacity_; }

    Duration DefaultTtl() const { return default_ttl_; }

    /// Statistics structure
    struct Stats {
        size_t size{0};
        size_t capacity{0};
        uint64_t hits{0};
        uint64_t misses{0};
        uint64_t evictions{0};    // Removed to make room
        uint64_t expirations{0};  // Removed because their TTL ran out
    };

    Stats GetStats() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);

        Stats stats;
        stats.size = entries_.size();
        stats.capacity = capacity_;
        stats.hits = hits_.load(std::memory_order_relaxed);
        stats.misses = misses_.load(std::memory_order_relaxed);
        stats.evictions = evictions_.load(std::memory_order_relaxed);
        stats.expirations = expirations_.load(std::memory_order_relaxed);
        return stats;
    }

private:
    /// Expiration time -> key, ordered soonest first
    using ExpiryIndex = std::multimap<TimePoint, Key>;

    struct Entry {
        Value value;
        TimePoint expires_at;
        typename ExpiryIndex::iterator expiry_it;
    };

    using EntryMap = std::unordered_map<Key, Entry, Hash>;

    void EraseUnlocked(typename EntryMap::iterator it) {
        expiry_index_.erase(it->second.expiry_it);
        entries_.erase(it);
    }

    size_t ClearExpiredUnlocked(TimePoint now) {
        size_t removed = 0;
        auto it = expiry_index_.begin();
        while (it != expiry_index_.end() && it->first <= now) {
            entries_.erase(it->second);
            it = expiry_index_.erase(it);
            ++removed;
        }
        expirations_.fetch_add(removed, std::memory_order_relaxed);
        return removed;
    }

    size_t capacity_;
    Duration default_ttl_;

    EntryMap entries_;
    ExpiryIndex expiry_index_;

    mutable std::shared_mutex mutex_;

    // Statistics
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> evictions_{0};
    std::atomic<uint64_t> expirations_{0};
};

} // namespace apo
