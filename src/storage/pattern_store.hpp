// File: src/storage/pattern_store.hpp
#pragma once

#include "core/pattern.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace apo {

struct StorageConfig;

/// Storage statistics for monitoring
struct StoreStats {
    /// Total number of patterns stored
    size_t total_patterns{0};

    /// Estimated memory usage in bytes (in-memory backends)
    size_t memory_usage_bytes{0};

    /// Disk usage in bytes (persistent backends)
    size_t disk_usage_bytes{0};

    /// Read operations served (Get, QueryRadius, FindAll)
    uint64_t total_reads{0};

    /// Write operations applied (Upsert, Update, Remove)
    uint64_t total_writes{0};

    /// Records skipped because they failed validation on read
    uint64_t corrupt_records{0};
};

/// Query options for store reads
struct QueryOptions {
    /// Maximum number of results to return; radius queries keep the nearest
    size_t max_results{10000};

    /// Whether returned patterns have last_used_at refreshed
    bool touch{true};
};

/// Abstract interface for pattern persistence backends
///
/// Patterns are keyed by (location, model_id) with exact coordinate
/// comparison. Every write stamps last_used_at with the current time.
///
/// Thread Safety: All methods must be thread-safe. Writes to one key are
/// serialized; Update() is an atomic read-modify-write of a single key.
///
/// Errors: StorageError{kUnavailable} when the backend cannot be reached.
/// Records failing validation on read are skipped with a logged warning and
/// counted in StoreStats::corrupt_records.
class PatternStore {
public:
    /// Receives the current pattern for a key (if any) and returns the
    /// replacement. Called with the key locked; must not call back into the
    /// store.
    using Mutator = std::function<Pattern(const std::optional<Pattern>& current)>;

    virtual ~PatternStore() = default;

    // ========================================================================
    // Core Operations
    // ========================================================================

    /// Insert or replace a pattern
    ///
    /// An existing pattern is replaced wholesale; a new one is inserted with
    /// its supplied sample_count (raised to 1 if zero).
    /// @throws InvalidCoordinateError on an out-of-range location
    /// @throws std::invalid_argument on an invalid pattern, or a replacement
    ///         whose sample_count is below the stored one
    /// @throws StorageError{kUnavailable} if the backend is unreachable
    virtual void Upsert(const Pattern& pattern) = 0;

    /// Atomically read, transform and write back a single pattern
    /// @return The pattern as stored
    virtual Pattern Update(const Coordinate& location,
                           const ModelID& model_id,
                           const Mutator& mutator) = 0;

    /// Exact lookup by (location, model_id)
    virtual std::optional<Pattern> Get(const Coordinate& location,
                                       const ModelID& model_id) = 0;

    /// Remove a pattern
    /// @return true if a pattern was removed
    virtual bool Remove(const Coordinate& location, const ModelID& model_id) = 0;

    // ========================================================================
    // Query Operations
    // ========================================================================

    /// All patterns within radius_km of center, nearest first
    /// @throws InvalidCoordinateError on an out-of-range center
    /// @throws std::invalid_argument on a negative or non-finite radius
    virtual std::vector<Pattern> QueryRadius(const Coordinate& center,
                                             double radius_km,
                                             const QueryOptions& options = {}) = 0;

    /// All stored patterns, without side effects on last_used_at
    virtual std::vector<Pattern> FindAll(const QueryOptions& options = {}) = 0;

    // ========================================================================
    // Statistics and Maintenance
    // ========================================================================

    virtual size_t Count() const = 0;
    virtual StoreStats GetStats() const = 0;

    /// Flush pending writes to durable storage (no-op in memory)
    virtual void Flush() = 0;

    /// Remove every pattern
    virtual void Clear() = 0;

    /// Write a snapshot of all patterns to path
    /// @return true on success
    virtual bool CreateSnapshot(const std::string& path) = 0;

    /// Replace the store contents with a snapshot
    /// @return true on success
    virtual bool RestoreSnapshot(const std::string& path) = 0;

protected:
    /// Common argument checks for Upsert/Update results
    static void ValidateForWrite(const Pattern& pattern);

    /// Common radius check for QueryRadius
    static void ValidateRadius(double radius_km);
};

/// Create a pattern store from configuration
///
/// storage.backend selects "memory" (grid-sharded hash map) or "sqlite".
/// @throws std::invalid_argument for an unknown backend name
/// @throws StorageError{kUnavailable} if the SQLite file cannot be opened
std::unique_ptr<PatternStore> CreatePatternStore(const StorageConfig& config);

} // namespace apo
