// File: src/storage/sqlite_pattern_store.hpp
#pragma once

#include "storage/pattern_store.hpp"
#include <atomic>
#include <mutex>
#include <string>
#include <vector>
#include <sqlite3.h>

namespace apo {

/// Persistent pattern store using SQLite
///
/// Features:
/// - Durable writes with WAL (Write-Ahead Logging)
/// - (latitude, longitude, model_id) primary key, exact REAL comparison
/// - Latitude/longitude index used as a bounding-box prefilter for radius
///   queries; the exact haversine test runs in C++
/// - Per-row validation on read; corrupt rows are skipped and counted
/// - Snapshot/restore through the SQLite backup API
///
/// Two connections share the file. Writes go through the writer connection,
/// one at a time, and Update() runs inside an IMMEDIATE transaction. Reads
/// (Get, QueryRadius, FindAll, Count) use a separate reader connection, so
/// under WAL they see the last committed state and never wait for a write in
/// progress. last_used_at refreshes from reads are applied immediately when
/// the writer is idle, otherwise queued and applied by the next write or
/// Flush(). In-memory databases cannot be shared between connections and
/// fall back to the writer for reads.
///
/// A file that is not a SQLite database surfaces as StorageError{kCorrupt};
/// any other SQLite failure as StorageError{kUnavailable}.
class SqlitePatternStore : public PatternStore {
public:
    /// Configuration for SqlitePatternStore
    struct Config {
        /// Path to the SQLite database file
        std::string db_path;

        /// Enable Write-Ahead Logging for better concurrency
        bool enable_wal{true};

        /// Cache size in KB (default: 10MB)
        size_t cache_size_kb{10240};

        /// Page size in bytes (default: 4KB)
        size_t page_size{4096};

        /// Synchronous mode: FULL, NORMAL, or OFF
        std::string synchronous{"NORMAL"};

        /// How long to wait on a locked database before giving up
        int busy_timeout_ms{5000};
    };

    /// Open (or create) the database and its schema
    /// @throws StorageError{kUnavailable} if the database cannot be opened
    /// @throws StorageError{kCorrupt} if the file is not a SQLite database
    explicit SqlitePatternStore(const Config& config);

    /// Closes the database connection
    ~SqlitePatternStore() override;

    // Prevent copying (SQLite connection is not copyable)
    SqlitePatternStore(const SqlitePatternStore&) = delete;
    SqlitePatternStore& operator=(const SqlitePatternStore&) = delete;

    // ========================================================================
    // PatternStore Interface Implementation
    // ========================================================================

    void Upsert(const Pattern& pattern) override;
    Pattern Update(const Coordinate& location,
                   const ModelID& model_id,
                   const Mutator& mutator) override;
    std::optional<Pattern> Get(const Coordinate& location,
                               const ModelID& model_id) override;
    bool Remove(const Coordinate& location, const ModelID& model_id) override;

    std::vector<Pattern> QueryRadius(const Coordinate& center,
                                     double radius_km,
                                     const QueryOptions& options = {}) override;
    std::vector<Pattern> FindAll(const QueryOptions& options = {}) override;

    size_t Count() const override;
    StoreStats GetStats() const override;

    void Flush() override;
    void Clear() override;

    bool CreateSnapshot(const std::string& path) override;
    bool RestoreSnapshot(const std::string& path) override;

    const Config& GetConfig() const { return config_; }

private:
    // Configuration
    Config config_;

    // Writer connection; every modification goes through it
    sqlite3* db_{nullptr};

    // Reader connection; nullptr for in-memory databases
    sqlite3* read_db_{nullptr};

    // One writer at a time
    mutable std::mutex write_mutex_;

    // One statement at a time on the reader connection
    mutable std::mutex read_mutex_;

    /// last_used_at refresh waiting for the writer
    struct PendingTouch {
        PatternKey key;
        int64_t used_at_us;
    };

    mutable std::mutex pending_mutex_;
    std::vector<PendingTouch> pending_touches_;

    // Statistics
    mutable std::atomic<uint64_t> total_reads_{0};
    std::atomic<uint64_t> total_writes_{0};
    mutable std::atomic<uint64_t> corrupt_records_{0};

    // ========================================================================
    // Helper Methods
    // ========================================================================

    /// Apply pragmas and create the schema
    void InitializeDatabase();

    /// Create tables and indices
    void CreateTables();

    /// Execute a SQL statement
    /// @throws StorageError{kUnavailable} on failure
    void ExecuteSQL(const std::string& sql);

    /// Execute a SQL statement, reporting failure instead of throwing
    bool TryExecuteSQL(const std::string& sql);

    /// Open the reader connection (file-backed databases only)
    void OpenReader();

    /// Run fn on the reader connection, or on the writer when there is none
    template <typename Fn>
    auto WithReader(Fn&& fn) const;

    /// Count rows on a connection whose lock is held
    size_t CountUnlocked(sqlite3* db) const;

    /// Read one row (rowid, latitude, longitude, model_id, confidence,
    /// sample_count, last_used_at) into a pattern
    /// @return std::nullopt (and a logged warning) if the row is corrupt
    std::optional<Pattern> DecodeRow(sqlite3_stmt* stmt) const;

    /// Write a pattern with INSERT OR REPLACE; mutex must be held
    void WriteUnlocked(const Pattern& pattern);

    /// Refresh last_used_at of a key unless it is already newer; write lock held
    void TouchUnlocked(const PatternKey& key, int64_t used_at_us);

    /// Record that patterns were read at used_at; applied now if the writer
    /// is idle, queued otherwise
    void Touch(const std::vector<PatternKey>& keys, Timestamp used_at);

    /// Apply queued touches; write lock held and a transaction open
    void ApplyPendingTouchesUnlocked();

    /// Get database file size in bytes
    size_t GetDatabaseSize() const;
};

} // namespace apo
