// File: src/storage/sqlite_pattern_store.cpp
#include "storage/sqlite_pattern_store.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include "geo/geo_distance.hpp"
#include <algorithm>
#include <sys/stat.h>

namespace apo {

namespace {

// Column layout shared by every SELECT that feeds DecodeRow()
constexpr const char* kSelectColumns =
    "SELECT rowid, latitude, longitude, model_id, confidence, sample_count, last_used_at "
    "FROM patterns";

// A damaged or foreign file is corrupt; every other failure is unavailability
StorageError::Kind KindForCode(int rc) {
    int primary = rc & 0xff;
    if (primary == SQLITE_CORRUPT || primary == SQLITE_NOTADB) {
        return StorageError::Kind::kCorrupt;
    }
    return StorageError::Kind::kUnavailable;
}

bool IsInMemoryPath(const std::string& path) {
    return path.empty() || path == ":memory:" ||
           path.find("mode=memory") != std::string::npos;
}

/// Owns a prepared statement; finalizes it on scope exit
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db) {
        int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr);
        if (rc != SQLITE_OK) {
            std::string error = sqlite3_errmsg(db);
            sqlite3_finalize(stmt_);
            throw StorageError(KindForCode(rc), "prepare failed (" + error + "): " + sql);
        }
    }

    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    sqlite3_stmt* get() const { return stmt_; }

    /// Step once; SQLITE_ROW or SQLITE_DONE, anything else throws
    int Step() {
        int rc = sqlite3_step(stmt_);
        if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
            throw StorageError(KindForCode(rc),
                               std::string("step failed: ") + sqlite3_errmsg(db_));
        }
        return rc;
    }

    void Reset() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_{nullptr};
};

/// Rolls back unless Commit() was reached
class Transaction {
public:
    Transaction(sqlite3* db, const char* begin_sql) : db_(db) {
        Exec(begin_sql);
    }

    ~Transaction() {
        if (!committed_) {
            // Nothing useful to do if rollback fails during unwinding
            sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void Commit() {
        Exec("COMMIT;");
        committed_ = true;
    }

private:
    void Exec(const char* sql) {
        char* error_msg = nullptr;
        int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &error_msg);
        if (rc != SQLITE_OK) {
            std::string error = error_msg ? error_msg : sqlite3_errmsg(db_);
            sqlite3_free(error_msg);
            throw StorageError(KindForCode(rc), std::string(sql) + " failed: " + error);
        }
    }

    sqlite3* db_;
    bool committed_{false};
};

bool IsNumericColumn(sqlite3_stmt* stmt, int column) {
    int type = sqlite3_column_type(stmt, column);
    return type == SQLITE_FLOAT || type == SQLITE_INTEGER;
}

} // namespace

// ============================================================================
// Constructor and Destructor
// ============================================================================

SqlitePatternStore::SqlitePatternStore(const Config& config)
    : config_(config) {

    int rc = sqlite3_open(config_.db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError(StorageError::Kind::kUnavailable,
                           "Failed to open database " + config_.db_path + ": " + error);
    }

    try {
        InitializeDatabase();
        OpenReader();
    } catch (const StorageError&) {
        sqlite3_close(read_db_);
        read_db_ = nullptr;
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqlitePatternStore::~SqlitePatternStore() {
    bool has_pending = false;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        has_pending = !pending_touches_.empty();
    }
    if (db_ && has_pending) {
        try {
            std::lock_guard<std::mutex> lock(write_mutex_);
            Transaction txn(db_, "BEGIN IMMEDIATE;");
            ApplyPendingTouchesUnlocked();
            txn.Commit();
        } catch (const StorageError& e) {
            APO_LOG(LogLevel::WARN, LogComponent::STORAGE,
                    "Dropping queued last_used_at updates for " << config_.db_path
                    << ": " << e.what());
        }
    }

    // close_v2 defers the close until outstanding statements finish
    if (read_db_) {
        sqlite3_close_v2(read_db_);
        read_db_ = nullptr;
    }
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

void SqlitePatternStore::InitializeDatabase() {
    std::lock_guard<std::mutex> lock(write_mutex_);

    sqlite3_busy_timeout(db_, config_.busy_timeout_ms);

    // page_size only takes effect before the first table is created
    TryExecuteSQL("PRAGMA page_size=" + std::to_string(config_.page_size) + ";");

    if (config_.enable_wal) {
        TryExecuteSQL("PRAGMA journal_mode=WAL;");
    }

    TryExecuteSQL("PRAGMA synchronous=" + config_.synchronous + ";");
    TryExecuteSQL("PRAGMA cache_size=-" + std::to_string(config_.cache_size_kb) + ";");

    CreateTables();
}

void SqlitePatternStore::OpenReader() {
    if (IsInMemoryPath(config_.db_path)) {
        return;
    }

    int rc = sqlite3_open_v2(config_.db_path.c_str(), &read_db_,
                             SQLITE_OPEN_READWRITE, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = read_db_ ? sqlite3_errmsg(read_db_) : "out of memory";
        throw StorageError(KindForCode(rc),
                           "Failed to open reader for " + config_.db_path + ": " + error);
    }
    sqlite3_busy_timeout(read_db_, config_.busy_timeout_ms);
}

template <typename Fn>
auto SqlitePatternStore::WithReader(Fn&& fn) const {
    if (read_db_) {
        std::lock_guard<std::mutex> lock(read_mutex_);
        return fn(read_db_);
    }
    std::lock_guard<std::mutex> lock(write_mutex_);
    return fn(db_);
}

void SqlitePatternStore::CreateTables() {
    ExecuteSQL(R"(
        CREATE TABLE IF NOT EXISTS patterns (
            latitude REAL NOT NULL,
            longitude REAL NOT NULL,
            model_id TEXT NOT NULL,
            confidence REAL NOT NULL,
            sample_count INTEGER NOT NULL,
            last_used_at INTEGER NOT NULL,
            PRIMARY KEY (latitude, longitude, model_id)
        );
    )");

    // Bounding-box prefilter for QueryRadius
    ExecuteSQL("CREATE INDEX IF NOT EXISTS idx_lat_lon ON patterns(latitude, longitude);");
}

void SqlitePatternStore::ExecuteSQL(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : sqlite3_errmsg(db_);
        sqlite3_free(error_msg);
        throw StorageError(KindForCode(rc), error + " [" + sql + "]");
    }
}

bool SqlitePatternStore::TryExecuteSQL(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

    if (rc != SQLITE_OK) {
        APO_LOG(LogLevel::WARN, LogComponent::STORAGE,
                "SQL failed: " << sql << ": " << (error_msg ? error_msg : "unknown"));
        sqlite3_free(error_msg);
        return false;
    }
    return true;
}

// ============================================================================
// Row Helpers
// ============================================================================

std::optional<Pattern> SqlitePatternStore::DecodeRow(sqlite3_stmt* stmt) const {
    int64_t rowid = sqlite3_column_int64(stmt, 0);

    std::string error;
    if (!IsNumericColumn(stmt, 1) || !IsNumericColumn(stmt, 2)) {
        error = "non-numeric coordinate";
    } else if (sqlite3_column_type(stmt, 3) != SQLITE_TEXT) {
        error = "model_id is not text";
    } else if (!IsNumericColumn(stmt, 4)) {
        error = "non-numeric confidence";
    } else if (sqlite3_column_type(stmt, 5) != SQLITE_INTEGER) {
        error = "sample_count is not an integer";
    } else if (sqlite3_column_type(stmt, 6) != SQLITE_INTEGER) {
        error = "last_used_at is not an integer";
    } else if (sqlite3_column_int64(stmt, 5) < 1) {
        error = "sample_count must be >= 1";
    }

    Pattern pattern;
    if (error.empty()) {
        pattern.location = Coordinate(sqlite3_column_double(stmt, 1),
                                      sqlite3_column_double(stmt, 2));
        const unsigned char* text = sqlite3_column_text(stmt, 3);
        pattern.model_id = text ? reinterpret_cast<const char*>(text) : "";
        pattern.confidence = sqlite3_column_double(stmt, 4);
        pattern.sample_count = static_cast<uint64_t>(sqlite3_column_int64(stmt, 5));
        pattern.last_used_at = Timestamp::FromMicros(sqlite3_column_int64(stmt, 6));
        error = pattern.ValidationError();
    }

    if (!error.empty()) {
        corrupt_records_.fetch_add(1, std::memory_order_relaxed);
        APO_LOG(LogLevel::WARN, LogComponent::STORAGE,
                "Skipping corrupt pattern row " << rowid << " in "
                << config_.db_path << ": " << error);
        return std::nullopt;
    }

    return pattern;
}

void SqlitePatternStore::WriteUnlocked(const Pattern& pattern) {
    Statement stmt(db_,
        "INSERT OR REPLACE INTO patterns "
        "(latitude, longitude, model_id, confidence, sample_count, last_used_at) "
        "VALUES (?, ?, ?, ?, ?, ?);");

    sqlite3_bind_double(stmt.get(), 1, pattern.location.latitude);
    sqlite3_bind_double(stmt.get(), 2, pattern.location.longitude);
    sqlite3_bind_text(stmt.get(), 3, pattern.model_id.c_str(),
                      static_cast<int>(pattern.model_id.size()), SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt.get(), 4, pattern.confidence);
    sqlite3_bind_int64(stmt.get(), 5, static_cast<sqlite3_int64>(pattern.sample_count));
    sqlite3_bind_int64(stmt.get(), 6, pattern.last_used_at.ToMicros());

    stmt.Step();
}

void SqlitePatternStore::TouchUnlocked(const PatternKey& key, int64_t used_at_us) {
    Statement stmt(db_,
        "UPDATE patterns SET last_used_at = MAX(last_used_at, ?) "
        "WHERE latitude = ? AND longitude = ? AND model_id = ?;");
    sqlite3_bind_int64(stmt.get(), 1, used_at_us);
    sqlite3_bind_double(stmt.get(), 2, key.location.latitude);
    sqlite3_bind_double(stmt.get(), 3, key.location.longitude);
    sqlite3_bind_text(stmt.get(), 4, key.model_id.c_str(),
                      static_cast<int>(key.model_id.size()), SQLITE_TRANSIENT);
    stmt.Step();
}

void SqlitePatternStore::ApplyPendingTouchesUnlocked() {
    std::vector<PendingTouch> pending;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending.swap(pending_touches_);
    }
    for (const auto& touch : pending) {
        TouchUnlocked(touch.key, touch.used_at_us);
    }
}

void SqlitePatternStore::Touch(const std::vector<PatternKey>& keys, Timestamp used_at) {
    if (keys.empty()) {
        return;
    }

    std::unique_lock<std::mutex> lock(write_mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        std::lock_guard<std::mutex> pending_lock(pending_mutex_);
        for (const auto& key : keys) {
            pending_touches_.push_back(PendingTouch{key, used_at.ToMicros()});
        }
        return;
    }

    Transaction txn(db_, "BEGIN IMMEDIATE;");
    ApplyPendingTouchesUnlocked();
    for (const auto& key : keys) {
        TouchUnlocked(key, used_at.ToMicros());
    }
    txn.Commit();
}

// ============================================================================
// Core Operations
// ============================================================================

void SqlitePatternStore::Upsert(const Pattern& pattern) {
    Update(pattern.location, pattern.model_id,
           [&pattern](const std::optional<Pattern>&) { return pattern; });
}

Pattern SqlitePatternStore::Update(const Coordinate& location,
                                   const ModelID& model_id,
                                   const Mutator& mutator) {
    ValidateCoordinate(location);
    if (model_id.empty()) {
        throw std::invalid_argument("Pattern model_id must not be empty");
    }

    std::lock_guard<std::mutex> lock(write_mutex_);
    PatternKey key{location, model_id};

    // IMMEDIATE takes the write lock up front, so other connections to the
    // same file cannot interleave between the read and the write
    Transaction txn(db_, "BEGIN IMMEDIATE;");

    std::optional<Pattern> current;
    {
        Statement select(db_, std::string(kSelectColumns) +
                              " WHERE latitude = ? AND longitude = ? AND model_id = ?;");
        sqlite3_bind_double(select.get(), 1, location.latitude);
        sqlite3_bind_double(select.get(), 2, location.longitude);
        sqlite3_bind_text(select.get(), 3, model_id.c_str(),
                          static_cast<int>(model_id.size()), SQLITE_TRANSIENT);

        if (select.Step() == SQLITE_ROW) {
            // A corrupt stored row is treated as absent and overwritten
            current = DecodeRow(select.get());
        }
    }

    Pattern next = mutator(current);
    if (next.location != location || next.model_id != model_id) {
        throw std::invalid_argument("Mutator changed the pattern key " + key.ToString());
    }
    if (next.sample_count == 0) {
        next.sample_count = 1;
    }
    ValidateForWrite(next);
    if (current && next.sample_count < current->sample_count) {
        throw std::invalid_argument("sample_count may not decrease for " + key.ToString());
    }

    ApplyPendingTouchesUnlocked();
    next.last_used_at = Timestamp::Now();
    WriteUnlocked(next);
    txn.Commit();

    total_writes_.fetch_add(1, std::memory_order_relaxed);
    return next;
}

std::optional<Pattern> SqlitePatternStore::Get(const Coordinate& location,
                                               const ModelID& model_id) {
    ValidateCoordinate(location);

    total_reads_.fetch_add(1, std::memory_order_relaxed);

    std::optional<Pattern> result = WithReader([&](sqlite3* db) -> std::optional<Pattern> {
        Statement select(db, std::string(kSelectColumns) +
                             " WHERE latitude = ? AND longitude = ? AND model_id = ?;");
        sqlite3_bind_double(select.get(), 1, location.latitude);
        sqlite3_bind_double(select.get(), 2, location.longitude);
        sqlite3_bind_text(select.get(), 3, model_id.c_str(),
                          static_cast<int>(model_id.size()), SQLITE_TRANSIENT);

        if (select.Step() != SQLITE_ROW) {
            return std::nullopt;
        }
        return DecodeRow(select.get());
    });

    if (result) {
        result->last_used_at = Timestamp::Now();
        Touch({result->Key()}, result->last_used_at);
    }
    return result;
}

bool SqlitePatternStore::Remove(const Coordinate& location, const ModelID& model_id) {
    ValidateCoordinate(location);

    std::lock_guard<std::mutex> lock(write_mutex_);

    Statement stmt(db_, "DELETE FROM patterns WHERE latitude = ? AND longitude = ? AND model_id = ?;");
    sqlite3_bind_double(stmt.get(), 1, location.latitude);
    sqlite3_bind_double(stmt.get(), 2, location.longitude);
    sqlite3_bind_text(stmt.get(), 3, model_id.c_str(),
                      static_cast<int>(model_id.size()), SQLITE_TRANSIENT);
    stmt.Step();

    // Check if any row was deleted
    if (sqlite3_changes(db_) == 0) {
        return false;
    }

    total_writes_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

// ============================================================================
// Query Operations
// ============================================================================

std::vector<Pattern> SqlitePatternStore::QueryRadius(const Coordinate& center,
                                                     double radius_km,
                                                     const QueryOptions& options) {
    ValidateCoordinate(center);
    ValidateRadius(radius_km);

    BoundingBox box = ComputeBoundingBox(center, radius_km);

    std::string sql = std::string(kSelectColumns) + " WHERE latitude BETWEEN ? AND ?";
    if (box.CoversAllLongitudes()) {
        // No longitude restriction
    } else if (box.WrapsAntimeridian()) {
        sql += " AND (longitude >= ? OR longitude <= ?)";
    } else {
        sql += " AND longitude BETWEEN ? AND ?";
    }
    sql += ";";

    total_reads_.fetch_add(1, std::memory_order_relaxed);

    struct Match {
        double distance;
        Pattern pattern;
    };
    std::vector<Match> matches;

    WithReader([&](sqlite3* db) {
        Statement select(db, sql);
        sqlite3_bind_double(select.get(), 1, box.min_latitude);
        sqlite3_bind_double(select.get(), 2, box.max_latitude);
        if (!box.CoversAllLongitudes()) {
            sqlite3_bind_double(select.get(), 3, box.min_longitude);
            sqlite3_bind_double(select.get(), 4, box.max_longitude);
        }

        while (select.Step() == SQLITE_ROW) {
            std::optional<Pattern> pattern = DecodeRow(select.get());
            if (!pattern) {
                continue;
            }
            double distance = HaversineDistanceKm(center, pattern->location);
            if (distance <= radius_km) {
                matches.push_back(Match{distance, std::move(*pattern)});
            }
        }
    });

    // Nearest first; ties broken by key for stable output
    std::sort(matches.begin(), matches.end(),
              [](const Match& a, const Match& b) {
                  if (a.distance != b.distance) return a.distance < b.distance;
                  if (a.pattern.model_id != b.pattern.model_id) {
                      return a.pattern.model_id < b.pattern.model_id;
                  }
                  return a.pattern.location < b.pattern.location;
              });

    if (matches.size() > options.max_results) {
        matches.resize(options.max_results);
    }

    if (options.touch && !matches.empty()) {
        Timestamp now = Timestamp::Now();
        std::vector<PatternKey> keys;
        keys.reserve(matches.size());
        for (auto& match : matches) {
            match.pattern.last_used_at = now;
            keys.push_back(match.pattern.Key());
        }
        Touch(keys, now);
    }

    std::vector<Pattern> results;
    results.reserve(matches.size());
    for (auto& match : matches) {
        results.push_back(std::move(match.pattern));
    }
    return results;
}

std::vector<Pattern> SqlitePatternStore::FindAll(const QueryOptions& options) {
    total_reads_.fetch_add(1, std::memory_order_relaxed);

    return WithReader([&](sqlite3* db) {
        std::vector<Pattern> results;

        Statement select(db, std::string(kSelectColumns) + " ORDER BY rowid;");
        while (results.size() < options.max_results && select.Step() == SQLITE_ROW) {
            std::optional<Pattern> pattern = DecodeRow(select.get());
            if (pattern) {
                results.push_back(std::move(*pattern));
            }
        }
        return results;
    });
}

// ============================================================================
// Statistics and Maintenance
// ============================================================================

// Internal helper - assumes the connection's mutex is already locked
size_t SqlitePatternStore::CountUnlocked(sqlite3* db) const {
    Statement stmt(db, "SELECT COUNT(*) FROM patterns;");

    size_t count = 0;
    if (stmt.Step() == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
    }
    return count;
}

size_t SqlitePatternStore::Count() const {
    return WithReader([this](sqlite3* db) { return CountUnlocked(db); });
}

StoreStats SqlitePatternStore::GetStats() const {
    StoreStats stats;
    stats.total_patterns = Count();
    stats.disk_usage_bytes = GetDatabaseSize();
    stats.memory_usage_bytes = 0;  // SQLite manages its own cache
    stats.total_reads = total_reads_.load(std::memory_order_relaxed);
    stats.total_writes = total_writes_.load(std::memory_order_relaxed);
    stats.corrupt_records = corrupt_records_.load(std::memory_order_relaxed);
    return stats;
}

void SqlitePatternStore::Flush() {
    std::lock_guard<std::mutex> lock(write_mutex_);

    {
        Transaction txn(db_, "BEGIN IMMEDIATE;");
        ApplyPendingTouchesUnlocked();
        txn.Commit();
    }

    if (config_.enable_wal) {
        ExecuteSQL("PRAGMA wal_checkpoint(FULL);");
    }
}

void SqlitePatternStore::Clear() {
    std::lock_guard<std::mutex> lock(write_mutex_);

    ExecuteSQL("DELETE FROM patterns;");
    {
        std::lock_guard<std::mutex> pending_lock(pending_mutex_);
        pending_touches_.clear();
    }

    // Reset statistics
    total_reads_.store(0, std::memory_order_relaxed);
    total_writes_.store(0, std::memory_order_relaxed);
    corrupt_records_.store(0, std::memory_order_relaxed);
}

// ============================================================================
// Snapshot and Restore
// ============================================================================

bool SqlitePatternStore::CreateSnapshot(const std::string& path) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    {
        Transaction txn(db_, "BEGIN IMMEDIATE;");
        ApplyPendingTouchesUnlocked();
        txn.Commit();
    }

    // Flush WAL first
    if (config_.enable_wal) {
        TryExecuteSQL("PRAGMA wal_checkpoint(FULL);");
    }

    sqlite3* backup_db = nullptr;
    if (sqlite3_open(path.c_str(), &backup_db) != SQLITE_OK) {
        APO_LOG(LogLevel::ERROR, LogComponent::STORAGE,
                "Cannot open snapshot target " << path);
        sqlite3_close(backup_db);
        return false;
    }

    sqlite3_backup* backup = sqlite3_backup_init(backup_db, "main", db_, "main");
    if (!backup) {
        sqlite3_close(backup_db);
        return false;
    }

    sqlite3_backup_step(backup, -1);  // Copy all pages
    int rc = sqlite3_backup_finish(backup);
    sqlite3_close(backup_db);

    return rc == SQLITE_OK;
}

bool SqlitePatternStore::RestoreSnapshot(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        return false;
    }

    std::lock_guard<std::mutex> lock(write_mutex_);
    {
        std::lock_guard<std::mutex> pending_lock(pending_mutex_);
        pending_touches_.clear();
    }

    sqlite3* backup_db = nullptr;
    if (sqlite3_open_v2(path.c_str(), &backup_db, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK) {
        sqlite3_close(backup_db);
        return false;
    }

    sqlite3_backup* backup = sqlite3_backup_init(db_, "main", backup_db, "main");
    if (!backup) {
        sqlite3_close(backup_db);
        return false;
    }

    sqlite3_backup_step(backup, -1);  // Copy all pages
    int rc = sqlite3_backup_finish(backup);
    sqlite3_close(backup_db);

    if (rc != SQLITE_OK) {
        APO_LOG(LogLevel::ERROR, LogComponent::STORAGE,
                "Restore from " << path << " failed: " << sqlite3_errmsg(db_));
        return false;
    }

    // A snapshot of an empty or foreign database may lack the schema
    return TryExecuteSQL(R"(
        CREATE TABLE IF NOT EXISTS patterns (
            latitude REAL NOT NULL,
            longitude REAL NOT NULL,
            model_id TEXT NOT NULL,
            confidence REAL NOT NULL,
            sample_count INTEGER NOT NULL,
            last_used_at INTEGER NOT NULL,
            PRIMARY KEY (latitude, longitude, model_id)
        );
    )");
}

size_t SqlitePatternStore::GetDatabaseSize() const {
    struct stat st;
    if (stat(config_.db_path.c_str(), &st) == 0) {
        return static_cast<size_t>(st.st_size);
    }
    return 0;
}

} // namespace apo
