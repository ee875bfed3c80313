// File: src/storage/memory_pattern_store.hpp
#pragma once

#include "storage/pattern_store.hpp"
#include "storage/indices/spatial_grid.hpp"
#include <atomic>
#include <memory>
#include <shared_mutex>
#include <unordered_map>

namespace apo {

/// In-memory pattern store sharded by spatial grid cell
///
/// Each grid cell owns its own hash map and shared_mutex:
/// - A write locks only the cell containing its key (exclusive)
/// - A radius query takes shared locks, one at a time, on the cells its
///   bounding box intersects
/// so a write to key K never blocks a radius query that does not reach K's
/// cell, and reads of the same cell proceed concurrently.
///
/// Cells are created on first write and never destroyed before the store,
/// which keeps raw cell pointers valid without holding the directory lock.
///
/// Snapshot/restore uses a versioned binary file.
class MemoryPatternStore : public PatternStore {
public:
    /// Configuration for MemoryPatternStore
    struct Config {
        /// Edge length of a grid cell in degrees
        double cell_size_degrees{1.0};

        /// Initial bucket count of each cell's hash map
        size_t initial_cell_capacity{16};
    };

    MemoryPatternStore();
    explicit MemoryPatternStore(const Config& config);
    ~MemoryPatternStore() override = default;

    MemoryPatternStore(const MemoryPatternStore&) = delete;
    MemoryPatternStore& operator=(const MemoryPatternStore&) = delete;

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

    /// Number of grid cells that currently hold at least one write
    size_t CellCount() const;

    const SpatialGrid& Grid() const { return grid_; }

private:
    /// Stored pattern plus a lock-free last-use stamp so shared readers can
    /// refresh it
    struct Entry {
        explicit Entry(const Pattern& p)
            : pattern(p), last_used_us(p.last_used_at.ToMicros()) {}

        Pattern pattern;
        mutable std::atomic<int64_t> last_used_us;

        Pattern Snapshot() const {
            Pattern copy = pattern;
            copy.last_used_at = Timestamp::FromMicros(
                last_used_us.load(std::memory_order_relaxed));
            return copy;
        }
    };

    struct Cell {
        mutable std::shared_mutex mutex;
        std::unordered_map<PatternKey, Entry, PatternKey::Hash> patterns;
    };

    Config config_;
    SpatialGrid grid_;

    // Directory of materialized cells; exclusive only while adding a cell
    mutable std::shared_mutex cells_mutex_;
    std::unordered_map<SpatialGrid::CellID, std::unique_ptr<Cell>> cells_;

    // Statistics (atomics for lock-free updates)
    std::atomic<size_t> count_{0};
    mutable std::atomic<uint64_t> total_reads_{0};
    std::atomic<uint64_t> total_writes_{0};
    std::atomic<uint64_t> corrupt_records_{0};

    // ========================================================================
    // Helper Methods
    // ========================================================================

    /// Existing cell or nullptr
    Cell* FindCell(SpatialGrid::CellID id) const;

    /// Existing cell, creating it when absent
    Cell* GetOrCreateCell(SpatialGrid::CellID id);

    /// Cells intersecting a bounding box that actually exist
    std::vector<Cell*> CellsInBox(const BoundingBox& box) const;

    /// All existing cells
    std::vector<Cell*> AllCells() const;

    static constexpr uint32_t kSnapshotVersion = 1;
    static constexpr uint32_t kSnapshotMagic = 0x41504f53;  // "APOS"
};

} // namespace apo
