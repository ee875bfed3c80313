// File: src/storage/memory_pattern_store.cpp
#include "storage/memory_pattern_store.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include "geo/geo_distance.hpp"
#include <algorithm>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <stdexcept>

namespace apo {

// ============================================================================
// Constructor
// ============================================================================

MemoryPatternStore::MemoryPatternStore()
    : MemoryPatternStore(Config{}) {}

MemoryPatternStore::MemoryPatternStore(const Config& config)
    : config_(config),
      grid_(config.cell_size_degrees) {}

// ============================================================================
// Cell Directory
// ============================================================================

MemoryPatternStore::Cell* MemoryPatternStore::FindCell(SpatialGrid::CellID id) const {
    std::shared_lock<std::shared_mutex> lock(cells_mutex_);
    auto it = cells_.find(id);
    return it != cells_.end() ? it->second.get() : nullptr;
}

MemoryPatternStore::Cell* MemoryPatternStore::GetOrCreateCell(SpatialGrid::CellID id) {
    if (Cell* cell = FindCell(id)) {
        return cell;
    }

    std::unique_lock<std::shared_mutex> lock(cells_mutex_);
    auto& slot = cells_[id];
    if (!slot) {
        slot = std::make_unique<Cell>();
        slot->patterns.reserve(config_.initial_cell_capacity);
    }
    return slot.get();
}

std::vector<MemoryPatternStore::Cell*> MemoryPatternStore::CellsInBox(
        const BoundingBox& box) const {
    std::vector<Cell*> result;
    std::shared_lock<std::shared_mutex> lock(cells_mutex_);

    // Walk whichever side is smaller: the candidate cells or the live ones
    if (grid_.CountCells(box) <= cells_.size()) {
        for (SpatialGrid::CellID id : grid_.CellsFor(box)) {
            auto it = cells_.find(id);
            if (it != cells_.end()) {
                result.push_back(it->second.get());
            }
        }
    } else {
        std::vector<SpatialGrid::CellID> ids;
        for (const auto& [id, cell] : cells_) {
            BoundingBox bounds = grid_.CellBounds(id);
            bool lat_overlap = bounds.max_latitude >= box.min_latitude &&
                               bounds.min_latitude <= box.max_latitude;
            bool lon_overlap;
            if (box.CoversAllLongitudes()) {
                lon_overlap = true;
            } else if (box.WrapsAntimeridian()) {
                lon_overlap = bounds.max_longitude >= box.min_longitude ||
                              bounds.min_longitude <= box.max_longitude;
            } else {
                lon_overlap = bounds.max_longitude >= box.min_longitude &&
                              bounds.min_longitude <= box.max_longitude;
            }
            if (lat_overlap && lon_overlap) {
                ids.push_back(id);
            }
        }
        std::sort(ids.begin(), ids.end());
        for (SpatialGrid::CellID id : ids) {
            result.push_back(cells_.at(id).get());
        }
    }

    return result;
}

std::vector<MemoryPatternStore::Cell*> MemoryPatternStore::AllCells() const {
    std::shared_lock<std::shared_mutex> lock(cells_mutex_);
    std::vector<Cell*> result;
    result.reserve(cells_.size());
    for (const auto& [id, cell] : cells_) {
        result.push_back(cell.get());
    }
    return result;
}

// ============================================================================
// Core Operations
// ============================================================================

void MemoryPatternStore::Upsert(const Pattern& pattern) {
    Update(pattern.location, pattern.model_id,
           [&pattern](const std::optional<Pattern>&) { return pattern; });
}

Pattern MemoryPatternStore::Update(const Coordinate& location,
                                   const ModelID& model_id,
                                   const Mutator& mutator) {
    ValidateCoordinate(location);
    if (model_id.empty()) {
        throw std::invalid_argument("Pattern model_id must not be empty");
    }

    Cell* cell = GetOrCreateCell(grid_.CellFor(location));
    PatternKey key{location, model_id};

    // Exclusive lock on this key's cell only
    std::unique_lock<std::shared_mutex> lock(cell->mutex);

    auto it = cell->patterns.find(key);
    std::optional<Pattern> current;
    if (it != cell->patterns.end()) {
        current = it->second.Snapshot();
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

    next.last_used_at = Timestamp::Now();

    if (it != cell->patterns.end()) {
        it->second.pattern = next;
        it->second.last_used_us.store(next.last_used_at.ToMicros(), std::memory_order_relaxed);
    } else {
        cell->patterns.try_emplace(key, next);
        count_.fetch_add(1, std::memory_order_relaxed);
    }

    total_writes_.fetch_add(1, std::memory_order_relaxed);
    return next;
}

std::optional<Pattern> MemoryPatternStore::Get(const Coordinate& location,
                                               const ModelID& model_id) {
    ValidateCoordinate(location);
    total_reads_.fetch_add(1, std::memory_order_relaxed);

    Cell* cell = FindCell(grid_.CellFor(location));
    if (cell == nullptr) {
        return std::nullopt;
    }

    std::shared_lock<std::shared_mutex> lock(cell->mutex);

    auto it = cell->patterns.find(PatternKey{location, model_id});
    if (it == cell->patterns.end()) {
        return std::nullopt;
    }

    it->second.last_used_us.store(Timestamp::Now().ToMicros(), std::memory_order_relaxed);
    return it->second.Snapshot();
}

bool MemoryPatternStore::Remove(const Coordinate& location, const ModelID& model_id) {
    ValidateCoordinate(location);

    Cell* cell = FindCell(grid_.CellFor(location));
    if (cell == nullptr) {
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(cell->mutex);

    if (cell->patterns.erase(PatternKey{location, model_id}) == 0) {
        return false;
    }

    count_.fetch_sub(1, std::memory_order_relaxed);
    total_writes_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

// ============================================================================
// Query Operations
// ============================================================================

std::vector<Pattern> MemoryPatternStore::QueryRadius(const Coordinate& center,
                                                     double radius_km,
                                                     const QueryOptions& options) {
    ValidateCoordinate(center);
    ValidateRadius(radius_km);
    total_reads_.fetch_add(1, std::memory_order_relaxed);

    BoundingBox box = ComputeBoundingBox(center, radius_km);
    int64_t now_us = Timestamp::Now().ToMicros();

    std::vector<std::pair<double, Pattern>> matches;

    for (Cell* cell : CellsInBox(box)) {
        std::shared_lock<std::shared_mutex> lock(cell->mutex);

        for (const auto& [key, entry] : cell->patterns) {
            if (!box.Contains(key.location)) {
                continue;
            }
            double distance = HaversineDistanceKm(center, key.location);
            if (distance > radius_km) {
                continue;
            }
            if (options.touch) {
                entry.last_used_us.store(now_us, std::memory_order_relaxed);
            }
            matches.emplace_back(distance, entry.Snapshot());
        }
    }

    // Nearest first; ties broken by key for stable output
    std::sort(matches.begin(), matches.end(),
              [](const auto& a, const auto& b) {
                  if (a.first != b.first) return a.first < b.first;
                  if (a.second.model_id != b.second.model_id) {
                      return a.second.model_id < b.second.model_id;
                  }
                  return a.second.location < b.second.location;
              });

    if (matches.size() > options.max_results) {
        APO_LOG(LogLevel::DEBUG, LogComponent::STORAGE,
                "Radius query around " << center.ToString() << " truncated from "
                << matches.size() << " to " << options.max_results << " patterns");
        matches.resize(options.max_results);
    }

    std::vector<Pattern> results;
    results.reserve(matches.size());
    for (auto& match : matches) {
        results.push_back(std::move(match.second));
    }
    return results;
}

std::vector<Pattern> MemoryPatternStore::FindAll(const QueryOptions& options) {
    total_reads_.fetch_add(1, std::memory_order_relaxed);

    std::vector<Pattern> results;
    for (Cell* cell : AllCells()) {
        std::shared_lock<std::shared_mutex> lock(cell->mutex);

        for (const auto& [key, entry] : cell->patterns) {
            if (results.size() >= options.max_results) {
                return results;
            }
            results.push_back(entry.Snapshot());
        }
    }
    return results;
}

// ============================================================================
// Statistics and Maintenance
// ============================================================================

size_t MemoryPatternStore::Count() const {
    return count_.load(std::memory_order_relaxed);
}

size_t MemoryPatternStore::CellCount() const {
    std::shared_lock<std::shared_mutex> lock(cells_mutex_);
    return cells_.size();
}

StoreStats MemoryPatternStore::GetStats() const {
    StoreStats stats;
    stats.total_patterns = Count();
    stats.total_reads = total_reads_.load(std::memory_order_relaxed);
    stats.total_writes = total_writes_.load(std::memory_order_relaxed);
    stats.corrupt_records = corrupt_records_.load(std::memory_order_relaxed);

    // Estimate memory usage
    size_t estimated = 0;
    for (Cell* cell : AllCells()) {
        std::shared_lock<std::shared_mutex> lock(cell->mutex);
        estimated += sizeof(Cell);
        for (const auto& [key, entry] : cell->patterns) {
            estimated += sizeof(PatternKey) + sizeof(Entry) +
                         key.model_id.capacity() + entry.pattern.model_id.capacity();
        }
    }
    stats.memory_usage_bytes = estimated;

    return stats;
}

void MemoryPatternStore::Flush() {
    // Nothing buffered
}

void MemoryPatternStore::Clear() {
    for (Cell* cell : AllCells()) {
        std::unique_lock<std::shared_mutex> lock(cell->mutex);
        count_.fetch_sub(cell->patterns.size(), std::memory_order_relaxed);
        cell->patterns.clear();
    }

    total_reads_.store(0, std::memory_order_relaxed);
    total_writes_.store(0, std::memory_order_relaxed);
    corrupt_records_.store(0, std::memory_order_relaxed);
}

// ============================================================================
// Snapshot and Restore
// ============================================================================

bool MemoryPatternStore::CreateSnapshot(const std::string& path) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        APO_LOG(LogLevel::ERROR, LogComponent::STORAGE,
                "Cannot open snapshot file for writing: " << path);
        return false;
    }

    std::vector<Pattern> patterns = FindAll(QueryOptions{SIZE_MAX, false});

    // Header: magic, version and pattern count
    uint32_t magic = kSnapshotMagic;
    uint32_t version = kSnapshotVersion;
    uint64_t count = patterns.size();

    file.write(reinterpret_cast<const char*>(&magic), sizeof(magic));
    file.write(reinterpret_cast<const char*>(&version), sizeof(version));
    file.write(reinterpret_cast<const char*>(&count), sizeof(count));

    for (const auto& pattern : patterns) {
        pattern.Serialize(file);
    }

    file.flush();
    return file.good();
}

bool MemoryPatternStore::RestoreSnapshot(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }

    uint32_t magic = 0;
    uint32_t version = 0;
    uint64_t count = 0;

    file.read(reinterpret_cast<char*>(&magic), sizeof(magic));
    file.read(reinterpret_cast<char*>(&version), sizeof(version));
    file.read(reinterpret_cast<char*>(&count), sizeof(count));

    if (!file || magic != kSnapshotMagic || version != kSnapshotVersion) {
        APO_LOG(LogLevel::ERROR, LogComponent::STORAGE,
                "Unsupported or damaged snapshot header: " << path);
        return false;
    }

    // Decode everything before touching the live data
    std::vector<Pattern> patterns;
    try {
        for (uint64_t i = 0; i < count; ++i) {
            patterns.push_back(Pattern::Deserialize(file));
        }
    } catch (const std::runtime_error& e) {
        APO_LOG(LogLevel::ERROR, LogComponent::STORAGE,
                "Snapshot " << path << " is truncated: " << e.what());
        return false;
    }

    Clear();

    for (const auto& pattern : patterns) {
        std::string error = pattern.ValidationError();
        if (!error.empty()) {
            APO_LOG(LogLevel::WARN, LogComponent::STORAGE,
                    "Skipping corrupt snapshot record " << pattern.Key().ToString()
                    << ": " << error);
            corrupt_records_.fetch_add(1, std::memory_order_relaxed);
            continue;
        }

        Cell* cell = GetOrCreateCell(grid_.CellFor(pattern.location));
        std::unique_lock<std::shared_mutex> lock(cell->mutex);

        // Restored records keep their original last_used_at
        auto [it, inserted] = cell->patterns.try_emplace(pattern.Key(), pattern);
        if (inserted) {
            count_.fetch_add(1, std::memory_order_relaxed);
        } else {
            it->second.pattern = pattern;
            it->second.last_used_us.store(pattern.last_used_at.ToMicros(),
                                          std::memory_order_relaxed);
        }
    }

    return true;
}

} // namespace apo
