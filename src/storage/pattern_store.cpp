// File: src/storage/pattern_store.cpp
#include "storage/pattern_store.hpp"
#include "config/optimizer_config.hpp"
#include "core/errors.hpp"
#include "geo/geo_distance.hpp"
#include "storage/memory_pattern_store.hpp"
#include "storage/sqlite_pattern_store.hpp"
#include <cmath>
#include <stdexcept>

namespace apo {

void PatternStore::ValidateForWrite(const Pattern& pattern) {
    ValidateCoordinate(pattern.location);

    std::string error = pattern.ValidationError();
    if (!error.empty()) {
        throw std::invalid_argument("Invalid pattern " + pattern.Key().ToString() + ": " + error);
    }
}

void PatternStore::ValidateRadius(double radius_km) {
    if (!std::isfinite(radius_km) || radius_km < 0.0) {
        throw std::invalid_argument("Radius must be a finite non-negative number of km");
    }
}

std::unique_ptr<PatternStore> CreatePatternStore(const StorageConfig& config) {
    if (config.backend == "memory") {
        MemoryPatternStore::Config memory_config;
        memory_config.cell_size_degrees = config.cell_size_degrees;
        memory_config.initial_cell_capacity = config.initial_cell_capacity;
        return std::make_unique<MemoryPatternStore>(memory_config);
    }

    if (config.backend == "sqlite") {
        SqlitePatternStore::Config sqlite_config;
        sqlite_config.db_path = config.db_path;
        sqlite_config.enable_wal = config.enable_wal;
        sqlite_config.synchronous = config.synchronous;
        sqlite_config.cache_size_kb = config.cache_size_kb;
        sqlite_config.busy_timeout_ms = config.busy_timeout_ms;
        return std::make_unique<SqlitePatternStore>(sqlite_config);
    }

    throw std::invalid_argument("Unknown pattern store backend: " + config.backend);
}

} // namespace apo
