// File: src/storage/indices/spatial_grid.hpp
#pragma once

#include "core/types.hpp"
#include "geo/geo_distance.hpp"
#include <cstdint>
#include <utility>
#include <vector>

namespace apo {

/// Fixed latitude/longitude grid used to bucket patterns by position
///
/// The world is split into square cells of cell_size_degrees. A radius
/// query only needs to visit the cells its bounding box intersects, so the
/// grid doubles as the spatial index and as the lock-sharding scheme of the
/// in-memory store.
///
/// Stateless apart from its dimensions; safe to share between threads.
class SpatialGrid {
public:
    using CellID = uint32_t;

    /// @param cell_size_degrees Edge length of one cell; clamped to [0.01, 180]
    explicit SpatialGrid(double cell_size_degrees = 1.0);

    /// Cell containing a (valid) coordinate
    CellID CellFor(const Coordinate& coordinate) const;

    /// Every cell intersecting a bounding box, in ascending order
    std::vector<CellID> CellsFor(const BoundingBox& box) const;

    /// Number of cells CellsFor(box) would return, without materializing them
    size_t CountCells(const BoundingBox& box) const;

    /// Bounding box of a single cell
    BoundingBox CellBounds(CellID cell) const;

    double CellSizeDegrees() const { return cell_size_; }
    uint32_t Rows() const { return rows_; }
    uint32_t Columns() const { return cols_; }
    size_t TotalCells() const { return static_cast<size_t>(rows_) * cols_; }

private:
    double cell_size_;
    uint32_t rows_;
    uint32_t cols_;

    uint32_t RowFor(double latitude) const;
    uint32_t ColumnFor(double longitude) const;

    /// Column ranges [first, last] covered by a box (two when it wraps)
    std::vector<std::pair<uint32_t, uint32_t>> ColumnRanges(const BoundingBox& box) const;
};

} // namespace apo
