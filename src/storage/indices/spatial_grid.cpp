// File: src/storage/indices/spatial_grid.cpp
#include "storage/indices/spatial_grid.hpp"
#include <algorithm>
#include <cmath>

namespace apo {

SpatialGrid::SpatialGrid(double cell_size_degrees)
    : cell_size_(std::isfinite(cell_size_degrees)
                     ? std::min(180.0, std::max(0.01, cell_size_degrees))
                     : 1.0) {
    rows_ = static_cast<uint32_t>(std::ceil(180.0 / cell_size_));
    cols_ = static_cast<uint32_t>(std::ceil(360.0 / cell_size_));
}

uint32_t SpatialGrid::RowFor(double latitude) const {
    double clamped = std::min(90.0, std::max(-90.0, latitude));
    auto row = static_cast<int64_t>(std::floor((clamped + 90.0) / cell_size_));
    return static_cast<uint32_t>(std::min<int64_t>(std::max<int64_t>(row, 0), rows_ - 1));
}

uint32_t SpatialGrid::ColumnFor(double longitude) const {
    double clamped = std::min(180.0, std::max(-180.0, longitude));
    auto col = static_cast<int64_t>(std::floor((clamped + 180.0) / cell_size_));
    return static_cast<uint32_t>(std::min<int64_t>(std::max<int64_t>(col, 0), cols_ - 1));
}

SpatialGrid::CellID SpatialGrid::CellFor(const Coordinate& coordinate) const {
    return RowFor(coordinate.latitude) * cols_ + ColumnFor(coordinate.longitude);
}

std::vector<std::pair<uint32_t, uint32_t>> SpatialGrid::ColumnRanges(
        const BoundingBox& box) const {
    std::vector<std::pair<uint32_t, uint32_t>> ranges;

    if (box.CoversAllLongitudes()) {
        ranges.emplace_back(0, cols_ - 1);
    } else if (box.WrapsAntimeridian()) {
        ranges.emplace_back(ColumnFor(box.min_longitude), cols_ - 1);
        ranges.emplace_back(0, ColumnFor(box.max_longitude));
    } else {
        ranges.emplace_back(ColumnFor(box.min_longitude), ColumnFor(box.max_longitude));
    }

    return ranges;
}

size_t SpatialGrid::CountCells(const BoundingBox& box) const {
    size_t rows = RowFor(box.max_latitude) - RowFor(box.min_latitude) + 1;
    size_t cols = 0;
    for (const auto& [first, last] : ColumnRanges(box)) {
        cols += last - first + 1;
    }
    return rows * cols;
}

std::vector<SpatialGrid::CellID> SpatialGrid::CellsFor(const BoundingBox& box) const {
    std::vector<CellID> cells;
    cells.reserve(CountCells(box));

    uint32_t first_row = RowFor(box.min_latitude);
    uint32_t last_row = RowFor(box.max_latitude);
    auto column_ranges = ColumnRanges(box);

    for (uint32_t row = first_row; row <= last_row; ++row) {
        for (const auto& [first, last] : column_ranges) {
            for (uint32_t col = first; col <= last; ++col) {
                cells.push_back(row * cols_ + col);
            }
        }
    }

    std::sort(cells.begin(), cells.end());
    return cells;
}

BoundingBox SpatialGrid::CellBounds(CellID cell) const {
    uint32_t row = cell / cols_;
    uint32_t col = cell % cols_;

    BoundingBox box;
    box.min_latitude = -90.0 + row * cell_size_;
    box.max_latitude = std::min(90.0, box.min_latitude + cell_size_);
    box.min_longitude = -180.0 + col * cell_size_;
    box.max_longitude = std::min(180.0, box.min_longitude + cell_size_);
    return box;
}

} // namespace apo
