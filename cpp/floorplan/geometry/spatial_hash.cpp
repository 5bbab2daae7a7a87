#include "floorplan/geometry/spatial_hash.h"

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace floorplan {

AABB segmentBounds(const Segment& s, double pad) {
    return AABB{
        std::min(s.a.x, s.b.x) - pad,
        std::min(s.a.y, s.b.y) - pad,
        std::max(s.a.x, s.b.x) + pad,
        std::max(s.a.y, s.b.y) + pad,
    };
}

namespace {
struct CellRange {
    std::int64_t x0, y0, x1, y1;
};

CellRange cellRange(const AABB& b, double cellSize) {
    const auto cell = [cellSize](double v) { return static_cast<std::int64_t>(std::floor(v / cellSize)); };
    return CellRange{cell(b.minX), cell(b.minY), cell(b.maxX), cell(b.maxY)};
}
} // namespace

SpatialHashGrid::SpatialHashGrid(double cellSize) : cellSize_(cellSize > 0.0 ? cellSize : 1.0) {}

std::int64_t SpatialHashGrid::hash(std::int64_t ix, std::int64_t iy) const {
    return (ix * 73856093) ^ (iy * 19349663);
}

void SpatialHashGrid::insert(std::uint32_t id, const AABB& bounds) {
    remove(id);
    const CellRange r = cellRange(bounds, cellSize_);
    std::vector<std::int64_t>& keys = entityCells_[id];
    for (std::int64_t cx = r.x0; cx <= r.x1; ++cx) {
        for (std::int64_t cy = r.y0; cy <= r.y1; ++cy) {
            const std::int64_t key = hash(cx, cy);
            // Distinct cells can collide on the same key
            if (std::find(keys.begin(), keys.end(), key) != keys.end()) continue;
            keys.push_back(key);
            cells_[key].push_back(id);
        }
    }
}

void SpatialHashGrid::remove(std::uint32_t id) {
    const auto owned = entityCells_.find(id);
    if (owned == entityCells_.end()) return;

    for (const std::int64_t key : owned->second) {
        const auto cell = cells_.find(key);
        if (cell == cells_.end()) continue;
        std::vector<std::uint32_t>& ids = cell->second;
        ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
        if (ids.empty()) cells_.erase(cell);
    }
    entityCells_.erase(owned);
}

void SpatialHashGrid::clear() {
    cells_.clear();
    entityCells_.clear();
}

void SpatialHashGrid::query(const AABB& bounds, std::vector<std::uint32_t>& results) const {
    const std::size_t first = results.size();
    const CellRange r = cellRange(bounds, cellSize_);
    for (std::int64_t cx = r.x0; cx <= r.x1; ++cx) {
        for (std::int64_t cy = r.y0; cy <= r.y1; ++cy) {
            const auto cell = cells_.find(hash(cx, cy));
            if (cell != cells_.end()) results.insert(results.end(), cell->second.begin(), cell->second.end());
        }
    }
    // A wall spanning several cells is reported once
    std::sort(results.begin() + static_cast<std::ptrdiff_t>(first), results.end());
    results.erase(std::unique(results.begin() + static_cast<std::ptrdiff_t>(first), results.end()), results.end());
}

} // namespace floorplan
