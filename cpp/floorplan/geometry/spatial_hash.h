#pragma once

#include "floorplan/core/types.h"

#include <cstdint>
#include <unordered_map>
#include <vector>

namespace floorplan {

struct AABB {
    double minX, minY, maxX, maxY;
};

AABB segmentBounds(const Segment& s, double pad = 0.0);

// Uniform grid over wall bounds. Query appends each candidate id once, sorted; candidates
// may be false positives.
class SpatialHashGrid {
public:
    explicit SpatialHashGrid(double cellSize);
    void insert(std::uint32_t id, const AABB& bounds);
    void remove(std::uint32_t id);
    void clear();
    void query(const AABB& bounds, std::vector<std::uint32_t>& results) const;

private:
    double cellSize_;
    std::unordered_map<std::int64_t, std::vector<std::uint32_t>> cells_;
    // Keys each wall occupies, for removal
    std::unordered_map<std::uint32_t, std::vector<std::int64_t>> entityCells_;

    std::int64_t hash(std::int64_t x, std::int64_t y) const;
};

} // namespace floorplan
