#include "floorplan/core/digest.h"

#include <algorithm>

namespace floorplan {

// Ids are excluded: the same geometry re-created through persistence digests identically.
std::uint64_t wallDigest(const WallRec& wall) {
    std::uint64_t h = kDigestOffset;
    h = hashU32(h, wall.storeyId);
    // Direction does not matter for geometry, hash the lexicographically smaller endpoint first.
    Point2d a = wall.start;
    Point2d b = wall.end;
    if (b.x < a.x || (b.x == a.x && b.y < a.y)) std::swap(a, b);
    h = hashF64(h, a.x);
    h = hashF64(h, a.y);
    h = hashF64(h, b.x);
    h = hashF64(h, b.y);
    h = hashF64(h, wall.thickness);
    h = hashF64(h, wall.height);
    h = hashU32(h, static_cast<std::uint32_t>(wall.type));
    h = hashU32(h, wall.hasConcreteBase ? 1u : 0u);
    h = hashF64(h, wall.concreteBaseHeight);
    return h;
}

std::uint64_t networkDigest(const std::vector<WallRec>& walls) {
    std::vector<std::uint64_t> parts;
    parts.reserve(walls.size());
    for (const WallRec& w : walls) parts.push_back(wallDigest(w));
    std::sort(parts.begin(), parts.end());

    std::uint64_t h = kDigestOffset;
    h = hashU32(h, static_cast<std::uint32_t>(parts.size()));
    for (const std::uint64_t p : parts) h = hashU64(h, p);
    return h;
}

} // namespace floorplan
