#include "floorplan/storey/ghosts.h"
#include "floorplan/geometry/geometry.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <set>
#include <utility>

namespace floorplan {

namespace {
using RoundedVertex = std::pair<long long, long long>;

// Vertices on the outline belong to neighbouring rooms, not to the void.
bool strictlyInside(const Point2d& p, const std::vector<Point2d>& polygon, double eps) {
    const std::size_t n = polygon.size();
    for (std::size_t i = 0; i < n; ++i) {
        if (pointSegmentDistance(p, Segment{polygon[i], polygon[(i + 1) % n]}) <= eps) return false;
    }
    return pointInPolygon(p, polygon);
}
} // namespace

std::size_t roomsSharingWall(std::uint32_t wallId, const std::vector<RoomRec>& rooms) {
    std::size_t count = 0;
    for (const RoomRec& r : rooms) {
        if (std::find(r.wallIds.begin(), r.wallIds.end(), wallId) != r.wallIds.end()) ++count;
    }
    return count;
}

double wallTopElevation(const WallRec& wall, const StoreyStack& storeys) {
    return storeys.elevationOf(wall.storeyId) + wall.height;
}

double wallBaseElevation(const WallRec& wall, const std::vector<RoomRec>& rooms, const StoreyStack& storeys) {
    double base = std::numeric_limits<double>::infinity();
    for (const RoomRec& r : rooms) {
        if (std::find(r.wallIds.begin(), r.wallIds.end(), wall.id) != r.wallIds.end()) {
            base = std::min(base, r.baseElevation);
        }
    }
    return std::isfinite(base) ? base : storeys.elevationOf(wall.storeyId);
}

std::string geometricSignature(const std::vector<Point2d>& polygon) {
    std::vector<RoundedVertex> verts;
    for (const Point2d& p : polygon) {
        const RoundedVertex v{std::llround(p.x), std::llround(p.y)};
        if (!verts.empty() && verts.back() == v) continue;
        verts.push_back(v);
    }
    while (verts.size() > 1 && verts.front() == verts.back()) verts.pop_back();
    if (verts.empty()) return std::string();

    const std::size_t n = verts.size();
    const std::size_t start = static_cast<std::size_t>(std::min_element(verts.begin(), verts.end()) - verts.begin());
    const bool forward = verts[(start + 1) % n] <= verts[(start + n - 1) % n];

    std::string sig;
    for (std::size_t k = 0; k < n; ++k) {
        const std::size_t idx = forward ? (start + k) % n : (start + n - k) % n;
        sig += std::to_string(verts[idx].first);
        sig += ',';
        sig += std::to_string(verts[idx].second);
        sig += ';';
    }
    return sig;
}

GhostProjection computeGhosts(
    const std::vector<WallRec>& walls,
    const std::vector<RoomRec>& rooms,
    const StoreyStack& storeys,
    std::uint32_t activeStoreyId,
    double eps) {
    GhostProjection out;
    const StoreyRec* active = storeys.find(activeStoreyId);
    if (!active) return out;

    // Walls from other storeys spanning the full height of the active storey
    const double requiredTop = active->elevation + active->defaultRoomHeight;
    for (const WallRec& w : walls) {
        if (w.storeyId == activeStoreyId) continue;
        if (roomsSharingWall(w.id, rooms) <= 1) continue;
        if (wallBaseElevation(w, rooms, storeys) > active->elevation + eps) continue;
        if (wallTopElevation(w, storeys) < requiredTop - eps) continue;
        out.ghostWalls.push_back(w);
    }

    // Footprints from lower storeys still rising through the active elevation.
    // Rooms at the active storey and higher ghosts claim their signature first.
    std::set<std::string> claimed;
    for (const RoomRec& r : rooms) {
        if (r.storeyId == activeStoreyId) claimed.insert(geometricSignature(r.polygon));
    }
    for (const StoreyRec& below : storeys.storeysBelow(activeStoreyId)) {
        for (const RoomRec& r : rooms) {
            if (r.storeyId != below.id) continue;
            const double top = r.baseElevation + r.height;
            if (top <= active->elevation + eps) continue;
            const std::string sig = geometricSignature(r.polygon);
            if (!claimed.insert(sig).second) continue;
            out.ghostAreas.push_back(GhostArea{r.id, r.storeyId, r.polygon, r.baseElevation, top});
        }
    }
    return out;
}

bool polygonHitsGhostArea(const std::vector<Point2d>& polygon, const std::vector<GhostArea>& ghosts, double eps) {
    if (polygon.empty()) return false;

    const std::string signature = geometricSignature(polygon);
    for (const GhostArea& g : ghosts) {
        if (geometricSignature(g.polygon) == signature) return true;
        for (const Point2d& p : polygon) {
            if (strictlyInside(p, g.polygon, eps)) return true;
        }
    }
    return false;
}

} // namespace floorplan
