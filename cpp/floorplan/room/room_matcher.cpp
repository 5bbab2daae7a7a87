#include "floorplan/room/room_matcher.h"
#include "floorplan/geometry/geometry.h"

#include <algorithm>

namespace floorplan {

RoomMatch matchRoomBoundary(const std::vector<Point2d>& polygon, const std::vector<WallRec>& walls, double eps) {
    RoomMatch out;
    const std::size_t n = polygon.size();
    if (n < 2) return out;

    for (std::size_t i = 0; i < n; ++i) {
        const Point2d& a = polygon[i];
        const Point2d& b = polygon[(i + 1) % n];
        if (pointsEqual(a, b, eps)) continue;

        bool matched = false;
        for (const WallRec& w : walls) {
            const bool forward = pointsEqual(w.start, a, eps) && pointsEqual(w.end, b, eps);
            const bool backward = pointsEqual(w.start, b, eps) && pointsEqual(w.end, a, eps);
            if (forward || backward) {
                out.wallIds.push_back(w.id);
                matched = true;
            }
        }
        if (!matched) out.unmatchedEdges.push_back(i);
    }

    std::sort(out.wallIds.begin(), out.wallIds.end());
    out.wallIds.erase(std::unique(out.wallIds.begin(), out.wallIds.end()), out.wallIds.end());
    return out;
}

std::size_t countDistinctVertices(const std::vector<Point2d>& polygon, double eps) {
    std::vector<Point2d> distinct;
    for (const Point2d& p : polygon) {
        const bool seen = std::any_of(distinct.begin(), distinct.end(), [&](const Point2d& q) {
            return pointsEqual(p, q, eps);
        });
        if (!seen) distinct.push_back(p);
    }
    return distinct.size();
}

EditError validateRoomPolygon(const std::vector<Point2d>& polygon, const std::vector<WallRec>& walls, double eps, RoomMatch& out) {
    out = RoomMatch{};
    if (countDistinctVertices(polygon, eps) < 3) return EditError::TooFewVertices;
    out = matchRoomBoundary(polygon, walls, eps);
    if (!out.complete()) return EditError::UnmatchedEdge;
    return EditError::Ok;
}

bool orderPolygonFromWalls(const std::vector<WallRec>& walls, double eps, std::vector<Point2d>& out) {
    out.clear();
    if (walls.size() < 3) return false;

    std::vector<bool> used(walls.size(), false);
    used[0] = true;
    const Point2d origin = walls[0].start;
    Point2d current = walls[0].end;
    out.push_back(origin);

    for (std::size_t step = 1; step < walls.size(); ++step) {
        out.push_back(current);
        bool advanced = false;
        for (std::size_t i = 0; i < walls.size(); ++i) {
            if (used[i]) continue;
            if (pointsEqual(walls[i].start, current, eps)) {
                current = walls[i].end;
            } else if (pointsEqual(walls[i].end, current, eps)) {
                current = walls[i].start;
            } else {
                continue;
            }
            used[i] = true;
            advanced = true;
            break;
        }
        if (!advanced) {
            out.clear();
            return false;
        }
    }

    if (!pointsEqual(current, origin, eps)) {
        out.clear();
        return false;
    }
    return true;
}

} // namespace floorplan
