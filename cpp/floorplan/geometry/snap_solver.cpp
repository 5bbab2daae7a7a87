#include "floorplan/geometry/snap_solver.h"
#include "floorplan/geometry/geometry.h"

#include <limits>

namespace floorplan {

namespace {
    inline SnapHit rawHit(const Point2d& raw) {
        return SnapHit{raw, SnapTargetKind::None, kInvalidId, 0.0};
    }

    inline void considerEndpoints(const Point2d& raw, const std::vector<WallRec>& walls, double tol, SnapHit& best) {
        for (const WallRec& w : walls) {
            const Point2d ends[2] = {w.start, w.end};
            for (const Point2d& e : ends) {
                const double d = distance(raw, e);
                if (d <= tol && d < best.distance) {
                    best = SnapHit{e, SnapTargetKind::Endpoint, w.id, d};
                }
            }
        }
    }

    inline void considerBodies(const Point2d& raw, const std::vector<WallRec>& walls, double tol, SnapHit& best) {
        for (const WallRec& w : walls) {
            const Point2d proj = projectOntoSegment(raw, wallSegment(w));
            const double d = distance(raw, proj);
            if (d <= tol && d < best.distance) {
                best = SnapHit{proj, SnapTargetKind::Body, w.id, d};
            }
        }
    }

    inline SnapHit unsnapped() {
        return SnapHit{Point2d{0.0, 0.0}, SnapTargetKind::None, kInvalidId, std::numeric_limits<double>::infinity()};
    }
} // namespace

double toWorldTolerance(double tolerancePx, double viewScale) {
    const double px = tolerancePx > 0.0 ? tolerancePx : floorplan_constants::SNAP_TOLERANCE_PX;
    if (viewScale <= 1e-6) return px;
    return px / viewScale;
}

SnapHit resolveSnap(
    const Point2d& raw,
    const std::vector<WallRec>& walls,
    const SnapOptions& options,
    double viewScale) {
    if (!options.enabled) return rawHit(raw);
    const double tol = toWorldTolerance(options.tolerancePx, viewScale);

    SnapHit best = unsnapped();
    if (options.endpointEnabled) {
        considerEndpoints(raw, walls, tol, best);
        if (best.kind != SnapTargetKind::None) return best;
    }
    if (options.bodyEnabled) {
        considerBodies(raw, walls, tol, best);
        if (best.kind != SnapTargetKind::None) return best;
    }
    return rawHit(raw);
}

SnapHit resolveRoomVertexSnap(
    const Point2d& raw,
    const std::vector<WallRec>& walls,
    const std::vector<JointRec>& joints,
    const SnapOptions& options,
    double viewScale) {
    if (!options.enabled) return rawHit(raw);
    const double tol = toWorldTolerance(options.tolerancePx, viewScale);
    const double jointTol = tol * (options.jointFactor > 0.0 ? options.jointFactor : 1.0);

    SnapHit best = unsnapped();
    for (const JointRec& j : joints) {
        const double d = distance(raw, j.point);
        if (d <= jointTol && d < best.distance) {
            best = SnapHit{j.point, SnapTargetKind::Joint, kInvalidId, d};
        }
    }
    if (best.kind != SnapTargetKind::None) return best;

    if (options.endpointEnabled) {
        considerEndpoints(raw, walls, tol, best);
        if (best.kind != SnapTargetKind::None) return best;
    }
    return rawHit(raw);
}

} // namespace floorplan
