#include "floorplan/network/wall_planner.h"
#include "floorplan/core/logging.h"
#include "floorplan/geometry/geometry.h"

#include <algorithm>
#include <deque>

namespace floorplan {

namespace {

struct WallSplit {
    WallRec wall;
    std::vector<Point2d> points;
    bool crossed = false;
};

void addUniquePoint(std::vector<Point2d>& points, const Point2d& p, double eps) {
    for (const Point2d& q : points) {
        if (pointsEqual(p, q, eps)) return;
    }
    points.push_back(p);
}

// Orders points along the segment starting at origin and chains them into pieces.
// Zero-length pieces are dropped.
std::vector<Segment> chainPieces(const Point2d& origin, const Point2d& terminus, std::vector<Point2d> interior, double eps) {
    std::sort(interior.begin(), interior.end(), [&origin](const Point2d& a, const Point2d& b) {
        return distance(origin, a) < distance(origin, b);
    });
    std::vector<Point2d> chain;
    chain.push_back(origin);
    for (const Point2d& p : interior) chain.push_back(p);
    chain.push_back(terminus);

    std::vector<Segment> pieces;
    for (std::size_t i = 0; i + 1 < chain.size(); ++i) {
        const Segment piece{chain[i], chain[i + 1]};
        if (segmentLength(piece) < eps) continue;
        pieces.push_back(normalizeSegment(piece));
    }
    return pieces;
}

bool sameSegment(const Segment& a, const Segment& b, double eps) {
    return (pointsEqual(a.a, b.a, eps) && pointsEqual(a.b, b.b, eps)) ||
           (pointsEqual(a.a, b.b, eps) && pointsEqual(a.b, b.a, eps));
}

WallRec withSegment(const WallRec& source, const Segment& seg, std::uint32_t id) {
    WallRec rec = source;
    rec.id = id;
    rec.start = seg.a;
    rec.end = seg.b;
    return rec;
}

// Fixed point over a worklist of candidate junctions. Every endpoint of the scratch
// network is seeded, and every merge re-queues the merged wall's endpoints, so an
// empty worklist means no junction in the network can merge any further.
void runMergeWorklist(
    WallNetwork& scratch,
    std::uint32_t storeyId,
    const std::vector<Point2d>& seeds,
    double eps,
    std::uint32_t& nextProvisional,
    WallDiff& out) {
    std::deque<Point2d> worklist(seeds.begin(), seeds.end());
    for (const Point2d& p : scratch.endpoints(storeyId, eps)) worklist.push_back(p);

    while (!worklist.empty()) {
        const Point2d p = worklist.front();
        worklist.pop_front();

        const std::vector<std::uint32_t> touching = scratch.wallsWithEndpointAt(p, eps, storeyId);
        if (touching.size() != 2) continue;
        if (!scratch.wallsWithBodyAt(p, eps, storeyId).empty()) continue;

        const WallRec first = *scratch.find(touching[0]);
        const WallRec second = *scratch.find(touching[1]);
        WallRec merged{};
        if (checkMerge(first, second, eps, merged) != EditError::Ok) continue;

        merged.id = nextProvisional++;
        out.merges.push_back(WallMergeStep{first.id, second.id, merged});
        FLOORPLAN_LOG_DEBUG("merge planned: %u + %u at (%.3f, %.3f)", first.id, second.id, p.x, p.y);

        scratch.remove(first.id);
        scratch.remove(second.id);
        scratch.upsert(merged);
        worklist.push_back(merged.start);
        worklist.push_back(merged.end);
    }
}

} // namespace

bool wallsCompatible(const WallRec& a, const WallRec& b) {
    return a.type == b.type && a.height == b.height && a.thickness == b.thickness;
}

EditError checkMerge(const WallRec& a, const WallRec& b, double eps, WallRec& mergedOut, Point2d* sharedOut) {
    if (!wallsCompatible(a, b)) return EditError::IncompatibleAttributes;
    if (!collinear(wallSegment(a), wallSegment(b), eps)) return EditError::NotCollinear;

    const Point2d aEnds[2] = {a.start, a.end};
    const Point2d bEnds[2] = {b.start, b.end};
    int sharedCount = 0;
    int ai = -1;
    int bi = -1;
    for (int i = 0; i < 2; ++i) {
        for (int j = 0; j < 2; ++j) {
            if (pointsEqual(aEnds[i], bEnds[j], eps)) {
                ++sharedCount;
                ai = i;
                bi = j;
            }
        }
    }
    if (sharedCount != 1) return EditError::NotConnected;

    const Point2d shared = aEnds[ai];
    const Point2d farA = aEnds[1 - ai];
    const Point2d farB = bEnds[1 - bi];
    // Collinear walls folding back over each other share an endpoint but do not continue the line
    if (dot(farA - shared, farB - shared) >= 0.0) return EditError::NotConnected;

    mergedOut = withSegment(a, normalizeSegment(Segment{farA, farB}), kInvalidId);
    if (sharedOut) *sharedOut = shared;
    return EditError::Ok;
}

EditError planAddWall(
    const WallNetwork& network,
    const WallRequest& request,
    const WallDefaults& defaults,
    const EditTolerances& tol,
    WallDiff& out) {
    out.clear();
    const double eps = tol.epsilon;

    if ((request.hasThickness && !(request.thickness > 0.0)) || (request.hasHeight && !(request.height > 0.0))) {
        return EditError::InvalidDimensions;
    }
    const Segment seg = normalizeSegment(Segment{request.start, request.end});
    if (segmentLength(seg) < eps) return EditError::DegenerateWall;

    const std::vector<WallRec> storeyWalls = network.wallsOnStorey(request.storeyId);

    std::vector<WallSplit> splits;
    std::vector<Point2d> newSplitPoints;
    for (const WallRec& w : storeyWalls) {
        const Segment ws = wallSegment(w);
        WallSplit entry;
        entry.wall = w;

        // New wall starting or ending on this wall's body
        if (onSegmentBody(seg.a, ws, eps)) addUniquePoint(entry.points, seg.a, eps);
        if (onSegmentBody(seg.b, ws, eps)) addUniquePoint(entry.points, seg.b, eps);

        // Proper crossing of both interiors
        if (const auto hit = intersect(seg, ws)) {
            const Point2d p = *hit;
            const bool atNewEnd = pointsEqual(p, seg.a, eps) || pointsEqual(p, seg.b, eps);
            const bool atOldEnd = pointsEqual(p, ws.a, eps) || pointsEqual(p, ws.b, eps);
            if (!atNewEnd && !atOldEnd) {
                addUniquePoint(entry.points, p, eps);
                addUniquePoint(newSplitPoints, p, eps);
                entry.crossed = true;
            }
        }

        // Existing wall ending on the new wall's body (T junction onto the new wall)
        if (onSegmentBody(ws.a, seg, eps)) addUniquePoint(newSplitPoints, ws.a, eps);
        if (onSegmentBody(ws.b, seg, eps)) addUniquePoint(newSplitPoints, ws.b, eps);

        if (!entry.points.empty()) splits.push_back(entry);
    }

    // Inherited dimensions: crossed wall > wall at the start point > first wall > defaults
    const WallRec* source = nullptr;
    for (const WallSplit& s : splits) {
        if (s.crossed) {
            source = &s.wall;
            break;
        }
    }
    if (!source) {
        for (const WallRec& w : storeyWalls) {
            if (pointsEqual(w.start, request.start, eps) || pointsEqual(w.end, request.start, eps) ||
                onSegmentBody(request.start, wallSegment(w), eps)) {
                source = &w;
                break;
            }
        }
    }
    if (!source && !network.empty()) source = &network.walls().front();

    WallRec proto{};
    proto.storeyId = request.storeyId;
    proto.type = request.type;
    proto.hasConcreteBase = request.hasConcreteBase;
    proto.concreteBaseHeight = request.concreteBaseHeight;
    proto.thickness = request.hasThickness ? request.thickness : (source ? source->thickness : defaults.thickness);
    proto.height = request.hasHeight ? request.height : (source ? source->height : defaults.height);

    std::uint32_t nextProvisional = kProvisionalIdBase;
    std::vector<Segment> occupied;
    for (const WallSplit& s : splits) {
        out.deletes.push_back(s.wall.id);
        for (const Segment& piece : chainPieces(s.wall.start, s.wall.end, s.points, eps)) {
            out.creates.push_back(withSegment(s.wall, piece, nextProvisional++));
            occupied.push_back(piece);
        }
    }
    for (const WallRec& w : storeyWalls) {
        const bool isSplit = std::any_of(splits.begin(), splits.end(), [&w](const WallSplit& s) {
            return s.wall.id == w.id;
        });
        if (!isSplit) occupied.push_back(wallSegment(w));
    }

    for (const Segment& piece : chainPieces(seg.a, seg.b, newSplitPoints, eps)) {
        // Overlap with a collinear wall: the shared stretch already exists
        const bool duplicate = std::any_of(occupied.begin(), occupied.end(), [&](const Segment& o) {
            return sameSegment(o, piece, eps);
        });
        if (duplicate) continue;
        out.creates.push_back(withSegment(proto, piece, nextProvisional++));
    }

    FLOORPLAN_LOG_DEBUG("planAddWall: %zu deletes, %zu creates", out.deletes.size(), out.creates.size());
    return EditError::Ok;
}

EditError planDeleteWall(
    const WallNetwork& network,
    std::uint32_t wallId,
    const EditTolerances& tol,
    WallDiff& out) {
    out.clear();
    const double eps = tol.epsilon;
    const WallRec* target = network.find(wallId);
    if (!target) return EditError::WallNotFound;

    const Segment ts = wallSegment(*target);
    std::vector<Point2d> checkPoints{ts.a, ts.b};
    const std::vector<WallRec> storeyWalls = network.wallsOnStorey(target->storeyId);
    for (const WallRec& w : storeyWalls) {
        if (w.id == wallId) continue;
        const Segment ws = wallSegment(w);
        const auto hit = intersect(ts, ws);
        if (!hit) continue;
        if (pointsEqual(*hit, ts.a, eps) || pointsEqual(*hit, ts.b, eps)) continue;
        if (pointsEqual(*hit, ws.a, eps) || pointsEqual(*hit, ws.b, eps)) continue;
        addUniquePoint(checkPoints, *hit, eps);
    }

    out.deletes.push_back(wallId);

    WallNetwork scratch(storeyWalls);
    scratch.remove(wallId);
    std::uint32_t nextProvisional = kProvisionalIdBase;
    runMergeWorklist(scratch, target->storeyId, checkPoints, eps, nextProvisional, out);
    return EditError::Ok;
}

void planMergePass(
    const WallNetwork& network,
    std::uint32_t storeyId,
    const EditTolerances& tol,
    WallDiff& out) {
    out.clear();
    WallNetwork scratch(network.wallsOnStorey(storeyId));
    std::uint32_t nextProvisional = kProvisionalIdBase;
    runMergeWorklist(scratch, storeyId, {}, tol.epsilon, nextProvisional, out);
}

EditError planSplitWall(
    const WallNetwork& network,
    std::uint32_t wallId,
    const Point2d& at,
    const EditTolerances& tol,
    WallDiff& out) {
    out.clear();
    const WallRec* wall = network.find(wallId);
    if (!wall) return EditError::WallNotFound;

    const Segment ws = wallSegment(*wall);
    if (segmentLength(ws) < tol.minSplittableLength) return EditError::WallTooShort;
    if (distance(at, ws.a) < tol.endpointExclusion || distance(at, ws.b) < tol.endpointExclusion) {
        return EditError::PointNearEndpoint;
    }
    double t = 0.0;
    const Point2d onAxis = projectOntoSegment(at, ws, &t);
    if (t <= 0.0 || t >= 1.0 || distance(onAxis, at) > tol.positionTolerance) {
        return EditError::PointOffSegment;
    }

    out.deletes.push_back(wallId);
    out.creates.push_back(withSegment(*wall, normalizeSegment(Segment{ws.a, onAxis}), kProvisionalIdBase));
    out.creates.push_back(withSegment(*wall, normalizeSegment(Segment{onAxis, ws.b}), kProvisionalIdBase + 1));
    return EditError::Ok;
}

EditError planMergeWalls(
    const WallNetwork& network,
    std::uint32_t firstId,
    std::uint32_t secondId,
    const EditTolerances& tol,
    WallDiff& out) {
    out.clear();
    if (firstId == secondId) return EditError::InvalidSelection;
    const WallRec* first = network.find(firstId);
    const WallRec* second = network.find(secondId);
    if (!first || !second) return EditError::WallNotFound;
    if (first->storeyId != second->storeyId) return EditError::InvalidSelection;

    WallRec merged{};
    const EditError err = checkMerge(*first, *second, tol.epsilon, merged);
    if (err != EditError::Ok) return err;

    merged.id = kProvisionalIdBase;
    out.merges.push_back(WallMergeStep{firstId, secondId, merged});
    return EditError::Ok;
}

EditError planDefaultBoundaryWalls(
    double width,
    double length,
    double height,
    double thickness,
    std::uint32_t storeyId,
    WallDiff& out) {
    out.clear();
    if (!(width > 0.0) || !(length > 0.0) || !(height > 0.0) || !(thickness > 0.0)) {
        return EditError::InvalidDimensions;
    }

    WallRec proto{};
    proto.storeyId = storeyId;
    proto.height = height;
    proto.thickness = thickness;
    proto.type = WallType::Wall;

    const Point2d corners[4] = {{0.0, 0.0}, {width, 0.0}, {width, length}, {0.0, length}};
    for (std::uint32_t i = 0; i < 4; ++i) {
        const Segment side = normalizeSegment(Segment{corners[i], corners[(i + 1) % 4]});
        out.creates.push_back(withSegment(proto, side, kProvisionalIdBase + i));
    }
    return EditError::Ok;
}

} // namespace floorplan
