#include "floorplan/network/joints.h"
#include "floorplan/geometry/geometry.h"

#include <cmath>
#include <map>
#include <optional>
#include <utility>

namespace floorplan {

namespace {

using PositionKey = std::pair<long long, long long>;

PositionKey roundedKey(const Point2d& p) {
    return PositionKey{std::llround(p.x), std::llround(p.y)};
}

// Endpoint of `probe` lying along `host` within the host's thickness.
std::optional<Point2d> touchesBody(const WallRec& probe, const WallRec& host) {
    const Point2d d = host.end - host.start;
    const double length = std::hypot(d.x, d.y);
    if (length <= 0.0) return std::nullopt;
    const Point2d u{d.x / length, d.y / length};
    const Point2d n{-u.y, u.x};
    const Point2d ends[2] = {probe.start, probe.end};
    for (const Point2d& pt : ends) {
        const Point2d rel = pt - host.start;
        const double along = dot(rel, u);
        const double perp = dot(rel, n);
        if (along >= 0.0 && along <= length && std::abs(perp) <= host.thickness) return pt;
    }
    return std::nullopt;
}

} // namespace

std::vector<JointRec> findJoints(const std::vector<WallRec>& walls, double eps) {
    std::vector<JointRec> joints;
    std::map<PositionKey, Point2d> positions;

    auto record = [&](const WallRec& a, const WallRec& b, const Point2d& at) {
        const auto inserted = positions.emplace(roundedKey(at), at);
        joints.push_back(JointRec{a.id, b.id, inserted.first->second, JointMethod::ButtIn});
    };

    for (std::size_t i = 0; i < walls.size(); ++i) {
        for (std::size_t j = i + 1; j < walls.size(); ++j) {
            const WallRec& a = walls[i];
            const WallRec& b = walls[j];
            if (a.storeyId != b.storeyId) continue;

            const Point2d aEnds[2] = {a.start, a.end};
            const Point2d bEnds[2] = {b.start, b.end};
            bool shared = false;
            for (const Point2d& pa : aEnds) {
                for (const Point2d& pb : bEnds) {
                    if (!shared && pointsEqual(pa, pb, eps)) {
                        record(a, b, pa);
                        shared = true;
                    }
                }
            }
            if (shared) continue;

            if (const auto hit = intersect(wallSegment(a), wallSegment(b))) {
                record(a, b, *hit);
                continue;
            }
            if (const auto touch = touchesBody(a, b)) {
                record(a, b, *touch);
                continue;
            }
            if (const auto touch = touchesBody(b, a)) {
                record(b, a, *touch);
            }
        }
    }
    return joints;
}

} // namespace floorplan
