#include "floorplan/geometry/geometry.h"
#include "floorplan/core/constants.h"

#include <algorithm>
#include <cmath>

namespace floorplan {

double cross(const Point2d& a, const Point2d& b) {
    return a.x * b.y - a.y * b.x;
}

double dot(const Point2d& a, const Point2d& b) {
    return a.x * b.x + a.y * b.y;
}

double distance(const Point2d& a, const Point2d& b) {
    return std::hypot(a.x - b.x, a.y - b.y);
}

double segmentLength(const Segment& s) {
    return distance(s.a, s.b);
}

bool pointsEqual(const Point2d& p, const Point2d& q, double eps) {
    return distance(p, q) < eps;
}

std::optional<Point2d> intersect(const Segment& a, const Segment& b) {
    const Point2d r = a.b - a.a;
    const Point2d s = b.b - b.a;
    const double denom = cross(r, s);
    const double lenProduct = std::hypot(r.x, r.y) * std::hypot(s.x, s.y);
    if (lenProduct <= 0.0) return std::nullopt;
    if (std::abs(denom) / lenProduct < floorplan_constants::PARALLEL_CROSS_EPSILON) return std::nullopt;

    const Point2d qp = b.a - a.a;
    const double ua = cross(qp, s) / denom;
    const double ub = cross(qp, r) / denom;
    constexpr double slack = floorplan_constants::INTERSECTION_PARAM_SLACK;
    if (ua < -slack || ua > 1.0 + slack) return std::nullopt;
    if (ub < -slack || ub > 1.0 + slack) return std::nullopt;

    return a.a + r * ua;
}

bool collinear(const Segment& a, const Segment& b, double eps) {
    const Point2d da = a.b - a.a;
    const Point2d db = b.b - b.a;
    const double la = std::hypot(da.x, da.y);
    const double lb = std::hypot(db.x, db.y);
    if (la <= 0.0 || lb <= 0.0) return false;

    const Point2d ua{da.x / la, da.y / la};
    const Point2d ub{db.x / lb, db.y / lb};
    if (std::abs(cross(ua, ub)) > eps) return false;

    // Perpendicular distance of b.a from the infinite line through a
    const double offset = std::abs(cross(ua, b.a - a.a));
    return offset <= eps;
}

Point2d projectOntoSegment(const Point2d& p, const Segment& seg, double* tOut) {
    const Point2d d = seg.b - seg.a;
    const double lenSq = dot(d, d);
    double t = 0.0;
    if (lenSq > 0.0) {
        t = dot(p - seg.a, d) / lenSq;
        t = std::clamp(t, 0.0, 1.0);
    }
    if (tOut) *tOut = t;
    return seg.a + d * t;
}

double pointSegmentDistance(const Point2d& p, const Segment& seg) {
    return distance(p, projectOntoSegment(p, seg));
}

bool onSegmentBody(const Point2d& p, const Segment& seg, double eps) {
    if (segmentLength(seg) < eps) return false;
    if (pointsEqual(p, seg.a, eps) || pointsEqual(p, seg.b, eps)) return false;
    double t = 0.0;
    const Point2d proj = projectOntoSegment(p, seg, &t);
    if (t <= 0.0 || t >= 1.0) return false;
    return pointsEqual(proj, p, eps);
}

double polygonSignedArea(const std::vector<Point2d>& polygon) {
    const std::size_t n = polygon.size();
    if (n < 3) return 0.0;
    double sum = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const Point2d& a = polygon[i];
        const Point2d& b = polygon[(i + 1) % n];
        sum += a.x * b.y - b.x * a.y;
    }
    return sum * 0.5;
}

bool pointInPolygon(const Point2d& p, const std::vector<Point2d>& polygon) {
    const std::size_t n = polygon.size();
    if (n < 3) return false;
    bool inside = false;
    for (std::size_t i = 0, j = n - 1; i < n; j = i++) {
        const Point2d& pi = polygon[i];
        const Point2d& pj = polygon[j];
        const bool straddles = (pi.y > p.y) != (pj.y > p.y);
        if (straddles) {
            const double xCross = (pj.x - pi.x) * (p.y - pi.y) / (pj.y - pi.y) + pi.x;
            if (p.x < xCross) inside = !inside;
        }
    }
    return inside;
}

Segment normalizeSegment(const Segment& s) {
    const double dx = s.b.x - s.a.x;
    const double dy = s.b.y - s.a.y;
    if (std::abs(dy) < std::abs(dx)) {
        if (s.a.x > s.b.x) return Segment{s.b, s.a};
        return s;
    }
    if (s.a.y > s.b.y) return Segment{s.b, s.a};
    return s;
}

} // namespace floorplan
