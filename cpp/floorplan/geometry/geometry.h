#pragma once

#include "floorplan/core/types.h"

#include <optional>
#include <vector>

namespace floorplan {

inline Segment wallSegment(const WallRec& w) { return Segment{w.start, w.end}; }

double cross(const Point2d& a, const Point2d& b);
double dot(const Point2d& a, const Point2d& b);
double distance(const Point2d& a, const Point2d& b);
double segmentLength(const Segment& s);

bool pointsEqual(const Point2d& p, const Point2d& q, double eps);

// Parametric intersection of two segments. Empty for parallel segments or when the
// crossing lies outside either segment.
std::optional<Point2d> intersect(const Segment& a, const Segment& b);

// Same line: direction vectors parallel within eps (unit cross) and b.a within eps of the line through a.
bool collinear(const Segment& a, const Segment& b, double eps);

// Clamped projection of p onto seg; tOut receives the clamped parameter.
Point2d projectOntoSegment(const Point2d& p, const Segment& seg, double* tOut = nullptr);

double pointSegmentDistance(const Point2d& p, const Segment& seg);

// True when p lies on seg within eps, excluding both endpoints.
bool onSegmentBody(const Point2d& p, const Segment& seg, double eps);

double polygonSignedArea(const std::vector<Point2d>& polygon);

// Even-odd ray cast. Points exactly on an edge may land on either side.
bool pointInPolygon(const Point2d& p, const std::vector<Point2d>& polygon);

// Horizontal-ish segments run left to right, vertical-ish ones by increasing y.
Segment normalizeSegment(const Segment& s);

} // namespace floorplan
