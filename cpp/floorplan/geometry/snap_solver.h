#pragma once

#include "floorplan/core/config.h"
#include "floorplan/core/types.h"

#include <cstdint>
#include <vector>

namespace floorplan {

enum class SnapTargetKind : std::uint8_t {
    None = 0,
    Endpoint = 1,
    Body = 2,
    Joint = 3,
};

struct SnapHit {
    Point2d point;
    SnapTargetKind kind;
    std::uint32_t wallId;   // 0 for raw points and joints
    double distance;
};

double toWorldTolerance(double tolerancePx, double viewScale);

// Wall drawing: nearest endpoint, else nearest body point, else the raw point.
SnapHit resolveSnap(
    const Point2d& raw,
    const std::vector<WallRec>& walls,
    const SnapOptions& options,
    double viewScale);

// Room vertex placement: nearest joint within jointFactor x tolerance, else nearest endpoint.
SnapHit resolveRoomVertexSnap(
    const Point2d& raw,
    const std::vector<WallRec>& walls,
    const std::vector<JointRec>& joints,
    const SnapOptions& options,
    double viewScale);

} // namespace floorplan
