#pragma once

#include "floorplan/core/config.h"
#include "floorplan/core/types.h"
#include "floorplan/network/wall_diff.h"
#include "floorplan/network/wall_network.h"

#include <cstdint>

// Pure planners for structural wall edits. Each reads the current network, validates,
// and fills a WallDiff; none of them touches persistence. On error the diff is left empty.

namespace floorplan {

struct WallRequest {
    Point2d start;
    Point2d end;
    std::uint32_t storeyId = kInvalidId;
    bool hasThickness = false;
    double thickness = 0.0;
    bool hasHeight = false;
    double height = 0.0;
    WallType type = WallType::Wall;
    bool hasConcreteBase = false;
    double concreteBaseHeight = 0.0;
};

// Identical (type, height, thickness).
bool wallsCompatible(const WallRec& a, const WallRec& b);

// Validates a pairwise merge and builds the merged wall (provisional id not set).
// sharedOut receives the common endpoint.
EditError checkMerge(const WallRec& a, const WallRec& b, double eps, WallRec& mergedOut, Point2d* sharedOut = nullptr);

EditError planAddWall(
    const WallNetwork& network,
    const WallRequest& request,
    const WallDefaults& defaults,
    const EditTolerances& tol,
    WallDiff& out);

EditError planDeleteWall(
    const WallNetwork& network,
    std::uint32_t wallId,
    const EditTolerances& tol,
    WallDiff& out);

// Network-wide merge convergence over one storey. Emits only merge steps.
void planMergePass(
    const WallNetwork& network,
    std::uint32_t storeyId,
    const EditTolerances& tol,
    WallDiff& out);

EditError planSplitWall(
    const WallNetwork& network,
    std::uint32_t wallId,
    const Point2d& at,
    const EditTolerances& tol,
    WallDiff& out);

EditError planMergeWalls(
    const WallNetwork& network,
    std::uint32_t firstId,
    std::uint32_t secondId,
    const EditTolerances& tol,
    WallDiff& out);

// Four perimeter walls of a width x length rectangle anchored at the origin.
EditError planDefaultBoundaryWalls(
    double width,
    double length,
    double height,
    double thickness,
    std::uint32_t storeyId,
    WallDiff& out);

} // namespace floorplan
