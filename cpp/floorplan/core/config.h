#pragma once

#include "floorplan/core/constants.h"
#include "floorplan/core/types.h"

#include <cstddef>

namespace floorplan {

struct EditTolerances {
    double epsilon = floorplan_constants::GEOMETRY_EPSILON;
    double endpointExclusion = floorplan_constants::SPLIT_ENDPOINT_EXCLUSION;
    double positionTolerance = floorplan_constants::SPLIT_POSITION_TOLERANCE;
    double minSplittableLength = floorplan_constants::MIN_SPLITTABLE_LENGTH;
};

struct SnapOptions {
    bool enabled = true;
    bool endpointEnabled = true;
    bool bodyEnabled = true;
    double tolerancePx = floorplan_constants::SNAP_TOLERANCE_PX;
    double jointFactor = floorplan_constants::ROOM_JOINT_SNAP_FACTOR;
};

struct WallDefaults {
    double thickness = floorplan_constants::DEFAULT_WALL_THICKNESS;
    double height = floorplan_constants::DEFAULT_WALL_HEIGHT;
    WallType type = WallType::Wall;
};

struct SessionConfig {
    EditTolerances tolerances;
    SnapOptions snap;
    WallDefaults wallDefaults;
    std::size_t historyDepth = floorplan_constants::HISTORY_MAX_DEPTH;
    double ghostEpsilon = floorplan_constants::GHOST_ELEVATION_EPSILON;
    unsigned successNoticeMs = floorplan_constants::NOTIFY_SUCCESS_MS;
    unsigned errorNoticeMs = floorplan_constants::NOTIFY_ERROR_MS;
};

} // namespace floorplan
