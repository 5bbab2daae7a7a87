#pragma once

/**
 * @file constants.h
 * @brief Tolerances and defaults shared by the planners and the edit session.
 *
 * Screen-space values are in pixels and are converted to world units via viewScale.
 * World-space values are in project units (millimetres).
 */

namespace floorplan_constants {

// =============================================================================
// Geometric tolerances (world units)
// =============================================================================

/// Point coincidence and collinearity tolerance
constexpr double GEOMETRY_EPSILON = 0.001;

/// Slack on the parametric range of a segment intersection
constexpr double INTERSECTION_PARAM_SLACK = 1e-9;

/// Below this normalized cross product two segments are treated as parallel
constexpr double PARALLEL_CROSS_EPSILON = 1e-12;

/// A manual split closer than this to either endpoint is rejected
constexpr double SPLIT_ENDPOINT_EXCLUSION = 1.0;

/// How far a manual split point may sit off the wall axis
constexpr double SPLIT_POSITION_TOLERANCE = 0.5;

/// Walls shorter than this cannot be split manually
constexpr double MIN_SPLITTABLE_LENGTH = 2.0;

// =============================================================================
// Snapping (screen pixels)
// =============================================================================

/// Endpoint and body snap radius
constexpr double SNAP_TOLERANCE_PX = 10.0;

/// Room vertices snap to joints within this multiple of the snap radius
constexpr double ROOM_JOINT_SNAP_FACTOR = 3.0;

// =============================================================================
// Wall defaults
// =============================================================================

constexpr double DEFAULT_WALL_THICKNESS = 200.0;
constexpr double DEFAULT_WALL_HEIGHT = 1000.0;

// Perimeter created for a fresh project
constexpr double DEFAULT_PROJECT_WIDTH = 10000.0;
constexpr double DEFAULT_PROJECT_LENGTH = 8000.0;

// =============================================================================
// Storeys and history
// =============================================================================

constexpr double DEFAULT_ROOM_HEIGHT = 2600.0;
constexpr double DEFAULT_SLAB_THICKNESS = 200.0;

/// Tolerance used when comparing elevations for ghost projection
constexpr double GHOST_ELEVATION_EPSILON = 0.001;

constexpr unsigned HISTORY_MAX_DEPTH = 100;

// =============================================================================
// Notifications (milliseconds)
// =============================================================================

constexpr unsigned NOTIFY_SUCCESS_MS = 3000;
constexpr unsigned NOTIFY_ERROR_MS = 5000;

} // namespace floorplan_constants
