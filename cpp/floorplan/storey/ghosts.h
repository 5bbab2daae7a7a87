#pragma once

#include "floorplan/core/types.h"
#include "floorplan/storey/storey_stack.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace floorplan {

struct GhostProjection {
    std::vector<WallRec> ghostWalls;
    std::vector<GhostArea> ghostAreas;
};

// Number of rooms listing wallId among their boundary walls.
std::size_t roomsSharingWall(std::uint32_t wallId, const std::vector<RoomRec>& rooms);

// Storey elevation plus wall height.
double wallTopElevation(const WallRec& wall, const StoreyStack& storeys);

// Lowest base elevation of the rooms bounded by the wall, else its storey elevation.
double wallBaseElevation(const WallRec& wall, const std::vector<RoomRec>& rooms, const StoreyStack& storeys);

// Rounded vertex list, rotated to start at the smallest vertex and walked in a fixed
// direction, so that the same footprint yields the same string however it was traced.
std::string geometricSignature(const std::vector<Point2d>& polygon);

// View-only projection of other storeys onto the active one. Recomputed on demand.
// Only walls and rooms from storeys below are projected, never from storeys above.
GhostProjection computeGhosts(
    const std::vector<WallRec>& walls,
    const std::vector<RoomRec>& rooms,
    const StoreyStack& storeys,
    std::uint32_t activeStoreyId,
    double eps);

// True when a polygon vertex lies strictly inside a ghost area, or the polygon retraces
// a ghost footprint. Concave rooms wrapping a ghost are allowed.
// Points within eps of a ghost outline are outside.
bool polygonHitsGhostArea(const std::vector<Point2d>& polygon, const std::vector<GhostArea>& ghosts, double eps);

} // namespace floorplan
