#pragma once

#include "floorplan/core/types.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace floorplan {

struct RoomMatch {
    std::vector<std::uint32_t> wallIds;         // sorted, deduplicated
    std::vector<std::size_t> unmatchedEdges;    // edge i runs from vertex i to vertex i+1 (wrapping)

    bool complete() const { return unmatchedEdges.empty(); }
};

// Matches every polygon edge (including the closing edge) to walls whose endpoints coincide
// with the edge's, in either direction. Zero-length edges are ignored.
RoomMatch matchRoomBoundary(const std::vector<Point2d>& polygon, const std::vector<WallRec>& walls, double eps);

std::size_t countDistinctVertices(const std::vector<Point2d>& polygon, double eps);

// TooFewVertices, UnmatchedEdge or Ok. out holds the match whenever there are at least 3 distinct vertices.
EditError validateRoomPolygon(const std::vector<Point2d>& polygon, const std::vector<WallRec>& walls, double eps, RoomMatch& out);

// Walks endpoint adjacency of a wall selection that forms a single closed loop.
// Returns false when the walls do not close or leave walls unused.
bool orderPolygonFromWalls(const std::vector<WallRec>& walls, double eps, std::vector<Point2d>& out);

} // namespace floorplan
