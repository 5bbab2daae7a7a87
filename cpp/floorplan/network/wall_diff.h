#pragma once

#include "floorplan/core/types.h"

#include <cstdint>
#include <vector>

namespace floorplan {

// One pairwise merge. Either input id may be provisional (a wall created by an earlier
// step of the same diff); merged.id is always provisional.
struct WallMergeStep {
    std::uint32_t firstId;
    std::uint32_t secondId;
    WallRec merged;
};

// Plain-value result of a planner. Applied in order: deletes, creates, merges.
// Creates carry provisional ids.
struct WallDiff {
    std::vector<std::uint32_t> deletes;
    std::vector<WallRec> creates;
    std::vector<WallMergeStep> merges;

    bool empty() const { return deletes.empty() && creates.empty() && merges.empty(); }
    void clear() {
        deletes.clear();
        creates.clear();
        merges.clear();
    }
};

class WallNetwork;

// Applies a diff to an in-memory network, assigning real ids from nextId.
// Returns false (leaving the network partially updated) if a step references a missing wall.
bool applyWallDiff(WallNetwork& network, const WallDiff& diff, std::uint32_t& nextId);

} // namespace floorplan
