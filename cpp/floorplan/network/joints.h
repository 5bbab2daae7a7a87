#pragma once

#include "floorplan/core/types.h"

#include <vector>

namespace floorplan {

// Contacts between wall pairs: shared endpoints, proper crossings, and an endpoint of one
// wall resting against the other within the host's thickness. One record per pair; pairs
// meeting at the same rounded position share the first recorded point.
std::vector<JointRec> findJoints(const std::vector<WallRec>& walls, double eps);

} // namespace floorplan
