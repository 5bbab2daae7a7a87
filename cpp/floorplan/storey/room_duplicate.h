#pragma once

#include "floorplan/core/types.h"
#include "floorplan/network/wall_network.h"
#include "floorplan/storey/storey_stack.h"

#include <cstdint>
#include <vector>

namespace floorplan {

struct RoomDuplicateRequest {
    std::uint32_t sourceRoomId = kInvalidId;
    std::uint32_t targetStoreyId = kInvalidId;
    bool hasBaseElevation = false;
    double baseElevation = 0.0;
    bool hasHeight = false;
    double height = 0.0;
};

struct RoomDuplicatePlan {
    std::vector<std::uint32_t> reusedWallIds;
    std::vector<WallRec> wallCopies;    // provisional ids, on the target storey
    RoomRec room;                       // id 0; wallIds = reused ids followed by the copies' provisional ids
};

// A source wall is reused when more than one room already shares it and its top reaches the
// target room's top; otherwise it is copied onto the target storey. The target base elevation
// never drops below the target storey's elevation.
EditError planRoomDuplicate(
    const WallNetwork& network,
    const std::vector<RoomRec>& rooms,
    const StoreyStack& storeys,
    const RoomDuplicateRequest& request,
    double eps,
    RoomDuplicatePlan& out);

} // namespace floorplan
