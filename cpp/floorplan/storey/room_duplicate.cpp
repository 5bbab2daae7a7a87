#include "floorplan/storey/room_duplicate.h"
#include "floorplan/core/logging.h"
#include "floorplan/storey/ghosts.h"

#include <algorithm>

namespace floorplan {

EditError planRoomDuplicate(
    const WallNetwork& network,
    const std::vector<RoomRec>& rooms,
    const StoreyStack& storeys,
    const RoomDuplicateRequest& request,
    double eps,
    RoomDuplicatePlan& out) {
    out = RoomDuplicatePlan{};

    const auto source = std::find_if(rooms.begin(), rooms.end(), [&request](const RoomRec& r) {
        return r.id == request.sourceRoomId;
    });
    if (source == rooms.end()) return EditError::RoomNotFound;
    const StoreyRec* target = storeys.find(request.targetStoreyId);
    if (!target) return EditError::StoreyNotFound;
    if (target->id == source->storeyId) return EditError::InvalidSelection;

    const double base = request.hasBaseElevation
        ? std::max(request.baseElevation, target->elevation)
        : target->elevation;
    const double height = request.hasHeight ? request.height : source->height;
    if (!(height > 0.0)) return EditError::InvalidDimensions;
    const double requiredTop = base + height;

    std::vector<std::uint32_t> copyIds;
    std::uint32_t nextProvisional = kProvisionalIdBase;
    for (const std::uint32_t wallId : source->wallIds) {
        const WallRec* wall = network.find(wallId);
        if (!wall) {
            FLOORPLAN_LOG_ERROR("room %u references missing wall %u", source->id, wallId);
            return EditError::WallNotFound;
        }
        const bool shared = roomsSharingWall(wallId, rooms) > 1;
        if (shared && wallTopElevation(*wall, storeys) >= requiredTop - eps) {
            out.reusedWallIds.push_back(wallId);
            continue;
        }
        WallRec copy = *wall;
        copy.id = nextProvisional++;
        copy.storeyId = target->id;
        out.wallCopies.push_back(copy);
        copyIds.push_back(copy.id);
    }

    out.room = *source;
    out.room.id = kInvalidId;
    out.room.storeyId = target->id;
    out.room.baseElevation = base;
    out.room.height = height;
    out.room.wallIds = out.reusedWallIds;
    out.room.wallIds.insert(out.room.wallIds.end(), copyIds.begin(), copyIds.end());
    return EditError::Ok;
}

} // namespace floorplan
