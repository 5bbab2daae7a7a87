#include "floorplan/session/edit_session.h"
#include "floorplan/core/logging.h"
#include "floorplan/session/session_internal.h"

#include <algorithm>
#include <limits>

namespace floorplan {

EditError EditSession::createRoom(const RoomRequest& request, std::uint32_t* idOut) {
    if (busy_) return reject(EditError::EditInProgress);
    const StoreyRec* storey = storeys_.find(activeStoreyId_);
    if (!storey) return reject(EditError::StoreyNotFound);

    const double eps = config_.tolerances.epsilon;
    if (countDistinctVertices(request.polygon, eps) < 3) return reject(EditError::TooFewVertices);
    if (polygonHitsGhostArea(request.polygon, ghosts().ghostAreas, eps)) return reject(EditError::InsideGhostArea);

    const std::vector<WallRec> storeyWalls = network_.wallsOnStorey(activeStoreyId_);
    RoomMatch match;
    const EditError err = validateRoomPolygon(request.polygon, storeyWalls, eps, match);
    if (err != EditError::Ok) return reject(err);

    double height = request.height;
    if (request.hasHeight) {
        if (!(height > 0.0)) return reject(EditError::InvalidDimensions);
    } else {
        // Lowest boundary wall, else the storey default
        height = std::numeric_limits<double>::infinity();
        for (const std::uint32_t wallId : match.wallIds) {
            if (const WallRec* w = network_.find(wallId)) height = std::min(height, w->height);
        }
        if (height == std::numeric_limits<double>::infinity()) height = storey->defaultRoomHeight;
    }

    RoomRec room{};
    room.storeyId = storey->id;
    room.name = request.name;
    room.polygon = request.polygon;
    room.wallIds = match.wallIds;
    room.floorType = request.floorType;
    room.floorThickness = request.floorThickness;
    room.height = height;
    room.baseElevation = request.hasBaseElevation ? std::max(request.baseElevation, storey->elevation) : storey->elevation;
    room.hasLabelAnchor = request.hasLabelAnchor;
    room.labelAnchor = request.labelAnchor;
    room.temperature = request.temperature;
    room.remarks = request.remarks;

    BusyScope scope(*this);
    RoomRec saved{};
    const PersistResult r = persistence_.createRoom(room, saved);
    if (!r.ok()) return persistError(r, "create room");

    rooms_.push_back(saved);
    if (idOut) *idOut = saved.id;
    notify(NoticeKind::Success, "Room created.");
    return EditError::Ok;
}

EditError EditSession::updateRoom(const RoomRec& room) {
    if (busy_) return reject(EditError::EditInProgress);
    RoomRec* existing = findRoomMutable(room.id);
    if (!existing) return reject(EditError::RoomNotFound);
    const StoreyRec* storey = storeys_.find(existing->storeyId);
    if (!storey) return reject(EditError::StoreyNotFound);
    if (!(room.height > 0.0)) return reject(EditError::InvalidDimensions);

    const double eps = config_.tolerances.epsilon;
    const GhostProjection projection =
        computeGhosts(network_.walls(), rooms_, storeys_, existing->storeyId, config_.ghostEpsilon);
    if (polygonHitsGhostArea(room.polygon, projection.ghostAreas, eps)) return reject(EditError::InsideGhostArea);

    RoomMatch match;
    const EditError err = validateRoomPolygon(room.polygon, network_.wallsOnStorey(existing->storeyId), eps, match);
    if (err != EditError::Ok) return reject(err);

    RoomRec updated = room;
    updated.storeyId = existing->storeyId;
    updated.wallIds = match.wallIds;
    updated.baseElevation = std::max(room.baseElevation, storey->elevation);

    BusyScope scope(*this);
    RoomRec saved{};
    const PersistResult r = persistence_.updateRoom(updated, saved);
    if (!r.ok()) return persistError(r, "update room");

    *existing = saved;
    notify(NoticeKind::Success, "Room updated.");
    return EditError::Ok;
}

EditError EditSession::setRoomHeight(std::uint32_t roomId, double height) {
    if (busy_) return reject(EditError::EditInProgress);
    RoomRec* room = findRoomMutable(roomId);
    if (!room) return reject(EditError::RoomNotFound);
    if (!(height > 0.0)) return reject(EditError::InvalidDimensions);

    BusyScope scope(*this);
    RoomRec updated = *room;
    updated.height = height;
    RoomRec saved{};
    PersistResult r = persistence_.updateRoom(updated, saved);
    if (!r.ok()) return persistError(r, "update room");
    *room = saved;

    // Boundary walls follow the room height
    for (const std::uint32_t wallId : saved.wallIds) {
        const WallRec* wall = network_.find(wallId);
        if (!wall) {
            FLOORPLAN_LOG_ERROR("room %u references missing wall %u", roomId, wallId);
            continue;
        }
        WallRec raised = *wall;
        raised.height = height;
        WallRec savedWall{};
        r = persistence_.updateWall(raised, savedWall);
        if (!r.ok()) {
            history_.push(network_.walls());
            return persistError(r, "update wall");
        }
        network_.upsert(savedWall);
    }

    history_.push(network_.walls());
    notify(NoticeKind::Success, "Room height updated.");
    return EditError::Ok;
}

EditError EditSession::deleteRoom(std::uint32_t roomId) {
    if (busy_) return reject(EditError::EditInProgress);
    if (!findRoom(roomId)) return reject(EditError::RoomNotFound);

    BusyScope scope(*this);
    const PersistResult r = persistence_.deleteRoom(roomId);
    if (!r.ok()) return persistError(r, "delete room");

    rooms_.erase(std::remove_if(rooms_.begin(), rooms_.end(), [roomId](const RoomRec& rr) {
        return rr.id == roomId;
    }), rooms_.end());
    notify(NoticeKind::Success, "Room deleted.");
    return EditError::Ok;
}

EditError EditSession::duplicateRoomToStorey(const RoomDuplicateRequest& request, std::uint32_t* idOut) {
    if (busy_) return reject(EditError::EditInProgress);

    RoomDuplicatePlan plan;
    const EditError err = planRoomDuplicate(network_, rooms_, storeys_, request, config_.tolerances.epsilon, plan);
    if (err != EditError::Ok) return reject(err);

    BusyScope scope(*this);
    std::unordered_map<std::uint32_t, std::uint32_t> realIds;
    for (const WallRec& copy : plan.wallCopies) {
        WallRec saved{};
        const PersistResult r = persistence_.createWall(copy, saved);
        if (!r.ok()) {
            history_.push(network_.walls());
            return persistError(r, "create wall");
        }
        network_.upsert(saved);
        realIds[copy.id] = saved.id;
    }

    RoomRec room = plan.room;
    for (std::uint32_t& wallId : room.wallIds) {
        if (isProvisionalId(wallId)) wallId = realIds[wallId];
    }
    std::sort(room.wallIds.begin(), room.wallIds.end());

    RoomRec saved{};
    const PersistResult r = persistence_.createRoom(room, saved);
    history_.push(network_.walls());
    if (!r.ok()) return persistError(r, "create room");

    rooms_.push_back(saved);
    if (idOut) *idOut = saved.id;
    notify(NoticeKind::Success, "Room copied to storey.");
    return EditError::Ok;
}

} // namespace floorplan
