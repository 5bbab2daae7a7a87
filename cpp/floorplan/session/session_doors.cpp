#include "floorplan/session/edit_session.h"
#include "floorplan/geometry/geometry.h"
#include "floorplan/session/session_internal.h"

#include <algorithm>

namespace floorplan {

namespace {
EditError validateDoor(const DoorRec& door, const WallNetwork& network) {
    const WallRec* wall = network.find(door.wallId);
    if (!wall) return EditError::InvalidDoorPosition;
    if (!(door.width > 0.0) || !(door.height > 0.0)) return EditError::InvalidDimensions;
    if (door.position < 0.0 || door.position > 1.0) return EditError::InvalidDoorPosition;
    if (door.width > segmentLength(wallSegment(*wall))) return EditError::InvalidDoorPosition;
    return EditError::Ok;
}
} // namespace

EditError EditSession::createDoor(const DoorRec& attrs, std::uint32_t* idOut) {
    if (busy_) return reject(EditError::EditInProgress);
    const EditError err = validateDoor(attrs, network_);
    if (err != EditError::Ok) return reject(err);

    BusyScope scope(*this);
    DoorRec saved{};
    const PersistResult r = persistence_.createDoor(attrs, saved);
    if (!r.ok()) return persistError(r, "create door");

    doors_.push_back(saved);
    if (idOut) *idOut = saved.id;
    notify(NoticeKind::Success, "Door created.");
    return EditError::Ok;
}

EditError EditSession::updateDoor(const DoorRec& door) {
    if (busy_) return reject(EditError::EditInProgress);
    auto it = std::find_if(doors_.begin(), doors_.end(), [&door](const DoorRec& d) { return d.id == door.id; });
    if (it == doors_.end()) return reject(EditError::DoorNotFound);
    const EditError err = validateDoor(door, network_);
    if (err != EditError::Ok) return reject(err);

    BusyScope scope(*this);
    DoorRec saved{};
    const PersistResult r = persistence_.updateDoor(door, saved);
    if (!r.ok()) return persistError(r, "update door");

    *it = saved;
    notify(NoticeKind::Success, "Door updated.");
    return EditError::Ok;
}

EditError EditSession::deleteDoor(std::uint32_t doorId) {
    if (busy_) return reject(EditError::EditInProgress);
    auto it = std::find_if(doors_.begin(), doors_.end(), [doorId](const DoorRec& d) { return d.id == doorId; });
    if (it == doors_.end()) return reject(EditError::DoorNotFound);

    BusyScope scope(*this);
    const PersistResult r = persistence_.deleteDoor(doorId);
    if (!r.ok()) return persistError(r, "delete door");

    doors_.erase(it);
    notify(NoticeKind::Success, "Door deleted.");
    return EditError::Ok;
}

} // namespace floorplan
