#include "floorplan/persistence/memory_persistence.h"
#include "floorplan/geometry/geometry.h"
#include "floorplan/network/wall_planner.h"

namespace floorplan {

namespace {
PersistResult fail(PersistStatus status, const char* detail) {
    return PersistResult{status, detail};
}

PersistResult validateWallRecord(const WallRec& w, double eps) {
    if (segmentLength(wallSegment(w)) < eps) return fail(PersistStatus::Rejected, "Wall length must be greater than 0.");
    if (!(w.thickness > 0.0) || !(w.height > 0.0)) {
        return fail(PersistStatus::Rejected, editErrorMessage(EditError::InvalidDimensions));
    }
    return persistOk();
}
} // namespace

MemoryPersistence::MemoryPersistence(const EditTolerances& tolerances) : tolerances_(tolerances) {}

void MemoryPersistence::failAfter(std::size_t calls) {
    budgeted_ = true;
    budget_ = calls;
}

void MemoryPersistence::clearFailures() {
    offline_ = false;
    failMerges_ = false;
    budgeted_ = false;
    budget_ = 0;
}

PersistResult MemoryPersistence::beginRequest() {
    ++requestCount_;
    if (requestHook_) requestHook_();
    if (offline_) return fail(PersistStatus::Unavailable, "Service unavailable.");
    if (budgeted_) {
        if (budget_ == 0) return fail(PersistStatus::Unavailable, "Service unavailable.");
        --budget_;
    }
    return persistOk();
}

PersistResult MemoryPersistence::createWall(const WallRec& attrs, WallRec& out) {
    PersistResult r = beginRequest();
    if (!r.ok()) return r;
    r = validateWallRecord(attrs, tolerances_.epsilon);
    if (!r.ok()) return r;
    out = attrs;
    out.id = nextId_++;
    walls_[out.id] = out;
    return r;
}

PersistResult MemoryPersistence::updateWall(const WallRec& wall, WallRec& out) {
    PersistResult r = beginRequest();
    if (!r.ok()) return r;
    auto it = walls_.find(wall.id);
    if (it == walls_.end()) return fail(PersistStatus::NotFound, "Wall not found.");
    r = validateWallRecord(wall, tolerances_.epsilon);
    if (!r.ok()) return r;
    it->second = wall;
    out = wall;
    return r;
}

PersistResult MemoryPersistence::deleteWall(std::uint32_t id) {
    PersistResult r = beginRequest();
    if (!r.ok()) return r;
    if (walls_.erase(id) == 0) return fail(PersistStatus::NotFound, "Wall not found.");
    return r;
}

PersistResult MemoryPersistence::mergeWalls(std::uint32_t firstId, std::uint32_t secondId, WallRec& out) {
    PersistResult r = beginRequest();
    if (!r.ok()) return r;
    if (failMerges_) return fail(PersistStatus::Unavailable, "Merge request failed.");

    const auto a = walls_.find(firstId);
    const auto b = walls_.find(secondId);
    if (a == walls_.end() || b == walls_.end() || firstId == secondId) {
        return fail(PersistStatus::NotFound, "Wall not found.");
    }
    WallRec merged{};
    const EditError err = checkMerge(a->second, b->second, tolerances_.epsilon, merged);
    if (err != EditError::Ok) return fail(PersistStatus::Rejected, editErrorMessage(err));

    walls_.erase(a);
    walls_.erase(secondId);
    merged.id = nextId_++;
    walls_[merged.id] = merged;
    out = merged;
    return r;
}

PersistResult MemoryPersistence::listWalls(std::vector<WallRec>& out) {
    PersistResult r = beginRequest();
    if (!r.ok()) return r;
    out.clear();
    for (const auto& entry : walls_) out.push_back(entry.second);
    return r;
}

PersistResult MemoryPersistence::createRoom(const RoomRec& attrs, RoomRec& out) {
    PersistResult r = beginRequest();
    if (!r.ok()) return r;
    if (attrs.polygon.size() < 3) return fail(PersistStatus::Rejected, editErrorMessage(EditError::TooFewVertices));
    out = attrs;
    out.id = nextId_++;
    rooms_[out.id] = out;
    return r;
}

PersistResult MemoryPersistence::updateRoom(const RoomRec& room, RoomRec& out) {
    PersistResult r = beginRequest();
    if (!r.ok()) return r;
    auto it = rooms_.find(room.id);
    if (it == rooms_.end()) return fail(PersistStatus::NotFound, "Room not found.");
    if (room.polygon.size() < 3) return fail(PersistStatus::Rejected, editErrorMessage(EditError::TooFewVertices));
    it->second = room;
    out = room;
    return r;
}

PersistResult MemoryPersistence::deleteRoom(std::uint32_t id) {
    PersistResult r = beginRequest();
    if (!r.ok()) return r;
    if (rooms_.erase(id) == 0) return fail(PersistStatus::NotFound, "Room not found.");
    return r;
}

PersistResult MemoryPersistence::listRooms(std::vector<RoomRec>& out) {
    PersistResult r = beginRequest();
    if (!r.ok()) return r;
    out.clear();
    for (const auto& entry : rooms_) out.push_back(entry.second);
    return r;
}

PersistResult MemoryPersistence::createStorey(const StoreyRec& attrs, StoreyRec& out) {
    PersistResult r = beginRequest();
    if (!r.ok()) return r;
    out = attrs;
    out.id = nextId_++;
    storeys_[out.id] = out;
    return r;
}

PersistResult MemoryPersistence::listStoreys(std::uint32_t projectId, std::vector<StoreyRec>& out) {
    PersistResult r = beginRequest();
    if (!r.ok()) return r;
    out.clear();
    for (const auto& entry : storeys_) {
        if (entry.second.projectId == projectId) out.push_back(entry.second);
    }
    return r;
}

PersistResult MemoryPersistence::createDoor(const DoorRec& attrs, DoorRec& out) {
    PersistResult r = beginRequest();
    if (!r.ok()) return r;
    if (walls_.find(attrs.wallId) == walls_.end()) {
        return fail(PersistStatus::Rejected, editErrorMessage(EditError::InvalidDoorPosition));
    }
    out = attrs;
    out.id = nextId_++;
    doors_[out.id] = out;
    return r;
}

PersistResult MemoryPersistence::updateDoor(const DoorRec& door, DoorRec& out) {
    PersistResult r = beginRequest();
    if (!r.ok()) return r;
    auto it = doors_.find(door.id);
    if (it == doors_.end()) return fail(PersistStatus::NotFound, "Door not found.");
    if (walls_.find(door.wallId) == walls_.end()) {
        return fail(PersistStatus::Rejected, editErrorMessage(EditError::InvalidDoorPosition));
    }
    it->second = door;
    out = door;
    return r;
}

PersistResult MemoryPersistence::deleteDoor(std::uint32_t id) {
    PersistResult r = beginRequest();
    if (!r.ok()) return r;
    if (doors_.erase(id) == 0) return fail(PersistStatus::NotFound, "Door not found.");
    return r;
}

PersistResult MemoryPersistence::listDoors(std::vector<DoorRec>& out) {
    PersistResult r = beginRequest();
    if (!r.ok()) return r;
    out.clear();
    for (const auto& entry : doors_) out.push_back(entry.second);
    return r;
}

} // namespace floorplan
