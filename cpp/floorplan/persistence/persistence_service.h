#pragma once

#include "floorplan/core/types.h"

#include <cstdint>
#include <string>
#include <vector>

namespace floorplan {

enum class PersistStatus : std::uint8_t {
    Ok = 0,
    Unavailable = 1,    // transport failure, retryable
    Rejected = 2,       // server-side validation refused the change
    NotFound = 3,
};

struct PersistResult {
    PersistStatus status = PersistStatus::Ok;
    std::string detail;

    bool ok() const { return status == PersistStatus::Ok; }
};

inline PersistResult persistOk() { return PersistResult{}; }

// Record CRUD backing the edit session. Ids are assigned here; every call is synchronous
// from the session's point of view and is issued strictly in order.
class PersistenceService {
public:
    virtual ~PersistenceService() = default;

    virtual PersistResult createWall(const WallRec& attrs, WallRec& out) = 0;
    virtual PersistResult updateWall(const WallRec& wall, WallRec& out) = 0;
    virtual PersistResult deleteWall(std::uint32_t id) = 0;
    // Server validates compatibility, collinearity and connection; replaces both walls.
    virtual PersistResult mergeWalls(std::uint32_t firstId, std::uint32_t secondId, WallRec& out) = 0;
    virtual PersistResult listWalls(std::vector<WallRec>& out) = 0;

    virtual PersistResult createRoom(const RoomRec& attrs, RoomRec& out) = 0;
    virtual PersistResult updateRoom(const RoomRec& room, RoomRec& out) = 0;
    virtual PersistResult deleteRoom(std::uint32_t id) = 0;
    virtual PersistResult listRooms(std::vector<RoomRec>& out) = 0;

    virtual PersistResult createStorey(const StoreyRec& attrs, StoreyRec& out) = 0;
    virtual PersistResult listStoreys(std::uint32_t projectId, std::vector<StoreyRec>& out) = 0;

    virtual PersistResult createDoor(const DoorRec& attrs, DoorRec& out) = 0;
    virtual PersistResult updateDoor(const DoorRec& door, DoorRec& out) = 0;
    virtual PersistResult deleteDoor(std::uint32_t id) = 0;
    virtual PersistResult listDoors(std::vector<DoorRec>& out) = 0;
};

} // namespace floorplan
