#pragma once

#include "floorplan/core/config.h"
#include "floorplan/persistence/persistence_service.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <utility>

namespace floorplan {

// In-process persistence with server-style validation and failure injection.
class MemoryPersistence : public PersistenceService {
public:
    explicit MemoryPersistence(const EditTolerances& tolerances = EditTolerances{});

    PersistResult createWall(const WallRec& attrs, WallRec& out) override;
    PersistResult updateWall(const WallRec& wall, WallRec& out) override;
    PersistResult deleteWall(std::uint32_t id) override;
    PersistResult mergeWalls(std::uint32_t firstId, std::uint32_t secondId, WallRec& out) override;
    PersistResult listWalls(std::vector<WallRec>& out) override;

    PersistResult createRoom(const RoomRec& attrs, RoomRec& out) override;
    PersistResult updateRoom(const RoomRec& room, RoomRec& out) override;
    PersistResult deleteRoom(std::uint32_t id) override;
    PersistResult listRooms(std::vector<RoomRec>& out) override;

    PersistResult createStorey(const StoreyRec& attrs, StoreyRec& out) override;
    PersistResult listStoreys(std::uint32_t projectId, std::vector<StoreyRec>& out) override;

    PersistResult createDoor(const DoorRec& attrs, DoorRec& out) override;
    PersistResult updateDoor(const DoorRec& door, DoorRec& out) override;
    PersistResult deleteDoor(std::uint32_t id) override;
    PersistResult listDoors(std::vector<DoorRec>& out) override;

    // Failure injection
    void setOffline(bool offline) { offline_ = offline; }
    void setMergeFailure(bool fail) { failMerges_ = fail; }
    // Let the next `calls` requests through, then fail every request as Unavailable.
    void failAfter(std::size_t calls);
    void clearFailures();
    // Invoked at the start of every request, before failure checks.
    void setRequestHook(std::function<void()> hook) { requestHook_ = std::move(hook); }

    std::size_t requestCount() const { return requestCount_; }
    std::size_t wallCount() const { return walls_.size(); }
    const std::map<std::uint32_t, WallRec>& wallRecords() const { return walls_; }

private:
    PersistResult beginRequest();

    EditTolerances tolerances_;
    std::uint32_t nextId_ = 1;
    std::map<std::uint32_t, WallRec> walls_;
    std::map<std::uint32_t, RoomRec> rooms_;
    std::map<std::uint32_t, StoreyRec> storeys_;
    std::map<std::uint32_t, DoorRec> doors_;

    bool offline_ = false;
    bool failMerges_ = false;
    bool budgeted_ = false;
    std::size_t budget_ = 0;
    std::size_t requestCount_ = 0;
    std::function<void()> requestHook_;
};

} // namespace floorplan
