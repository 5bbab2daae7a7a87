#pragma once

#include "floorplan/core/config.h"
#include "floorplan/core/types.h"
#include "floorplan/geometry/snap_solver.h"
#include "floorplan/history/edit_history.h"
#include "floorplan/network/wall_diff.h"
#include "floorplan/network/wall_network.h"
#include "floorplan/network/wall_planner.h"
#include "floorplan/persistence/persistence_service.h"
#include "floorplan/room/room_matcher.h"
#include "floorplan/storey/ghosts.h"
#include "floorplan/storey/room_duplicate.h"
#include "floorplan/storey/storey_stack.h"

#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace floorplan {

enum class NoticeKind : std::uint8_t {
    Success = 0,
    Validation = 1,
    Connectivity = 2,
};

struct Notification {
    NoticeKind kind;
    std::string message;
    unsigned durationMs;
};

struct RoomRequest {
    std::string name;
    std::vector<Point2d> polygon;
    bool hasHeight = false;
    double height = 0.0;
    bool hasBaseElevation = false;
    double baseElevation = 0.0;
    FloorType floorType = FloorType::None;
    double floorThickness = 0.0;
    bool hasLabelAnchor = false;
    Point2d labelAnchor{0.0, 0.0};
    double temperature = 0.0;
    std::string remarks;
};

struct ConsistencyViolation {
    std::uint32_t roomId;
    std::uint32_t wallId;
};

// Editing context for one project. Owns the in-memory walls, rooms, storeys and doors,
// plans every structural edit with the pure planners, and applies the resulting diffs
// through the persistence service one call at a time.
class EditSession {
public:
    EditSession(PersistenceService& persistence, std::uint32_t projectId, const SessionConfig& config = SessionConfig{});

    EditSession(const EditSession&) = delete;
    EditSession& operator=(const EditSession&) = delete;

    // Reads storeys, walls, rooms and doors; activates the default storey and resets history.
    EditError load();

    // ==========================================================================
    // Storeys
    // ==========================================================================
    EditError createStorey(const StoreyRec& attrs, std::uint32_t* idOut = nullptr);
    EditError setActiveStorey(std::uint32_t storeyId);
    std::uint32_t activeStoreyId() const { return activeStoreyId_; }
    const StoreyStack& storeys() const { return storeys_; }

    // ==========================================================================
    // Walls (storeyId 0 in a request means the active storey)
    // ==========================================================================
    EditError addWall(const WallRequest& request);
    EditError createDefaultWalls(double width, double length);
    EditError deleteWall(std::uint32_t wallId);
    EditError splitWall(std::uint32_t wallId, const Point2d& at);
    EditError mergeWalls(std::uint32_t firstId, std::uint32_t secondId);
    // Non-geometric attributes only: thickness, height, type and material.
    EditError updateWall(const WallRec& wall);

    // ==========================================================================
    // Rooms
    // ==========================================================================
    EditError createRoom(const RoomRequest& request, std::uint32_t* idOut = nullptr);
    EditError updateRoom(const RoomRec& room);
    EditError setRoomHeight(std::uint32_t roomId, double height);
    EditError deleteRoom(std::uint32_t roomId);
    EditError duplicateRoomToStorey(const RoomDuplicateRequest& request, std::uint32_t* idOut = nullptr);

    // ==========================================================================
    // Doors
    // ==========================================================================
    EditError createDoor(const DoorRec& attrs, std::uint32_t* idOut = nullptr);
    EditError updateDoor(const DoorRec& door);
    EditError deleteDoor(std::uint32_t doorId);

    // ==========================================================================
    // History
    // ==========================================================================
    EditError undo();
    EditError redo();
    bool canUndo() const { return history_.canUndo(); }
    bool canRedo() const { return history_.canRedo(); }
    const EditHistory& history() const { return history_; }

    // ==========================================================================
    // Presentation
    // ==========================================================================
    const WallNetwork& network() const { return network_; }
    const std::vector<WallRec>& walls() const { return network_.walls(); }
    const std::vector<RoomRec>& rooms() const { return rooms_; }
    std::vector<RoomRec> roomsOnActiveStorey() const;
    const std::vector<DoorRec>& doors() const { return doors_; }
    const RoomRec* findRoom(std::uint32_t roomId) const;
    const DoorRec* findDoor(std::uint32_t doorId) const;

    GhostProjection ghosts() const;
    std::vector<JointRec> joints() const;
    void setJointMethod(std::uint32_t wallA, std::uint32_t wallB, JointMethod method);
    SnapHit snapPreview(const Point2d& raw, double viewScale) const;
    SnapHit roomVertexSnap(const Point2d& raw, double viewScale) const;

    std::vector<ConsistencyViolation> findConsistencyViolations() const;
    std::vector<Notification> drainNotifications();
    const std::vector<Notification>& pendingNotifications() const { return notifications_; }

    bool busy() const { return busy_; }
    const SessionConfig& config() const { return config_; }

private:
    class BusyScope;
    using WallSnapshot = std::unordered_map<std::uint32_t, WallRec>;

    // Applies deletes and creates (abort on first failure, nothing rolled back) and then
    // merges (skipped on failure). mergeFailure receives the first failed merge result.
    EditError applyDiff(const WallDiff& diff, PersistResult& mergeFailure);
    EditError runStructuralEdit(const WallDiff& diff, bool mergeRequired, const char* successMessage);
    // Brings the network to the given wall set by geometry; used by undo and redo.
    EditError resyncWalls(const std::vector<WallRec>& target);

    WallSnapshot snapshotWalls() const;
    void remapRoomWalls(const WallSnapshot& before);
    void revalidateDoors(const WallSnapshot& before);

    EditError persistError(const PersistResult& result, const char* operation);
    EditError reject(EditError err);
    void notify(NoticeKind kind, const std::string& message);

    RoomRec* findRoomMutable(std::uint32_t roomId);

    PersistenceService& persistence_;
    std::uint32_t projectId_;
    SessionConfig config_;

    WallNetwork network_;
    std::vector<RoomRec> rooms_;
    StoreyStack storeys_;
    std::vector<DoorRec> doors_;
    std::uint32_t activeStoreyId_ = kInvalidId;

    EditHistory history_;
    std::map<std::pair<std::uint32_t, std::uint32_t>, JointMethod> jointMethods_;
    std::vector<Notification> notifications_;
    bool busy_ = false;
};

} // namespace floorplan
