#include "floorplan/session/edit_session.h"
#include "floorplan/core/logging.h"
#include "floorplan/network/joints.h"
#include "floorplan/session/session_internal.h"

#include <algorithm>

namespace floorplan {

EditSession::EditSession(PersistenceService& persistence, std::uint32_t projectId, const SessionConfig& config)
    : persistence_(persistence),
      projectId_(projectId),
      config_(config),
      history_(config.historyDepth) {}

EditError EditSession::load() {
    if (busy_) return reject(EditError::EditInProgress);
    BusyScope scope(*this);

    std::vector<StoreyRec> storeys;
    PersistResult r = persistence_.listStoreys(projectId_, storeys);
    if (!r.ok()) return persistError(r, "list storeys");
    std::vector<WallRec> walls;
    r = persistence_.listWalls(walls);
    if (!r.ok()) return persistError(r, "list walls");
    std::vector<RoomRec> rooms;
    r = persistence_.listRooms(rooms);
    if (!r.ok()) return persistError(r, "list rooms");
    std::vector<DoorRec> doors;
    r = persistence_.listDoors(doors);
    if (!r.ok()) return persistError(r, "list doors");

    storeys_.assign(storeys);
    network_.assign(walls);
    rooms_ = std::move(rooms);
    doors_ = std::move(doors);
    const StoreyRec* def = storeys_.defaultStorey();
    activeStoreyId_ = def ? def->id : kInvalidId;

    history_.clear();
    history_.push(network_.walls());
    FLOORPLAN_LOG_DEBUG("session loaded: %zu storeys, %zu walls, %zu rooms, %zu doors",
        storeys_.size(), network_.size(), rooms_.size(), doors_.size());
    return EditError::Ok;
}

// =============================================================================
// Storeys
// =============================================================================

EditError EditSession::createStorey(const StoreyRec& attrs, std::uint32_t* idOut) {
    if (busy_) return reject(EditError::EditInProgress);
    BusyScope scope(*this);

    StoreyRec request = attrs;
    request.projectId = projectId_;
    if (!(request.defaultRoomHeight > 0.0)) request.defaultRoomHeight = floorplan_constants::DEFAULT_ROOM_HEIGHT;

    StoreyRec created{};
    const PersistResult r = persistence_.createStorey(request, created);
    if (!r.ok()) return persistError(r, "create storey");

    storeys_.upsert(created);
    if (activeStoreyId_ == kInvalidId) activeStoreyId_ = created.id;
    if (idOut) *idOut = created.id;
    notify(NoticeKind::Success, "Storey created.");
    return EditError::Ok;
}

EditError EditSession::setActiveStorey(std::uint32_t storeyId) {
    if (!storeys_.find(storeyId)) return reject(EditError::StoreyNotFound);
    activeStoreyId_ = storeyId;
    return EditError::Ok;
}

// =============================================================================
// Presentation
// =============================================================================

std::vector<RoomRec> EditSession::roomsOnActiveStorey() const {
    std::vector<RoomRec> out;
    for (const RoomRec& r : rooms_) {
        if (r.storeyId == activeStoreyId_) out.push_back(r);
    }
    return out;
}

const RoomRec* EditSession::findRoom(std::uint32_t roomId) const {
    for (const RoomRec& r : rooms_) {
        if (r.id == roomId) return &r;
    }
    return nullptr;
}

RoomRec* EditSession::findRoomMutable(std::uint32_t roomId) {
    for (RoomRec& r : rooms_) {
        if (r.id == roomId) return &r;
    }
    return nullptr;
}

const DoorRec* EditSession::findDoor(std::uint32_t doorId) const {
    for (const DoorRec& d : doors_) {
        if (d.id == doorId) return &d;
    }
    return nullptr;
}

GhostProjection EditSession::ghosts() const {
    return computeGhosts(network_.walls(), rooms_, storeys_, activeStoreyId_, config_.ghostEpsilon);
}

std::vector<JointRec> EditSession::joints() const {
    std::vector<JointRec> out = findJoints(network_.wallsOnStorey(activeStoreyId_), config_.tolerances.epsilon);
    for (JointRec& j : out) {
        const auto it = jointMethods_.find(jointKey(j.wallA, j.wallB));
        if (it != jointMethods_.end()) j.method = it->second;
    }
    return out;
}

void EditSession::setJointMethod(std::uint32_t wallA, std::uint32_t wallB, JointMethod method) {
    jointMethods_[jointKey(wallA, wallB)] = method;
}

SnapHit EditSession::snapPreview(const Point2d& raw, double viewScale) const {
    const double tol = toWorldTolerance(config_.snap.tolerancePx, viewScale);
    return resolveSnap(raw, network_.wallsNear(raw, tol, activeStoreyId_), config_.snap, viewScale);
}

SnapHit EditSession::roomVertexSnap(const Point2d& raw, double viewScale) const {
    return resolveRoomVertexSnap(raw, network_.wallsOnStorey(activeStoreyId_), joints(), config_.snap, viewScale);
}

std::vector<ConsistencyViolation> EditSession::findConsistencyViolations() const {
    std::vector<ConsistencyViolation> out;
    for (const RoomRec& room : rooms_) {
        for (const std::uint32_t wallId : room.wallIds) {
            if (network_.contains(wallId)) continue;
            FLOORPLAN_LOG_ERROR("room %u references missing wall %u", room.id, wallId);
            out.push_back(ConsistencyViolation{room.id, wallId});
        }
    }
    return out;
}

// =============================================================================
// Notifications and error mapping
// =============================================================================

std::vector<Notification> EditSession::drainNotifications() {
    std::vector<Notification> out;
    out.swap(notifications_);
    return out;
}

void EditSession::notify(NoticeKind kind, const std::string& message) {
    const unsigned duration = kind == NoticeKind::Success ? config_.successNoticeMs : config_.errorNoticeMs;
    notifications_.push_back(Notification{kind, message, duration});
}

EditError EditSession::reject(EditError err) {
    if (err == EditError::Ok) return err;
    const NoticeKind kind = isConnectivityError(err) ? NoticeKind::Connectivity : NoticeKind::Validation;
    notify(kind, editErrorMessage(err));
    return err;
}

EditError EditSession::persistError(const PersistResult& result, const char* operation) {
    const EditError err = result.status == PersistStatus::Unavailable
        ? EditError::PersistenceUnavailable
        : EditError::PersistenceRejected;
    FLOORPLAN_LOG_WARN("%s failed: %s", operation, result.detail.c_str());
    if (result.detail.empty()) {
        notify(NoticeKind::Connectivity, editErrorMessage(err));
    } else {
        notify(NoticeKind::Connectivity, result.detail);
    }
    return err;
}

} // namespace floorplan
