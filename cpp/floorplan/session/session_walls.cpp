#include "floorplan/session/edit_session.h"
#include "floorplan/core/logging.h"
#include "floorplan/geometry/geometry.h"
#include "floorplan/session/session_internal.h"

#include <algorithm>

namespace floorplan {

// =============================================================================
// Structural wall edits
// =============================================================================

EditError EditSession::addWall(const WallRequest& request) {
    if (busy_) return reject(EditError::EditInProgress);

    WallRequest resolved = request;
    if (resolved.storeyId == kInvalidId) resolved.storeyId = activeStoreyId_;
    if (!storeys_.find(resolved.storeyId)) return reject(EditError::StoreyNotFound);

    WallDiff diff;
    const EditError err = planAddWall(network_, resolved, config_.wallDefaults, config_.tolerances, diff);
    if (err != EditError::Ok) return reject(err);

    BusyScope scope(*this);
    return runStructuralEdit(diff, false, "Wall added.");
}

EditError EditSession::createDefaultWalls(double width, double length) {
    if (busy_) return reject(EditError::EditInProgress);
    if (!storeys_.find(activeStoreyId_)) return reject(EditError::StoreyNotFound);
    // The perimeter is laid down without splitting, so it needs an empty storey
    if (!network_.wallsOnStorey(activeStoreyId_).empty()) return reject(EditError::InvalidSelection);

    WallDiff diff;
    const EditError err = planDefaultBoundaryWalls(
        width, length, config_.wallDefaults.height, config_.wallDefaults.thickness, activeStoreyId_, diff);
    if (err != EditError::Ok) return reject(err);

    BusyScope scope(*this);
    return runStructuralEdit(diff, false, "Boundary walls created.");
}

EditError EditSession::deleteWall(std::uint32_t wallId) {
    if (busy_) return reject(EditError::EditInProgress);

    WallDiff diff;
    const EditError err = planDeleteWall(network_, wallId, config_.tolerances, diff);
    if (err != EditError::Ok) return reject(err);

    BusyScope scope(*this);
    return runStructuralEdit(diff, false, "Wall deleted.");
}

EditError EditSession::splitWall(std::uint32_t wallId, const Point2d& at) {
    if (busy_) return reject(EditError::EditInProgress);

    WallDiff diff;
    const EditError err = planSplitWall(network_, wallId, at, config_.tolerances, diff);
    if (err != EditError::Ok) return reject(err);

    BusyScope scope(*this);
    return runStructuralEdit(diff, false, "Wall split.");
}

EditError EditSession::mergeWalls(std::uint32_t firstId, std::uint32_t secondId) {
    if (busy_) return reject(EditError::EditInProgress);

    WallDiff diff;
    const EditError err = planMergeWalls(network_, firstId, secondId, config_.tolerances, diff);
    if (err != EditError::Ok) return reject(err);

    BusyScope scope(*this);
    return runStructuralEdit(diff, true, "Walls merged.");
}

EditError EditSession::updateWall(const WallRec& wall) {
    if (busy_) return reject(EditError::EditInProgress);
    const WallRec* existing = network_.find(wall.id);
    if (!existing) return reject(EditError::WallNotFound);
    if (!(wall.thickness > 0.0) || !(wall.height > 0.0)) return reject(EditError::InvalidDimensions);

    BusyScope scope(*this);
    WallRec updated = *existing;
    updated.thickness = wall.thickness;
    updated.height = wall.height;
    updated.type = wall.type;
    updated.hasConcreteBase = wall.hasConcreteBase;
    updated.concreteBaseHeight = wall.concreteBaseHeight;

    WallRec saved{};
    const PersistResult r = persistence_.updateWall(updated, saved);
    if (!r.ok()) return persistError(r, "update wall");

    network_.upsert(saved);
    history_.push(network_.walls());
    notify(NoticeKind::Success, "Wall updated.");
    return EditError::Ok;
}

// =============================================================================
// Diff application
// =============================================================================

EditError EditSession::runStructuralEdit(const WallDiff& diff, bool mergeRequired, const char* successMessage) {
    if (diff.empty()) return EditError::Ok;

    const WallSnapshot before = snapshotWalls();
    PersistResult mergeFailure;
    const EditError err = applyDiff(diff, mergeFailure);

    // Partially applied diffs still changed the network
    remapRoomWalls(before);
    revalidateDoors(before);
    history_.push(network_.walls());

    if (err != EditError::Ok) return err;
    if (!mergeFailure.ok()) {
        if (mergeRequired) return persistError(mergeFailure, "merge walls");
        notify(NoticeKind::Connectivity, "Some walls could not be merged. The network is still valid.");
    }
    notify(NoticeKind::Success, successMessage);
    return EditError::Ok;
}

EditError EditSession::applyDiff(const WallDiff& diff, PersistResult& mergeFailure) {
    mergeFailure = persistOk();
    std::unordered_map<std::uint32_t, std::uint32_t> realIds;
    auto resolve = [&realIds](std::uint32_t id) -> std::uint32_t {
        if (!isProvisionalId(id)) return id;
        const auto it = realIds.find(id);
        return it == realIds.end() ? kInvalidId : it->second;
    };

    for (const std::uint32_t id : diff.deletes) {
        const PersistResult r = persistence_.deleteWall(id);
        if (!r.ok()) return persistError(r, "delete wall");
        network_.remove(id);
    }
    for (const WallRec& create : diff.creates) {
        WallRec created{};
        const PersistResult r = persistence_.createWall(create, created);
        if (!r.ok()) return persistError(r, "create wall");
        realIds[create.id] = created.id;
        network_.upsert(created);
    }
    for (const WallMergeStep& step : diff.merges) {
        const std::uint32_t a = resolve(step.firstId);
        const std::uint32_t b = resolve(step.secondId);
        if (a == kInvalidId || b == kInvalidId) {
            FLOORPLAN_LOG_WARN("merge skipped: walls %u/%u came from a skipped merge", step.firstId, step.secondId);
            continue;
        }
        WallRec merged{};
        const PersistResult r = persistence_.mergeWalls(a, b, merged);
        if (!r.ok()) {
            FLOORPLAN_LOG_WARN("merge of walls %u and %u skipped: %s", a, b, r.detail.c_str());
            if (mergeFailure.ok()) mergeFailure = r;
            continue;
        }
        network_.remove(a);
        network_.remove(b);
        network_.upsert(merged);
        realIds[step.merged.id] = merged.id;
    }
    return EditError::Ok;
}

EditSession::WallSnapshot EditSession::snapshotWalls() const {
    WallSnapshot out;
    for (const WallRec& w : network_.walls()) out.emplace(w.id, w);
    return out;
}

// Rooms follow their walls through splits (pieces lying on the old wall) and merges
// (a wall covering the old one). References with no such successor are left in place.
void EditSession::remapRoomWalls(const WallSnapshot& before) {
    const double eps = config_.tolerances.epsilon;
    for (RoomRec& room : rooms_) {
        bool changed = false;
        std::vector<std::uint32_t> ids;
        for (const std::uint32_t wallId : room.wallIds) {
            if (network_.contains(wallId)) {
                ids.push_back(wallId);
                continue;
            }
            const auto old = before.find(wallId);
            if (old == before.end()) {
                ids.push_back(wallId);
                continue;
            }
            const Segment oldSeg = wallSegment(old->second);
            std::vector<std::uint32_t> successors;
            for (const WallRec& w : network_.walls()) {
                if (w.storeyId != old->second.storeyId) continue;
                const Segment seg = wallSegment(w);
                const bool pieceOfOld = pointSegmentDistance(seg.a, oldSeg) <= eps && pointSegmentDistance(seg.b, oldSeg) <= eps;
                const bool coversOld = pointSegmentDistance(oldSeg.a, seg) <= eps && pointSegmentDistance(oldSeg.b, seg) <= eps;
                if (pieceOfOld || coversOld) successors.push_back(w.id);
            }
            if (successors.empty()) {
                ids.push_back(wallId);
                continue;
            }
            ids.insert(ids.end(), successors.begin(), successors.end());
            changed = true;
        }
        if (!changed) continue;

        std::sort(ids.begin(), ids.end());
        ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
        RoomRec updated = room;
        updated.wallIds = ids;
        RoomRec saved{};
        const PersistResult r = persistence_.updateRoom(updated, saved);
        if (!r.ok()) {
            FLOORPLAN_LOG_WARN("room %u keeps stale wall references: %s", room.id, r.detail.c_str());
            continue;
        }
        room = saved;
    }
}

// Doors on a replaced wall move to the successor wall under their old world position,
// or are removed when no wall remains there.
void EditSession::revalidateDoors(const WallSnapshot& before) {
    const double eps = config_.tolerances.epsilon;
    std::vector<DoorRec> kept;
    kept.reserve(doors_.size());
    for (const DoorRec& door : doors_) {
        if (network_.contains(door.wallId)) {
            kept.push_back(door);
            continue;
        }
        const auto old = before.find(door.wallId);
        if (old == before.end()) {
            kept.push_back(door);
            continue;
        }
        const WallRec& oldWall = old->second;
        const Point2d world = oldWall.start + (oldWall.end - oldWall.start) * door.position;

        const WallRec* host = nullptr;
        double t = 0.0;
        for (const WallRec& w : network_.walls()) {
            if (w.storeyId != oldWall.storeyId) continue;
            double tw = 0.0;
            const Point2d proj = projectOntoSegment(world, wallSegment(w), &tw);
            if (pointsEqual(proj, world, eps)) {
                host = &w;
                t = tw;
                break;
            }
        }

        if (host) {
            DoorRec moved = door;
            moved.wallId = host->id;
            moved.position = t;
            DoorRec saved{};
            const PersistResult r = persistence_.updateDoor(moved, saved);
            if (!r.ok()) {
                FLOORPLAN_LOG_WARN("door %u could not be moved to wall %u: %s", door.id, host->id, r.detail.c_str());
                kept.push_back(door);
                continue;
            }
            kept.push_back(saved);
            continue;
        }

        FLOORPLAN_LOG_WARN("door %u removed: wall %u no longer exists", door.id, door.wallId);
        const PersistResult r = persistence_.deleteDoor(door.id);
        if (!r.ok()) {
            FLOORPLAN_LOG_WARN("door %u could not be removed: %s", door.id, r.detail.c_str());
            kept.push_back(door);
        }
    }
    doors_.swap(kept);
}

} // namespace floorplan
