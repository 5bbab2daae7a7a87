#include "floorplan/session/edit_session.h"
#include "floorplan/core/digest.h"
#include "floorplan/core/logging.h"
#include "floorplan/session/session_internal.h"

#include <map>

namespace floorplan {

EditError EditSession::undo() {
    if (busy_) return reject(EditError::EditInProgress);
    const HistorySnapshot* snapshot = history_.undo();
    if (!snapshot) return EditError::NothingToUndo;

    BusyScope scope(*this);
    const std::vector<WallRec> target = snapshot->walls;
    const EditError err = resyncWalls(target);
    if (err != EditError::Ok) {
        // Leave the cursor where the network still is; a retry diffs from there
        history_.redo();
        return err;
    }
    history_.replaceCurrent(network_.walls());
    return EditError::Ok;
}

EditError EditSession::redo() {
    if (busy_) return reject(EditError::EditInProgress);
    const HistorySnapshot* snapshot = history_.redo();
    if (!snapshot) return EditError::NothingToRedo;

    BusyScope scope(*this);
    const std::vector<WallRec> target = snapshot->walls;
    const EditError err = resyncWalls(target);
    if (err != EditError::Ok) {
        history_.undo();
        return err;
    }
    history_.replaceCurrent(network_.walls());
    return EditError::Ok;
}

// Walls are matched by geometry and attributes, not ids: persisted ids change every time a
// wall is re-created.
EditError EditSession::resyncWalls(const std::vector<WallRec>& target) {
    const WallSnapshot before = snapshotWalls();

    std::multimap<std::uint64_t, std::uint32_t> current;
    for (const WallRec& w : network_.walls()) current.emplace(wallDigest(w), w.id);

    WallDiff diff;
    std::uint32_t nextProvisional = kProvisionalIdBase;
    for (const WallRec& t : target) {
        const auto it = current.find(wallDigest(t));
        if (it != current.end()) {
            current.erase(it);
            continue;
        }
        WallRec create = t;
        create.id = nextProvisional++;
        diff.creates.push_back(create);
    }
    for (const auto& entry : current) diff.deletes.push_back(entry.second);

    FLOORPLAN_LOG_DEBUG("history resync: %zu deletes, %zu creates", diff.deletes.size(), diff.creates.size());
    PersistResult mergeFailure;
    const EditError err = applyDiff(diff, mergeFailure);
    remapRoomWalls(before);
    revalidateDoors(before);
    return err;
}

} // namespace floorplan
