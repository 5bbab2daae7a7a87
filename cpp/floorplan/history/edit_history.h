#pragma once

#include "floorplan/core/constants.h"
#include "floorplan/core/types.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace floorplan {

struct HistorySnapshot {
    std::vector<WallRec> walls;
    std::uint64_t digest = 0;
};

// Linear undo stack of full wall snapshots. The cursor indexes the snapshot that matches
// the current network; pushing discards everything after it.
class EditHistory {
public:
    explicit EditHistory(std::size_t maxDepth = floorplan_constants::HISTORY_MAX_DEPTH);

    bool canUndo() const noexcept;
    bool canRedo() const noexcept;

    // Returns false when the snapshot equals the current one (nothing recorded).
    bool push(const std::vector<WallRec>& walls);

    // Move the cursor and return the snapshot to restore, nullptr at either end.
    const HistorySnapshot* undo();
    const HistorySnapshot* redo();

    const HistorySnapshot* current() const;

    // Re-synchronizing persisted state assigns new ids; the entry keeps its place.
    void replaceCurrent(const std::vector<WallRec>& walls);

    void clear();
    std::size_t getHistorySize() const noexcept { return history_.size(); }
    std::size_t getCursor() const noexcept { return cursor_; }
    std::uint32_t getGeneration() const noexcept { return historyGeneration_; }
    std::size_t getMaxDepth() const noexcept { return maxDepth_; }

private:
    std::vector<HistorySnapshot> history_;
    std::size_t cursor_ = 0;
    std::uint32_t historyGeneration_ = 0;
    std::size_t maxDepth_;
};

} // namespace floorplan
