#include "floorplan/history/edit_history.h"
#include "floorplan/core/digest.h"
#include "floorplan/core/logging.h"

namespace floorplan {

EditHistory::EditHistory(std::size_t maxDepth) : maxDepth_(maxDepth > 0 ? maxDepth : 1) {}

void EditHistory::clear() {
    history_.clear();
    cursor_ = 0;
    historyGeneration_++;
}

bool EditHistory::canUndo() const noexcept {
    return !history_.empty() && cursor_ > 0;
}

bool EditHistory::canRedo() const noexcept {
    return !history_.empty() && cursor_ + 1 < history_.size();
}

bool EditHistory::push(const std::vector<WallRec>& walls) {
    const std::uint64_t digest = networkDigest(walls);
    if (!history_.empty()) {
        if (history_[cursor_].digest == digest) return false;
        history_.erase(history_.begin() + static_cast<std::ptrdiff_t>(cursor_) + 1, history_.end());
    }
    history_.push_back(HistorySnapshot{walls, digest});
    while (history_.size() > maxDepth_) {
        history_.erase(history_.begin());
    }
    cursor_ = history_.size() - 1;
    historyGeneration_++;
    FLOORPLAN_LOG_DEBUG("history push: %zu entries, cursor %zu", history_.size(), cursor_);
    return true;
}

const HistorySnapshot* EditHistory::undo() {
    if (!canUndo()) return nullptr;
    --cursor_;
    historyGeneration_++;
    return &history_[cursor_];
}

const HistorySnapshot* EditHistory::redo() {
    if (!canRedo()) return nullptr;
    ++cursor_;
    historyGeneration_++;
    return &history_[cursor_];
}

const HistorySnapshot* EditHistory::current() const {
    if (history_.empty()) return nullptr;
    return &history_[cursor_];
}

void EditHistory::replaceCurrent(const std::vector<WallRec>& walls) {
    if (history_.empty()) {
        push(walls);
        return;
    }
    history_[cursor_] = HistorySnapshot{walls, networkDigest(walls)};
}

} // namespace floorplan
