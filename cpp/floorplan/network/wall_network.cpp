#include "floorplan/network/wall_network.h"
#include "floorplan/core/digest.h"
#include "floorplan/geometry/geometry.h"

#include <algorithm>

namespace floorplan {

namespace {
constexpr double kGridCellSize = 1000.0;
} // namespace

WallNetwork::WallNetwork() : grid_(kGridCellSize) {}

WallNetwork::WallNetwork(const std::vector<WallRec>& walls) : grid_(kGridCellSize) {
    assign(walls);
}

void WallNetwork::clear() {
    walls_.clear();
    index_.clear();
    grid_.clear();
}

void WallNetwork::assign(const std::vector<WallRec>& walls) {
    clear();
    for (const WallRec& w : walls) upsert(w);
}

void WallNetwork::upsert(const WallRec& wall) {
    auto it = index_.find(wall.id);
    if (it != index_.end()) {
        walls_[it->second] = wall;
    } else {
        index_.emplace(wall.id, walls_.size());
        walls_.push_back(wall);
    }
    grid_.insert(wall.id, segmentBounds(wallSegment(wall)));
}

bool WallNetwork::remove(std::uint32_t id) {
    auto it = index_.find(id);
    if (it == index_.end()) return false;
    walls_.erase(walls_.begin() + static_cast<std::ptrdiff_t>(it->second));
    grid_.remove(id);
    rebuildIndex();
    return true;
}

void WallNetwork::rebuildIndex() {
    index_.clear();
    for (std::size_t i = 0; i < walls_.size(); ++i) {
        index_.emplace(walls_[i].id, i);
    }
}

const WallRec* WallNetwork::find(std::uint32_t id) const {
    auto it = index_.find(id);
    if (it == index_.end()) return nullptr;
    return &walls_[it->second];
}

std::vector<WallRec> WallNetwork::wallsOnStorey(std::uint32_t storeyId) const {
    std::vector<WallRec> out;
    for (const WallRec& w : walls_) {
        if (w.storeyId == storeyId) out.push_back(w);
    }
    return out;
}

std::vector<std::uint32_t> WallNetwork::candidatesNear(const Point2d& p, double radius) const {
    std::vector<std::uint32_t> ids;
    grid_.query(AABB{p.x - radius, p.y - radius, p.x + radius, p.y + radius}, ids);
    return ids;
}

std::vector<std::uint32_t> WallNetwork::wallsWithEndpointAt(const Point2d& p, double eps, std::uint32_t storeyId) const {
    std::vector<std::uint32_t> out;
    for (const std::uint32_t id : candidatesNear(p, eps)) {
        const WallRec* w = find(id);
        if (!w || w->storeyId != storeyId) continue;
        if (pointsEqual(w->start, p, eps) || pointsEqual(w->end, p, eps)) out.push_back(id);
    }
    return out;
}

std::vector<std::uint32_t> WallNetwork::wallsWithBodyAt(const Point2d& p, double eps, std::uint32_t storeyId) const {
    std::vector<std::uint32_t> out;
    for (const std::uint32_t id : candidatesNear(p, eps)) {
        const WallRec* w = find(id);
        if (!w || w->storeyId != storeyId) continue;
        if (onSegmentBody(p, wallSegment(*w), eps)) out.push_back(id);
    }
    return out;
}

std::vector<WallRec> WallNetwork::wallsNear(const Point2d& p, double radius, std::uint32_t storeyId) const {
    std::vector<WallRec> out;
    for (const std::uint32_t id : candidatesNear(p, radius)) {
        const WallRec* w = find(id);
        if (!w || w->storeyId != storeyId) continue;
        if (pointSegmentDistance(p, wallSegment(*w)) <= radius) out.push_back(*w);
    }
    // Keep snapping deterministic: candidates in network order
    std::sort(out.begin(), out.end(), [this](const WallRec& a, const WallRec& b) {
        return index_.at(a.id) < index_.at(b.id);
    });
    return out;
}

std::vector<Point2d> WallNetwork::endpoints(std::uint32_t storeyId, double eps) const {
    std::vector<Point2d> out;
    auto addUnique = [&](const Point2d& p) {
        for (const Point2d& q : out) {
            if (pointsEqual(p, q, eps)) return;
        }
        out.push_back(p);
    };
    for (const WallRec& w : walls_) {
        if (w.storeyId != storeyId) continue;
        addUnique(w.start);
        addUnique(w.end);
    }
    return out;
}

std::uint64_t WallNetwork::digest() const {
    return networkDigest(walls_);
}

} // namespace floorplan
