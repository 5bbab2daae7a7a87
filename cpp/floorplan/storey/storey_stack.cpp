#include "floorplan/storey/storey_stack.h"

#include <algorithm>

namespace floorplan {

StoreyStack::StoreyStack(const std::vector<StoreyRec>& storeys) {
    assign(storeys);
}

void StoreyStack::assign(const std::vector<StoreyRec>& storeys) {
    storeys_ = storeys;
    sortStoreys();
}

void StoreyStack::upsert(const StoreyRec& storey) {
    auto it = std::find_if(storeys_.begin(), storeys_.end(), [&storey](const StoreyRec& s) {
        return s.id == storey.id;
    });
    if (it != storeys_.end()) {
        *it = storey;
    } else {
        storeys_.push_back(storey);
    }
    sortStoreys();
}

bool StoreyStack::remove(std::uint32_t id) {
    auto it = std::find_if(storeys_.begin(), storeys_.end(), [id](const StoreyRec& s) { return s.id == id; });
    if (it == storeys_.end()) return false;
    storeys_.erase(it);
    return true;
}

const StoreyRec* StoreyStack::find(std::uint32_t id) const {
    for (const StoreyRec& s : storeys_) {
        if (s.id == id) return &s;
    }
    return nullptr;
}

const StoreyRec* StoreyStack::defaultStorey() const {
    return storeys_.empty() ? nullptr : &storeys_.front();
}

std::vector<StoreyRec> StoreyStack::storeysBelow(std::uint32_t id) const {
    std::vector<StoreyRec> out;
    for (const StoreyRec& s : storeys_) {
        if (s.id == id) break;
        out.push_back(s);
    }
    if (out.size() == storeys_.size()) return {};
    std::reverse(out.begin(), out.end());
    return out;
}

double StoreyStack::elevationOf(std::uint32_t id) const {
    const StoreyRec* s = find(id);
    return s ? s->elevation : 0.0;
}

void StoreyStack::sortStoreys() {
    std::sort(storeys_.begin(), storeys_.end(), [](const StoreyRec& a, const StoreyRec& b) {
        if (a.order != b.order) return a.order < b.order;
        if (a.elevation != b.elevation) return a.elevation < b.elevation;
        return a.id < b.id;
    });
}

} // namespace floorplan
