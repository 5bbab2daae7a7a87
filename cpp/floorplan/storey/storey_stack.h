#pragma once

#include "floorplan/core/types.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace floorplan {

// Storeys in (order, elevation, id) order.
class StoreyStack {
public:
    StoreyStack() = default;
    explicit StoreyStack(const std::vector<StoreyRec>& storeys);

    void assign(const std::vector<StoreyRec>& storeys);
    void upsert(const StoreyRec& storey);
    bool remove(std::uint32_t id);
    void clear() { storeys_.clear(); }

    const StoreyRec* find(std::uint32_t id) const;
    const std::vector<StoreyRec>& ordered() const { return storeys_; }
    std::size_t size() const { return storeys_.size(); }
    bool empty() const { return storeys_.empty(); }

    // First storey in stack order, nullptr when empty.
    const StoreyRec* defaultStorey() const;

    // Storeys preceding id in stack order, nearest first.
    std::vector<StoreyRec> storeysBelow(std::uint32_t id) const;

    // Storey elevation, 0 for unknown ids.
    double elevationOf(std::uint32_t id) const;

private:
    void sortStoreys();

    std::vector<StoreyRec> storeys_;
};

} // namespace floorplan
