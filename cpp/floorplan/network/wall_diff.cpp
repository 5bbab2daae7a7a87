#include "floorplan/network/wall_diff.h"
#include "floorplan/core/logging.h"
#include "floorplan/network/wall_network.h"

#include <unordered_map>

namespace floorplan {

bool applyWallDiff(WallNetwork& network, const WallDiff& diff, std::uint32_t& nextId) {
    std::unordered_map<std::uint32_t, std::uint32_t> realIds;
    auto resolve = [&realIds](std::uint32_t id) -> std::uint32_t {
        if (!isProvisionalId(id)) return id;
        const auto it = realIds.find(id);
        return it == realIds.end() ? kInvalidId : it->second;
    };

    for (const std::uint32_t id : diff.deletes) {
        if (!network.remove(id)) {
            FLOORPLAN_LOG_WARN("applyWallDiff: delete of missing wall %u", id);
            return false;
        }
    }
    for (const WallRec& create : diff.creates) {
        WallRec rec = create;
        rec.id = nextId++;
        realIds[create.id] = rec.id;
        network.upsert(rec);
    }
    for (const WallMergeStep& step : diff.merges) {
        const std::uint32_t a = resolve(step.firstId);
        const std::uint32_t b = resolve(step.secondId);
        if (!network.contains(a) || !network.contains(b)) {
            FLOORPLAN_LOG_WARN("applyWallDiff: merge of missing walls %u/%u", step.firstId, step.secondId);
            return false;
        }
        network.remove(a);
        network.remove(b);
        WallRec rec = step.merged;
        rec.id = nextId++;
        realIds[step.merged.id] = rec.id;
        network.upsert(rec);
    }
    return true;
}

} // namespace floorplan
