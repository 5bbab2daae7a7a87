#pragma once

#include "floorplan/core/types.h"
#include "floorplan/geometry/spatial_hash.h"

#include <cstdint>
#include <cstddef>
#include <unordered_map>
#include <vector>

namespace floorplan {

// In-memory wall set with an id index and a spatial index over wall bounds.
// Adjacency is derived on demand from endpoint coincidence.
class WallNetwork {
public:
    WallNetwork();
    explicit WallNetwork(const std::vector<WallRec>& walls);

    void clear();
    void assign(const std::vector<WallRec>& walls);

    // Inserts or replaces by id.
    void upsert(const WallRec& wall);
    bool remove(std::uint32_t id);

    const WallRec* find(std::uint32_t id) const;
    bool contains(std::uint32_t id) const { return find(id) != nullptr; }

    const std::vector<WallRec>& walls() const { return walls_; }
    std::size_t size() const { return walls_.size(); }
    bool empty() const { return walls_.empty(); }

    std::vector<WallRec> wallsOnStorey(std::uint32_t storeyId) const;

    // Walls on the storey with an endpoint within eps of p.
    std::vector<std::uint32_t> wallsWithEndpointAt(const Point2d& p, double eps, std::uint32_t storeyId) const;

    // Walls on the storey whose body (endpoints excluded) contains p within eps.
    std::vector<std::uint32_t> wallsWithBodyAt(const Point2d& p, double eps, std::uint32_t storeyId) const;

    // Walls on the storey within radius of p (grid query plus exact distance check).
    std::vector<WallRec> wallsNear(const Point2d& p, double radius, std::uint32_t storeyId) const;

    // Distinct endpoints of walls on the storey, in wall order.
    std::vector<Point2d> endpoints(std::uint32_t storeyId, double eps) const;

    std::uint64_t digest() const;

private:
    std::vector<std::uint32_t> candidatesNear(const Point2d& p, double radius) const;
    void rebuildIndex();

    std::vector<WallRec> walls_;
    std::unordered_map<std::uint32_t, std::size_t> index_;
    SpatialHashGrid grid_;
};

} // namespace floorplan
