#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

#include "floorplan/geometry/snap_solver.h"
#include "floorplan/network/joints.h"
#include "floorplan/network/wall_planner.h"
#include "floorplan/room/room_matcher.h"
#include "floorplan/storey/ghosts.h"

#ifdef EMSCRIPTEN
using namespace floorplan;

namespace {

// Planner results for JS: status plus the diff it produced.
struct PlanResult {
    EditError error;
    WallDiff diff;
};

PlanResult addWallPlan(const WallNetwork& network, const WallRequest& request) {
    PlanResult out{};
    out.error = planAddWall(network, request, WallDefaults{}, EditTolerances{}, out.diff);
    return out;
}

PlanResult deleteWallPlan(const WallNetwork& network, std::uint32_t wallId) {
    PlanResult out{};
    out.error = planDeleteWall(network, wallId, EditTolerances{}, out.diff);
    return out;
}

PlanResult splitWallPlan(const WallNetwork& network, std::uint32_t wallId, const Point2d& at) {
    PlanResult out{};
    out.error = planSplitWall(network, wallId, at, EditTolerances{}, out.diff);
    return out;
}

PlanResult mergeWallsPlan(const WallNetwork& network, std::uint32_t firstId, std::uint32_t secondId) {
    PlanResult out{};
    out.error = planMergeWalls(network, firstId, secondId, EditTolerances{}, out.diff);
    return out;
}

RoomMatch matchRoom(const std::vector<Point2d>& polygon, const WallNetwork& network, std::uint32_t storeyId) {
    return matchRoomBoundary(polygon, network.wallsOnStorey(storeyId), floorplan_constants::GEOMETRY_EPSILON);
}

GhostProjection ghostsFor(
    const WallNetwork& network,
    const std::vector<RoomRec>& rooms,
    const std::vector<StoreyRec>& storeys,
    std::uint32_t activeStoreyId) {
    return computeGhosts(network.walls(), rooms, StoreyStack(storeys), activeStoreyId,
        floorplan_constants::GHOST_ELEVATION_EPSILON);
}

SnapHit snapPoint(const Point2d& raw, const WallNetwork& network, std::uint32_t storeyId, double viewScale) {
    return resolveSnap(raw, network.wallsOnStorey(storeyId), SnapOptions{}, viewScale);
}

std::vector<JointRec> jointsFor(const WallNetwork& network, std::uint32_t storeyId) {
    return findJoints(network.wallsOnStorey(storeyId), floorplan_constants::GEOMETRY_EPSILON);
}

std::string errorMessage(EditError err) {
    return editErrorMessage(err);
}
} // namespace

EMSCRIPTEN_BINDINGS(floorplan_module) {
    emscripten::enum_<WallType>("WallType")
        .value("Wall", WallType::Wall)
        .value("Partition", WallType::Partition);

    emscripten::enum_<JointMethod>("JointMethod")
        .value("ButtIn", JointMethod::ButtIn)
        .value("Cut45", JointMethod::Cut45);

    emscripten::enum_<FloorType>("FloorType")
        .value("None", FloorType::None)
        .value("Slab", FloorType::Slab)
        .value("Panel", FloorType::Panel);

    emscripten::enum_<SnapTargetKind>("SnapTargetKind")
        .value("None", SnapTargetKind::None)
        .value("Endpoint", SnapTargetKind::Endpoint)
        .value("Body", SnapTargetKind::Body)
        .value("Joint", SnapTargetKind::Joint);

    emscripten::enum_<EditError>("EditError")
        .value("Ok", EditError::Ok)
        .value("WallNotFound", EditError::WallNotFound)
        .value("RoomNotFound", EditError::RoomNotFound)
        .value("StoreyNotFound", EditError::StoreyNotFound)
        .value("DoorNotFound", EditError::DoorNotFound)
        .value("DegenerateWall", EditError::DegenerateWall)
        .value("IncompatibleAttributes", EditError::IncompatibleAttributes)
        .value("NotCollinear", EditError::NotCollinear)
        .value("NotConnected", EditError::NotConnected)
        .value("PointOffSegment", EditError::PointOffSegment)
        .value("PointNearEndpoint", EditError::PointNearEndpoint)
        .value("WallTooShort", EditError::WallTooShort)
        .value("InvalidSelection", EditError::InvalidSelection)
        .value("TooFewVertices", EditError::TooFewVertices)
        .value("UnmatchedEdge", EditError::UnmatchedEdge)
        .value("InsideGhostArea", EditError::InsideGhostArea)
        .value("InvalidDimensions", EditError::InvalidDimensions)
        .value("InvalidDoorPosition", EditError::InvalidDoorPosition)
        .value("PersistenceUnavailable", EditError::PersistenceUnavailable)
        .value("PersistenceRejected", EditError::PersistenceRejected)
        .value("EditInProgress", EditError::EditInProgress)
        .value("NothingToUndo", EditError::NothingToUndo)
        .value("NothingToRedo", EditError::NothingToRedo)
        .value("ConsistencyViolation", EditError::ConsistencyViolation);

    emscripten::value_object<Point2d>("Point2d")
        .field("x", &Point2d::x)
        .field("y", &Point2d::y);

    emscripten::value_object<WallRec>("WallRec")
        .field("id", &WallRec::id)
        .field("storeyId", &WallRec::storeyId)
        .field("start", &WallRec::start)
        .field("end", &WallRec::end)
        .field("thickness", &WallRec::thickness)
        .field("height", &WallRec::height)
        .field("type", &WallRec::type)
        .field("hasConcreteBase", &WallRec::hasConcreteBase)
        .field("concreteBaseHeight", &WallRec::concreteBaseHeight);

    emscripten::value_object<WallRequest>("WallRequest")
        .field("start", &WallRequest::start)
        .field("end", &WallRequest::end)
        .field("storeyId", &WallRequest::storeyId)
        .field("hasThickness", &WallRequest::hasThickness)
        .field("thickness", &WallRequest::thickness)
        .field("hasHeight", &WallRequest::hasHeight)
        .field("height", &WallRequest::height)
        .field("type", &WallRequest::type)
        .field("hasConcreteBase", &WallRequest::hasConcreteBase)
        .field("concreteBaseHeight", &WallRequest::concreteBaseHeight);

    emscripten::value_object<WallMergeStep>("WallMergeStep")
        .field("firstId", &WallMergeStep::firstId)
        .field("secondId", &WallMergeStep::secondId)
        .field("merged", &WallMergeStep::merged);

    emscripten::value_object<WallDiff>("WallDiff")
        .field("deletes", &WallDiff::deletes)
        .field("creates", &WallDiff::creates)
        .field("merges", &WallDiff::merges);

    emscripten::value_object<PlanResult>("PlanResult")
        .field("error", &PlanResult::error)
        .field("diff", &PlanResult::diff);

    emscripten::value_object<RoomMatch>("RoomMatch")
        .field("wallIds", &RoomMatch::wallIds)
        .field("unmatchedEdges", &RoomMatch::unmatchedEdges);

    emscripten::value_object<RoomRec>("RoomRec")
        .field("id", &RoomRec::id)
        .field("storeyId", &RoomRec::storeyId)
        .field("name", &RoomRec::name)
        .field("polygon", &RoomRec::polygon)
        .field("wallIds", &RoomRec::wallIds)
        .field("floorType", &RoomRec::floorType)
        .field("floorThickness", &RoomRec::floorThickness)
        .field("height", &RoomRec::height)
        .field("baseElevation", &RoomRec::baseElevation)
        .field("hasLabelAnchor", &RoomRec::hasLabelAnchor)
        .field("labelAnchor", &RoomRec::labelAnchor)
        .field("temperature", &RoomRec::temperature)
        .field("remarks", &RoomRec::remarks);

    emscripten::value_object<StoreyRec>("StoreyRec")
        .field("id", &StoreyRec::id)
        .field("projectId", &StoreyRec::projectId)
        .field("name", &StoreyRec::name)
        .field("elevation", &StoreyRec::elevation)
        .field("order", &StoreyRec::order)
        .field("defaultRoomHeight", &StoreyRec::defaultRoomHeight)
        .field("slabThickness", &StoreyRec::slabThickness);

    emscripten::value_object<GhostArea>("GhostArea")
        .field("roomId", &GhostArea::roomId)
        .field("storeyId", &GhostArea::storeyId)
        .field("polygon", &GhostArea::polygon)
        .field("baseElevation", &GhostArea::baseElevation)
        .field("topElevation", &GhostArea::topElevation);

    emscripten::value_object<GhostProjection>("GhostProjection")
        .field("ghostWalls", &GhostProjection::ghostWalls)
        .field("ghostAreas", &GhostProjection::ghostAreas);

    emscripten::value_object<JointRec>("JointRec")
        .field("wallA", &JointRec::wallA)
        .field("wallB", &JointRec::wallB)
        .field("point", &JointRec::point)
        .field("method", &JointRec::method);

    emscripten::value_object<SnapHit>("SnapHit")
        .field("point", &SnapHit::point)
        .field("kind", &SnapHit::kind)
        .field("wallId", &SnapHit::wallId)
        .field("distance", &SnapHit::distance);

    emscripten::register_vector<std::uint32_t>("VectorUInt32");
    emscripten::register_vector<std::size_t>("VectorSize");
    emscripten::register_vector<Point2d>("VectorPoint2d");
    emscripten::register_vector<WallRec>("VectorWallRec");
    emscripten::register_vector<WallMergeStep>("VectorWallMergeStep");
    emscripten::register_vector<RoomRec>("VectorRoomRec");
    emscripten::register_vector<StoreyRec>("VectorStoreyRec");
    emscripten::register_vector<GhostArea>("VectorGhostArea");
    emscripten::register_vector<JointRec>("VectorJointRec");

    emscripten::class_<WallNetwork>("WallNetwork")
        .constructor<>()
        .function("clear", &WallNetwork::clear)
        .function("upsert", &WallNetwork::upsert)
        .function("remove", &WallNetwork::remove)
        .function("size", &WallNetwork::size)
        .function("walls", &WallNetwork::walls)
        .function("wallsOnStorey", &WallNetwork::wallsOnStorey);

    emscripten::function("planAddWall", &addWallPlan);
    emscripten::function("planDeleteWall", &deleteWallPlan);
    emscripten::function("planSplitWall", &splitWallPlan);
    emscripten::function("planMergeWalls", &mergeWallsPlan);
    emscripten::function("matchRoomBoundary", &matchRoom);
    emscripten::function("computeGhosts", &ghostsFor);
    emscripten::function("resolveSnap", &snapPoint);
    emscripten::function("findJoints", &jointsFor);
    emscripten::function("editErrorMessage", &errorMessage);
}
#endif
