#include "tests/floorplan_test_common.h"

#include <algorithm>

using namespace floorplan_test;

namespace {
DoorRec makeDoor(std::uint32_t wallId, double position, double width = 200.0) {
    DoorRec d{};
    d.wallId = wallId;
    d.width = width;
    d.height = 2100.0;
    d.thickness = 50.0;
    d.position = position;
    d.type = DoorType::Swing;
    d.configuration = DoorConfiguration::Single;
    d.side = DoorSide::Interior;
    d.direction = DoorDirection::Left;
    return d;
}

RoomRequest roomRequest(std::vector<Point2d> polygon) {
    RoomRequest req;
    req.name = "Living";
    req.polygon = std::move(polygon);
    return req;
}

bool hasNotice(const std::vector<Notification>& notices, NoticeKind kind) {
    return std::any_of(notices.begin(), notices.end(), [kind](const Notification& n) { return n.kind == kind; });
}
} // namespace

// =============================================================================
// Walls
// =============================================================================

TEST_F(SessionTest, AddWallPersistsAndRecordsHistory) {
    ASSERT_EQ(addWall({0.0, 0.0}, {1000.0, 0.0}), EditError::Ok);
    EXPECT_EQ(session.walls().size(), 1u);
    EXPECT_EQ(persistence.wallCount(), 1u);
    EXPECT_EQ(session.walls()[0].storeyId, groundId);
    EXPECT_DOUBLE_EQ(session.walls()[0].thickness, session.config().wallDefaults.thickness);
    EXPECT_TRUE(session.canUndo());

    const std::vector<Notification> notices = session.drainNotifications();
    ASSERT_EQ(notices.size(), 1u);
    EXPECT_EQ(notices[0].kind, NoticeKind::Success);
    EXPECT_EQ(notices[0].durationMs, 3000u);
    EXPECT_TRUE(session.pendingNotifications().empty());
}

TEST_F(SessionTest, CrossingWallSplitsThroughPersistence) {
    ASSERT_EQ(addWall({0.0, 0.0}, {1000.0, 0.0}), EditError::Ok);
    ASSERT_EQ(addWall({500.0, -500.0}, {500.0, 500.0}), EditError::Ok);

    EXPECT_EQ(session.walls().size(), 4u);
    EXPECT_EQ(persistence.wallCount(), 4u);
    EXPECT_TRUE(noHiddenJunctions(session.walls()));
    for (const WallRec& w : session.walls()) EXPECT_FALSE(isProvisionalId(w.id));
}

TEST_F(SessionTest, DeleteWallMergesFreedNeighbours) {
    ASSERT_EQ(addWall({0.0, 0.0}, {1000.0, 0.0}), EditError::Ok);
    ASSERT_EQ(addWall({500.0, 0.0}, {500.0, 500.0}), EditError::Ok);
    ASSERT_EQ(session.walls().size(), 3u);

    const WallRec* stub = findSegment(session.walls(), {500.0, 0.0}, {500.0, 500.0});
    ASSERT_NE(stub, nullptr);
    ASSERT_EQ(session.deleteWall(stub->id), EditError::Ok);

    ASSERT_EQ(session.walls().size(), 1u);
    EXPECT_TRUE(hasSegment(session.walls(), {0.0, 0.0}, {1000.0, 0.0}));
    EXPECT_EQ(persistence.wallCount(), 1u);
}

TEST_F(SessionTest, MergeFailureDuringDeleteIsSkipped) {
    ASSERT_EQ(addWall({0.0, 0.0}, {1000.0, 0.0}), EditError::Ok);
    ASSERT_EQ(addWall({500.0, 0.0}, {500.0, 500.0}), EditError::Ok);
    session.drainNotifications();

    persistence.setMergeFailure(true);
    const WallRec* stub = findSegment(session.walls(), {500.0, 0.0}, {500.0, 500.0});
    ASSERT_NE(stub, nullptr);
    EXPECT_EQ(session.deleteWall(stub->id), EditError::Ok);

    // Both halves survive as separate, valid walls
    EXPECT_EQ(session.walls().size(), 2u);
    EXPECT_EQ(persistence.wallCount(), 2u);
    const std::vector<Notification> notices = session.drainNotifications();
    EXPECT_TRUE(hasNotice(notices, NoticeKind::Connectivity));
    EXPECT_TRUE(hasNotice(notices, NoticeKind::Success));
}

TEST_F(SessionTest, ManualMergeReportsFailure) {
    ASSERT_EQ(addWall({0.0, 0.0}, {500.0, 0.0}), EditError::Ok);
    ASSERT_EQ(addWall({500.0, 0.0}, {1000.0, 0.0}), EditError::Ok);
    ASSERT_EQ(session.walls().size(), 2u);
    const std::uint32_t first = session.walls()[0].id;
    const std::uint32_t second = session.walls()[1].id;

    persistence.setMergeFailure(true);
    EXPECT_EQ(session.mergeWalls(first, second), EditError::PersistenceUnavailable);
    EXPECT_EQ(session.walls().size(), 2u);

    persistence.clearFailures();
    session.drainNotifications();
    ASSERT_EQ(session.mergeWalls(first, second), EditError::Ok);
    ASSERT_EQ(session.walls().size(), 1u);
    EXPECT_TRUE(hasSegment(session.walls(), {0.0, 0.0}, {1000.0, 0.0}));
}

TEST_F(SessionTest, ValidationErrorsLeaveNetworkUntouched) {
    ASSERT_EQ(addWall({0.0, 0.0}, {1000.0, 0.0}), EditError::Ok);
    session.drainNotifications();
    const std::size_t requests = persistence.requestCount();
    const std::uint32_t id = session.walls()[0].id;

    EXPECT_EQ(addWall({5.0, 5.0}, {5.0, 5.0}), EditError::DegenerateWall);
    EXPECT_EQ(session.splitWall(id, {0.5, 0.0}), EditError::PointNearEndpoint);
    EXPECT_EQ(session.splitWall(id, {500.0, 30.0}), EditError::PointOffSegment);
    EXPECT_EQ(session.mergeWalls(id, id), EditError::InvalidSelection);
    EXPECT_EQ(session.deleteWall(999), EditError::WallNotFound);

    EXPECT_EQ(session.walls().size(), 1u);
    EXPECT_EQ(persistence.requestCount(), requests);
    const std::vector<Notification> notices = session.drainNotifications();
    ASSERT_EQ(notices.size(), 5u);
    EXPECT_EQ(notices[0].kind, NoticeKind::Validation);
    EXPECT_EQ(notices[0].durationMs, 5000u);
}

TEST_F(SessionTest, OfflineServiceRejectsEdit) {
    persistence.setOffline(true);
    EXPECT_EQ(addWall({0.0, 0.0}, {1000.0, 0.0}), EditError::PersistenceUnavailable);
    EXPECT_TRUE(session.walls().empty());
    EXPECT_FALSE(session.canUndo());

    const std::vector<Notification> notices = session.drainNotifications();
    ASSERT_EQ(notices.size(), 1u);
    EXPECT_EQ(notices[0].kind, NoticeKind::Connectivity);
    EXPECT_EQ(notices[0].message, "Service unavailable.");
    EXPECT_EQ(notices[0].durationMs, 5000u);
}

TEST_F(SessionTest, PartialFailureKeepsSessionInStepWithService) {
    ASSERT_EQ(addWall({0.0, 0.0}, {1000.0, 0.0}), EditError::Ok);

    // The delete of the crossed wall goes through, the first create does not
    persistence.failAfter(1);
    EXPECT_EQ(addWall({500.0, -500.0}, {500.0, 500.0}), EditError::PersistenceUnavailable);
    EXPECT_EQ(session.walls().size(), persistence.wallCount());
    EXPECT_TRUE(session.walls().empty());
}

TEST_F(SessionTest, OverlappingEditIsRejected) {
    std::vector<EditError> nested;
    persistence.setRequestHook([this, &nested]() {
        nested.push_back(addWall({0.0, 500.0}, {1000.0, 500.0}));
        EXPECT_TRUE(session.busy());
    });
    ASSERT_EQ(addWall({0.0, 0.0}, {1000.0, 0.0}), EditError::Ok);
    persistence.setRequestHook(nullptr);

    ASSERT_FALSE(nested.empty());
    for (const EditError err : nested) EXPECT_EQ(err, EditError::EditInProgress);
    EXPECT_FALSE(session.busy());
    EXPECT_EQ(session.walls().size(), 1u);
}

TEST_F(SessionTest, UpdateWallChangesAttributesOnly) {
    ASSERT_EQ(addWall({0.0, 0.0}, {1000.0, 0.0}), EditError::Ok);
    WallRec changed = session.walls()[0];
    changed.height = 2750.0;
    changed.end = {5000.0, 0.0};
    ASSERT_EQ(session.updateWall(changed), EditError::Ok);

    const WallRec& stored = session.walls()[0];
    EXPECT_DOUBLE_EQ(stored.height, 2750.0);
    EXPECT_DOUBLE_EQ(stored.end.x, 1000.0);

    changed.thickness = 0.0;
    EXPECT_EQ(session.updateWall(changed), EditError::InvalidDimensions);
}

TEST_F(SessionTest, DefaultWallsNeedEmptyStorey) {
    ASSERT_EQ(session.createDefaultWalls(10000.0, 8000.0), EditError::Ok);
    EXPECT_EQ(activeWalls().size(), 4u);
    EXPECT_TRUE(hasSegment(activeWalls(), {10000.0, 0.0}, {10000.0, 8000.0}));
    EXPECT_EQ(session.createDefaultWalls(10000.0, 8000.0), EditError::InvalidSelection);
}

// =============================================================================
// History
// =============================================================================

TEST_F(SessionTest, UndoRedoRestoresGeometry) {
    ASSERT_EQ(addWall({0.0, 0.0}, {1000.0, 0.0}), EditError::Ok);
    ASSERT_EQ(session.splitWall(session.walls()[0].id, {400.0, 0.0}), EditError::Ok);
    ASSERT_EQ(session.walls().size(), 2u);

    ASSERT_EQ(session.undo(), EditError::Ok);
    ASSERT_EQ(session.walls().size(), 1u);
    EXPECT_TRUE(hasSegment(session.walls(), {0.0, 0.0}, {1000.0, 0.0}));
    EXPECT_EQ(persistence.wallCount(), 1u);
    EXPECT_TRUE(session.canRedo());

    ASSERT_EQ(session.redo(), EditError::Ok);
    EXPECT_EQ(session.walls().size(), 2u);
    EXPECT_TRUE(hasSegment(session.walls(), {0.0, 0.0}, {400.0, 0.0}));
    EXPECT_FALSE(session.canRedo());
    EXPECT_EQ(session.redo(), EditError::NothingToRedo);

    ASSERT_EQ(session.undo(), EditError::Ok);
    ASSERT_EQ(session.undo(), EditError::Ok);
    EXPECT_TRUE(session.walls().empty());
    EXPECT_EQ(session.undo(), EditError::NothingToUndo);
}

TEST_F(SessionTest, FailedUndoKeepsCursor) {
    ASSERT_EQ(addWall({0.0, 0.0}, {1000.0, 0.0}), EditError::Ok);
    const std::size_t cursor = session.history().getCursor();

    persistence.setOffline(true);
    EXPECT_EQ(session.undo(), EditError::PersistenceUnavailable);
    EXPECT_EQ(session.history().getCursor(), cursor);
    EXPECT_EQ(session.walls().size(), 1u);

    persistence.clearFailures();
    ASSERT_EQ(session.undo(), EditError::Ok);
    EXPECT_TRUE(session.walls().empty());
}

// =============================================================================
// Rooms
// =============================================================================

TEST_F(SessionTest, CreateRoomMatchesBoundaryWalls) {
    addSquare(1000.0);
    std::uint32_t roomId = 0;
    ASSERT_EQ(session.createRoom(roomRequest(square(0.0, 0.0, 1000.0)), &roomId), EditError::Ok);

    const RoomRec* room = session.findRoom(roomId);
    ASSERT_NE(room, nullptr);
    EXPECT_EQ(room->wallIds.size(), 4u);
    EXPECT_EQ(room->storeyId, groundId);
    EXPECT_DOUBLE_EQ(room->baseElevation, 0.0);
    EXPECT_DOUBLE_EQ(room->height, session.config().wallDefaults.height);
    EXPECT_EQ(session.roomsOnActiveStorey().size(), 1u);
}

TEST_F(SessionTest, CreateRoomRejectsBadPolygons) {
    addSquare(1000.0);
    session.drainNotifications();

    EXPECT_EQ(session.createRoom(roomRequest(square(0.0, 0.0, 1200.0))), EditError::UnmatchedEdge);
    EXPECT_EQ(session.createRoom(roomRequest({{0.0, 0.0}, {1000.0, 0.0}})), EditError::TooFewVertices);

    RoomRequest req = roomRequest(square(0.0, 0.0, 1000.0));
    req.hasHeight = true;
    req.height = 0.0;
    EXPECT_EQ(session.createRoom(req), EditError::InvalidDimensions);

    EXPECT_TRUE(session.rooms().empty());
    const std::vector<Notification> notices = session.drainNotifications();
    ASSERT_EQ(notices.size(), 3u);
    EXPECT_EQ(notices[0].kind, NoticeKind::Validation);
}

TEST_F(SessionTest, RoomFollowsSplitAndMerge) {
    addSquare(1000.0);
    std::uint32_t roomId = 0;
    ASSERT_EQ(session.createRoom(roomRequest(square(0.0, 0.0, 1000.0)), &roomId), EditError::Ok);

    const WallRec* bottom = findSegment(session.walls(), {0.0, 0.0}, {1000.0, 0.0});
    ASSERT_NE(bottom, nullptr);
    ASSERT_EQ(session.splitWall(bottom->id, {500.0, 0.0}), EditError::Ok);
    EXPECT_EQ(session.findRoom(roomId)->wallIds.size(), 5u);
    EXPECT_TRUE(session.findConsistencyViolations().empty());

    const WallRec* left = findSegment(session.walls(), {0.0, 0.0}, {500.0, 0.0});
    const WallRec* right = findSegment(session.walls(), {500.0, 0.0}, {1000.0, 0.0});
    ASSERT_NE(left, nullptr);
    ASSERT_NE(right, nullptr);
    ASSERT_EQ(session.mergeWalls(left->id, right->id), EditError::Ok);
    EXPECT_EQ(session.findRoom(roomId)->wallIds.size(), 4u);
    EXPECT_TRUE(session.findConsistencyViolations().empty());
}

TEST_F(SessionTest, DeletedBoundaryWallIsReportedAsViolation) {
    addSquare(1000.0);
    std::uint32_t roomId = 0;
    ASSERT_EQ(session.createRoom(roomRequest(square(0.0, 0.0, 1000.0)), &roomId), EditError::Ok);

    const WallRec* bottom = findSegment(session.walls(), {0.0, 0.0}, {1000.0, 0.0});
    ASSERT_NE(bottom, nullptr);
    const std::uint32_t bottomId = bottom->id;
    ASSERT_EQ(session.deleteWall(bottomId), EditError::Ok);

    const std::vector<ConsistencyViolation> violations = session.findConsistencyViolations();
    ASSERT_EQ(violations.size(), 1u);
    EXPECT_EQ(violations[0].roomId, roomId);
    EXPECT_EQ(violations[0].wallId, bottomId);
}

TEST_F(SessionTest, RoomHeightPropagatesToWalls) {
    addSquare(1000.0);
    std::uint32_t roomId = 0;
    ASSERT_EQ(session.createRoom(roomRequest(square(0.0, 0.0, 1000.0)), &roomId), EditError::Ok);

    ASSERT_EQ(session.setRoomHeight(roomId, 2800.0), EditError::Ok);
    EXPECT_DOUBLE_EQ(session.findRoom(roomId)->height, 2800.0);
    for (const WallRec& w : session.walls()) EXPECT_DOUBLE_EQ(w.height, 2800.0);
    EXPECT_EQ(session.setRoomHeight(roomId, -1.0), EditError::InvalidDimensions);
    EXPECT_EQ(session.setRoomHeight(999, 2800.0), EditError::RoomNotFound);
}

TEST_F(SessionTest, UpdateAndDeleteRoom) {
    addSquare(1000.0);
    std::uint32_t roomId = 0;
    ASSERT_EQ(session.createRoom(roomRequest(square(0.0, 0.0, 1000.0)), &roomId), EditError::Ok);

    RoomRec room = *session.findRoom(roomId);
    room.name = "Kitchen";
    room.baseElevation = -500.0;
    ASSERT_EQ(session.updateRoom(room), EditError::Ok);
    EXPECT_EQ(session.findRoom(roomId)->name, "Kitchen");
    EXPECT_DOUBLE_EQ(session.findRoom(roomId)->baseElevation, 0.0);

    room.polygon = square(0.0, 0.0, 900.0);
    EXPECT_EQ(session.updateRoom(room), EditError::UnmatchedEdge);

    ASSERT_EQ(session.deleteRoom(roomId), EditError::Ok);
    EXPECT_EQ(session.findRoom(roomId), nullptr);
    EXPECT_EQ(session.deleteRoom(roomId), EditError::RoomNotFound);
}

// =============================================================================
// Storeys
// =============================================================================

TEST_F(SessionTest, DuplicateRoomToUpperStorey) {
    const std::uint32_t firstId = addStorey("First", 3000.0, 1);
    addSquare(1000.0);
    std::uint32_t roomId = 0;
    RoomRequest req = roomRequest(square(0.0, 0.0, 1000.0));
    req.hasHeight = true;
    req.height = 3000.0;
    ASSERT_EQ(session.createRoom(req, &roomId), EditError::Ok);

    RoomDuplicateRequest dup;
    dup.sourceRoomId = roomId;
    dup.targetStoreyId = firstId;
    std::uint32_t copyId = 0;
    ASSERT_EQ(session.duplicateRoomToStorey(dup, &copyId), EditError::Ok);

    const RoomRec* copy = session.findRoom(copyId);
    ASSERT_NE(copy, nullptr);
    EXPECT_EQ(copy->storeyId, firstId);
    EXPECT_DOUBLE_EQ(copy->baseElevation, 3000.0);
    EXPECT_EQ(copy->wallIds.size(), 4u);
    EXPECT_EQ(session.network().wallsOnStorey(firstId).size(), 4u);
    EXPECT_EQ(persistence.wallCount(), 8u);
    EXPECT_TRUE(session.findConsistencyViolations().empty());
}

TEST_F(SessionTest, GhostAreaBlocksRoomAbove) {
    addSquare(1000.0);
    RoomRequest tall = roomRequest(square(0.0, 0.0, 1000.0));
    tall.hasHeight = true;
    tall.height = 4500.0;
    ASSERT_EQ(session.createRoom(tall), EditError::Ok);

    const std::uint32_t firstId = addStorey("First", 3000.0, 1);
    ASSERT_EQ(session.setActiveStorey(firstId), EditError::Ok);
    addSquare(1000.0);
    ASSERT_EQ(session.ghosts().ghostAreas.size(), 1u);

    EXPECT_EQ(session.createRoom(roomRequest(square(0.0, 0.0, 1000.0))), EditError::InsideGhostArea);
    EXPECT_TRUE(session.roomsOnActiveStorey().empty());
    EXPECT_EQ(session.setActiveStorey(999), EditError::StoreyNotFound);
}

TEST_F(SessionTest, ReloadRestoresState) {
    addSquare(1000.0);
    ASSERT_EQ(session.createRoom(roomRequest(square(0.0, 0.0, 1000.0))), EditError::Ok);

    EditSession other(persistence, kProject);
    ASSERT_EQ(other.load(), EditError::Ok);
    EXPECT_EQ(other.activeStoreyId(), groundId);
    EXPECT_EQ(other.walls().size(), 4u);
    EXPECT_EQ(other.rooms().size(), 1u);
    EXPECT_FALSE(other.canUndo());
}

// =============================================================================
// Doors
// =============================================================================

TEST_F(SessionTest, DoorFollowsSplitThenGoesWithItsWall) {
    ASSERT_EQ(addWall({0.0, 0.0}, {1000.0, 0.0}), EditError::Ok);
    std::uint32_t doorId = 0;
    ASSERT_EQ(session.createDoor(makeDoor(session.walls()[0].id, 0.25), &doorId), EditError::Ok);

    ASSERT_EQ(session.splitWall(session.walls()[0].id, {500.0, 0.0}), EditError::Ok);
    const DoorRec* door = session.findDoor(doorId);
    ASSERT_NE(door, nullptr);
    const WallRec* host = findSegment(session.walls(), {0.0, 0.0}, {500.0, 0.0});
    ASSERT_NE(host, nullptr);
    EXPECT_EQ(door->wallId, host->id);
    EXPECT_NEAR(door->position, 0.5, 1e-9);

    ASSERT_EQ(session.deleteWall(host->id), EditError::Ok);
    EXPECT_EQ(session.findDoor(doorId), nullptr);
    EXPECT_TRUE(session.doors().empty());
}

TEST_F(SessionTest, DoorValidation) {
    ASSERT_EQ(addWall({0.0, 0.0}, {1000.0, 0.0}), EditError::Ok);
    const std::uint32_t wallId = session.walls()[0].id;

    EXPECT_EQ(session.createDoor(makeDoor(wallId, 1.5)), EditError::InvalidDoorPosition);
    EXPECT_EQ(session.createDoor(makeDoor(wallId, 0.5, 2000.0)), EditError::InvalidDoorPosition);
    EXPECT_EQ(session.createDoor(makeDoor(999, 0.5)), EditError::InvalidDoorPosition);
    DoorRec flat = makeDoor(wallId, 0.5);
    flat.height = 0.0;
    EXPECT_EQ(session.createDoor(flat), EditError::InvalidDimensions);

    std::uint32_t doorId = 0;
    ASSERT_EQ(session.createDoor(makeDoor(wallId, 0.5), &doorId), EditError::Ok);
    DoorRec moved = *session.findDoor(doorId);
    moved.position = 0.75;
    ASSERT_EQ(session.updateDoor(moved), EditError::Ok);
    EXPECT_DOUBLE_EQ(session.findDoor(doorId)->position, 0.75);

    ASSERT_EQ(session.deleteDoor(doorId), EditError::Ok);
    EXPECT_EQ(session.deleteDoor(doorId), EditError::DoorNotFound);
}

// =============================================================================
// Presentation
// =============================================================================

TEST_F(SessionTest, JointMethodOverride) {
    ASSERT_EQ(addWall({0.0, 0.0}, {1000.0, 0.0}), EditError::Ok);
    ASSERT_EQ(addWall({1000.0, 0.0}, {1000.0, 1000.0}), EditError::Ok);

    std::vector<JointRec> joints = session.joints();
    ASSERT_EQ(joints.size(), 1u);
    EXPECT_EQ(joints[0].method, JointMethod::ButtIn);

    session.setJointMethod(joints[0].wallB, joints[0].wallA, JointMethod::Cut45);
    joints = session.joints();
    ASSERT_EQ(joints.size(), 1u);
    EXPECT_EQ(joints[0].method, JointMethod::Cut45);
}

TEST_F(SessionTest, SnapPreviewUsesActiveStorey) {
    ASSERT_EQ(addWall({0.0, 0.0}, {1000.0, 0.0}), EditError::Ok);
    const SnapHit hit = session.snapPreview({1003.0, 2.0}, 1.0);
    EXPECT_EQ(hit.kind, SnapTargetKind::Endpoint);
    EXPECT_DOUBLE_EQ(hit.point.x, 1000.0);

    const std::uint32_t firstId = addStorey("First", 3000.0, 1);
    ASSERT_EQ(session.setActiveStorey(firstId), EditError::Ok);
    EXPECT_EQ(session.snapPreview({1003.0, 2.0}, 1.0).kind, SnapTargetKind::None);
}
