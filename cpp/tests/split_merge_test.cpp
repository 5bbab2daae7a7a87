#include "tests/floorplan_test_common.h"
#include "floorplan/core/digest.h"
#include "floorplan/network/wall_planner.h"

using namespace floorplan_test;

TEST(WallMergeTest, AdjacentHalvesMergeIntoOneWall) {
    WallNetwork network({
        makeWall(1, {0.0, 0.0}, {500.0, 0.0}),
        makeWall(2, {500.0, 0.0}, {1000.0, 0.0}),
    });

    WallDiff diff;
    ASSERT_EQ(planMergeWalls(network, 1, 2, EditTolerances{}, diff), EditError::Ok);
    ASSERT_EQ(diff.merges.size(), 1u);
    EXPECT_TRUE(diff.deletes.empty());
    EXPECT_TRUE(diff.creates.empty());
    const WallRec& merged = diff.merges[0].merged;
    EXPECT_DOUBLE_EQ(merged.start.x, 0.0);
    EXPECT_DOUBLE_EQ(merged.end.x, 1000.0);

    applyDiff(network, diff);
    ASSERT_EQ(network.size(), 1u);
    EXPECT_TRUE(hasSegment(network.walls(), {0.0, 0.0}, {1000.0, 0.0}));
}

TEST(WallMergeTest, MergedWallKeepsFirstWallMaterial) {
    WallRec first = makeWall(1, {0.0, 0.0}, {500.0, 0.0});
    first.hasConcreteBase = true;
    first.concreteBaseHeight = 150.0;
    const WallRec second = makeWall(2, {1000.0, 0.0}, {500.0, 0.0});

    WallRec merged{};
    Point2d shared{};
    ASSERT_EQ(checkMerge(first, second, kEps, merged, &shared), EditError::Ok);
    EXPECT_DOUBLE_EQ(shared.x, 500.0);
    EXPECT_TRUE(merged.hasConcreteBase);
    EXPECT_DOUBLE_EQ(merged.concreteBaseHeight, 150.0);
    EXPECT_DOUBLE_EQ(merged.start.x, 0.0);
    EXPECT_DOUBLE_EQ(merged.end.x, 1000.0);
}

TEST(WallMergeTest, RejectsInvalidPairs) {
    WallNetwork network({
        makeWall(1, {0.0, 0.0}, {500.0, 0.0}),
        makeWall(2, {500.0, 0.0}, {1000.0, 0.0}, 200.0, 2500.0),
        makeWall(3, {500.0, 0.0}, {500.0, 500.0}),
        makeWall(4, {600.0, 0.0}, {900.0, 0.0}),
        makeWall(5, {500.0, 0.0}, {200.0, 0.0}),
        makeWall(6, {500.0, 0.0}, {1000.0, 0.0}, 200.0, 3000.0, WallType::Wall, 2),
        makeWall(7, {500.0, 0.0}, {1000.0, 0.0}, 200.0, 3000.0, WallType::Partition),
    });

    WallDiff diff;
    EXPECT_EQ(planMergeWalls(network, 1, 1, EditTolerances{}, diff), EditError::InvalidSelection);
    EXPECT_EQ(planMergeWalls(network, 1, 6, EditTolerances{}, diff), EditError::InvalidSelection);
    EXPECT_EQ(planMergeWalls(network, 1, 99, EditTolerances{}, diff), EditError::WallNotFound);
    EXPECT_EQ(planMergeWalls(network, 1, 2, EditTolerances{}, diff), EditError::IncompatibleAttributes);
    EXPECT_EQ(planMergeWalls(network, 1, 7, EditTolerances{}, diff), EditError::IncompatibleAttributes);
    EXPECT_EQ(planMergeWalls(network, 1, 3, EditTolerances{}, diff), EditError::NotCollinear);
    EXPECT_EQ(planMergeWalls(network, 1, 4, EditTolerances{}, diff), EditError::NotConnected);
    // Folds back over wall 1 instead of continuing it
    EXPECT_EQ(planMergeWalls(network, 1, 5, EditTolerances{}, diff), EditError::NotConnected);
    EXPECT_TRUE(diff.empty());
}

TEST(WallSplitTest, SplitProjectsPointOntoAxis) {
    WallNetwork network({makeWall(1, {0.0, 0.0}, {1000.0, 0.0})});

    WallDiff diff;
    ASSERT_EQ(planSplitWall(network, 1, {400.0, 0.3}, EditTolerances{}, diff), EditError::Ok);
    ASSERT_EQ(diff.deletes.size(), 1u);
    ASSERT_EQ(diff.creates.size(), 2u);
    EXPECT_TRUE(hasSegment(diff.creates, {0.0, 0.0}, {400.0, 0.0}));
    EXPECT_TRUE(hasSegment(diff.creates, {400.0, 0.0}, {1000.0, 0.0}));
    for (const WallRec& piece : diff.creates) {
        EXPECT_DOUBLE_EQ(piece.thickness, 200.0);
        EXPECT_DOUBLE_EQ(piece.height, 3000.0);
    }
}

TEST(WallSplitTest, SplitThenMergeRestoresGeometry) {
    const WallRec original = makeWall(1, {0.0, 0.0}, {1000.0, 0.0});
    WallNetwork network({original});

    WallDiff diff;
    ASSERT_EQ(planSplitWall(network, 1, {400.0, 0.0}, EditTolerances{}, diff), EditError::Ok);
    applyDiff(network, diff, 10);
    ASSERT_EQ(network.size(), 2u);

    ASSERT_EQ(planMergeWalls(network, 10, 11, EditTolerances{}, diff), EditError::Ok);
    applyDiff(network, diff, 20);
    ASSERT_EQ(network.size(), 1u);
    EXPECT_EQ(wallDigest(network.walls()[0]), wallDigest(original));
}

TEST(WallSplitTest, RejectsBadSplitPoints) {
    WallNetwork network({
        makeWall(1, {0.0, 0.0}, {1000.0, 0.0}),
        makeWall(2, {0.0, 100.0}, {1.5, 100.0}),
    });

    WallDiff diff;
    EXPECT_EQ(planSplitWall(network, 99, {500.0, 0.0}, EditTolerances{}, diff), EditError::WallNotFound);
    EXPECT_EQ(planSplitWall(network, 2, {0.75, 100.0}, EditTolerances{}, diff), EditError::WallTooShort);
    EXPECT_EQ(planSplitWall(network, 1, {0.5, 0.0}, EditTolerances{}, diff), EditError::PointNearEndpoint);
    EXPECT_EQ(planSplitWall(network, 1, {999.8, 0.0}, EditTolerances{}, diff), EditError::PointNearEndpoint);
    EXPECT_EQ(planSplitWall(network, 1, {500.0, 5.0}, EditTolerances{}, diff), EditError::PointOffSegment);
    EXPECT_EQ(planSplitWall(network, 1, {-200.0, 0.0}, EditTolerances{}, diff), EditError::PointOffSegment);
    EXPECT_TRUE(diff.empty());
}

TEST(DefaultWallsTest, PerimeterRectangle) {
    WallDiff diff;
    ASSERT_EQ(planDefaultBoundaryWalls(10000.0, 8000.0, 1000.0, 200.0, kStorey, diff), EditError::Ok);
    ASSERT_EQ(diff.creates.size(), 4u);
    EXPECT_TRUE(hasSegment(diff.creates, {0.0, 0.0}, {10000.0, 0.0}));
    EXPECT_TRUE(hasSegment(diff.creates, {10000.0, 0.0}, {10000.0, 8000.0}));
    EXPECT_TRUE(hasSegment(diff.creates, {0.0, 8000.0}, {10000.0, 8000.0}));
    EXPECT_TRUE(hasSegment(diff.creates, {0.0, 0.0}, {0.0, 8000.0}));

    EXPECT_EQ(planDefaultBoundaryWalls(0.0, 8000.0, 1000.0, 200.0, kStorey, diff), EditError::InvalidDimensions);
    EXPECT_TRUE(diff.empty());
}
