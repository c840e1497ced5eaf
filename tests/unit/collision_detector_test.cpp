#include <gtest/gtest.h>
#include "elastic/physics/collision_detector.hpp"

using namespace Physics;

TEST(CollisionDetectorTest, OverlappingDisks) {
    Body a(Position(0.0, 0.0), Vector(), 0.5);
    Body b(Position(0.8, 0.0), Vector(), 0.5);

    ContactInfo info = CollisionDetector::checkCollision(a, b);
    EXPECT_TRUE(info.isColliding);
    EXPECT_NEAR(info.overlap, 0.2, 1e-6);
    EXPECT_NEAR(info.normal.x, 1.0, 1e-6);
    EXPECT_NEAR(info.normal.y, 0.0, 1e-6);
}

TEST(CollisionDetectorTest, SeparatedDisksReportSentinel) {
    Body a(Position(0.0, 0.0), Vector(), 0.5);
    Body b(Position(2.0, 0.0), Vector(), 0.5);

    ContactInfo info = CollisionDetector::checkCollision(a, b);
    EXPECT_FALSE(info.isColliding);
    EXPECT_EQ(info.overlap, 0.0);
    EXPECT_EQ(info.normal.x, 0.0);
    EXPECT_EQ(info.normal.y, 0.0);
}

TEST(CollisionDetectorTest, NormalPointsFromFirstToSecond) {
    Body a(Position(1.0, 1.0), Vector(), 0.5);
    Body b(Position(1.6, 1.8), Vector(), 0.5);

    ContactInfo ab = CollisionDetector::checkCollision(a, b);
    ContactInfo ba = CollisionDetector::checkCollision(b, a);
    ASSERT_TRUE(ab.isColliding);
    ASSERT_TRUE(ba.isColliding);

    EXPECT_NEAR(ab.normal.x, 0.6, 1e-12);
    EXPECT_NEAR(ab.normal.y, 0.8, 1e-12);
    EXPECT_NEAR(ba.normal.x, -0.6, 1e-12);
    EXPECT_NEAR(ba.normal.y, -0.8, 1e-12);
    EXPECT_NEAR(ab.overlap, 0.0, 1e-12);
}

TEST(CollisionDetectorTest, TouchingWithinToleranceCounts) {
    Body a(Position(0.0, 0.0), Vector(), 0.5);
    Body touching(Position(1.0 + 5e-9, 0.0), Vector(), 0.5);
    Body apart(Position(1.0 + 1e-6, 0.0), Vector(), 0.5);

    ContactInfo t = CollisionDetector::checkCollision(a, touching);
    EXPECT_TRUE(t.isColliding);
    EXPECT_EQ(t.overlap, 0.0);

    EXPECT_FALSE(CollisionDetector::checkCollision(a, apart).isColliding);
}

TEST(CollisionDetectorTest, CoincidentCentresUseFixedNormal) {
    Body a(Position(3.0, 3.0), Vector(), 0.5);
    Body b(Position(3.0, 3.0), Vector(), 0.25);

    ContactInfo info = CollisionDetector::checkCollision(a, b);
    EXPECT_TRUE(info.isColliding);
    EXPECT_DOUBLE_EQ(info.overlap, 0.75);
    EXPECT_DOUBLE_EQ(info.normal.x, 1.0);
    EXPECT_DOUBLE_EQ(info.normal.y, 0.0);
}

TEST(CollisionDetectorTest, NearlyCoincidentCentresUseFixedNormal) {
    // Below the coincidence threshold the direction is meaningless
    Body a(Position(3.0, 3.0), Vector(), 0.5);
    Body b(Position(3.0, 3.0 + 1e-11), Vector(), 0.5);

    ContactInfo info = CollisionDetector::checkCollision(a, b);
    EXPECT_TRUE(info.isColliding);
    EXPECT_DOUBLE_EQ(info.normal.x, 1.0);
    EXPECT_DOUBLE_EQ(info.normal.y, 0.0);

    // Just above it the normal follows the centre offset
    Body c(Position(3.0, 3.0 + 1e-9), Vector(), 0.5);
    ContactInfo offset = CollisionDetector::checkCollision(a, c);
    EXPECT_NEAR(offset.normal.x, 0.0, 1e-12);
    EXPECT_NEAR(offset.normal.y, 1.0, 1e-6);
}

TEST(CollisionDetectorTest, CheckBoundaryReportsDeepestWall) {
    Boundary box(10.0, 8.0);

    Body inside(Position(5.0, 4.0), Vector(), 0.5);
    ContactInfo none = CollisionDetector::checkBoundary(inside, box);
    EXPECT_FALSE(none.isColliding);
    EXPECT_EQ(none.overlap, 0.0);
    EXPECT_EQ(none.normal.x, 0.0);
    EXPECT_EQ(none.normal.y, 0.0);

    Body corner(Position(0.3, 0.4), Vector(), 0.5);
    ContactInfo left = CollisionDetector::checkBoundary(corner, box);
    EXPECT_TRUE(left.isColliding);
    EXPECT_NEAR(left.overlap, 0.2, 1e-12);
    EXPECT_DOUBLE_EQ(left.normal.x, -1.0);
    EXPECT_DOUBLE_EQ(left.normal.y, 0.0);

    Body top(Position(5.0, 7.9), Vector(), 0.5);
    ContactInfo topInfo = CollisionDetector::checkBoundary(top, box);
    EXPECT_TRUE(topInfo.isColliding);
    EXPECT_NEAR(topInfo.overlap, 0.4, 1e-12);
    EXPECT_DOUBLE_EQ(topInfo.normal.x, 0.0);
    EXPECT_DOUBLE_EQ(topInfo.normal.y, 1.0);

    // checkBoundary is a pure query
    EXPECT_DOUBLE_EQ(top.position.y, 7.9);
}

TEST(CollisionDetectorTest, EnforceBoundaryReflectsLowerWalls) {
    Boundary box(10.0, 8.0);
    Body ball(Position(0.3, 0.2), Vector(-1.0, -2.0), 0.5);

    EXPECT_TRUE(CollisionDetector::enforceBoundary(ball, box));
    EXPECT_DOUBLE_EQ(ball.position.x, 0.5);
    EXPECT_DOUBLE_EQ(ball.position.y, 0.5);
    EXPECT_DOUBLE_EQ(ball.velocity.x, 1.0);
    EXPECT_DOUBLE_EQ(ball.velocity.y, 2.0);
}

TEST(CollisionDetectorTest, EnforceBoundaryReflectsUpperWalls) {
    Boundary box(10.0, 8.0);
    Body ball(Position(9.8, 7.7), Vector(3.0, 0.5), 0.5);

    EXPECT_TRUE(CollisionDetector::enforceBoundary(ball, box));
    EXPECT_DOUBLE_EQ(ball.position.x, 9.5);
    EXPECT_DOUBLE_EQ(ball.position.y, 7.5);
    EXPECT_DOUBLE_EQ(ball.velocity.x, -3.0);
    EXPECT_DOUBLE_EQ(ball.velocity.y, -0.5);
}

TEST(CollisionDetectorTest, EnforceBoundaryKeepsInwardVelocityAndInteriorBodies) {
    Boundary box(10.0, 8.0);

    // Already moving away from the penetrated wall: clamp only
    Body leaving(Position(0.4, 4.0), Vector(2.0, 0.0), 0.5);
    EXPECT_TRUE(CollisionDetector::enforceBoundary(leaving, box));
    EXPECT_DOUBLE_EQ(leaving.position.x, 0.5);
    EXPECT_DOUBLE_EQ(leaving.velocity.x, 2.0);

    Body inside(Position(5.0, 4.0), Vector(-1.0, 1.0), 0.5);
    EXPECT_FALSE(CollisionDetector::enforceBoundary(inside, box));
    EXPECT_DOUBLE_EQ(inside.position.x, 5.0);
    EXPECT_DOUBLE_EQ(inside.velocity.x, -1.0);
    EXPECT_DOUBLE_EQ(inside.velocity.y, 1.0);
}
