#include "tests/test_common.h"
#include "shapeedit/geometry/geometry.h"
#include <limits>

using namespace shapeedit;
using namespace shapeedit_test;

TEST(GeometryTest, ConstructorsRejectInvalidInput) {
    Geometry g;
    ASSERT_EQ(makeCircle(1.0, 2.0, 3.0, g), ShapeError::Ok);

    EXPECT_EQ(makeCircle(0.0, 0.0, -1.0, g), ShapeError::InvalidGeometry);
    EXPECT_EQ(makeCircle(std::numeric_limits<double>::quiet_NaN(), 0.0, 1.0, g), ShapeError::InvalidGeometry);
    EXPECT_EQ(makeRect(0.0, 0.0, -2.0, 5.0, g), ShapeError::InvalidGeometry);
    EXPECT_EQ(makeRect(0.0, 0.0, 2.0, std::numeric_limits<double>::infinity(), g), ShapeError::InvalidGeometry);
    EXPECT_EQ(makePath({}, g), ShapeError::InvalidGeometry);

    // Failed constructors leave the output alone.
    EXPECT_EQ(g.kind, ShapeKind::Circle);
    EXPECT_DOUBLE_EQ(g.circle.r, 3.0);
}

TEST(GeometryTest, CircleContainmentIsStrict) {
    Geometry g;
    ASSERT_EQ(makeCircle(0.0, 0.0, 10.0, g), ShapeError::Ok);
    EXPECT_TRUE(containsPoint(g, {0.0, 0.0}));
    EXPECT_TRUE(containsPoint(g, {9.99, 0.0}));
    EXPECT_FALSE(containsPoint(g, {10.0, 0.0}));
    EXPECT_FALSE(containsPoint(g, {8.0, 8.0}));
}

TEST(GeometryTest, RectContainmentIsHalfOpen) {
    Geometry g;
    ASSERT_EQ(makeRect(10.0, 20.0, 30.0, 5.0, g), ShapeError::Ok);
    EXPECT_TRUE(containsPoint(g, {10.0, 20.0}));
    EXPECT_TRUE(containsPoint(g, {39.9, 24.9}));
    EXPECT_FALSE(containsPoint(g, {40.0, 22.0}));
    EXPECT_FALSE(containsPoint(g, {20.0, 25.0}));
    EXPECT_FALSE(containsPoint(g, {9.9, 22.0}));
}

TEST(GeometryTest, ZeroAreaRectContainsNothing) {
    Geometry g;
    ASSERT_EQ(makeRect(0.0, 0.0, 0.0, 10.0, g), ShapeError::Ok);
    EXPECT_FALSE(containsPoint(g, {0.0, 5.0}));
}

TEST(GeometryTest, DegeneratePathContainsNothing) {
    Geometry g;
    ASSERT_EQ(makePath({{0.0, 0.0}, {10.0, 10.0}}, g), ShapeError::Ok);
    EXPECT_FALSE(containsPoint(g, {5.0, 5.0}));
}

TEST(GeometryTest, SquarePathContainsInterior) {
    Geometry g;
    ASSERT_EQ(makePath(squarePath(0.0, 0.0, 10.0), g), ShapeError::Ok);
    EXPECT_TRUE(containsPoint(g, {5.0, 5.0}));
    EXPECT_FALSE(containsPoint(g, {15.0, 5.0}));
    EXPECT_FALSE(containsPoint(g, {-1.0, -1.0}));
}

TEST(GeometryTest, PentagramCenterIsInsideUnderNonzeroWinding) {
    Geometry g;
    const std::vector<Point2> star = pentagram({0.0, 0.0}, 100.0);
    ASSERT_EQ(makePath(star, g), ShapeError::Ok);

    EXPECT_EQ(std::abs(windingNumber(star, {0.0, 0.0})), 2);
    EXPECT_TRUE(containsPoint(g, {0.0, 0.0}));
    // Inside the top tip.
    EXPECT_TRUE(containsPoint(g, {0.0, -80.0}));
    // Between two tips, outside the star.
    EXPECT_FALSE(containsPoint(g, {0.0, 90.0}));
    EXPECT_FALSE(containsPoint(g, {150.0, 0.0}));
}

TEST(GeometryTest, BoundingBoxes) {
    Geometry g;
    ASSERT_EQ(makeCircle(5.0, 5.0, 2.0, g), ShapeError::Ok);
    expectAabbNear(boundingBox(g), AABB{3.0, 3.0, 7.0, 7.0}, kGeomEps);

    ASSERT_EQ(makeRect(1.0, 2.0, 3.0, 4.0, g), ShapeError::Ok);
    expectAabbNear(boundingBox(g), AABB{1.0, 2.0, 4.0, 6.0}, kGeomEps);

    ASSERT_EQ(makePath({{-1.0, 4.0}, {3.0, -2.0}, {0.0, 7.0}}, g), ShapeError::Ok);
    expectAabbNear(boundingBox(g), AABB{-1.0, -2.0, 3.0, 7.0}, kGeomEps);
}

TEST(GeometryTest, RotatedRectBoundsAndContainment) {
    Geometry g;
    ASSERT_EQ(makeRect(-10.0, -10.0, 20.0, 20.0, g), ShapeError::Ok);
    g.rect.rot = kPi / 4.0;
    EXPECT_FALSE(isAxisAligned(g.rect));

    const double half = 10.0 * std::sqrt(2.0);
    expectAabbNear(boundingBox(g), AABB{-half, -half, half, half}, kGeomEps);

    // The diamond covers its axis tips but not the old square corners.
    EXPECT_TRUE(containsPoint(g, {0.0, -13.0}));
    EXPECT_FALSE(containsPoint(g, {9.5, 9.5}));

    const std::array<Point2, 4> corners = rectCorners(g.rect);
    EXPECT_NEAR(corners[0].x, 0.0, kGeomEps);
    EXPECT_NEAR(corners[0].y, -half, kGeomEps);
}
