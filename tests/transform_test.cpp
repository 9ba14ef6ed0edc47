#include "tests/test_common.h"
#include "shapeedit/geometry/transform.h"

using namespace shapeedit;
using namespace shapeedit_test;

TEST(TransformTest, PositiveRotationIsClockwiseOnScreen) {
    const Point2 p = applyAffine(affineRotate(degreesToRadians(90.0)), Point2{1.0, 0.0});
    // y grows downward, so +x turns into +y.
    EXPECT_NEAR(p.x, 0.0, kGeomEps);
    EXPECT_NEAR(p.y, 1.0, kGeomEps);
}

TEST(TransformTest, ConcatAppliesRightHandSideFirst) {
    const Affine2 m = affineConcat(affineTranslate(10.0, 0.0), affineScale(2.0));
    const Point2 p = applyAffine(m, Point2{1.0, 1.0});
    EXPECT_NEAR(p.x, 12.0, kGeomEps);
    EXPECT_NEAR(p.y, 2.0, kGeomEps);
}

TEST(TransformTest, RotateAroundKeepsCenterFixed) {
    const Point2 c{3.0, -4.0};
    const Point2 p = applyAffine(affineRotateAround(c, 37.0), c);
    EXPECT_NEAR(p.x, c.x, kGeomEps);
    EXPECT_NEAR(p.y, c.y, kGeomEps);
}

TEST(TransformTest, TwentyFourFifteenDegreeTurnsRestoreBounds) {
    const Point2 c{50.0, 40.0};
    std::vector<Geometry> shapes(3);
    ASSERT_EQ(makeCircle(70.0, 40.0, 12.0, shapes[0]), ShapeError::Ok);
    ASSERT_EQ(makeRect(10.0, 20.0, 30.0, 5.0, shapes[1]), ShapeError::Ok);
    ASSERT_EQ(makePath(pentagram({60.0, 60.0}, 25.0), shapes[2]), ShapeError::Ok);

    for (const Geometry& original : shapes) {
        Geometry g = original;
        for (int i = 0; i < 24; ++i) {
            g = rotatedAround(g, c, 15.0);
        }
        EXPECT_EQ(g.kind, original.kind);
        expectAabbNear(boundingBox(g), boundingBox(original), kDriftEps);
    }
}

TEST(TransformTest, RectRotationKeepsRectKind) {
    Geometry g;
    ASSERT_EQ(makeRect(0.0, 0.0, 20.0, 10.0, g), ShapeError::Ok);
    const Geometry r = rotatedAround(g, rectCenter(g.rect), 30.0);
    EXPECT_EQ(r.kind, ShapeKind::Rect);
    EXPECT_FALSE(isAxisAligned(r.rect));
    EXPECT_NEAR(r.rect.rot, degreesToRadians(30.0), kGeomEps);
    EXPECT_NEAR(r.rect.w, 20.0, kGeomEps);
    EXPECT_NEAR(r.rect.h, 10.0, kGeomEps);
}

TEST(TransformTest, QuarterTurnBakesBackToAxisAligned) {
    Geometry g;
    ASSERT_EQ(makeRect(0.0, 0.0, 20.0, 10.0, g), ShapeError::Ok);
    const Geometry r = rotatedAround(g, Point2{10.0, 5.0}, 90.0);
    ASSERT_EQ(r.kind, ShapeKind::Rect);
    EXPECT_TRUE(isAxisAligned(r.rect));
    EXPECT_NEAR(r.rect.x, 5.0, kGeomEps);
    EXPECT_NEAR(r.rect.y, -5.0, kGeomEps);
    EXPECT_NEAR(r.rect.w, 10.0, kGeomEps);
    EXPECT_NEAR(r.rect.h, 20.0, kGeomEps);
}

TEST(TransformTest, TranslateMovesEveryVariant) {
    Geometry circle;
    Geometry rect;
    Geometry path;
    ASSERT_EQ(makeCircle(1.0, 1.0, 2.0, circle), ShapeError::Ok);
    ASSERT_EQ(makeRect(1.0, 1.0, 2.0, 3.0, rect), ShapeError::Ok);
    ASSERT_EQ(makePath(squarePath(1.0, 1.0, 2.0), path), ShapeError::Ok);

    const Geometry c = translated(circle, 5.0, -1.0);
    EXPECT_DOUBLE_EQ(c.circle.cx, 6.0);
    EXPECT_DOUBLE_EQ(c.circle.cy, 0.0);
    EXPECT_DOUBLE_EQ(c.circle.r, 2.0);

    const Geometry r = translated(rect, 5.0, -1.0);
    EXPECT_DOUBLE_EQ(r.rect.x, 6.0);
    EXPECT_DOUBLE_EQ(r.rect.y, 0.0);
    EXPECT_DOUBLE_EQ(r.rect.w, 2.0);
    EXPECT_DOUBLE_EQ(r.rect.h, 3.0);

    const Geometry p = translated(path, 5.0, -1.0);
    ASSERT_EQ(p.path.size(), 4u);
    EXPECT_DOUBLE_EQ(p.path[2].x, 8.0);
    EXPECT_DOUBLE_EQ(p.path[2].y, 2.0);
}

TEST(TransformTest, ScaleAroundCenterIsUniform) {
    Geometry circle;
    ASSERT_EQ(makeCircle(10.0, 10.0, 4.0, circle), ShapeError::Ok);
    Geometry out;
    ASSERT_EQ(scaledAround(circle, Point2{10.0, 10.0}, 2.5, out), ShapeError::Ok);
    EXPECT_EQ(out.kind, ShapeKind::Circle);
    EXPECT_NEAR(out.circle.cx, 10.0, kGeomEps);
    EXPECT_NEAR(out.circle.r, 10.0, kGeomEps);

    Geometry rect;
    ASSERT_EQ(makeRect(0.0, 0.0, 10.0, 4.0, rect), ShapeError::Ok);
    ASSERT_EQ(scaledAround(rect, Point2{5.0, 2.0}, 0.5, out), ShapeError::Ok);
    expectAabbNear(boundingBox(out), AABB{2.5, 1.0, 7.5, 3.0}, kGeomEps);
}

TEST(TransformTest, ScaleRejectsNonPositiveFactor) {
    Geometry circle;
    ASSERT_EQ(makeCircle(0.0, 0.0, 1.0, circle), ShapeError::Ok);
    Geometry out;
    ASSERT_EQ(makeCircle(7.0, 7.0, 7.0, out), ShapeError::Ok);
    EXPECT_EQ(scaledAround(circle, Point2{0.0, 0.0}, 0.0, out), ShapeError::InvalidGeometry);
    EXPECT_EQ(scaledAround(circle, Point2{0.0, 0.0}, -2.0, out), ShapeError::InvalidGeometry);
    EXPECT_EQ(scaledAround(circle, Point2{0.0, 0.0}, std::nan(""), out), ShapeError::InvalidGeometry);
    EXPECT_DOUBLE_EQ(out.circle.r, 7.0);
}
