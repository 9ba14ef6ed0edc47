#ifndef SHAPEEDIT_GEOMETRY_H
#define SHAPEEDIT_GEOMETRY_H

#include "shapeedit/core/types.h"
#include <array>
#include <vector>

namespace shapeedit {

struct CircleGeom {
    double cx, cy;
    double r;
};

// Axis-aligned frame (x, y, w, h) rotated by `rot` radians about its center.
struct RectGeom {
    double x, y;
    double w, h;
    double rot;
};

// Tagged union over the three shape variants. Only the payload matching
// `kind` is meaningful; transforms never change `kind`.
struct Geometry {
    ShapeKind kind{ShapeKind::Circle};
    CircleGeom circle{0.0, 0.0, 0.0};
    RectGeom rect{0.0, 0.0, 0.0, 0.0, 0.0};
    // Open vertex list; the closing edge back to path[0] is implicit.
    std::vector<Point2> path;
};

// Constructors reject negative or non-finite sizes and empty paths with
// ShapeError::InvalidGeometry, leaving `out` untouched.
ShapeError makeCircle(double cx, double cy, double r, Geometry& out);
ShapeError makeRect(double x, double y, double w, double h, Geometry& out);
ShapeError makePath(const std::vector<Point2>& vertices, Geometry& out);

// Fill-region containment.
//   Circle: strictly inside.
//   Rect:   half-open [x, x+w) x [y, y+h) in the rectangle's local frame.
//   Path:   nonzero winding over the implicitly closed polygon.
bool containsPoint(const Geometry& geometry, Point2 p);

AABB boundingBox(const Geometry& geometry);

Point2 rectCenter(const RectGeom& rect);

// Corners in world space, in order (x,y) (x+w,y) (x+w,y+h) (x,y+h) before rotation.
std::array<Point2, 4> rectCorners(const RectGeom& rect);

bool isAxisAligned(const RectGeom& rect);

// Winding number of the closed polygon around `p` (Sunday's crossing test).
int windingNumber(const std::vector<Point2>& polygon, Point2 p);

} // namespace shapeedit

#endif // SHAPEEDIT_GEOMETRY_H
