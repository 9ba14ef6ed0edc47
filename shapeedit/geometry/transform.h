#ifndef SHAPEEDIT_TRANSFORM_H
#define SHAPEEDIT_TRANSFORM_H

#include "shapeedit/geometry/geometry.h"

namespace shapeedit {

// 2x3 affine matrix, row-major:
//   x' = m00 * x + m01 * y + m02
//   y' = m10 * x + m11 * y + m12
struct Affine2 {
    double m00, m01, m02;
    double m10, m11, m12;
};

Affine2 affineIdentity();
Affine2 affineTranslate(double dx, double dy);
// Positive angle rotates clockwise on screen (y down).
Affine2 affineRotate(double radians);
Affine2 affineScale(double factor);

// Returns lhs * rhs: the result applies rhs first, then lhs.
Affine2 affineConcat(const Affine2& lhs, const Affine2& rhs);

Point2 applyAffine(const Affine2& m, Point2 p);

// translate(center) * rotate(angle) * translate(-center)
Affine2 affineRotateAround(Point2 center, double angleDegrees);
// translate(center) * scale(factor) * translate(-center)
Affine2 affineScaleAround(Point2 center, double factor);

// Bakes `m` into a new geometry of the same kind. `m` must be a similarity
// (uniform scale, rotation, translation); every defining parameter is
// recomputed, so repeated calls accumulate floating-point drift.
Geometry transformed(const Geometry& geometry, const Affine2& m);

Geometry translated(const Geometry& geometry, double dx, double dy);
Geometry rotatedAround(const Geometry& geometry, Point2 center, double angleDegrees);

// Rejects factor <= 0 or non-finite with InvalidGeometry, leaving `out` untouched.
ShapeError scaledAround(const Geometry& geometry, Point2 center, double factor, Geometry& out);

double degreesToRadians(double degrees);

} // namespace shapeedit

#endif // SHAPEEDIT_TRANSFORM_H
