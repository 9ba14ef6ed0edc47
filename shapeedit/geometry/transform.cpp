#include "shapeedit/geometry/transform.h"
#include "shapeedit/interaction/interaction_constants.h"
#include "shapeedit/core/logging.h"
#include <cmath>

namespace {
    constexpr double kPi = 3.14159265358979323846;
    constexpr double kHalfPi = kPi * 0.5;
    constexpr double kTwoPi = kPi * 2.0;

    // Folds an accumulated rectangle rotation back into (-pi, pi] and bakes
    // quarter turns into the axis-aligned frame.
    void normalizeRectRotation(shapeedit::RectGeom& rect) {
        double rot = std::remainder(rect.rot, kTwoPi);
        const double quarters = std::round(rot / kHalfPi);
        if (std::abs(rot - quarters * kHalfPi) >= shapeedit::interaction_constants::RIGHT_ANGLE_SNAP_EPSILON_RAD) {
            rect.rot = rot;
            return;
        }
        const double cx = rect.x + rect.w * 0.5;
        const double cy = rect.y + rect.h * 0.5;
        if (static_cast<long long>(quarters) % 2 != 0) {
            const double w = rect.w;
            rect.w = rect.h;
            rect.h = w;
        }
        rect.x = cx - rect.w * 0.5;
        rect.y = cy - rect.h * 0.5;
        rect.rot = 0.0;
    }
}

namespace shapeedit {

double degreesToRadians(double degrees) {
    return degrees * kPi / 180.0;
}

Affine2 affineIdentity() {
    return Affine2{1.0, 0.0, 0.0, 0.0, 1.0, 0.0};
}

Affine2 affineTranslate(double dx, double dy) {
    return Affine2{1.0, 0.0, dx, 0.0, 1.0, dy};
}

Affine2 affineRotate(double radians) {
    const double c = std::cos(radians);
    const double s = std::sin(radians);
    return Affine2{c, -s, 0.0, s, c, 0.0};
}

Affine2 affineScale(double factor) {
    return Affine2{factor, 0.0, 0.0, 0.0, factor, 0.0};
}

Affine2 affineConcat(const Affine2& lhs, const Affine2& rhs) {
    Affine2 out{};
    out.m00 = lhs.m00 * rhs.m00 + lhs.m01 * rhs.m10;
    out.m01 = lhs.m00 * rhs.m01 + lhs.m01 * rhs.m11;
    out.m02 = lhs.m00 * rhs.m02 + lhs.m01 * rhs.m12 + lhs.m02;
    out.m10 = lhs.m10 * rhs.m00 + lhs.m11 * rhs.m10;
    out.m11 = lhs.m10 * rhs.m01 + lhs.m11 * rhs.m11;
    out.m12 = lhs.m10 * rhs.m02 + lhs.m11 * rhs.m12 + lhs.m12;
    return out;
}

Point2 applyAffine(const Affine2& m, Point2 p) {
    return Point2{
        m.m00 * p.x + m.m01 * p.y + m.m02,
        m.m10 * p.x + m.m11 * p.y + m.m12,
    };
}

Affine2 affineRotateAround(Point2 center, double angleDegrees) {
    Affine2 m = affineTranslate(center.x, center.y);
    m = affineConcat(m, affineRotate(degreesToRadians(angleDegrees)));
    return affineConcat(m, affineTranslate(-center.x, -center.y));
}

Affine2 affineScaleAround(Point2 center, double factor) {
    Affine2 m = affineTranslate(center.x, center.y);
    m = affineConcat(m, affineScale(factor));
    return affineConcat(m, affineTranslate(-center.x, -center.y));
}

Geometry transformed(const Geometry& geometry, const Affine2& m) {
    Geometry out = geometry;
    switch (geometry.kind) {
        case ShapeKind::Circle: {
            const double scale = std::sqrt(std::abs(m.m00 * m.m11 - m.m01 * m.m10));
            const Point2 c = applyAffine(m, Point2{geometry.circle.cx, geometry.circle.cy});
            out.circle = CircleGeom{c.x, c.y, geometry.circle.r * scale};
            break;
        }
        case ShapeKind::Rect: {
            const RectGeom& r = geometry.rect;
            const double scale = std::sqrt(std::abs(m.m00 * m.m11 - m.m01 * m.m10));
            const double angle = std::atan2(m.m10, m.m00);
            if (scale == 1.0 && angle == 0.0) {
                const Point2 origin = applyAffine(m, Point2{r.x, r.y});
                out.rect.x = origin.x;
                out.rect.y = origin.y;
                break;
            }
            const Point2 c = applyAffine(m, rectCenter(r));
            const double w = r.w * scale;
            const double h = r.h * scale;
            out.rect = RectGeom{c.x - w * 0.5, c.y - h * 0.5, w, h, r.rot + angle};
            normalizeRectRotation(out.rect);
            break;
        }
        case ShapeKind::Path: {
            for (Point2& p : out.path) {
                p = applyAffine(m, p);
            }
            break;
        }
    }
    return out;
}

Geometry translated(const Geometry& geometry, double dx, double dy) {
    return transformed(geometry, affineTranslate(dx, dy));
}

Geometry rotatedAround(const Geometry& geometry, Point2 center, double angleDegrees) {
    return transformed(geometry, affineRotateAround(center, angleDegrees));
}

ShapeError scaledAround(const Geometry& geometry, Point2 center, double factor, Geometry& out) {
    if (!std::isfinite(factor) || factor <= 0.0) {
        SHAPEEDIT_LOG_WARN("rejected scale factor %g", factor);
        return ShapeError::InvalidGeometry;
    }
    out = transformed(geometry, affineScaleAround(center, factor));
    return ShapeError::Ok;
}

} // namespace shapeedit
