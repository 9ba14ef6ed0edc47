#include "shapeedit/geometry/geometry.h"
#include "shapeedit/core/logging.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace {
    using shapeedit::AABB;
    using shapeedit::Point2;

    bool isFinite(double v) { return std::isfinite(v); }

    // Transform a point from world space to local space (inverse rotation around center)
    void worldToLocal(double wx, double wy, double cx, double cy, double rot, double& lx, double& ly) {
        if (rot == 0.0) {
            lx = wx;
            ly = wy;
            return;
        }
        const double cosR = std::cos(-rot);
        const double sinR = std::sin(-rot);
        const double dx = wx - cx;
        const double dy = wy - cy;
        lx = cx + dx * cosR - dy * sinR;
        ly = cy + dx * sinR + dy * cosR;
    }

    // Transform a point from local space to world space (apply rotation around center)
    Point2 localToWorld(double lx, double ly, double cx, double cy, double rot) {
        if (rot == 0.0) return Point2{lx, ly};
        const double cosR = std::cos(rot);
        const double sinR = std::sin(rot);
        const double dx = lx - cx;
        const double dy = ly - cy;
        return Point2{cx + dx * cosR - dy * sinR, cy + dx * sinR + dy * cosR};
    }

    // > 0 when p is left of the directed line a->b, < 0 when right, 0 on it.
    double isLeft(Point2 a, Point2 b, Point2 p) {
        return (b.x - a.x) * (p.y - a.y) - (p.x - a.x) * (b.y - a.y);
    }

    AABB pointsAABB(const Point2* pts, std::size_t count) {
        if (count == 0) return AABB{0.0, 0.0, 0.0, 0.0};
        double minX = std::numeric_limits<double>::max();
        double minY = std::numeric_limits<double>::max();
        double maxX = std::numeric_limits<double>::lowest();
        double maxY = std::numeric_limits<double>::lowest();
        for (std::size_t i = 0; i < count; ++i) {
            const Point2 p = pts[i];
            if (p.x < minX) minX = p.x;
            if (p.x > maxX) maxX = p.x;
            if (p.y < minY) minY = p.y;
            if (p.y > maxY) maxY = p.y;
        }
        return AABB{minX, minY, maxX, maxY};
    }
}

namespace shapeedit {

ShapeError makeCircle(double cx, double cy, double r, Geometry& out) {
    if (!isFinite(cx) || !isFinite(cy) || !isFinite(r) || r < 0.0) {
        SHAPEEDIT_LOG_WARN("rejected circle (%g, %g, r=%g)", cx, cy, r);
        return ShapeError::InvalidGeometry;
    }
    out = Geometry{};
    out.kind = ShapeKind::Circle;
    out.circle = CircleGeom{cx, cy, r};
    return ShapeError::Ok;
}

ShapeError makeRect(double x, double y, double w, double h, Geometry& out) {
    if (!isFinite(x) || !isFinite(y) || !isFinite(w) || !isFinite(h) || w < 0.0 || h < 0.0) {
        SHAPEEDIT_LOG_WARN("rejected rectangle (%g, %g, %g x %g)", x, y, w, h);
        return ShapeError::InvalidGeometry;
    }
    out = Geometry{};
    out.kind = ShapeKind::Rect;
    out.rect = RectGeom{x, y, w, h, 0.0};
    return ShapeError::Ok;
}

ShapeError makePath(const std::vector<Point2>& vertices, Geometry& out) {
    if (vertices.empty()) {
        SHAPEEDIT_LOG_WARN("rejected empty path");
        return ShapeError::InvalidGeometry;
    }
    for (const Point2& p : vertices) {
        if (!isFinite(p.x) || !isFinite(p.y)) {
            SHAPEEDIT_LOG_WARN("rejected path with non-finite vertex");
            return ShapeError::InvalidGeometry;
        }
    }
    out = Geometry{};
    out.kind = ShapeKind::Path;
    out.path = vertices;
    return ShapeError::Ok;
}

int windingNumber(const std::vector<Point2>& polygon, Point2 p) {
    const std::size_t n = polygon.size();
    int wn = 0;
    for (std::size_t i = 0; i < n; ++i) {
        const Point2 a = polygon[i];
        const Point2 b = polygon[(i + 1) % n];
        if (a.y <= p.y) {
            if (b.y > p.y && isLeft(a, b, p) > 0.0) ++wn;
        } else {
            if (b.y <= p.y && isLeft(a, b, p) < 0.0) --wn;
        }
    }
    return wn;
}

Point2 rectCenter(const RectGeom& rect) {
    return Point2{rect.x + rect.w * 0.5, rect.y + rect.h * 0.5};
}

std::array<Point2, 4> rectCorners(const RectGeom& rect) {
    const Point2 c = rectCenter(rect);
    return {
        localToWorld(rect.x, rect.y, c.x, c.y, rect.rot),
        localToWorld(rect.x + rect.w, rect.y, c.x, c.y, rect.rot),
        localToWorld(rect.x + rect.w, rect.y + rect.h, c.x, c.y, rect.rot),
        localToWorld(rect.x, rect.y + rect.h, c.x, c.y, rect.rot),
    };
}

bool isAxisAligned(const RectGeom& rect) {
    return rect.rot == 0.0;
}

bool containsPoint(const Geometry& geometry, Point2 p) {
    switch (geometry.kind) {
        case ShapeKind::Circle: {
            const CircleGeom& c = geometry.circle;
            const double dx = p.x - c.cx;
            const double dy = p.y - c.cy;
            return dx * dx + dy * dy < c.r * c.r;
        }
        case ShapeKind::Rect: {
            const RectGeom& r = geometry.rect;
            if (r.w <= 0.0 || r.h <= 0.0) return false;
            const Point2 c = rectCenter(r);
            double lx = 0.0;
            double ly = 0.0;
            worldToLocal(p.x, p.y, c.x, c.y, r.rot, lx, ly);
            return lx >= r.x && ly >= r.y && lx < r.x + r.w && ly < r.y + r.h;
        }
        case ShapeKind::Path: {
            if (geometry.path.size() < 3) return false;
            return windingNumber(geometry.path, p) != 0;
        }
    }
    return false;
}

AABB boundingBox(const Geometry& geometry) {
    switch (geometry.kind) {
        case ShapeKind::Circle: {
            const CircleGeom& c = geometry.circle;
            return AABB{c.cx - c.r, c.cy - c.r, c.cx + c.r, c.cy + c.r};
        }
        case ShapeKind::Rect: {
            const RectGeom& r = geometry.rect;
            if (isAxisAligned(r)) return AABB{r.x, r.y, r.x + r.w, r.y + r.h};
            const std::array<Point2, 4> corners = rectCorners(r);
            return pointsAABB(corners.data(), corners.size());
        }
        case ShapeKind::Path:
            return pointsAABB(geometry.path.data(), geometry.path.size());
    }
    return AABB{0.0, 0.0, 0.0, 0.0};
}

} // namespace shapeedit
