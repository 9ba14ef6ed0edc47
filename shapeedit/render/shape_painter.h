#pragma once

#include "shapeedit/core/types.h"
#include "shapeedit/entity/shape_style.h"
#include "shapeedit/geometry/geometry.h"
#include <vector>

namespace shapeedit {

// Host graphics surface. The core never rasterizes; it only tells the
// surface what to draw, in z-order, once per redraw.
class ShapePainter {
public:
    virtual ~ShapePainter() = default;
    virtual void paint(const Geometry& geometry, const ShapeStyle& style, bool selected) = 0;
    virtual void paintSelectionBounds(const AABB& bounds) = 0;
    virtual void paintStagedPath(const std::vector<Point2>& vertices, int strokeWidth) = 0;
};

} // namespace shapeedit
