#pragma once

#include "shapeedit/core/types.h"
#include "shapeedit/entity/shape_style.h"
#include "shapeedit/geometry/geometry.h"
#include "shapeedit/persistence/shape_record.h"
#include <cstdint>

namespace shapeedit {

class ShapePainter;

class ShapeEntity {
public:
    ShapeEntity() = default;
    ShapeEntity(std::uint32_t id, Geometry geometry, const ShapeStyle& style);

    std::uint32_t id() const noexcept { return id_; }
    ShapeKind kind() const noexcept { return geometry_.kind; }
    const Geometry& geometry() const noexcept { return geometry_; }
    const ShapeStyle& style() const noexcept { return style_; }
    bool isSelected() const noexcept { return selected_; }

    void setSelected(bool selected) noexcept { selected_ = selected; }

    // Applies every set field or none of them. A non-positive stroke width
    // rejects the whole update with InvalidStyle.
    ShapeError setStyle(const StyleUpdate& update);
    ShapeError replaceStyle(const ShapeStyle& style);

    bool contains(Point2 p) const { return containsPoint(geometry_, p); }
    AABB bounds() const { return boundingBox(geometry_); }
    // Pivot for rotate/scale: the current bounding-box center.
    Point2 pivot() const { return aabbCenter(bounds()); }

    // Destructive transforms: the baked result replaces the current geometry.
    void translate(double dx, double dy);
    void rotate(double angleDegrees);
    ShapeError scale(double factor);

    void draw(ShapePainter& painter) const;

    ShapeRecord toRecord() const;
    static ShapeError fromRecord(const ShapeRecord& record, std::uint32_t id, ShapeEntity& out);

private:
    std::uint32_t id_{0};
    Geometry geometry_{};
    ShapeStyle style_{};
    bool selected_{false};
};

} // namespace shapeedit
