#include "shapeedit/entity/shape_entity.h"
#include "shapeedit/geometry/transform.h"
#include "shapeedit/render/shape_painter.h"
#include "shapeedit/core/logging.h"
#include <utility>

namespace shapeedit {

ShapeEntity::ShapeEntity(std::uint32_t id, Geometry geometry, const ShapeStyle& style)
    : id_(id), geometry_(std::move(geometry)), style_(style) {}

ShapeError ShapeEntity::setStyle(const StyleUpdate& update) {
    if (update.strokeWidth && !isValidStrokeWidth(*update.strokeWidth)) {
        SHAPEEDIT_LOG_WARN("shape %u: rejected stroke width %d", id_, *update.strokeWidth);
        return ShapeError::InvalidStyle;
    }
    if (update.outline) style_.outline = *update.outline;
    if (update.fill) style_.fill = *update.fill;
    if (update.filled) style_.filled = *update.filled;
    if (update.strokeWidth) style_.strokeWidth = *update.strokeWidth;
    return ShapeError::Ok;
}

ShapeError ShapeEntity::replaceStyle(const ShapeStyle& style) {
    if (!isValidStrokeWidth(style.strokeWidth)) {
        SHAPEEDIT_LOG_WARN("shape %u: rejected stroke width %d", id_, style.strokeWidth);
        return ShapeError::InvalidStyle;
    }
    style_ = style;
    return ShapeError::Ok;
}

void ShapeEntity::translate(double dx, double dy) {
    geometry_ = translated(geometry_, dx, dy);
}

void ShapeEntity::rotate(double angleDegrees) {
    geometry_ = rotatedAround(geometry_, pivot(), angleDegrees);
}

ShapeError ShapeEntity::scale(double factor) {
    Geometry next;
    const ShapeError err = scaledAround(geometry_, pivot(), factor, next);
    if (err != ShapeError::Ok) return err;
    geometry_ = std::move(next);
    return ShapeError::Ok;
}

void ShapeEntity::draw(ShapePainter& painter) const {
    painter.paint(geometry_, style_, selected_);
    if (selected_) {
        painter.paintSelectionBounds(bounds());
    }
}

ShapeRecord ShapeEntity::toRecord() const {
    return encodeShape(geometry_, style_);
}

ShapeError ShapeEntity::fromRecord(const ShapeRecord& record, std::uint32_t id, ShapeEntity& out) {
    Geometry geometry;
    ShapeStyle style;
    const ShapeError err = decodeShape(record, geometry, style);
    if (err != ShapeError::Ok) return err;
    out = ShapeEntity(id, std::move(geometry), style);
    return ShapeError::Ok;
}

} // namespace shapeedit
