#include "shapeedit/render/render.h"
#include "shapeedit/entity/shape_collection.h"
#include "shapeedit/interaction/interaction_session.h"
#include <utility>

namespace shapeedit {

void RenderList::paint(const Geometry& geometry, const ShapeStyle& style, bool selected) {
    DrawCommand cmd;
    cmd.kind = DrawCommandKind::Shape;
    cmd.geometry = geometry;
    cmd.style = style;
    cmd.selected = selected;
    cmd.strokeWidth = style.strokeWidth;
    commands_.push_back(std::move(cmd));
}

void RenderList::paintSelectionBounds(const AABB& bounds) {
    DrawCommand cmd;
    cmd.kind = DrawCommandKind::SelectionBounds;
    cmd.bounds = bounds;
    commands_.push_back(std::move(cmd));
}

void RenderList::paintStagedPath(const std::vector<Point2>& vertices, int strokeWidth) {
    DrawCommand cmd;
    cmd.kind = DrawCommandKind::StagedPath;
    cmd.vertices = vertices;
    cmd.strokeWidth = strokeWidth;
    commands_.push_back(std::move(cmd));
}

void renderScene(const ShapeCollection& shapes, const InteractionSession* session, ShapePainter& painter) {
    for (const ShapeEntity& shape : shapes.all()) {
        shape.draw(painter);
    }
    if (session && session->phase() == SessionPhase::PathBuilding && !session->stagedPath().empty()) {
        painter.paintStagedPath(session->stagedPath(), session->pendingStyle().strokeWidth);
    }
}

} // namespace shapeedit
