#include "shapeedit/interaction/interaction_session.h"
#include "shapeedit/core/logging.h"
#include "shapeedit/interaction/style_editor.h"
#include <algorithm>
#include <cmath>

namespace shapeedit {

InteractionSession::InteractionSession(ShapeCollection& shapes, const EditorConfig& config)
    : shapes_(shapes),
      rotationStepDegrees_(config.rotationStepDegrees),
      wheelScaleStep_(config.wheelScaleStep),
      pendingStyle_(config.defaultStyle)
{
}

void InteractionSession::setConfig(const EditorConfig& config) {
    rotationStepDegrees_ = config.rotationStepDegrees;
    wheelScaleStep_ = config.wheelScaleStep;
    pendingStyle_ = config.defaultStyle;
}

void InteractionSession::setActiveTool(Tool tool) {
    endDrag();
    resetDraft(tool);
    shapes_.deselectAll();
}

ShapeError InteractionSession::setStrokeWidth(int width) {
    if (!isValidStrokeWidth(width)) {
        SHAPEEDIT_LOG_WARN("ignored stroke width %d", width);
        return ShapeError::InvalidStyle;
    }
    pendingStyle_.strokeWidth = width;
    return ShapeError::Ok;
}

void InteractionSession::resetDraft(Tool tool) {
    draft_.tool = tool;
    draft_.phase = SessionPhase::Idle;
    draft_.hasFirstPoint = false;
    draft_.firstPoint = Point2{0.0, 0.0};
    draft_.vertices.clear();
}

void InteractionSession::finishTool(std::uint32_t committedId) {
    lastCommittedId_ = committedId;
    resetDraft(Tool::None);
}

void InteractionSession::endDrag() {
    drag_ = DragState{};
}

// ==============================================================================
// Pointer API
// ==============================================================================

void InteractionSession::pointerDown(Point2 p, PointerButton button) {
    if (button == PointerButton::Secondary) {
        if (styleEditor_) {
            const ShapeError err = editSelectedStyle(*styleEditor_);
            if (err != ShapeError::Ok && err != ShapeError::NotFound) {
                SHAPEEDIT_LOG_WARN("style edit rejected: %s", shapeErrorName(err));
            }
        }
        return;
    }

    if (draft_.tool != Tool::None) {
        // Selection is bypassed while a tool is armed.
        selection_.hasLastClick = false;
        handleToolClick(p);
        return;
    }

    if (!resolveSelection(p)) {
        shapes_.deselectAll();
        handleToolClick(p);
    }
    beginDragIfSelectedUnder(p);
}

void InteractionSession::pointerMove(Point2 p) {
    if (!drag_.active) return;
    ShapeEntity* target = shapes_.find(drag_.targetId);
    if (!target) {
        endDrag();
        return;
    }
    target->translate(p.x - drag_.anchor.x, p.y - drag_.anchor.y);
    drag_.anchor = p;
}

void InteractionSession::pointerUp(Point2 /*p*/) {
    endDrag();
}

bool InteractionSession::resolveSelection(Point2 p) {
    SelectionState& sel = selection_;
    if (sel.hasLastClick && sel.lastClick == p) {
        // Repeat click: drill down through everything under the point.
        pickSystem_.pickStack(shapes_, p, sel.stack);
        if (sel.stack.empty()) return false;
        sel.cycleIndex = (sel.cycleIndex + 1) % sel.stack.size();
        shapes_.deselectAll();
        const ShapeError err = shapes_.select(sel.stack[sel.cycleIndex].id);
        return err == ShapeError::Ok;
    }

    sel.hasLastClick = true;
    sel.lastClick = p;
    sel.cycleIndex = 0;
    const PickResult hit = pickSystem_.pick(shapes_, p);
    if (hit.id == 0) return false;
    shapes_.deselectAll();
    return shapes_.select(hit.id) == ShapeError::Ok;
}

void InteractionSession::beginDragIfSelectedUnder(Point2 p) {
    const PickResult hit = pickSystem_.pickSelected(shapes_, p);
    if (hit.id == 0) return;
    drag_.active = true;
    drag_.targetId = hit.id;
    drag_.anchor = p;
}

void InteractionSession::handleToolClick(Point2 p) {
    switch (draft_.tool) {
        case Tool::None:
            return;
        case Tool::Circle:
        case Tool::Rectangle: {
            if (!draft_.hasFirstPoint) {
                draft_.hasFirstPoint = true;
                draft_.firstPoint = p;
                draft_.phase = SessionPhase::Staging;
                return;
            }
            const Point2 a = draft_.firstPoint;
            std::uint32_t id = 0;
            if (draft_.tool == Tool::Circle) {
                const double r = std::trunc(std::hypot(p.x - a.x, p.y - a.y));
                id = shapes_.addCircle(a.x, a.y, r, pendingStyle_);
            } else {
                id = shapes_.addRectangle(std::min(a.x, p.x), std::min(a.y, p.y),
                                          std::abs(p.x - a.x), std::abs(p.y - a.y), pendingStyle_);
            }
            if (id == 0) {
                SHAPEEDIT_LOG_WARN("staged shape rejected: %s", shapeErrorName(shapes_.lastError()));
            }
            finishTool(id);
            return;
        }
        case Tool::Path:
            draft_.vertices.push_back(p);
            draft_.phase = SessionPhase::PathBuilding;
            return;
    }
}

// ==============================================================================
// Signals
// ==============================================================================

void InteractionSession::handleKey(EditorKey key) {
    switch (key) {
        case EditorKey::Cancel:
            setActiveTool(Tool::None);
            break;
        case EditorKey::DeleteSelection:
            deleteSelected();
            break;
        case EditorKey::CommitPath:
            if (draft_.tool == Tool::Path) commitPath();
            break;
        case EditorKey::RotateClockwise:
            rotateSelected(rotationStepDegrees_);
            break;
        case EditorKey::RotateCounterClockwise:
            rotateSelected(-rotationStepDegrees_);
            break;
    }
}

ShapeError InteractionSession::handleWheel(int notches) {
    if (notches == 0) return ShapeError::Ok;
    return scaleSelected(std::pow(wheelScaleStep_, -static_cast<double>(notches)));
}

void InteractionSession::rotateSelected(double angleDegrees) {
    shapes_.forEachSelected([angleDegrees](ShapeEntity& shape) { shape.rotate(angleDegrees); });
}

ShapeError InteractionSession::scaleSelected(double factor) {
    if (!std::isfinite(factor) || factor <= 0.0) return ShapeError::InvalidGeometry;
    ShapeError result = ShapeError::Ok;
    shapes_.forEachSelected([factor, &result](ShapeEntity& shape) {
        const ShapeError err = shape.scale(factor);
        if (err != ShapeError::Ok) result = err;
    });
    return result;
}

std::size_t InteractionSession::deleteSelected() {
    const std::size_t removed = shapes_.deleteSelected();
    if (drag_.active && !shapes_.find(drag_.targetId)) endDrag();
    return removed;
}

std::uint32_t InteractionSession::commitPath() {
    if (draft_.tool != Tool::Path || draft_.vertices.empty()) return 0;
    const std::uint32_t id = shapes_.addPath(draft_.vertices, pendingStyle_);
    if (id == 0) {
        SHAPEEDIT_LOG_WARN("staged path rejected: %s", shapeErrorName(shapes_.lastError()));
    }
    finishTool(id);
    return id;
}

void InteractionSession::cancelDraft() {
    resetDraft(draft_.tool);
}

ShapeError InteractionSession::editSelectedStyle(StyleEditor& editor) {
    const auto& all = shapes_.all();
    const auto it = std::find_if(all.begin(), all.end(),
        [](const ShapeEntity& shape) { return shape.isSelected(); });
    if (it == all.end()) return ShapeError::NotFound;

    ShapeEntity* shape = shapes_.find(it->id());
    ShapeStyle proposed = shape->style();
    if (!editor.editStyle(shape->style(), proposed)) {
        return ShapeError::Ok;
    }
    return shape->replaceStyle(proposed);
}

} // namespace shapeedit
