#pragma once

#include "shapeedit/core/config.h"
#include "shapeedit/core/types.h"
#include "shapeedit/entity/shape_collection.h"
#include "shapeedit/interaction/interaction_types.h"
#include "shapeedit/interaction/pick_system.h"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace shapeedit {

class StyleEditor;

// Turns pointer, key and wheel signals into selection changes, drags,
// transforms and staged shapes. Owns no shapes; all commits go through the
// collection passed in.
class InteractionSession {
public:
    InteractionSession(ShapeCollection& shapes, const EditorConfig& config);

    // ==============================================================================
    // State Query
    // ==============================================================================
    SessionPhase phase() const noexcept { return draft_.phase; }
    Tool activeTool() const noexcept { return draft_.tool; }
    bool isDragActive() const noexcept { return drag_.active; }
    std::uint32_t dragTargetId() const noexcept { return drag_.active ? drag_.targetId : 0; }
    bool hasFirstPoint() const noexcept { return draft_.hasFirstPoint; }
    Point2 firstPoint() const noexcept { return draft_.firstPoint; }
    const std::vector<Point2>& stagedPath() const noexcept { return draft_.vertices; }
    std::size_t cycleIndex() const noexcept { return selection_.cycleIndex; }
    std::uint32_t lastCommittedId() const noexcept { return lastCommittedId_; }
    const ShapeStyle& pendingStyle() const noexcept { return pendingStyle_; }

    // ==============================================================================
    // Host setters (toolbar, palette, dialogs)
    // ==============================================================================
    // Discards any staging and drag, and deselects everything.
    void setActiveTool(Tool tool);
    void setOutlineColor(const Color& color) { pendingStyle_.outline = color; }
    void setFillColor(const Color& color) { pendingStyle_.fill = color; }
    void setFillEnabled(bool enabled) { pendingStyle_.filled = enabled; }
    ShapeError setStrokeWidth(int width);
    void setConfig(const EditorConfig& config);
    void setStyleEditor(StyleEditor* editor) { styleEditor_ = editor; }

    // ==============================================================================
    // Pointer API
    // ==============================================================================
    void pointerDown(Point2 p, PointerButton button = PointerButton::Primary);
    void pointerMove(Point2 p);
    void pointerUp(Point2 p);

    // ==============================================================================
    // Signals
    // ==============================================================================
    void handleKey(EditorKey key);
    // Negative notches scroll away from the user (wheel up) and enlarge.
    ShapeError handleWheel(int notches);

    void rotateSelected(double angleDegrees);
    ShapeError scaleSelected(double factor);
    std::size_t deleteSelected();

    // Commits the staged path. Returns the new id, or 0 when nothing is staged.
    std::uint32_t commitPath();
    // Drops staged geometry of any tool and returns to Idle.
    void cancelDraft();

    // Runs the style editor on the first selected shape and applies its
    // answer all-or-nothing. NotFound when nothing is selected.
    ShapeError editSelectedStyle(StyleEditor& editor);

private:
    ShapeCollection& shapes_;
    PickSystem pickSystem_;
    StyleEditor* styleEditor_ = nullptr;

    double rotationStepDegrees_;
    double wheelScaleStep_;
    ShapeStyle pendingStyle_;
    std::uint32_t lastCommittedId_ = 0;

    struct DraftState {
        Tool tool = Tool::None;
        SessionPhase phase = SessionPhase::Idle;
        bool hasFirstPoint = false;
        Point2 firstPoint{0.0, 0.0};
        std::vector<Point2> vertices;
    };

    struct DragState {
        bool active = false;
        std::uint32_t targetId = 0;
        Point2 anchor{0.0, 0.0};
    };

    struct SelectionState {
        bool hasLastClick = false;
        Point2 lastClick{0.0, 0.0};
        std::size_t cycleIndex = 0;
        std::vector<PickResult> stack;
    };

    DraftState draft_;
    DragState drag_;
    SelectionState selection_;

    // Returns true when a shape was hit and selected.
    bool resolveSelection(Point2 p);
    void handleToolClick(Point2 p);
    void beginDragIfSelectedUnder(Point2 p);
    void endDrag();
    void resetDraft(Tool tool);
    void finishTool(std::uint32_t committedId);
};

} // namespace shapeedit
