#pragma once

#include "shapeedit/core/color.h"
#include "shapeedit/core/config.h"
#include "shapeedit/core/types.h"
#include "shapeedit/entity/shape_collection.h"
#include "shapeedit/interaction/interaction_session.h"
#include "shapeedit/interaction/interaction_types.h"
#include "shapeedit/persistence/document.h"
#include "shapeedit/render/render.h"

#include <cstdint>
#include <string>
#include <vector>

namespace shapeedit {

// Host-facing editor: owns the shape collection and the interaction session
// that drives it, and wires persistence and frame building on top.
class ShapeEditor {
public:
    ShapeEditor();
    // An invalid config is replaced by the defaults.
    explicit ShapeEditor(const EditorConfig& config);

    ShapeEditor(const ShapeEditor&) = delete;
    ShapeEditor& operator=(const ShapeEditor&) = delete;

    ShapeCollection& shapes() noexcept { return shapes_; }
    const ShapeCollection& shapes() const noexcept { return shapes_; }
    InteractionSession& session() noexcept { return session_; }
    const InteractionSession& session() const noexcept { return session_; }

    const EditorConfig& config() const noexcept { return config_; }
    // Rejects a config with a non-positive wheel step or stroke width.
    ShapeError setConfig(const EditorConfig& config);

    void clear();

    // ==============================================================================
    // Input
    // ==============================================================================
    void pointerDown(double x, double y, PointerButton button) { session_.pointerDown(Point2{x, y}, button); }
    void pointerMove(double x, double y) { session_.pointerMove(Point2{x, y}); }
    void pointerUp(double x, double y) { session_.pointerUp(Point2{x, y}); }
    void handleKey(EditorKey key) { session_.handleKey(key); }
    ShapeError handleWheel(int notches) { return session_.handleWheel(notches); }

    // ==============================================================================
    // Pending style
    // ==============================================================================
    void setActiveTool(Tool tool) { session_.setActiveTool(tool); }
    Tool activeTool() const noexcept { return session_.activeTool(); }
    // Hex variants accept "#rrggbb"; anything else is InvalidStyle.
    ShapeError setOutlineColorHex(const std::string& hex);
    ShapeError setFillColorHex(const std::string& hex);
    ShapeError setStrokeWidth(int width) { return session_.setStrokeWidth(width); }
    // Widths a host toolbar should offer.
    static std::vector<int> strokeWidthPalette();
    void setFillEnabled(bool enabled) { session_.setFillEnabled(enabled); }

    // ==============================================================================
    // Persistence
    // ==============================================================================
    std::string saveDocument() const;
    ShapeError loadDocument(const std::string& json);
    ShapeError saveToFile(const std::string& path) const;
    ShapeError loadFromFile(const std::string& path);
    const LoadReport& lastLoadReport() const noexcept { return lastLoadReport_; }

    // ==============================================================================
    // Frame
    // ==============================================================================
    // Re-records the scene into the internal render list and returns it.
    const RenderList& buildFrame();
    std::vector<DrawCommand> frameCommands();

    std::uint32_t shapeCount() const { return static_cast<std::uint32_t>(shapes_.size()); }
    std::uint32_t selectedCount() const { return static_cast<std::uint32_t>(shapes_.selectedCount()); }

private:
    EditorConfig config_;
    ShapeCollection shapes_;
    InteractionSession session_;
    RenderList frame_;
    LoadReport lastLoadReport_;
};

} // namespace shapeedit
