#ifndef SHAPEEDIT_RENDER_H
#define SHAPEEDIT_RENDER_H

#include "shapeedit/core/types.h"
#include "shapeedit/render/shape_painter.h"
#include <cstdint>
#include <vector>

namespace shapeedit {

class ShapeCollection;
class InteractionSession;

enum class DrawCommandKind : std::uint8_t {
    Shape = 0,
    SelectionBounds = 1,
    StagedPath = 2
};

// One recorded painter call. `geometry` and `style` are meaningful for Shape,
// `bounds` for SelectionBounds, `vertices` and `strokeWidth` for StagedPath.
struct DrawCommand {
    DrawCommandKind kind{DrawCommandKind::Shape};
    Geometry geometry{};
    ShapeStyle style{};
    bool selected{false};
    AABB bounds{0.0, 0.0, 0.0, 0.0};
    std::vector<Point2> vertices;
    int strokeWidth{0};
};

// Painter that records calls instead of drawing, for hosts that pull a frame.
class RenderList : public ShapePainter {
public:
    void paint(const Geometry& geometry, const ShapeStyle& style, bool selected) override;
    void paintSelectionBounds(const AABB& bounds) override;
    void paintStagedPath(const std::vector<Point2>& vertices, int strokeWidth) override;

    const std::vector<DrawCommand>& commands() const noexcept { return commands_; }
    std::size_t size() const noexcept { return commands_.size(); }
    void clear() { commands_.clear(); }

private:
    std::vector<DrawCommand> commands_;
};

// Draws every entity in z-order, then the in-progress path of the session
// when one is staged. `session` may be null.
void renderScene(const ShapeCollection& shapes, const InteractionSession* session, ShapePainter& painter);

} // namespace shapeedit

#endif // SHAPEEDIT_RENDER_H
