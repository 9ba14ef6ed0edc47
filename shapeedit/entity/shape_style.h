#pragma once

#include "shapeedit/core/color.h"
#include "shapeedit/interaction/interaction_constants.h"
#include <optional>

namespace shapeedit {

struct ShapeStyle {
    Color outline{kBlack};
    Color fill{kWhite};
    bool filled{false};
    int strokeWidth{interaction_constants::DEFAULT_STROKE_WIDTH};
};

inline bool operator==(const ShapeStyle& a, const ShapeStyle& b) {
    return a.outline == b.outline && a.fill == b.fill && a.filled == b.filled && a.strokeWidth == b.strokeWidth;
}
inline bool operator!=(const ShapeStyle& a, const ShapeStyle& b) { return !(a == b); }

// Partial style edit; unset fields keep their current value.
struct StyleUpdate {
    std::optional<Color> outline;
    std::optional<Color> fill;
    std::optional<bool> filled;
    std::optional<int> strokeWidth;
};

inline bool isValidStrokeWidth(int width) { return width > 0; }

} // namespace shapeedit
