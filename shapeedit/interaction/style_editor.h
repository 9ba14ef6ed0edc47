#pragma once

#include "shapeedit/entity/shape_style.h"

namespace shapeedit {

// Per-shape style dialog supplied by the host. Returns true and fills
// `proposed` when the user confirms; false when the user cancels.
class StyleEditor {
public:
    virtual ~StyleEditor() = default;
    virtual bool editStyle(const ShapeStyle& current, ShapeStyle& proposed) = 0;
};

} // namespace shapeedit
