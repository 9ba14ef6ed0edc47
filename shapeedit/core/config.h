#pragma once

#include "shapeedit/entity/shape_style.h"
#include "shapeedit/interaction/interaction_constants.h"

namespace shapeedit {

// Runtime editor settings. Defaults mirror interaction_constants.h.
struct EditorConfig {
    double rotationStepDegrees = interaction_constants::ROTATION_STEP_DEGREES;
    double wheelScaleStep = interaction_constants::WHEEL_SCALE_STEP;
    ShapeStyle defaultStyle{};
    bool prettyPrintDocuments = true;
};

inline bool isValidConfig(const EditorConfig& config) {
    return config.wheelScaleStep > 0.0
        && isValidStrokeWidth(config.defaultStyle.strokeWidth);
}

} // namespace shapeedit
