#pragma once

#include <array>

/**
 * @file interaction_constants.h
 * @brief Centralized constants for the interaction controller.
 *
 * Hosts that mirror these values (toolbars, key hints) must read them from
 * here rather than hard-coding their own copies.
 *
 * Coordinate convention: screen space, x grows right, y grows down.
 * A positive rotation angle is therefore clockwise on screen.
 */

namespace shapeedit::interaction_constants {

// =============================================================================
// Rotation
// =============================================================================

/// Angle applied by one discrete rotate signal (degrees)
constexpr double ROTATION_STEP_DEGREES = 15.0;

/// Rectangles whose accumulated rotation is this close (radians) to a
/// multiple of 90 degrees are baked back into an axis-aligned rectangle
constexpr double RIGHT_ANGLE_SNAP_EPSILON_RAD = 1e-9;

// =============================================================================
// Wheel scaling
// =============================================================================

/// Scale factor per wheel notch away from the user (enlarge). The opposite
/// direction uses the reciprocal, so N notches up then N down is identity.
constexpr double WHEEL_SCALE_STEP = 1.1;

// =============================================================================
// Stroke
// =============================================================================

/// Widths offered by the stroke palette. The model accepts any positive width.
constexpr std::array<int, 6> STROKE_WIDTH_PALETTE = {1, 2, 4, 6, 8, 10};

/// Stroke width preselected for new shapes
constexpr int DEFAULT_STROKE_WIDTH = 2;

} // namespace shapeedit::interaction_constants
