#pragma once

#include "shapeedit/core/types.h"
#include "shapeedit/entity/shape_collection.h"
#include <cstdint>
#include <vector>

namespace shapeedit {

// Return struct for picking
struct PickResult {
    std::uint32_t id;       // 0 when nothing was hit
    ShapeKind kind;
    std::uint32_t zIndex;   // position in the collection (higher = on top)
};

struct PickStats {
    std::uint32_t candidatesChecked;
    std::uint32_t hits;
};

// Fill-region hit testing over a collection. Candidates are visited from the
// top of the z-order down, so the first hit is always the topmost shape.
class PickSystem {
public:
    PickSystem() = default;

    // Topmost shape whose fill region contains `p`.
    PickResult pick(const ShapeCollection& shapes, Point2 p) const;

    // Topmost selected shape whose fill region contains `p`.
    PickResult pickSelected(const ShapeCollection& shapes, Point2 p) const;

    // Every shape containing `p`, topmost first. Recomputed on every call.
    void pickStack(const ShapeCollection& shapes, Point2 p, std::vector<PickResult>& out) const;

    PickStats getLastStats() const { return lastStats_; }

private:
    mutable PickStats lastStats_{0, 0};
};

} // namespace shapeedit
