#include "shapeedit/interaction/pick_system.h"

namespace {
    constexpr shapeedit::PickResult kNoPick{0, shapeedit::ShapeKind::Circle, 0};

    template <typename Accept>
    shapeedit::PickResult pickFirst(const shapeedit::ShapeCollection& shapes, shapeedit::Point2 p,
                                    shapeedit::PickStats& stats, Accept accept) {
        const auto& all = shapes.all();
        stats = {0, 0};
        for (std::size_t i = all.size(); i-- > 0;) {
            const shapeedit::ShapeEntity& shape = all[i];
            if (!accept(shape)) continue;
            stats.candidatesChecked++;
            if (shape.contains(p)) {
                stats.hits = 1;
                return shapeedit::PickResult{shape.id(), shape.kind(), static_cast<std::uint32_t>(i)};
            }
        }
        return kNoPick;
    }
}

namespace shapeedit {

PickResult PickSystem::pick(const ShapeCollection& shapes, Point2 p) const {
    return pickFirst(shapes, p, lastStats_, [](const ShapeEntity&) { return true; });
}

PickResult PickSystem::pickSelected(const ShapeCollection& shapes, Point2 p) const {
    return pickFirst(shapes, p, lastStats_, [](const ShapeEntity& shape) { return shape.isSelected(); });
}

void PickSystem::pickStack(const ShapeCollection& shapes, Point2 p, std::vector<PickResult>& out) const {
    out.clear();
    const auto& all = shapes.all();
    lastStats_ = {0, 0};
    for (std::size_t i = all.size(); i-- > 0;) {
        const ShapeEntity& shape = all[i];
        lastStats_.candidatesChecked++;
        if (shape.contains(p)) {
            out.push_back(PickResult{shape.id(), shape.kind(), static_cast<std::uint32_t>(i)});
        }
    }
    lastStats_.hits = static_cast<std::uint32_t>(out.size());
}

} // namespace shapeedit
