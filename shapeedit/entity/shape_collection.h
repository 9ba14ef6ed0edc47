#pragma once

#include "shapeedit/core/types.h"
#include "shapeedit/entity/shape_entity.h"
#include "shapeedit/persistence/document.h"
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace shapeedit {

// Ordered registry of shapes. Vector order is z-order: later entries are
// drawn on top and hit-tested first.
class ShapeCollection {
public:
    ShapeCollection() = default;

    // Each add* returns the new shape id, or 0 when the geometry or style is
    // rejected (see lastError()). A rejected add leaves the collection unchanged.
    std::uint32_t addCircle(double cx, double cy, double r, const ShapeStyle& style);
    std::uint32_t addRectangle(double x, double y, double w, double h, const ShapeStyle& style);
    std::uint32_t addPath(const std::vector<Point2>& vertices, const ShapeStyle& style);

    // Removes every selected shape; survivors keep their relative order.
    std::size_t deleteSelected();
    void deselectAll();
    void clear();

    // Marks one shape selected without touching the others.
    ShapeError select(std::uint32_t id);

    const std::vector<ShapeEntity>& all() const noexcept { return shapes_; }
    std::size_t size() const noexcept { return shapes_.size(); }
    bool empty() const noexcept { return shapes_.empty(); }
    std::size_t selectedCount() const;

    ShapeEntity* find(std::uint32_t id);
    const ShapeEntity* find(std::uint32_t id) const;

    template <typename Fn>
    void forEachSelected(Fn&& fn) {
        for (ShapeEntity& shape : shapes_) {
            if (shape.isSelected()) fn(shape);
        }
    }

    std::vector<ShapeRecord> toRecords() const;

    // Persistence. Loading decodes into scratch storage and swaps on success:
    // a document-level failure (I/O, invalid JSON, non-array top level) leaves
    // the current shapes untouched. Individual bad records are skipped and
    // listed in `report`.
    ShapeError saveTo(std::ostream& out, bool pretty = true) const;
    ShapeError loadFrom(std::istream& in, LoadReport* report = nullptr);
    ShapeError saveToString(std::string& out, bool pretty = true) const;
    ShapeError loadFromString(std::string_view text, LoadReport* report = nullptr);
    ShapeError saveToFile(const std::string& path, bool pretty = true) const;
    ShapeError loadFromFile(const std::string& path, LoadReport* report = nullptr);

    ShapeError lastError() const noexcept { return lastError_; }

private:
    std::uint32_t insert(ShapeError geometryStatus, Geometry geometry, const ShapeStyle& style);

    std::vector<ShapeEntity> shapes_;
    std::uint32_t nextId_{1};
    mutable ShapeError lastError_{ShapeError::Ok};
};

} // namespace shapeedit
