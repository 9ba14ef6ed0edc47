#ifndef SHAPEEDIT_SHAPE_RECORD_H
#define SHAPEEDIT_SHAPE_RECORD_H

#include "shapeedit/core/types.h"
#include "shapeedit/entity/shape_style.h"
#include "shapeedit/geometry/geometry.h"
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

namespace shapeedit {

// Record type tags as they appear in documents.
inline constexpr const char* kRecordTypeCircle = "CIRCLE";
inline constexpr const char* kRecordTypeRect = "RECTANGLE";
inline constexpr const char* kRecordTypePath = "PATH";

// Flat, type-tagged form of a shape. Exists only at the save/load boundary.
struct ShapeRecord {
    std::string type;
    std::vector<double> params;
    std::string outlineColor;
    std::string fillColor;
    bool filled{false};
    int strokeWidth{0};
};

inline bool operator==(const ShapeRecord& a, const ShapeRecord& b) {
    return a.type == b.type && a.params == b.params
        && a.outlineColor == b.outlineColor && a.fillColor == b.fillColor
        && a.filled == b.filled && a.strokeWidth == b.strokeWidth;
}

// Geometry + style -> record. Paths are written with their closure
// normalized; rotated rectangles are written as PATH records of their corners.
ShapeRecord encodeShape(const Geometry& geometry, const ShapeStyle& style);

// Record -> geometry + style. Fails with ParseError on an unknown type, an
// arity mismatch (CIRCLE 3, RECTANGLE 4, PATH even and >= 4), a malformed
// color or a non-positive stroke width; with InvalidGeometry on negative
// sizes. Outputs are untouched on failure.
ShapeError decodeShape(const ShapeRecord& record, Geometry& outGeometry, ShapeStyle& outStyle);

// Drops trailing vertices that repeat the first one.
std::vector<Point2> normalizePathClosure(const std::vector<Point2>& vertices);

// JSON mapping. from_json throws nlohmann::json exceptions on missing or
// mistyped fields; callers at the document boundary convert them to ParseError.
void to_json(nlohmann::json& j, const ShapeRecord& record);
void from_json(const nlohmann::json& j, ShapeRecord& record);

} // namespace shapeedit

#endif // SHAPEEDIT_SHAPE_RECORD_H
