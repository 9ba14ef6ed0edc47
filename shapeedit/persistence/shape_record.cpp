#include "shapeedit/persistence/shape_record.h"
#include "shapeedit/core/logging.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <limits>

namespace shapeedit {

std::vector<Point2> normalizePathClosure(const std::vector<Point2>& vertices) {
    std::vector<Point2> out = vertices;
    while (out.size() > 1 && out.back() == out.front()) {
        out.pop_back();
    }
    return out;
}

ShapeRecord encodeShape(const Geometry& geometry, const ShapeStyle& style) {
    ShapeRecord record;
    record.outlineColor = formatHexColor(style.outline);
    record.fillColor = formatHexColor(style.fill);
    record.filled = style.filled;
    record.strokeWidth = style.strokeWidth;

    switch (geometry.kind) {
        case ShapeKind::Circle: {
            const CircleGeom& c = geometry.circle;
            record.type = kRecordTypeCircle;
            record.params = { c.cx, c.cy, c.r };
            break;
        }
        case ShapeKind::Rect: {
            const RectGeom& r = geometry.rect;
            if (isAxisAligned(r)) {
                record.type = kRecordTypeRect;
                record.params = { r.x, r.y, r.w, r.h };
                break;
            }
            // No four-parameter form exists for a rotated rectangle.
            record.type = kRecordTypePath;
            for (const Point2& p : rectCorners(r)) {
                record.params.push_back(p.x);
                record.params.push_back(p.y);
            }
            break;
        }
        case ShapeKind::Path: {
            record.type = kRecordTypePath;
            std::vector<Point2> closed = normalizePathClosure(geometry.path);
            if (closed.size() == 1) {
                closed.push_back(closed.front());
            }
            record.params.reserve(closed.size() * 2);
            for (const Point2& p : closed) {
                record.params.push_back(p.x);
                record.params.push_back(p.y);
            }
            break;
        }
    }
    return record;
}

ShapeError decodeShape(const ShapeRecord& record, Geometry& outGeometry, ShapeStyle& outStyle) {
    ShapeStyle style{};
    if (!parseHexColor(record.outlineColor, style.outline)) {
        SHAPEEDIT_LOG_WARN("bad outline color '%s'", record.outlineColor.c_str());
        return ShapeError::ParseError;
    }
    if (!parseHexColor(record.fillColor, style.fill)) {
        SHAPEEDIT_LOG_WARN("bad fill color '%s'", record.fillColor.c_str());
        return ShapeError::ParseError;
    }
    if (!isValidStrokeWidth(record.strokeWidth)) {
        SHAPEEDIT_LOG_WARN("bad stroke width %d", record.strokeWidth);
        return ShapeError::ParseError;
    }
    style.filled = record.filled;
    style.strokeWidth = record.strokeWidth;

    const std::vector<double>& p = record.params;
    Geometry geometry;
    ShapeError err = ShapeError::ParseError;
    if (record.type == kRecordTypeCircle) {
        if (p.size() == 3) err = makeCircle(p[0], p[1], p[2], geometry);
    } else if (record.type == kRecordTypeRect) {
        if (p.size() == 4) err = makeRect(p[0], p[1], p[2], p[3], geometry);
    } else if (record.type == kRecordTypePath) {
        if (p.size() >= 4 && p.size() % 2 == 0) {
            std::vector<Point2> vertices;
            vertices.reserve(p.size() / 2);
            for (std::size_t i = 0; i < p.size(); i += 2) {
                vertices.push_back(Point2{p[i], p[i + 1]});
            }
            err = makePath(normalizePathClosure(vertices), geometry);
        }
    }

    if (err != ShapeError::Ok) {
        SHAPEEDIT_LOG_WARN("cannot decode %s record with %zu params", record.type.c_str(), p.size());
        return err;
    }
    outGeometry = std::move(geometry);
    outStyle = style;
    return ShapeError::Ok;
}

void to_json(nlohmann::json& j, const ShapeRecord& record) {
    j = nlohmann::json{
        {"type", record.type},
        {"params", record.params},
        {"outlineColor", record.outlineColor},
        {"fillColor", record.fillColor},
        {"filled", record.filled},
        {"strokeWidth", record.strokeWidth},
    };
}

void from_json(const nlohmann::json& j, ShapeRecord& record) {
    j.at("type").get_to(record.type);
    j.at("params").get_to(record.params);
    j.at("outlineColor").get_to(record.outlineColor);
    j.at("fillColor").get_to(record.fillColor);
    j.at("filled").get_to(record.filled);
    // Fractional or out-of-range widths reject the record instead of truncating.
    const nlohmann::json& width = j.at("strokeWidth");
    if (!width.is_number_integer()) {
        throw nlohmann::json::type_error::create(302, "strokeWidth must be an integer", &width);
    }
    const bool inRange = width.is_number_unsigned()
        ? width.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
        : width.get<std::int64_t>() >= std::numeric_limits<int>::min()
            && width.get<std::int64_t>() <= std::numeric_limits<int>::max();
    if (!inRange) {
        throw nlohmann::json::out_of_range::create(406, "strokeWidth out of range", &width);
    }
    record.strokeWidth = width.get<int>();
}

} // namespace shapeedit
