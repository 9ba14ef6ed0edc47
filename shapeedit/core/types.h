#ifndef SHAPEEDIT_CORE_TYPES_H
#define SHAPEEDIT_CORE_TYPES_H

#include <cstdint>
#include <cstddef>

// Lightweight types shared by every shapeedit module.

namespace shapeedit {

struct Point2 { double x; double y; };

inline bool operator==(const Point2& a, const Point2& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Point2& a, const Point2& b) { return !(a == b); }

// Axis-aligned bounds. An empty geometry reports a zero-sized box at its anchor.
struct AABB {
    double minX, minY, maxX, maxY;
};

inline double aabbWidth(const AABB& b) { return b.maxX - b.minX; }
inline double aabbHeight(const AABB& b) { return b.maxY - b.minY; }
inline Point2 aabbCenter(const AABB& b) { return Point2{ (b.minX + b.maxX) * 0.5, (b.minY + b.maxY) * 0.5 }; }

enum class ShapeKind : std::uint8_t { Circle = 1, Rect = 2, Path = 3 };

enum class ShapeError : std::uint32_t {
    Ok = 0,
    ParseError = 1,
    IoError = 2,
    InvalidGeometry = 3,
    InvalidStyle = 4,
    NotFound = 5,
    InvalidOperation = 6,
};

inline const char* shapeErrorName(ShapeError err) {
    switch (err) {
        case ShapeError::Ok: return "Ok";
        case ShapeError::ParseError: return "ParseError";
        case ShapeError::IoError: return "IoError";
        case ShapeError::InvalidGeometry: return "InvalidGeometry";
        case ShapeError::InvalidStyle: return "InvalidStyle";
        case ShapeError::NotFound: return "NotFound";
        case ShapeError::InvalidOperation: return "InvalidOperation";
    }
    return "Unknown";
}

} // namespace shapeedit

#endif // SHAPEEDIT_CORE_TYPES_H
