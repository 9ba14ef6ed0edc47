#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace shapeedit {

// 8-bit sRGB color. Alpha is not modeled; the document format has none.
struct Color {
    std::uint8_t r;
    std::uint8_t g;
    std::uint8_t b;
};

inline bool operator==(const Color& a, const Color& b) { return a.r == b.r && a.g == b.g && a.b == b.b; }
inline bool operator!=(const Color& a, const Color& b) { return !(a == b); }

constexpr Color kBlack{0, 0, 0};
constexpr Color kWhite{255, 255, 255};

// Parse "#rrggbb" (either case). Returns false and leaves `out` untouched on any deviation.
bool parseHexColor(std::string_view text, Color& out);

// Format as lowercase "#rrggbb".
std::string formatHexColor(const Color& color);

} // namespace shapeedit
