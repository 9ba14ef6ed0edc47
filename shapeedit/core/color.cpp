#include "shapeedit/core/color.h"

namespace {
    int hexNibble(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
        if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
        return -1;
    }

    bool readByte(std::string_view text, std::size_t pos, std::uint8_t& out) {
        const int hi = hexNibble(text[pos]);
        const int lo = hexNibble(text[pos + 1]);
        if (hi < 0 || lo < 0) return false;
        out = static_cast<std::uint8_t>((hi << 4) | lo);
        return true;
    }
}

namespace shapeedit {

bool parseHexColor(std::string_view text, Color& out) {
    if (text.size() != 7 || text[0] != '#') return false;
    Color parsed{};
    if (!readByte(text, 1, parsed.r)) return false;
    if (!readByte(text, 3, parsed.g)) return false;
    if (!readByte(text, 5, parsed.b)) return false;
    out = parsed;
    return true;
}

std::string formatHexColor(const Color& color) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out(7, '#');
    out[1] = kDigits[color.r >> 4];
    out[2] = kDigits[color.r & 0x0F];
    out[3] = kDigits[color.g >> 4];
    out[4] = kDigits[color.g & 0x0F];
    out[5] = kDigits[color.b >> 4];
    out[6] = kDigits[color.b & 0x0F];
    return out;
}

} // namespace shapeedit
