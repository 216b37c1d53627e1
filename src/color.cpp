#include "color.hpp"
#include "common.hpp"

#include <cctype>
#include <sstream>

namespace {

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool parseHexByte(const std::string& s, size_t at, int& out) {
    const int hi = hexDigit(s[at]);
    const int lo = hexDigit(s[at + 1]);
    if (hi < 0 || lo < 0) return false;
    out = hi * 16 + lo;
    return true;
}

} // namespace

Color Color::random(RNG& rng) {
    const int cr = rng.range(0, 254);
    const int cg = rng.range(0, 254);
    const int cb = rng.range(0, 254);
    return {cr, cg, cb};
}

Color Color::validated() const {
    return {clampi(r, 0, 255), clampi(g, 0, 255), clampi(b, 0, 255)};
}

Color Color::variate(RNG& rng, int amount) const {
    if (amount <= 0) return *this;
    Color c = *this;
    c.r = std::max(0, c.r + rng.range(-amount, amount - 1));
    c.g = std::max(0, c.g + rng.range(-amount, amount - 1));
    c.b = std::max(0, c.b + rng.range(-amount, amount - 1));
    return c;
}

Color Color::meanpoint(const Color& other, int distance) const {
    const int d = clampi(distance, 0, 100);
    return {
        (r * (100 - d) + other.r * d) / 100,
        (g * (100 - d) + other.g * d) / 100,
        (b * (100 - d) + other.b * d) / 100,
    };
}

std::string Color::svg() const {
    const Color c = validated();
    std::ostringstream ss;
    ss << "rgb(" << c.r << "," << c.g << "," << c.b << ")";
    return ss.str();
}

std::optional<Color> parseColorString(const std::string& s, const ColorList& dict) {
    auto it = dict.find(s);
    if (it != dict.end()) return it->second;

    if (s.size() != 7 || s[0] != '#') return std::nullopt;

    Color c;
    if (!parseHexByte(s, 1, c.r)) return std::nullopt;
    if (!parseHexByte(s, 3, c.g)) return std::nullopt;
    if (!parseHexByte(s, 5, c.b)) return std::nullopt;
    return c;
}
