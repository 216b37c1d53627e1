#pragma once
#include "rng.hpp"

#include <map>
#include <optional>
#include <string>

// RGB color. Channels are kept as plain ints so blends and jitter can run
// outside [0,255] without wrapping; clamping happens on output.
struct Color {
    int r = 0;
    int g = 0;
    int b = 0;

    Color() = default;
    Color(int r_, int g_, int b_) : r(r_), g(g_), b(b_) {}

    static Color random(RNG& rng);

    // Every channel within [0,255].
    Color validated() const;

    // Per-channel uniform noise in [-amount, amount). Negative results floor at 0.
    Color variate(RNG& rng, int amount) const;

    // Linear blend toward `other`: 0 keeps this color, 100 gives `other`.
    Color meanpoint(const Color& other, int distance) const;

    // "rgb(r,g,b)", clamped.
    std::string svg() const;

    bool operator==(const Color& o) const { return r == o.r && g == o.g && b == o.b; }
    bool operator!=(const Color& o) const { return !(*this == o); }
};

using ColorList = std::map<std::string, Color>;

// "#RRGGBB" or the name of a color already in `dict`.
std::optional<Color> parseColorString(const std::string& s, const ColorList& dict);
