#pragma once
#include "pos.hpp"

#include <variant>

// Decorative regions. Every pattern family produces some of these; the scene
// only ever asks whether a point is inside.

struct DiscRegion {
    Pos center;
    double radius = 0.0;
};

struct TriangleRegion {
    Pos a;
    Pos b;
    Pos c;
};

// Band lo <= (p - origin).normal < hi.
struct StripeRegion {
    Pos origin;
    Pos normal{1.0, 0.0};
    double lo = 0.0;
    double hi = 0.0;
};

// One Archimedean arm: radius grows by `spacing` per turn, `width` is the
// fraction of each turn covered (0..1).
struct SpiralRegion {
    Pos center;
    double spacing = 1.0;
    double width = 0.3;
    double phaseDeg = 0.0;
    int handedness = 1;
    double maxRadius = 0.0;
};

// Annulus inner <= |p - center| < outer.
struct RingRegion {
    Pos center;
    double inner = 0.0;
    double outer = 0.0;
};

// Band whose boundaries are displaced along `normal` by a sine of the position
// along the band. Neighbouring bands share wavelength and phase, so they stay adjacent.
struct WaveRegion {
    Pos origin;
    Pos normal{1.0, 0.0};
    double lo = 0.0;
    double hi = 0.0;
    double amplitude = 0.0;
    double wavelength = 1.0;
    double phaseDeg = 0.0;
};

// Same as WaveRegion with a triangle wave.
struct SawtoothRegion {
    Pos origin;
    Pos normal{1.0, 0.0};
    double lo = 0.0;
    double hi = 0.0;
    double amplitude = 0.0;
    double wavelength = 1.0;
    double phaseDeg = 0.0;
};

using Region = std::variant<DiscRegion, TriangleRegion, StripeRegion, SpiralRegion, RingRegion, WaveRegion, SawtoothRegion>;

bool contains(const Region& region, const Pos& p);
