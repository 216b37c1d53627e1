#include "tessellate.hpp"

#include <cmath>

namespace {

constexpr double SQRT3 = 1.7320508075688772;

Pos midpoint(const Pos& a, const Pos& b) {
    return (a + b) * 0.5;
}

Polygon scaled(const Polygon& poly, double k) {
    Polygon out;
    out.reserve(poly.size());
    for (const Pos& p : poly) out.push_back(p * k);
    return out;
}

Polygon rotatedPolygon(const Polygon& poly, double deg) {
    Polygon out;
    out.reserve(poly.size());
    for (const Pos& p : poly) out.push_back(p.rotated(deg));
    return out;
}

// Hexagon corners V0..V5 and edge midpoints M0..M5 (Mi between Vi and Vi+1).
void hexagonPoints(const Pos& center, double r, Pos (&vtx)[6], Pos (&mid)[6]) {
    for (int i = 0; i < 6; ++i) vtx[i] = center + Pos::polar(60.0 * i, r);
    for (int i = 0; i < 6; ++i) mid[i] = midpoint(vtx[i], vtx[(i + 1) % 6]);
}

// Square body with a pitched roof, stacked with upside-down houses filling the gaps.
bool housesMotif(double a, Motif& m, std::string* err) {
    Pos apex;
    if (!intersectOrFail({0.0, a}, 45.0, {a, a}, 135.0, apex, err)) return false;
    const double h = apex.y - a;

    m.polygons.push_back({{0.0, 0.0}, {a, 0.0}, {a, a}, apex, {0.0, a}});
    m.polygons.push_back({apex, {a, a}, apex + Pos(a, 0.0), {apex.x + a, 2.0 * a + h}, {apex.x, 2.0 * a + h}});
    m.u = {a, 0.0};
    m.v = {0.0, 2.0 * a + h};
    return true;
}

// Cairo tiling: four pentagons turning around a right-angled corner.
bool cairoMotif(double s, Motif& m, std::string* err) {
    Pos tip;
    if (!intersectOrFail({s, 0.0}, 45.0, {s, 2.0 * s}, -45.0, tip, err)) return false;

    const Polygon base = {{0.0, 0.0}, {s, 0.0}, tip, {s, 2.0 * s}, {0.0, s}};
    for (int k = 0; k < 4; ++k) m.polygons.push_back(rotatedPolygon(base, 90.0 * k));
    m.u = {3.0 * s, s};
    m.v = {-s, 3.0 * s};
    return true;
}

// Hexagon cut in three from its center to every other edge midpoint.
Motif splitHexagonMotif(double r) {
    Pos vtx[6];
    Pos mid[6];
    hexagonPoints({0.0, 0.0}, r, vtx, mid);
    const Pos c{0.0, 0.0};

    Motif m;
    m.polygons.push_back({c, mid[0], vtx[1], vtx[2], mid[2]});
    m.polygons.push_back({c, mid[2], vtx[3], vtx[4], mid[4]});
    m.polygons.push_back({c, mid[4], vtx[5], vtx[0], mid[0]});
    m.u = Pos::polar(30.0, r * SQRT3);
    m.v = Pos::polar(90.0, r * SQRT3);
    return m;
}

// Hexagon halved between two opposite edge midpoints.
Motif halvedHexagonMotif(double r) {
    Pos vtx[6];
    Pos mid[6];
    hexagonPoints({0.0, 0.0}, r, vtx, mid);

    Motif m;
    m.polygons.push_back({mid[0], vtx[1], vtx[2], vtx[3], mid[3]});
    m.polygons.push_back({mid[3], vtx[4], vtx[5], vtx[0], mid[0]});
    m.u = Pos::polar(30.0, r * SQRT3);
    m.v = Pos::polar(90.0, r * SQRT3);
    return m;
}

// Floret: six pentagons around their 60 degree corners. Long edges are 2 units, short ones 1.
bool floretMotif(double unit, Motif& m, std::string* err) {
    const Pos o{0.0, 0.0};
    const Pos a{2.0, 0.0};
    const Pos b{2.5, SQRT3 / 2.0};
    const Pos d{1.0, SQRT3};
    Pos c;
    if (!intersectOrFail(b, 120.0, d, 0.0, c, err)) return false;

    const Polygon petal = scaled({o, a, b, c, d}, unit);
    for (int k = 0; k < 6; ++k) m.polygons.push_back(rotatedPolygon(petal, 60.0 * k));
    m.u = Pos(4.5, SQRT3 / 2.0) * unit;
    m.v = Pos(1.5, 2.5 * SQRT3) * unit;
    return true;
}

// Halved hexagons whose cut direction alternates between neighbouring rows.
Motif alternatingHalvesMotif(double r) {
    Motif m = halvedHexagonMotif(r);

    Pos vtx[6];
    Pos mid[6];
    hexagonPoints(m.v, r, vtx, mid);
    m.polygons.push_back({mid[1], vtx[2], vtx[3], vtx[4], mid[4]});
    m.polygons.push_back({mid[4], vtx[5], vtx[0], vtx[1], mid[1]});
    m.v = m.v * 2.0;
    return m;
}

} // namespace

bool pentagonMotif(int type, double s, Motif& out, std::string* err) {
    out = Motif{};
    switch (type) {
        case 1: return housesMotif(s, out, err);
        case 2: return cairoMotif(s, out, err);
        case 3: out = splitHexagonMotif(s); return true;
        case 4: out = halvedHexagonMotif(s); return true;
        case 5: return floretMotif(s / 2.0, out, err);
        case 6: out = alternatingHalvesMotif(s); return true;
        default: break;
    }
    if (err) *err = "Unknown pentagon type " + std::to_string(type);
    return false;
}
