#include "tessellate.hpp"
#include "delaunay.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace {

constexpr double SQRT3 = 1.7320508075688772;

// Upper bound on candidate tiles for one tiling.
constexpr long long MAX_TILES = 4000000;

Polygon regularPolygon(const Pos& center, int sides, double radius, double startDeg) {
    Polygon p;
    p.reserve(static_cast<size_t>(sides));
    const double step = 360.0 / sides;
    for (int k = 0; k < sides; ++k) {
        p.push_back(center + Pos::polar(startDeg + step * k, radius));
    }
    return p;
}

} // namespace

Motif hexagonMotif(double s) {
    Motif m;
    m.polygons.push_back(regularPolygon({0.0, 0.0}, 6, s, 0.0));
    m.u = Pos::polar(30.0, s * SQRT3);
    m.v = Pos::polar(90.0, s * SQRT3);
    return m;
}

Motif triangleMotif(double s) {
    Motif m;
    m.polygons.push_back(regularPolygon({0.0, 0.0}, 3, s, 0.0));
    m.polygons.push_back(regularPolygon(Pos::polar(60.0, s), 3, s, 60.0));
    m.u = Pos::polar(30.0, s * SQRT3);
    m.v = Pos::polar(90.0, s * SQRT3);
    return m;
}

// Trihexagonal: one hexagon of edge s and the two triangles on its 30 and 90 degree edges.
Motif hexagonTriangleMotif(double s) {
    const double triRadius = s / SQRT3;
    Motif m;
    m.polygons.push_back(regularPolygon({0.0, 0.0}, 6, s, 0.0));
    m.polygons.push_back(regularPolygon(Pos::polar(30.0, 2.0 * triRadius), 3, triRadius, 30.0));
    m.polygons.push_back(regularPolygon(Pos::polar(90.0, 2.0 * triRadius), 3, triRadius, 90.0));
    m.u = Pos::polar(0.0, 2.0 * s);
    m.v = Pos::polar(60.0, 2.0 * s);
    return m;
}

// Elongated triangular: a square row, then a row of alternating triangles, shifted by half a square.
Motif squareTriangleMotif(double s) {
    const double a = s;
    const double h = a * SQRT3 / 2.0;
    Motif m;
    m.polygons.push_back({{-a / 2, -a / 2}, {a / 2, -a / 2}, {a / 2, a / 2}, {-a / 2, a / 2}});
    m.polygons.push_back({{-a / 2, a / 2}, {a / 2, a / 2}, {0.0, a / 2 + h}});
    m.polygons.push_back({{a / 2, a / 2}, {a, a / 2 + h}, {0.0, a / 2 + h}});
    m.u = {a, 0.0};
    m.v = {a / 2, a + h};
    return m;
}

Motif rhombusMotif(double s, double shortFactor) {
    const double l = s;
    const double w = s * shortFactor;
    Motif m;
    m.polygons.push_back({{l, 0.0}, {0.0, w}, {-l, 0.0}, {0.0, -w}});
    m.u = {l, w};
    m.v = {l, -w};
    return m;
}

bool fillPeriodic(const Frame& frame, const Motif& motif, double rotDeg, std::vector<Tile>& out, std::string* err) {
    if (motif.polygons.empty()) return true;

    const Pos u = motif.u.rotated(rotDeg);
    const Pos v = motif.v.rotated(rotDeg);
    const double det = u.cross(v);
    if (std::abs(det) < 1e-9) {
        if (err) *err = "Degenerate lattice";
        return false;
    }

    std::vector<Polygon> polys;
    std::vector<Pos> centroids;
    double tileRadius = 0.0;
    double offset = 0.0;
    for (const Polygon& src : motif.polygons) {
        Polygon p;
        p.reserve(src.size());
        for (const Pos& q : src) p.push_back(q.rotated(rotDeg));
        const Pos c = polygonCentroid(p);
        for (const Pos& q : p) tileRadius = std::max(tileRadius, q.dist(c));
        offset = std::max(offset, c.norm());
        polys.push_back(std::move(p));
        centroids.push_back(c);
    }

    const double margin = 2.0 * tileRadius;
    const Pos center{frame.centerX(), frame.centerY()};
    const double reach = frame.halfDiagonal() + margin + offset;
    const double spanI = std::ceil(reach * v.norm() / std::abs(det)) + 1.0;
    const double spanJ = std::ceil(reach * u.norm() / std::abs(det)) + 1.0;
    if (!std::isfinite(spanI) || !std::isfinite(spanJ)) {
        if (err) *err = "Non-finite lattice";
        return false;
    }
    if ((2.0 * spanI + 1.0) * (2.0 * spanJ + 1.0) * static_cast<double>(polys.size()) > static_cast<double>(MAX_TILES)) {
        if (err) *err = "Tile size too small for the frame";
        return false;
    }
    const long long ni = static_cast<long long>(spanI);
    const long long nj = static_cast<long long>(spanJ);

    const double loX = frame.x - margin;
    const double hiX = frame.x + frame.w + margin;
    const double loY = frame.y - margin;
    const double hiY = frame.y + frame.h + margin;

    std::unordered_set<Pos, PosHash> seen;
    for (long long j = -nj; j <= nj; ++j) {
        for (long long i = -ni; i <= ni; ++i) {
            const Pos t = center + u * static_cast<double>(i) + v * static_cast<double>(j);
            for (size_t k = 0; k < polys.size(); ++k) {
                const Pos anchor = t + centroids[k];
                if (anchor.x < loX || anchor.x > hiX || anchor.y < loY || anchor.y > hiY) continue;
                if (!seen.insert(anchor).second) continue;

                Tile tile;
                tile.anchor = anchor;
                tile.polygon.reserve(polys[k].size());
                for (const Pos& q : polys[k]) tile.polygon.push_back(t + q);
                out.push_back(std::move(tile));
            }
        }
    }
    return true;
}

void fillDelaunay(const Frame& frame, int nbPoints, RNG& rng, std::vector<Tile>& out) {
    std::vector<Pos> pts;
    pts.reserve(static_cast<size_t>(std::max(0, nbPoints)) + 4);
    for (int k = 0; k < nbPoints; ++k) pts.push_back(Pos::random(frame, rng));

    const double ex = frame.w / 10.0;
    const double ey = frame.h / 10.0;
    pts.push_back({frame.x - ex, frame.y - ey});
    pts.push_back({frame.x + frame.w + ex, frame.y - ey});
    pts.push_back({frame.x + frame.w + ex, frame.y + frame.h + ey});
    pts.push_back({frame.x - ex, frame.y + frame.h + ey});

    for (const delaunay::Triangle& t : delaunay::triangulate(pts)) {
        Tile tile;
        tile.polygon = {pts[static_cast<size_t>(t.a)], pts[static_cast<size_t>(t.b)], pts[static_cast<size_t>(t.c)]};
        tile.anchor = polygonCentroid(tile.polygon);
        out.push_back(std::move(tile));
    }
}

bool makeTiling(const SceneCfg& cfg, RNG& rng, std::vector<Tile>& out, std::string* err) {
    out.clear();
    const double s = cfg.sizeTiling;
    if (cfg.tiling.kind != TilingKind::Delaunay && (!std::isfinite(s) || !(s > 0.0))) {
        if (err) *err = "Tile size must be a positive finite number";
        return false;
    }

    Motif motif;
    double rot = 0.0;
    switch (cfg.tiling.kind) {
        case TilingKind::Hexagons:
            rot = rng.range(0, 359);
            motif = hexagonMotif(s);
            break;
        case TilingKind::Triangles:
            rot = rng.range(0, 359);
            motif = triangleMotif(s);
            break;
        case TilingKind::HexagonsAndTriangles:
            rot = rng.range(0, 359);
            motif = hexagonTriangleMotif(s);
            break;
        case TilingKind::SquaresAndTriangles:
            rot = rng.range(0, 359);
            motif = squareTriangleMotif(s);
            break;
        case TilingKind::Rhombus: {
            const double factor = 0.4 + 0.6 * rng.next01();
            rot = rng.range(0, 359);
            motif = rhombusMotif(s, factor);
            break;
        }
        case TilingKind::Pentagons: {
            const int type = (cfg.tiling.pentagonType >= 1 && cfg.tiling.pentagonType <= 6)
                ? cfg.tiling.pentagonType
                : rng.range(1, 6);
            rot = rng.range(0, 359);
            if (!pentagonMotif(type, s, motif, err)) return false;
            break;
        }
        case TilingKind::Delaunay:
            fillDelaunay(cfg.frame, cfg.nbDelaunay, rng, out);
            return true;
    }

    if (!fillPeriodic(cfg.frame, motif, rot, out, err)) {
        out.clear();
        return false;
    }
    if (out.empty()) {
        if (err) *err = "No tile covers the frame";
        return false;
    }
    return true;
}
