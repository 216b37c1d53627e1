#include "pos.hpp"

#include <cmath>

Pos Pos::random(const Frame& f, RNG& rng) {
    const double errx = f.w / 10.0;
    const double erry = f.h / 10.0;
    const double px = f.x - errx + rng.next01() * f.w * 1.2;
    const double py = f.y - erry + rng.next01() * f.h * 1.2;
    return {px, py};
}

std::optional<Pos> intersect(const Pos& p1, double deg1, const Pos& p2, double deg2) {
    const Pos d1 = Pos::polar(deg1, 1.0);
    const Pos d2 = Pos::polar(deg2, 1.0);

    // sin of the angle between both lines; 0.01 is roughly half a degree.
    const double det = d1.cross(d2);
    if (std::abs(det) < 0.01) return std::nullopt;

    const double t = (p2 - p1).cross(d2) / det;
    return p1 + d1 * t;
}

bool intersectOrFail(const Pos& p1, double deg1, const Pos& p2, double deg2, Pos& out, std::string* err) {
    const std::optional<Pos> p = intersect(p1, deg1, p2, deg2);
    if (!p) {
        if (err) *err = "Malformed intersection";
        return false;
    }
    out = *p;
    return true;
}

double polygonSignedArea(const Polygon& poly) {
    const size_t n = poly.size();
    if (n < 3) return 0.0;
    double a = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const Pos& p = poly[i];
        const Pos& q = poly[(i + 1) % n];
        a += p.cross(q);
    }
    return 0.5 * a;
}

Pos polygonCentroid(const Polygon& poly) {
    const size_t n = poly.size();
    if (n == 0) return {};

    const double area = polygonSignedArea(poly);
    if (std::abs(area) < 1e-12) {
        // Degenerate: fall back to the vertex average.
        Pos s;
        for (const Pos& p : poly) s += p;
        return s * (1.0 / static_cast<double>(n));
    }

    double cx = 0.0;
    double cy = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const Pos& p = poly[i];
        const Pos& q = poly[(i + 1) % n];
        const double c = p.cross(q);
        cx += (p.x + q.x) * c;
        cy += (p.y + q.y) * c;
    }
    const double k = 1.0 / (6.0 * area);
    return {cx * k, cy * k};
}

bool pointInPolygon(const Pos& p, const Polygon& poly) {
    const size_t n = poly.size();
    if (n < 3) return false;

    constexpr double eps = 1e-9;

    // Points on an edge count as inside.
    for (size_t i = 0; i < n; ++i) {
        const Pos& a = poly[i];
        const Pos& b = poly[(i + 1) % n];
        const Pos ab = b - a;
        const Pos ap = p - a;
        const double len2 = ab.dot(ab);
        if (len2 <= 0.0) continue;
        if (std::abs(ab.cross(ap)) <= eps * std::sqrt(len2)) {
            const double t = ap.dot(ab) / len2;
            if (t >= -eps && t <= 1.0 + eps) return true;
        }
    }

    // Even-odd crossing test.
    bool inside = false;
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        const Pos& a = poly[i];
        const Pos& b = poly[j];
        if ((a.y > p.y) != (b.y > p.y)) {
            const double xCross = a.x + (p.y - a.y) * (b.x - a.x) / (b.y - a.y);
            if (p.x < xCross) inside = !inside;
        }
    }
    return inside;
}
