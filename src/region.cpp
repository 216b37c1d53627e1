#include "region.hpp"

#include <cmath>

namespace {

// Position of p across (along normal) and along the band.
void bandCoords(const Pos& origin, const Pos& normal, const Pos& p, double& across, double& along) {
    const Pos d = p - origin;
    across = d.dot(normal);
    along = d.cross(normal);
}

// Triangle wave in [-1, 1] with period 1.
double triangleWave(double t) {
    const double f = t - std::floor(t);
    return 4.0 * std::abs(f - 0.5) - 1.0;
}

struct ContainsVisitor {
    const Pos& p;

    bool operator()(const DiscRegion& r) const {
        return p.dist(r.center) < r.radius;
    }

    bool operator()(const TriangleRegion& r) const {
        return pointInPolygon(p, {r.a, r.b, r.c});
    }

    bool operator()(const StripeRegion& r) const {
        const double x = (p - r.origin).dot(r.normal);
        return x >= r.lo && x < r.hi;
    }

    bool operator()(const SpiralRegion& r) const {
        const Pos d = p - r.center;
        const double dist = d.norm();
        if (dist >= r.maxRadius || r.spacing <= 0.0) return false;

        double turn = std::atan2(d.y, d.x) * 180.0 / PI;
        turn = (r.handedness >= 0 ? turn : -turn) - r.phaseDeg;
        const double t = dist / r.spacing - turn / 360.0;
        const double f = t - std::floor(t);
        return f < r.width;
    }

    bool operator()(const RingRegion& r) const {
        const double dist = p.dist(r.center);
        return dist >= r.inner && dist < r.outer;
    }

    bool operator()(const WaveRegion& r) const {
        double across = 0.0;
        double along = 0.0;
        bandCoords(r.origin, r.normal, p, across, along);
        const double shift = r.amplitude * std::sin(2.0 * PI * along / r.wavelength + radians(r.phaseDeg));
        const double x = across - shift;
        return x >= r.lo && x < r.hi;
    }

    bool operator()(const SawtoothRegion& r) const {
        double across = 0.0;
        double along = 0.0;
        bandCoords(r.origin, r.normal, p, across, along);
        const double shift = r.amplitude * triangleWave(along / r.wavelength + r.phaseDeg / 360.0);
        const double x = across - shift;
        return x >= r.lo && x < r.hi;
    }
};

} // namespace

bool contains(const Region& region, const Pos& p) {
    return std::visit(ContainsVisitor{p}, region);
}
