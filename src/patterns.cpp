#include "patterns.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace {

// Extent of the frame projected on `normal`, measured from the frame center.
void frameExtent(const Frame& f, const Pos& normal, double& lo, double& hi) {
    const Pos c{f.centerX(), f.centerY()};
    const Pos corners[4] = {
        {static_cast<double>(f.x), static_cast<double>(f.y)},
        {static_cast<double>(f.x + f.w), static_cast<double>(f.y)},
        {static_cast<double>(f.x + f.w), static_cast<double>(f.y + f.h)},
        {static_cast<double>(f.x), static_cast<double>(f.y + f.h)},
    };
    lo = hi = 0.0;
    for (const Pos& p : corners) {
        const double x = (p - c).dot(normal);
        lo = std::min(lo, x);
        hi = std::max(hi, x);
    }
}

// nb+1 boundaries splitting [lo, hi]; inner ones are jittered by up to var% of the spacing.
std::vector<double> bandBoundaries(double lo, double hi, int nb, int var, RNG& rng) {
    std::vector<double> b;
    b.reserve(static_cast<size_t>(nb) + 1);
    const double spacing = (hi - lo) / nb;
    var = std::clamp(var, 0, MAX_STRIPE_VARIATION);
    for (int k = 0; k <= nb; ++k) {
        double x = lo + spacing * k;
        if (k > 0 && k < nb && var > 0) {
            x += spacing * (var / 100.0) * (2.0 * rng.next01() - 1.0);
        }
        b.push_back(x);
    }
    return b;
}

template <typename WaveT>
std::vector<Region> wavyBands(const Frame& f, int nb, double width, RNG& rng) {
    std::vector<Region> out;
    if (nb <= 0) return out;

    const double angle = rng.range(0, 359);
    const Pos normal = Pos::polar(angle, 1.0);
    double lo = 0.0;
    double hi = 0.0;
    frameExtent(f, normal, lo, hi);

    const double spacing = (hi - lo) / nb;
    const double amplitude = width * spacing;
    const double wavelength = f.h * (0.1 + 0.4 * rng.next01());
    const double phase = rng.range(0, 359);

    // Outer bands are stretched by the amplitude so the displaced edges still cover the frame.
    const std::vector<double> b = bandBoundaries(lo - amplitude, hi + amplitude, nb, 0, rng);
    for (int k = 0; k < nb; ++k) {
        WaveT w;
        w.origin = {f.centerX(), f.centerY()};
        w.normal = normal;
        w.lo = b[static_cast<size_t>(k)];
        w.hi = b[static_cast<size_t>(k) + 1];
        w.amplitude = amplitude;
        w.wavelength = std::max(wavelength, 1.0);
        w.phaseDeg = phase;
        out.push_back(w);
    }
    return out;
}

} // namespace

std::vector<Region> freeCircles(const Frame& f, int nb, RNG& rng) {
    std::vector<DiscRegion> discs;
    for (int k = 0; k < nb; ++k) {
        DiscRegion d;
        d.center = Pos::random(f, rng);
        d.radius = f.h * (0.05 + 0.2 * rng.next01());
        discs.push_back(d);
    }
    // Small discs first so they stay visible on top of large ones.
    std::stable_sort(discs.begin(), discs.end(), [](const DiscRegion& a, const DiscRegion& b) {
        return a.radius < b.radius;
    });
    return std::vector<Region>(discs.begin(), discs.end());
}

std::vector<Region> freeTriangles(const Frame& f, int nb, RNG& rng) {
    std::vector<std::pair<double, TriangleRegion>> tris;
    for (int k = 0; k < nb; ++k) {
        const Pos c = Pos::random(f, rng);
        const double size = f.h * (0.08 + 0.25 * rng.next01());
        const double rot = rng.range(0, 359);
        TriangleRegion t;
        t.a = c + Pos::polar(rot, size);
        t.b = c + Pos::polar(rot + 120.0, size);
        t.c = c + Pos::polar(rot + 240.0, size);
        tris.emplace_back(size, t);
    }
    std::stable_sort(tris.begin(), tris.end(), [](const auto& a, const auto& b) {
        return a.first < b.first;
    });
    std::vector<Region> out;
    for (const auto& t : tris) out.push_back(t.second);
    return out;
}

std::vector<Region> freeStripes(const Frame& f, int nb, double width, RNG& rng) {
    std::vector<Region> out;
    for (int k = 0; k < nb; ++k) {
        StripeRegion s;
        s.origin = Pos::random(f, rng);
        s.normal = Pos::polar(rng.range(0, 359), 1.0);
        const double w = width * f.h * (0.5 + rng.next01());
        s.lo = -w / 2.0;
        s.hi = w / 2.0;
        out.push_back(s);
    }
    return out;
}

std::vector<Region> freeSpirals(const Frame& f, int nb, double width, double tightness, RNG& rng) {
    std::vector<Region> out;
    const double spacing = 0.2 * f.h / std::max(tightness, 0.01);
    for (int k = 0; k < nb; ++k) {
        SpiralRegion s;
        s.center = Pos::random(f, rng);
        s.spacing = spacing;
        s.width = std::clamp(width, 0.0, 1.0);
        s.phaseDeg = rng.range(0, 359);
        s.handedness = rng.chance(0.5) ? 1 : -1;
        s.maxRadius = f.h * (0.3 + 0.7 * rng.next01());
        out.push_back(s);
    }
    return out;
}

std::vector<Region> concentricCircles(const Frame& f, int nb, RNG& rng) {
    std::vector<Region> out;
    if (nb <= 0) return out;

    const Pos center = Pos::random(f, rng);
    const double step = f.halfDiagonal() / nb;
    double inner = 0.0;
    for (int k = 0; k < nb; ++k) {
        RingRegion r;
        r.center = center;
        r.inner = inner;
        r.outer = inner + step * (0.5 + rng.next01());
        inner = r.outer;
        out.push_back(r);
    }
    return out;
}

std::vector<Region> parallelStripes(const Frame& f, int nb, int var, RNG& rng) {
    std::vector<Region> out;
    if (nb <= 0) return out;

    const Pos normal = Pos::polar(rng.range(0, 359), 1.0);
    double lo = 0.0;
    double hi = 0.0;
    frameExtent(f, normal, lo, hi);

    const std::vector<double> b = bandBoundaries(lo, hi, nb, var, rng);
    for (int k = 0; k < nb; ++k) {
        StripeRegion s;
        s.origin = {f.centerX(), f.centerY()};
        s.normal = normal;
        s.lo = b[static_cast<size_t>(k)];
        s.hi = b[static_cast<size_t>(k) + 1];
        out.push_back(s);
    }
    return out;
}

std::vector<Region> crossedStripes(const Frame& f, int nb, int var, RNG& rng) {
    std::vector<Region> out;
    if (nb <= 0) return out;

    const double angle = rng.range(0, 359);
    const Pos normals[2] = {Pos::polar(angle, 1.0), Pos::polar(angle + 90.0, 1.0)};
    double lo[2] = {0.0, 0.0};
    double hi[2] = {0.0, 0.0};
    for (int d = 0; d < 2; ++d) frameExtent(f, normals[d], lo[d], hi[d]);

    const Pos origin{f.centerX(), f.centerY()};
    for (int k = 0; k < nb; ++k) {
        for (int d = 0; d < 2; ++d) {
            const double spacing = (hi[d] - lo[d]) / nb;
            const double mid = lo[d] + spacing * (k + 0.5);
            const double w = spacing * (0.3 + (var / 100.0) * rng.next01());
            StripeRegion s;
            s.origin = origin;
            s.normal = normals[d];
            s.lo = mid - w / 2.0;
            s.hi = mid + w / 2.0;
            out.push_back(s);
        }
    }
    return out;
}

std::vector<Region> parallelWaves(const Frame& f, int nb, double width, RNG& rng) {
    return wavyBands<WaveRegion>(f, nb, width, rng);
}

std::vector<Region> parallelSawteeth(const Frame& f, int nb, double width, RNG& rng) {
    return wavyBands<SawtoothRegion>(f, nb, width, rng);
}

std::vector<Region> createRegions(const SceneCfg& cfg, RNG& rng) {
    const Frame& f = cfg.frame;
    const int nb = std::max(0, cfg.nbPattern);
    switch (cfg.pattern) {
        case Pattern::FreeCircles: return freeCircles(f, nb, rng);
        case Pattern::FreeTriangles: return freeTriangles(f, nb, rng);
        case Pattern::FreeStripes: return freeStripes(f, nb, cfg.widthPattern, rng);
        case Pattern::FreeSpirals: return freeSpirals(f, nb, cfg.widthPattern, cfg.tightnessSpiral, rng);
        case Pattern::ConcentricCircles: return concentricCircles(f, nb, rng);
        case Pattern::ParallelStripes: return parallelStripes(f, nb, cfg.varStripes, rng);
        case Pattern::CrossedStripes: return crossedStripes(f, nb, cfg.varStripes, rng);
        case Pattern::ParallelWaves: return parallelWaves(f, nb, cfg.widthPattern, rng);
        case Pattern::ParallelSawteeth: return parallelSawteeth(f, nb, cfg.widthPattern, rng);
    }
    return {};
}
