#pragma once

// Delaunay triangulation (Bowyer-Watson)
//
// Small incremental triangulator for a few thousand points. Quadratic in the
// worst case, which is fine for background tilings.
//
// The point set is wrapped in a large super-triangle; triangles still touching
// it at the end are dropped, so callers that need full coverage of a rectangle
// should include its corners in the input.

#include "pos.hpp"

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

namespace delaunay {

struct Triangle {
    int a = 0;
    int b = 0;
    int c = 0;
};

namespace detail {

struct Work {
    Triangle t;
    Pos center;
    double r2 = 0.0;
};

inline Work makeWork(const std::vector<Pos>& pts, int a, int b, int c) {
    Work w;
    w.t = {a, b, c};

    const Pos& pa = pts[static_cast<size_t>(a)];
    const Pos& pb = pts[static_cast<size_t>(b)];
    const Pos& pc = pts[static_cast<size_t>(c)];

    const double d = 2.0 * (pa.x * (pb.y - pc.y) + pb.x * (pc.y - pa.y) + pc.x * (pa.y - pb.y));
    if (std::abs(d) < 1e-12) {
        // Collinear: nothing can be strictly inside, never flagged as bad.
        w.center = pa;
        w.r2 = -1.0;
        return w;
    }

    const double a2 = pa.dot(pa);
    const double b2 = pb.dot(pb);
    const double c2 = pc.dot(pc);
    w.center.x = (a2 * (pb.y - pc.y) + b2 * (pc.y - pa.y) + c2 * (pa.y - pb.y)) / d;
    w.center.y = (a2 * (pc.x - pb.x) + b2 * (pa.x - pc.x) + c2 * (pb.x - pa.x)) / d;
    const Pos diff = pa - w.center;
    w.r2 = diff.dot(diff);
    return w;
}

} // namespace detail

// Triangulate `points`. Returned indices refer to `points`.
// Exact duplicates are ignored.
inline std::vector<Triangle> triangulate(const std::vector<Pos>& points) {
    std::vector<Triangle> out;
    if (points.size() < 3) return out;

    double minX = points[0].x, maxX = points[0].x;
    double minY = points[0].y, maxY = points[0].y;
    for (const Pos& p : points) {
        minX = std::min(minX, p.x);
        maxX = std::max(maxX, p.x);
        minY = std::min(minY, p.y);
        maxY = std::max(maxY, p.y);
    }
    const double span = std::max({maxX - minX, maxY - minY, 1.0});
    const double midX = 0.5 * (minX + maxX);
    const double midY = 0.5 * (minY + maxY);

    std::vector<Pos> pts = points;
    const int n = static_cast<int>(points.size());
    pts.push_back({midX - 100.0 * span, midY - 100.0 * span});
    pts.push_back({midX + 100.0 * span, midY - 100.0 * span});
    pts.push_back({midX, midY + 100.0 * span});

    std::vector<detail::Work> tris;
    tris.push_back(detail::makeWork(pts, n, n + 1, n + 2));

    std::vector<std::pair<int, int>> edges;
    std::vector<detail::Work> keep;

    for (int i = 0; i < n; ++i) {
        const Pos& p = pts[static_cast<size_t>(i)];

        edges.clear();
        keep.clear();
        keep.reserve(tris.size() + 4);

        bool duplicate = false;
        for (const detail::Work& w : tris) {
            const Pos diff = p - w.center;
            if (w.r2 >= 0.0 && diff.dot(diff) < w.r2) {
                edges.emplace_back(std::min(w.t.a, w.t.b), std::max(w.t.a, w.t.b));
                edges.emplace_back(std::min(w.t.b, w.t.c), std::max(w.t.b, w.t.c));
                edges.emplace_back(std::min(w.t.c, w.t.a), std::max(w.t.c, w.t.a));
                const int ids[3] = {w.t.a, w.t.b, w.t.c};
                for (int id : ids) {
                    const Pos d = pts[static_cast<size_t>(id)] - p;
                    if (d.dot(d) < 1e-18) duplicate = true;
                }
            } else {
                keep.push_back(w);
            }
        }
        if (duplicate || edges.empty()) continue;

        // Boundary of the cavity: edges owned by exactly one bad triangle.
        std::vector<std::pair<int, int>> sorted = edges;
        std::sort(sorted.begin(), sorted.end());
        for (const auto& e : edges) {
            const auto range = std::equal_range(sorted.begin(), sorted.end(), e);
            if (range.second - range.first != 1) continue;
            keep.push_back(detail::makeWork(pts, e.first, e.second, i));
        }
        tris.swap(keep);
    }

    out.reserve(tris.size());
    for (const detail::Work& w : tris) {
        if (w.t.a >= n || w.t.b >= n || w.t.c >= n) continue;
        out.push_back(w.t);
    }
    return out;
}

} // namespace delaunay
