#pragma once
#include "rng.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Axis-aligned drawing area, in abstract drawing units.
struct Frame {
    int x = 0;
    int y = 0;
    int w = 1000;
    int h = 600;

    double centerX() const { return x + w * 0.5; }
    double centerY() const { return y + h * 0.5; }
    double halfDiagonal() const { return 0.5 * std::sqrt(static_cast<double>(w) * w + static_cast<double>(h) * h); }
};

constexpr double PI = 3.14159265358979323846;

inline double radians(double deg) {
    return deg * PI / 180.0;
}

struct Pos {
    double x = 0.0;
    double y = 0.0;

    Pos() = default;
    Pos(double x_, double y_) : x(x_), y(y_) {}

    static Pos polar(double deg, double r) {
        const double t = radians(deg);
        return {r * std::cos(t), r * std::sin(t)};
    }

    // Uniform point in the frame widened by 10% on every side.
    static Pos random(const Frame& f, RNG& rng);

    double dot(const Pos& o) const { return x * o.x + y * o.y; }
    double cross(const Pos& o) const { return x * o.y - y * o.x; }
    double norm() const { return std::sqrt(x * x + y * y); }
    double dist(const Pos& o) const { return Pos(x - o.x, y - o.y).norm(); }
    Pos unit() const {
        const double n = norm();
        return n > 0.0 ? Pos(x / n, y / n) : Pos();
    }
    // Rotate counter-clockwise around the origin.
    Pos rotated(double deg) const {
        const double t = radians(deg);
        const double c = std::cos(t);
        const double s = std::sin(t);
        return {x * c - y * s, x * s + y * c};
    }

    // Nearest hundredth of a unit; equality and hashing go through this.
    std::pair<int64_t, int64_t> rounded() const {
        return {static_cast<int64_t>(std::llround(x * 100.0)), static_cast<int64_t>(std::llround(y * 100.0))};
    }

    Pos operator+(const Pos& o) const { return {x + o.x, y + o.y}; }
    Pos operator-(const Pos& o) const { return {x - o.x, y - o.y}; }
    Pos operator-() const { return {-x, -y}; }
    Pos operator*(double k) const { return {x * k, y * k}; }
    Pos& operator+=(const Pos& o) {
        x += o.x;
        y += o.y;
        return *this;
    }

    bool operator==(const Pos& o) const { return rounded() == o.rounded(); }
    bool operator!=(const Pos& o) const { return !(*this == o); }
};

struct PosHash {
    std::size_t operator()(const Pos& p) const noexcept {
        const auto r = p.rounded();
        const std::size_t a = std::hash<int64_t>()(r.first);
        const std::size_t b = std::hash<int64_t>()(r.second);
        return a ^ (b + 0x9e3779b97f4a7c15ull + (a << 6) + (a >> 2));
    }
};

// Intersection of two lines, each given by a point and a direction in degrees.
// Returns nullopt when the lines are (nearly) parallel: that is a geometry defect
// in whatever construction asked for it.
std::optional<Pos> intersect(const Pos& p1, double deg1, const Pos& p2, double deg2);

// Same, failing with "Malformed intersection" for constructions that need the point.
bool intersectOrFail(const Pos& p1, double deg1, const Pos& p2, double deg2, Pos& out, std::string* err = nullptr);

using Polygon = std::vector<Pos>;

Pos polygonCentroid(const Polygon& poly);
double polygonSignedArea(const Polygon& poly);
bool pointInPolygon(const Pos& p, const Polygon& poly);
