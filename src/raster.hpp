#pragma once

#include "pos.hpp"
#include "svg.hpp"

#include <cstdint>
#include <string>
#include <vector>

// A tiny CPU-side polygon rasterizer for the background documents.
//
// This is *not* a general-purpose SVG renderer. It supports exactly what
// Document emits: opaque filled polygons with an opaque stroke, drawn in order.
// Polygons are fanned into triangles from their centroid, strokes become one
// quad per edge, and every pixel is sampled once at its center (no AA).

struct Rgba {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 255;

    bool operator==(const Rgba& o) const { return r == o.r && g == o.g && b == o.b && a == o.a; }
    bool operator!=(const Rgba& o) const { return !(*this == o); }
};

Rgba toRgba(const Color& c);

struct RasterImage {
    int w = 0;
    int h = 0;
    std::vector<Rgba> px; // row-major

    Rgba& at(int x, int y) { return px[static_cast<size_t>(y * w + x)]; }
    const Rgba& at(int x, int y) const { return px[static_cast<size_t>(y * w + x)]; }
    bool empty() const { return w <= 0 || h <= 0; }
};

struct RasterTriangle {
    Pos p0;
    Pos p1;
    Pos p2;
    Rgba c;
};

// Fill one triangle (either winding). Coordinates are in pixels; pixel (x, y)
// is sampled at (x + 0.5, y + 0.5).
void rasterTriangle(RasterImage& img, const RasterTriangle& t);

// One pixel per drawing unit, white background.
RasterImage rasterizeDocument(const Document& doc);

// 32-bit BMP through SDL surfaces.
bool saveBmp(const RasterImage& img, const std::string& path, std::string* err = nullptr);
bool loadBmp(const std::string& path, RasterImage& out, std::string* err = nullptr);
