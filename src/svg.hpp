#pragma once
#include "color.hpp"
#include "pos.hpp"

#include <string>
#include <vector>

// One closed, filled and stroked polygon.
struct Path {
    Polygon points;
    Color fill;
    Color stroke;
    double strokeWidth = 1.0;
};

// Tile outline with the line settings applied: below 0.0001 the outline takes
// the fill color (hides the seams), and no stroke is thinner than 0.1.
Path makeTilePath(const Polygon& points, const Color& fill, const Color& lineColor, double lineWidth);

struct Document {
    Frame frame;
    std::vector<Path> paths;

    void add(Path p) { paths.push_back(std::move(p)); }

    // Standalone SVG markup, one <path> per line.
    std::string toSvg() const;
};

// At most three decimals, trailing zeros removed ("12.5", "3", "-0.125").
std::string formatNumber(double v);

// Write `doc` to `dest`. The extension picks the format: ".svg" (markup) or
// ".bmp" (rasterized), optionally followed by ".tmp". Anything else is rejected.
bool saveDocument(const Document& doc, const std::string& dest, std::string* err = nullptr);
