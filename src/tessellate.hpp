#pragma once
#include "pos.hpp"
#include "rng.hpp"
#include "scene_cfg.hpp"

#include <string>
#include <vector>

// One cell of a tessellation. The anchor is the point used to look up the
// tile's color; for every family it is the polygon centroid.
struct Tile {
    Pos anchor;
    Polygon polygon;
};

// A periodic tiling: the polygons of one fundamental cell (around the origin,
// unrotated) plus the two lattice vectors that repeat it.
struct Motif {
    std::vector<Polygon> polygons;
    Pos u;
    Pos v;
};

// Canonical motifs. `s` is the characteristic size of the family.
Motif hexagonMotif(double s);
Motif triangleMotif(double s);
Motif hexagonTriangleMotif(double s);
Motif squareTriangleMotif(double s);
Motif rhombusMotif(double s, double shortFactor);

// Pentagon sub-types 1..6. Fails when a construction line pair is degenerate.
bool pentagonMotif(int type, double s, Motif& out, std::string* err = nullptr);

// Repeat `motif` rotated by `rotDeg` over `frame`. Tiles whose anchor lies in
// the frame widened by twice the largest tile radius are appended; anchors
// that round to an already emitted one are skipped.
bool fillPeriodic(const Frame& frame, const Motif& motif, double rotDeg, std::vector<Tile>& out,
                  std::string* err = nullptr);

// `nbPoints` random points in the widened frame plus its corners, triangulated.
void fillDelaunay(const Frame& frame, int nbPoints, RNG& rng, std::vector<Tile>& out);

// Build the tiling described by cfg (family, size or point count).
// Consumes rng in a fixed order per family. Returns false (with err) on a
// geometry defect; out is left empty then.
bool makeTiling(const SceneCfg& cfg, RNG& rng, std::vector<Tile>& out, std::string* err = nullptr);
