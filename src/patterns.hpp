#pragma once
#include "region.hpp"
#include "rng.hpp"
#include "scene_cfg.hpp"

#include <vector>

// Decorative regions for cfg.pattern, in the order the scene tests them.
// Uses cfg.nbPattern, cfg.widthPattern, cfg.varStripes and cfg.tightnessSpiral
// as the family requires. A non-positive count yields no region.
std::vector<Region> createRegions(const SceneCfg& cfg, RNG& rng);

// Individual families, exposed for tests.
std::vector<Region> freeCircles(const Frame& f, int nb, RNG& rng);
std::vector<Region> freeTriangles(const Frame& f, int nb, RNG& rng);
std::vector<Region> freeStripes(const Frame& f, int nb, double width, RNG& rng);
std::vector<Region> freeSpirals(const Frame& f, int nb, double width, double tightness, RNG& rng);
std::vector<Region> concentricCircles(const Frame& f, int nb, RNG& rng);
std::vector<Region> parallelStripes(const Frame& f, int nb, int var, RNG& rng);
std::vector<Region> crossedStripes(const Frame& f, int nb, int var, RNG& rng);
std::vector<Region> parallelWaves(const Frame& f, int nb, double width, RNG& rng);
std::vector<Region> parallelSawteeth(const Frame& f, int nb, double width, RNG& rng);
