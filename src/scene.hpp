#pragma once
#include "color.hpp"
#include "region.hpp"
#include "rng.hpp"
#include "salt.hpp"
#include "scene_cfg.hpp"

#include <vector>

// Color recipe of one decorative element. Drawn once when the scene is built.
struct ColorItem {
    Color shade;
    int deviation = 0;
    int distance = 0;
    Color theme;
    Salt salt;

    // meanpoint toward the theme color, jitter, then salt.
    Color sample(RNG& rng) const;
};

// Weighted theme draw (black when the theme is empty) plus a fresh random shade.
ColorItem chooseColor(const SceneCfg& cfg, RNG& rng);

struct Scene {
    std::vector<Region> regions;
    std::vector<ColorItem> colors; // parallel to regions
    ColorItem background;

    // Regions first, then one color item per region, then the background item.
    static Scene build(const SceneCfg& cfg, RNG& rng);

    // The first region (in generation order) containing p decides; otherwise the background.
    Color color(const Pos& p, RNG& rng) const;
};
