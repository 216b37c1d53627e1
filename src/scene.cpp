#include "scene.hpp"
#include "patterns.hpp"

Color ColorItem::sample(RNG& rng) const {
    const Color base = shade.meanpoint(theme, distance).variate(rng, deviation);
    if (auto salted = salt.sample(rng)) return *salted;
    return base;
}

ColorItem chooseColor(const SceneCfg& cfg, RNG& rng) {
    const ThemeItem item = cfg.theme.choose(rng).value_or(ThemeItem{});

    ColorItem c;
    c.shade = Color::random(rng);
    c.deviation = item.deviation.value_or(cfg.deviation);
    c.distance = item.distance.value_or(cfg.distance);
    c.theme = item.color;
    c.salt = item.salt;
    return c;
}

Scene Scene::build(const SceneCfg& cfg, RNG& rng) {
    Scene s;
    s.regions = createRegions(cfg, rng);
    s.colors.reserve(s.regions.size());
    for (size_t k = 0; k < s.regions.size(); ++k) {
        s.colors.push_back(chooseColor(cfg, rng));
    }
    s.background = chooseColor(cfg, rng);
    return s;
}

Color Scene::color(const Pos& p, RNG& rng) const {
    for (size_t k = 0; k < regions.size() && k < colors.size(); ++k) {
        if (contains(regions[k], p)) return colors[k].sample(rng);
    }
    return background.sample(rng);
}
