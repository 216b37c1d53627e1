#pragma once
#include "color.hpp"
#include "rng.hpp"

#include <optional>
#include <vector>

// One speckle rule: with probability `likeliness` the element takes `color`
// (jittered by `variability`) instead of its computed shade.
struct SaltItem {
    Color color;
    double likeliness = 1.0;
    int variability = 0;
};

struct Salt {
    std::vector<SaltItem> items;

    static Salt none() { return {}; }
    bool empty() const { return items.empty(); }

    // Entries are tried in order; each costs one draw, a hit costs the jitter draws too.
    std::optional<Color> sample(RNG& rng) const {
        for (const SaltItem& it : items) {
            if (rng.next01() < it.likeliness) {
                return it.color.variate(rng, it.variability);
            }
        }
        return std::nullopt;
    }
};
