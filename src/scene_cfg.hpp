#pragma once
#include "chooser.hpp"
#include "color.hpp"
#include "pos.hpp"
#include "rng.hpp"
#include "salt.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>

struct MetaConfig;

enum class TilingKind : uint8_t {
    Hexagons = 0,
    Triangles,
    HexagonsAndTriangles,
    SquaresAndTriangles,
    Rhombus,
    Delaunay,
    Pentagons,
};

constexpr int TILING_KIND_COUNT = 7;

struct Tiling {
    TilingKind kind = TilingKind::Hexagons;
    // Pentagons only: 1..6, 0 = pick one at tiling time.
    int pentagonType = 0;

    bool operator==(const Tiling& o) const { return kind == o.kind && pentagonType == o.pentagonType; }
    bool operator!=(const Tiling& o) const { return !(*this == o); }

    // Uniform over the seven families (Pentagons comes out as sub-type 0).
    static Tiling random(RNG& rng);
};

enum class Pattern : uint8_t {
    FreeCircles = 0,
    FreeTriangles,
    FreeStripes,
    FreeSpirals,
    ConcentricCircles,
    ParallelStripes,
    CrossedStripes,
    ParallelWaves,
    ParallelSawteeth,
};

constexpr int PATTERN_COUNT = 9;

// Stripe boundary jitter, in percent of the band spacing.
constexpr int MAX_STRIPE_VARIATION = 50;

Pattern randomPattern(RNG& rng);

const char* tilingName(const Tiling& t);
const char* patternName(Pattern p);

// Shape token table (short code | dotted abbreviation | full word).
// Exactly one of the outputs is set on success.
bool parseShapeToken(const std::string& token, std::optional<Tiling>& tiling, std::optional<Pattern>& pattern);

// Theme entry: color plus optional per-item deviation/distance and a salt rule.
struct ThemeItem {
    Color color;
    std::optional<int> deviation;
    std::optional<int> distance;
    Salt salt;
};

using Theme = Chooser<ThemeItem>;
using ThemeList = std::map<std::string, Theme>;

struct ShapeCombo {
    Chooser<Pattern> patterns;
    Chooser<Tiling> tilings;
};

using ShapeList = std::map<std::string, ShapeCombo>;

// Hard-coded fallbacks for every resolved field. Tests can pass their own copy.
struct SceneDefaults {
    int deviation = 20;
    int distance = 40;
    double size = 15.0;
    int width = 1000;
    int height = 600;

    int nbFreeCircles = 10;
    int nbFreeTriangles = 15;
    int nbFreeStripes = 7;
    int nbParallelStripes = 15;
    int nbConcentricCircles = 5;
    int nbCrossedStripes = 10;
    int nbFreeSpirals = 3;
    int nbParallelWaves = 15;
    int nbParallelSawteeth = 15;

    int varParallelStripes = 15;
    int varCrossedStripes = 10;

    double widthSpiral = 0.3;
    double widthStripe = 0.1;
    double widthWave = 0.3;
    double widthSawtooth = 0.3;
    double tightnessSpiral = 0.5;

    int nbDelaunay = 1000;

    double lineWidth = 1.0;
    Color lineColor{0, 0, 0};

    // Weight of theme items, shapes and time-span entries that don't give one.
    int baseWeight = 10;
};

// Explicit value, else the section-level default, else the constant.
template <typename T>
T resolveOption(const std::optional<T>& value, const std::optional<T>& parentDefault, const T& hardDefault) {
    if (value) return *value;
    if (parentDefault) return *parentDefault;
    return hardDefault;
}

// Fully resolved description of one generation.
struct SceneCfg {
    Theme theme;
    int distance = 40;
    int deviation = 20;
    Frame frame;

    Tiling tiling;
    double sizeTiling = 15.0;
    int nbDelaunay = 0;

    Pattern pattern = Pattern::FreeCircles;
    int nbPattern = 0;
    int varStripes = 0;
    double widthPattern = 0.0;
    double tightnessSpiral = 0.0;

    double lineWidth = 1.0;
    Color lineColor;
};

// Time of day (hhmm) derived from a seed; the identity for seeds that are already hhmm values.
uint64_t seedTimeOfDay(uint64_t seed);

// Turn a (possibly empty) configuration into a concrete scene description.
// Consumes `rng` in a fixed order. Configuration problems are appended to outWarnings
// and replaced by defaults; this never fails.
SceneCfg pickSceneCfg(const MetaConfig& meta, RNG& rng, uint64_t time,
                      const SceneDefaults& defaults = SceneDefaults{},
                      std::string* outWarnings = nullptr);

// Named dictionaries built from the configuration; exposed for tooling/tests.
ColorList buildColorList(const MetaConfig& meta, std::string* outWarnings = nullptr);
ThemeList buildThemeList(const MetaConfig& meta, const ColorList& colors, int baseWeight = 10,
                         std::string* outWarnings = nullptr);
ShapeList buildShapeList(const MetaConfig& meta, int baseWeight = 10, std::string* outWarnings = nullptr);
