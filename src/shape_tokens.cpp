#include "scene_cfg.hpp"

#include <array>

namespace {

struct TilingToken {
    const char* shortCode;
    const char* abbrev;
    const char* word;
    TilingKind kind;
    int pentagonType;
};

struct PatternToken {
    const char* shortCode;
    const char* abbrev;
    const char* word;
    Pattern pattern;
};

constexpr std::array<TilingToken, 13> TILING_TOKENS = {{
    {"H", "hex.", "hexagons", TilingKind::Hexagons, 0},
    {"T", "tri.", "triangles", TilingKind::Triangles, 0},
    {"H&T", "hex.&tri.", "hexagons&squares", TilingKind::HexagonsAndTriangles, 0},
    {"S&T", "squ.&tri.", "squares&triangles", TilingKind::SquaresAndTriangles, 0},
    {"R", "rho.", "rhombus", TilingKind::Rhombus, 0},
    {"D", "del.", "delaunay", TilingKind::Delaunay, 0},
    {"P", "pen.", "pentagons", TilingKind::Pentagons, 0},
    {"P1", "pen.1", "pentagons-1", TilingKind::Pentagons, 1},
    {"P2", "pen.2", "pentagons-2", TilingKind::Pentagons, 2},
    {"P3", "pen.3", "pentagons-3", TilingKind::Pentagons, 3},
    {"P4", "pen.4", "pentagons-4", TilingKind::Pentagons, 4},
    {"P5", "pen.5", "pentagons-5", TilingKind::Pentagons, 5},
    {"P6", "pen.6", "pentagons-6", TilingKind::Pentagons, 6},
}};

constexpr std::array<PatternToken, PATTERN_COUNT> PATTERN_TOKENS = {{
    {"FC", "f-cir.", "free-circles", Pattern::FreeCircles},
    {"FT", "f-tri.", "free-triangles", Pattern::FreeTriangles},
    {"FR", "f-str.", "free-stripes", Pattern::FreeStripes},
    {"FP", "f-spi.", "free-spirals", Pattern::FreeSpirals},
    {"CC", "c-cir.", "concentric-circles", Pattern::ConcentricCircles},
    {"PS", "p-str.", "parallel-stripes", Pattern::ParallelStripes},
    {"CS", "c-str.", "crossed-stripes", Pattern::CrossedStripes},
    {"PW", "p-wav.", "parallel-waves", Pattern::ParallelWaves},
    {"PT", "p-saw.", "parallel-sawteeth", Pattern::ParallelSawteeth},
}};

} // namespace

Tiling Tiling::random(RNG& rng) {
    Tiling t;
    t.kind = static_cast<TilingKind>(rng.range(0, TILING_KIND_COUNT - 1));
    t.pentagonType = 0;
    return t;
}

Pattern randomPattern(RNG& rng) {
    return static_cast<Pattern>(rng.range(0, PATTERN_COUNT - 1));
}

const char* tilingName(const Tiling& t) {
    for (const TilingToken& tok : TILING_TOKENS) {
        if (tok.kind == t.kind && tok.pentagonType == t.pentagonType) return tok.word;
    }
    return "pentagons";
}

const char* patternName(Pattern p) {
    for (const PatternToken& tok : PATTERN_TOKENS) {
        if (tok.pattern == p) return tok.word;
    }
    return "unknown";
}

bool parseShapeToken(const std::string& token, std::optional<Tiling>& tiling, std::optional<Pattern>& pattern) {
    tiling.reset();
    pattern.reset();

    for (const TilingToken& tok : TILING_TOKENS) {
        if (token == tok.shortCode || token == tok.abbrev || token == tok.word) {
            Tiling t;
            t.kind = tok.kind;
            t.pentagonType = tok.pentagonType;
            tiling = t;
            return true;
        }
    }
    for (const PatternToken& tok : PATTERN_TOKENS) {
        if (token == tok.shortCode || token == tok.abbrev || token == tok.word) {
            pattern = tok.pattern;
            return true;
        }
    }
    return false;
}
