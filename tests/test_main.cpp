#include "blurhash.hpp"
#include "chooser.hpp"
#include "color.hpp"
#include "gen_image.hpp"
#include "meta_config.hpp"
#include "meta_doc.hpp"
#include "patterns.hpp"
#include "pos.hpp"
#include "raster.hpp"
#include "region.hpp"
#include "rng.hpp"
#include "salt.hpp"
#include "scene.hpp"
#include "scene_cfg.hpp"
#include "svg.hpp"
#include "tessellate.hpp"

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

namespace {

int failures = 0;

void expect(bool cond, const std::string& msg) {
    if (!cond) {
        ++failures;
        std::cerr << "[FAIL] " << msg << "\n";
    }
}

bool hasText(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

// Walks a dotted key path ("data.tilings.size_hex").
const MetaValue* lookup(const MetaValue& doc, const std::string& dotted) {
    const MetaValue* cur = &doc;
    size_t start = 0;
    while (cur) {
        const size_t dot = dotted.find('.', start);
        cur = cur->find(dotted.substr(start, dot == std::string::npos ? std::string::npos : dot - start));
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return cur;
}

std::string readFile(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

SceneCfg resolve(const std::string& doc, uint64_t seed, uint64_t time, std::string* warnings = nullptr) {
    std::string parseWarnings;
    const MetaConfig meta = parseMetaConfig(doc, &parseWarnings);
    expect(parseWarnings.empty(), "unexpected config warnings: " + parseWarnings);
    RNG rng(seed);
    return pickSceneCfg(meta, rng, time, SceneDefaults{}, warnings);
}

void test_rng_reproducible() {
    RNG a(7u);
    RNG b(7u);
    for (int i = 0; i < 100; ++i) {
        expect(a.nextU64() == b.nextU64(), "RNG streams with the same seed diverged at " + std::to_string(i));
    }

    RNG c(8u);
    RNG d(7u);
    expect(c.nextU64() != d.nextU64(), "RNG seeds 7 and 8 gave the same first value");

    RNG rng(123u);
    for (int i = 0; i < 1000; ++i) {
        const int r = rng.range(-3, 7);
        expect(r >= -3 && r <= 7, "RNG range() out of bounds");
        const double f = rng.next01();
        expect(f >= 0.0 && f < 1.0, "RNG next01() out of [0,1)");
    }
    expect(rng.range(5, 5) == 5, "range(5,5) should be 5");
}

void test_seed_time_of_day() {
    expect(seedTimeOfDay(1430) == 1430, "hhmm seeds map to themselves");
    expect(seedTimeOfDay(0) == 0, "seed 0 is midnight");
    expect(seedTimeOfDay(2575) == 115, "seed 2575 should project to 01:15");
    for (uint64_t s = 0; s < 100000; s += 37) {
        const uint64_t t = seedTimeOfDay(s);
        expect(t < 2400 && t % 100 < 60, "seedTimeOfDay produced an invalid time");
    }
}

void test_geometry_basics() {
    const auto hit = intersect(Pos(0, 0), 0.0, Pos(3, 5), 90.0);
    expect(hit.has_value(), "perpendicular lines should intersect");
    if (hit) expect(std::abs(hit->x - 3.0) < 1e-9 && std::abs(hit->y) < 1e-9, "intersection should be (3,0)");

    expect(!intersect(Pos(0, 0), 0.0, Pos(0, 1), 0.1).has_value(), "nearly parallel lines must not intersect");
    expect(!intersect(Pos(0, 0), 30.0, Pos(0, 1), 210.0).has_value(), "opposite directions are parallel too");

    Pos at;
    std::string err;
    expect(!intersectOrFail(Pos(0, 0), 45.0, Pos(2, 0), 45.2, at, &err), "parallel construction lines fail");
    expect(err == "Malformed intersection", "parallel construction error: " + err);
    expect(intersectOrFail(Pos(0, 0), 0.0, Pos(3, 5), 90.0, at, &err) && std::abs(at.x - 3.0) < 1e-9,
           "crossing construction lines give the point");

    expect(Pos(1.001, 2.0) == Pos(1.0, 2.0), "positions equal to a hundredth compare equal");
    expect(Pos(1.02, 2.0) != Pos(1.0, 2.0), "positions further apart compare different");
    expect(PosHash()(Pos(1.001, 2.0)) == PosHash()(Pos(1.0, 2.0)), "equal positions hash alike");

    const Polygon square = {{0, 0}, {1, 0}, {1, 1}, {0, 1}};
    expect(std::abs(std::abs(polygonSignedArea(square)) - 1.0) < 1e-12, "unit square area");
    const Pos c = polygonCentroid(square);
    expect(std::abs(c.x - 0.5) < 1e-12 && std::abs(c.y - 0.5) < 1e-12, "unit square centroid");
    expect(pointInPolygon({0.5, 0.5}, square), "center is inside");
    expect(pointInPolygon({0.0, 0.5}, square), "edges count as inside");
    expect(!pointInPolygon({1.5, 0.5}, square), "outside point");

    const Frame f{0, 0, 100, 50};
    RNG rng(3u);
    for (int i = 0; i < 500; ++i) {
        const Pos p = Pos::random(f, rng);
        expect(p.x >= -10.0 && p.x <= 110.0 && p.y >= -5.0 && p.y <= 55.0, "Pos::random outside widened frame");
    }
}

void test_chooser() {
    RNG rng(11u);

    Chooser<int> empty;
    const uint64_t before = rng.state;
    expect(!empty.choose(rng).has_value(), "empty chooser should give nothing");
    expect(rng.state == before, "empty chooser must not consume the stream");

    Chooser<int> zero;
    zero.push(1, 0);
    zero.push(2, 0);
    expect(!zero.choose(rng).has_value(), "all-zero weights should give nothing");

    Chooser<char> ch;
    ch.push('a', 1);
    ch.push('b', 3);
    int hitsA = 0;
    const int n = 40000;
    for (int i = 0; i < n; ++i) {
        const auto v = ch.choose(rng);
        expect(v.has_value(), "weighted chooser should always pick");
        if (v && *v == 'a') ++hitsA;
    }
    const double freq = static_cast<double>(hitsA) / n;
    expect(freq > 0.23 && freq < 0.27, "weight 1 of 4 should be picked about a quarter of the time");

    Chooser<char> first;
    first.push('x', 1);
    Chooser<char> second;
    second.push('y', 2);
    first.append(second.extract());
    expect(first.size() == 2, "append should add entries");
    expect(first.entries()[0].first == 'x' && first.entries()[1].first == 'y', "append keeps insertion order");
    expect(first.totalWeight() == 3, "total weight after append");

    Chooser<char> skipZero;
    skipZero.push('z', 0);
    skipZero.push('w', 5);
    for (int i = 0; i < 50; ++i) {
        expect(skipZero.choose(rng) == 'w', "zero-weight entries are never chosen");
    }
}

void test_color() {
    expect(Color(0, 0, 0).meanpoint(Color(200, 100, 50), 50) == Color(100, 50, 25), "meanpoint halfway");
    expect(Color(10, 20, 30).meanpoint(Color(200, 100, 50), 0) == Color(10, 20, 30), "meanpoint 0 keeps the color");
    expect(Color(10, 20, 30).meanpoint(Color(200, 100, 50), 100) == Color(200, 100, 50), "meanpoint 100 is the target");

    expect(Color(-5, 300, 10).validated() == Color(0, 255, 10), "validated clamps channels");
    expect(Color(-5, 300, 10).svg() == "rgb(0,255,10)", "svg() is clamped");

    RNG rng(5u);
    for (int i = 0; i < 200; ++i) {
        const Color c = Color::random(rng);
        expect(c.r >= 0 && c.r <= 254 && c.g >= 0 && c.g <= 254 && c.b >= 0 && c.b <= 254, "random color out of range");
        const Color v = Color(100, 5, 200).variate(rng, 10);
        expect(v.r >= 90 && v.r <= 109, "variate red out of range");
        expect(v.g >= 0 && v.g <= 14, "variate green out of range");
        expect(v.b >= 190 && v.b <= 209, "variate blue out of range");
    }
    const uint64_t before = rng.state;
    expect(Color(1, 2, 3).variate(rng, 0) == Color(1, 2, 3), "variate 0 is the identity");
    expect(rng.state == before, "variate 0 draws nothing");

    ColorList dict;
    dict["sky"] = Color(1, 2, 3);
    expect(parseColorString("#0A0B0C", dict) == Color(10, 11, 12), "hex color");
    expect(parseColorString("sky", dict) == Color(1, 2, 3), "named color");
    expect(!parseColorString("#GG0000", dict).has_value(), "bad hex digits");
    expect(!parseColorString("#123", dict).has_value(), "short hex");
    expect(!parseColorString("nowhere", dict).has_value(), "unknown name");
}

void test_salt() {
    RNG rng(9u);
    Salt always;
    always.items.push_back({Color(1, 2, 3), 1.0, 0});
    Salt never;
    never.items.push_back({Color(1, 2, 3), 0.0, 0});

    for (int i = 0; i < 50; ++i) {
        expect(always.sample(rng) == Color(1, 2, 3), "likeliness 1 always hits");
        expect(!never.sample(rng).has_value(), "likeliness 0 never hits");
    }
    expect(Salt::none().empty(), "none() is empty");

    Salt jittered;
    jittered.items.push_back({Color(100, 100, 100), 1.0, 8});
    bool moved = false;
    for (int i = 0; i < 50; ++i) {
        const std::optional<Color> c = jittered.sample(rng);
        expect(c.has_value(), "jittered salt still hits");
        if (!c) continue;
        expect(c->r >= 92 && c->r <= 107 && c->g >= 92 && c->g <= 107 && c->b >= 92 && c->b <= 107,
               "salt jitter stays within its variability");
        moved = moved || !(*c == Color(100, 100, 100));
    }
    expect(moved, "salt variability changes the color");

    // Entries are tried in declaration order: a miss on the first one costs one draw.
    Salt ordered;
    ordered.items.push_back({Color(255, 0, 0), 0.0, 0});
    ordered.items.push_back({Color(0, 0, 200), 1.0, 6});
    ordered.items.push_back({Color(0, 255, 0), 1.0, 0});
    RNG seq(44u);
    RNG replay(44u);
    const std::optional<Color> got = ordered.sample(seq);
    replay.next01();
    replay.next01();
    const Color want = Color(0, 0, 200).variate(replay, 6);
    expect(got && *got == want, "second salt entry wins after the first misses");
    expect(seq.state == replay.state, "salt draws one roll per tried entry, then the jitter");

    const MetaConfig doc = parseMetaConfig(
        "[themes]\n"
        "T = [{ color = \"#102030\", salt = [{ color = \"#FF0000\", likeliness = 0.25, variability = 8 },"
        " { color = \"#00FF00\" }] }]\n");
    const ThemeList themes = buildThemeList(doc, buildColorList(doc));
    expect(themes.count("T") && themes.at("T").size() == 1, "theme with salt exists");
    if (themes.count("T") && themes.at("T").size() == 1) {
        const Salt& salt = themes.at("T").entries()[0].first.salt;
        expect(salt.items.size() == 2, "both salt entries are kept");
        if (salt.items.size() == 2) {
            expect(salt.items[0].color == Color(255, 0, 0) && salt.items[1].color == Color(0, 255, 0),
                   "salt entries keep declaration order");
            expect(std::abs(salt.items[0].likeliness - 0.25) < 1e-12 && salt.items[0].variability == 8,
                   "salt likeliness and variability are read");
            expect(std::abs(salt.items[1].likeliness - 1.0) < 1e-12 && salt.items[1].variability == 0,
                   "salt defaults: likeliness 1, variability 0");
        }
    }
}

void test_meta_doc_parse() {
    const std::string text =
        "# comment\n"
        "title = 'literal \\n'\n"
        "[global]\n"
        "deviation = 1_000\n"
        "size = 2.5e1\n"
        "flag = true\n"
        "\"quoted key\" = \"a\\tb\"\n"
        "[data.tilings]\n"
        "size_hex = 12.0 # trailing comment\n"
        "[colors]\n"
        "list = [\n"
        "  1,\n"
        "  2,\n"
        "]\n"
        "inline = { r = 1, g = [2, 3] }\n"
        "a.b = 4\n"
        "[[entry]]\n"
        "span = \"0-1200\"\n"
        "[[entry]]\n"
        "span = \"1200-2400\"\n";

    MetaValue doc;
    std::string err;
    expect(parseMetaDoc(text, doc, &err), "document should parse: " + err);

    const MetaValue* title = doc.find("title");
    expect(title && title->isString() && title->str == "literal \\n", "literal strings keep backslashes");

    const MetaValue* dev = lookup(doc, "global.deviation");
    expect(dev && dev->kind == MetaKind::Integer && dev->i == 1000, "underscores in integers");
    const MetaValue* size = lookup(doc, "global.size");
    expect(size && size->kind == MetaKind::Float && std::abs(size->f - 25.0) < 1e-12, "exponent float");
    const MetaValue* flag = lookup(doc, "global.flag");
    expect(flag && flag->kind == MetaKind::Boolean && flag->b, "boolean");
    const MetaValue* quoted = lookup(doc, "global.quoted key");
    expect(quoted && quoted->str == "a\tb", "quoted key and escape");

    const MetaValue* sizeHex = lookup(doc, "data.tilings.size_hex");
    expect(sizeHex && std::abs(sizeHex->asDouble() - 12.0) < 1e-12, "nested header");

    const MetaValue* list = lookup(doc, "colors.list");
    expect(list && list->isArray() && list->arr.size() == 2, "multi-line array with trailing comma");
    const MetaValue* g = lookup(doc, "colors.inline.g");
    expect(g && g->isArray() && g->arr.size() == 2, "inline table with array");
    const MetaValue* ab = lookup(doc, "colors.a.b");
    expect(ab && ab->i == 4, "dotted key");

    const MetaValue* entries = doc.find("entry");
    expect(entries && entries->isArray() && entries->arr.size() == 2, "array of tables");
    if (entries && entries->arr.size() == 2) {
        const MetaValue* span = entries->arr[1].find("span");
        expect(span && span->str == "1200-2400", "second [[entry]] keeps its own keys");
    }
}

void test_meta_doc_errors() {
    MetaValue doc;
    std::string err;

    expect(!parseMetaDoc("a = 1\na = 2\n", doc, &err), "duplicate key must fail");
    expect(hasText(err, "Line 2") && hasText(err, "Duplicate"), "duplicate key error: " + err);
    expect(doc.isTable() && doc.keys.empty(), "failed parse resets the output");

    err.clear();
    expect(!parseMetaDoc("x = 1\ny = \"open\n", doc, &err), "unterminated string must fail");
    expect(err.rfind("Line 2", 0) == 0, "error should point at line 2: " + err);

    err.clear();
    expect(!parseMetaDoc("[global\n", doc, &err), "broken header must fail");
    expect(err.rfind("Line 1", 0) == 0, "error should point at line 1: " + err);

    err.clear();
    expect(!parseMetaDoc("t = { a = 1, b = }\n", doc, &err), "inline table with a missing value must fail");
    expect(err.rfind("Line 1", 0) == 0, "inline table error points at line 1: " + err);

    err.clear();
    expect(!parseMetaDoc("t = { a = 1 b = 2 }\n", doc, &err), "inline table without a comma must fail");

    err.clear();
    expect(!parseMetaDoc("t = [1, 2\n", doc, &err), "truncated array must fail");
    expect(hasText(err, "Unterminated array"), "truncated array error: " + err);

    err.clear();
    std::string nested = "ok = [";
    for (int k = 0; k < 63; ++k) nested += "[";
    for (int k = 0; k < 64; ++k) nested += "]";
    expect(parseMetaDoc(nested + "\n", doc, &err), "64 nested arrays are accepted: " + err);

    err.clear();
    expect(!parseMetaDoc("a = " + std::string(10000, '[') + "\n", doc, &err), "deep array nesting must fail");
    expect(hasText(err, "Nesting too deep"), "deep nesting error: " + err);

    err.clear();
    std::string braces = "a = ";
    for (int k = 0; k < 10000; ++k) braces += "{ b = ";
    expect(!parseMetaDoc(braces + "\n", doc, &err), "deep inline table nesting must fail");
    expect(hasText(err, "Nesting too deep"), "deep inline table error: " + err);

    std::string warnings;
    const MetaConfig deep = parseMetaConfig("[global]\nsize = 9\na = " + std::string(500000, '[') + "\n", &warnings);
    expect(hasText(warnings, "Nesting too deep"), "deeply nested config warns: " + warnings);
    expect(!deep.global, "deeply nested config yields defaults");

    warnings.clear();
    const MetaConfig cfg = parseMetaConfig("width = = 3\n", &warnings);
    expect(hasText(warnings, "config: Line 1"), "unparsable config warns: " + warnings);
    expect(!cfg.global && !cfg.colors && cfg.entries.empty(), "unparsable config yields defaults");

    warnings.clear();
    const MetaConfig missing = loadMetaConfig("/nonexistent/backdrop/config.toml", &warnings);
    expect(hasText(warnings, "Could not open"), "missing config warns: " + warnings);
    expect(!missing.global, "missing config yields defaults");
}

void test_meta_config_typed() {
    std::string warnings;
    const MetaConfig cfg = parseMetaConfig(
        "[global]\n"
        "deviation = \"lots\"\n"
        "distance = -4\n"
        "size = 7\n"
        "[[entry]]\n"
        "themes = [\"a\", 3]\n",
        &warnings);

    expect(hasText(warnings, "global.deviation: Expected a number"), "wrong type warns: " + warnings);
    expect(hasText(warnings, "global.distance"), "negative integer warns: " + warnings);
    expect(cfg.global && !cfg.global->deviation && !cfg.global->distance, "bad values are skipped");
    expect(cfg.global && cfg.global->size && std::abs(*cfg.global->size - 7.0) < 1e-12, "integers read as doubles");
    expect(cfg.entries.size() == 1 && cfg.entries[0].themes.size() == 1, "non-string theme names are dropped");

    warnings.clear();
    const MetaConfig huge = parseMetaConfig(
        "[global]\nsize = 1e999\nwidth = -1e999\ndeviation = 1e999\n"
        "[lines]\nwidth = 1e999\n"
        "[data.patterns]\nwidth_stripe = -1e999\n",
        &warnings);
    expect(hasText(warnings, "global.size: Expected a finite number"), "infinite size warns: " + warnings);
    expect(hasText(warnings, "global.width: Expected a finite number"), "infinite width warns: " + warnings);
    expect(hasText(warnings, "global.deviation: Expected a finite number"), "infinite count warns: " + warnings);
    expect(hasText(warnings, "lines.width: Expected a finite number"), "infinite line width warns: " + warnings);
    expect(hasText(warnings, "data.patterns.width_stripe"), "infinite stripe width warns: " + warnings);
    expect(huge.global && !huge.global->size && !huge.global->width && !huge.global->deviation,
           "non-finite globals are skipped");
    expect(huge.lines && !huge.lines->base.width, "non-finite line width is skipped");

    warnings.clear();
    const MetaConfig big = parseMetaConfig("[global]\ndistance = 1e300\n", &warnings);
    expect(warnings.empty(), "large finite counts are accepted: " + warnings);
    expect(big.global && big.global->distance && *big.global->distance == 1000000000, "large counts are capped");
}

void test_resolver_defaults() {
    std::string warnings;
    const SceneCfg cfg = resolve("", 1430u, seedTimeOfDay(1430u), &warnings);
    const SceneDefaults d;

    expect(warnings.empty(), "empty document should not warn: " + warnings);
    expect(cfg.deviation == 20 && cfg.distance == 40, "default deviation/distance");
    expect(cfg.frame.x == 0 && cfg.frame.y == 0 && cfg.frame.w == 1000 && cfg.frame.h == 600, "default frame");
    expect(std::abs(cfg.lineWidth - 1.0) < 1e-12 && cfg.lineColor == Color(0, 0, 0), "default lines");
    expect(cfg.theme.size() == 1 && cfg.theme.totalWeight() == d.baseWeight, "fallback theme has one item");

    const int tk = static_cast<int>(cfg.tiling.kind);
    const int pk = static_cast<int>(cfg.pattern);
    expect(tk >= 0 && tk < TILING_KIND_COUNT, "tiling family in range");
    expect(pk >= 0 && pk < PATTERN_COUNT, "pattern family in range");
    if (cfg.tiling.kind == TilingKind::Delaunay) {
        expect(cfg.nbDelaunay == d.nbDelaunay, "default Delaunay point count");
    } else {
        expect(std::abs(cfg.sizeTiling - d.size) < 1e-12, "default tile size");
    }
    expect(cfg.nbPattern > 0, "default pattern count");

    const SceneCfg again = resolve("", 1430u, 1430u);
    expect(again.tiling == cfg.tiling && again.pattern == cfg.pattern, "resolution is deterministic");
}

void test_resolver_explicit_document() {
    const std::string doc =
        "[global]\n"
        "deviation = 7\n"
        "distance = 55\n"
        "size = 22.5\n"
        "width = 640\n"
        "height = 480\n"
        "[lines]\n"
        "width = 0.5\n"
        "color = \"#102030\"\n"
        "hex_width = 2.0\n"
        "hex_color = \"blue\"\n"
        "[colors]\n"
        "blue = \"#0000FF\"\n"
        "red = [255, 0, 0]\n"
        "[themes]\n"
        "warm = [\"red x3 ~5 !60\", \"blue\"]\n"
        "[shapes]\n"
        "only = [[\"H\", 1], [\"PS\", 1]]\n"
        "[data.patterns]\n"
        "nb_parallel_stripes = 9\n"
        "var_parallel_stripes = 4\n"
        "[data.tilings]\n"
        "size_hex = 12.0\n"
        "[[entry]]\n"
        "span = \"0-2400\"\n"
        "themes = [\"warm\"]\n"
        "shapes = [\"only\"]\n";

    std::string warnings;
    const SceneCfg cfg = resolve(doc, 42u, 900u, &warnings);
    expect(warnings.empty(), "explicit document should not warn: " + warnings);

    expect(cfg.deviation == 7 && cfg.distance == 55, "explicit deviation/distance");
    expect(cfg.frame.w == 640 && cfg.frame.h == 480, "explicit frame");
    expect(cfg.tiling.kind == TilingKind::Hexagons, "explicit tiling");
    expect(cfg.pattern == Pattern::ParallelStripes, "explicit pattern");
    expect(cfg.nbPattern == 9 && cfg.varStripes == 4, "explicit pattern parameters");
    expect(std::abs(cfg.sizeTiling - 12.0) < 1e-12, "per-family size wins over global size");
    expect(std::abs(cfg.lineWidth - 2.0) < 1e-12, "per-family line width wins");
    expect(cfg.lineColor == Color(0, 0, 255), "per-family line color via the dictionary");

    expect(cfg.theme.size() == 2, "theme has two items");
    if (cfg.theme.size() == 2) {
        const auto& e0 = cfg.theme.entries()[0];
        expect(e0.first.color == Color(255, 0, 0) && e0.second == 3, "first item red x3");
        expect(e0.first.deviation == 5 && e0.first.distance == 60, "~ and ! tokens");
        const auto& e1 = cfg.theme.entries()[1];
        expect(e1.first.color == Color(0, 0, 255) && e1.second == SceneDefaults{}.baseWeight, "second item blue, base weight");
        expect(!e1.first.deviation && !e1.first.distance, "no per-item overrides without tokens");
    }

    // Without a per-family key the section-wide line settings apply.
    const SceneCfg tri = resolve(
        "[lines]\nwidth = 0.5\ncolor = \"#102030\"\n[shapes]\ns = [\"T\"]\n[[entry]]\nshapes = [\"s\"]\n", 1u, 100u);
    expect(tri.tiling.kind == TilingKind::Triangles, "single tiling shape");
    expect(std::abs(tri.lineWidth - 0.5) < 1e-12 && tri.lineColor == Color(16, 32, 48), "section-wide lines");

    // An invalid per-family color falls back to the section-wide one, not straight to the default.
    std::string lineWarn;
    const SceneCfg hex = resolve(
        "[lines]\ncolor = \"#123456\"\nhex_color = \"bogus\"\n[shapes]\ns = [\"H\"]\n[[entry]]\nshapes = [\"s\"]\n",
        1u, 100u, &lineWarn);
    expect(hex.tiling.kind == TilingKind::Hexagons, "single hexagon shape");
    expect(hex.lineColor == Color(0x12, 0x34, 0x56), "bad per-family line color uses lines.color");
    expect(hasText(lineWarn, "'bogus' is not a valid line color"), "bad per-family line color warns: " + lineWarn);

    lineWarn.clear();
    const SceneCfg both = resolve(
        "[lines]\ncolor = \"nope\"\nhex_color = \"bogus\"\n[shapes]\ns = [\"H\"]\n[[entry]]\nshapes = [\"s\"]\n",
        1u, 100u, &lineWarn);
    expect(both.lineColor == Color(0, 0, 0), "both line colors invalid gives the default");
    expect(hasText(lineWarn, "'bogus'") && hasText(lineWarn, "'nope'"), "each rejected line color warns: " + lineWarn);
}

void test_resolver_dictionaries() {
    const MetaConfig a = parseMetaConfig("[colors]\nA = \"#FF0000\"\n[themes]\nT = \"A x5\"\n");
    const ColorList colors = buildColorList(a);
    const ThemeList themes = buildThemeList(a, colors);
    expect(themes.count("T") == 1, "theme T exists");
    if (themes.count("T")) {
        const Theme& t = themes.at("T");
        expect(t.size() == 1, "theme T has one item");
        expect(t.size() == 1 && t.entries()[0].first.color == Color(255, 0, 0) && t.entries()[0].second == 5,
               "theme T is red with weight 5");
    }

    const MetaConfig s = parseMetaConfig("[shapes]\nS = [[\"H\", 3], [\"FC\", 1]]\n");
    const ShapeList shapes = buildShapeList(s);
    expect(shapes.count("S") == 1, "shape S exists");
    if (shapes.count("S")) {
        const ShapeCombo& c = shapes.at("S");
        expect(c.tilings.size() == 1 && c.tilings.entries()[0].first.kind == TilingKind::Hexagons
                   && c.tilings.entries()[0].second == 3,
               "tilings of S: hexagons x3");
        expect(c.patterns.size() == 1 && c.patterns.entries()[0].first == Pattern::FreeCircles
                   && c.patterns.entries()[0].second == 1,
               "patterns of S: free circles x1");
    }

    const MetaConfig refs = parseMetaConfig(
        "[themes]\nbase = [\"#FF0000 x2\"]\ncombo = [\"base\", \"#00FF00\"]\ncopy = \"base\"\n");
    const ThemeList rt = buildThemeList(refs, buildColorList(refs));
    expect(rt.count("combo") && rt.at("combo").size() == 2, "theme references are flattened");
    if (rt.count("combo") && rt.at("combo").size() == 2) {
        expect(rt.at("combo").entries()[0].first.color == Color(255, 0, 0)
                   && rt.at("combo").entries()[0].second == 2,
               "referenced items keep their weights");
    }
    expect(rt.count("copy") && rt.at("copy").size() == 1, "bare theme name copies the theme");
    if (rt.count("copy") && rt.at("copy").size() == 1) {
        expect(rt.at("copy").entries()[0].first.color == Color(255, 0, 0), "copied theme keeps its colors");
    }

    const MetaConfig shapeRefs = parseMetaConfig("[shapes]\na = [\"H\", \"FC\"]\nb = [\"a\", \"P3\"]\n");
    const ShapeList sr = buildShapeList(shapeRefs);
    expect(sr.count("b") && sr.at("b").tilings.size() == 2 && sr.at("b").patterns.size() == 1, "shape references");
    if (sr.count("b") && sr.at("b").tilings.size() == 2) {
        const Tiling pen = sr.at("b").tilings.entries()[1].first;
        expect(pen.kind == TilingKind::Pentagons && pen.pentagonType == 3, "P3 token");
    }
}

void test_resolver_warnings() {
    std::string warnings;
    const MetaConfig bad = parseMetaConfig(
        "[colors]\nbad = \"#GG0000\"\nok = \"#010203\"\n"
        "[themes]\nt = \"nocolor x4\"\n"
        "[shapes]\ns = [\"ZZ\", \"H\"]\nn = 5\n",
        &warnings);
    expect(warnings.empty(), "document itself is fine: " + warnings);

    RNG rng(1u);
    pickSceneCfg(bad, rng, 0u, SceneDefaults{}, &warnings);
    expect(hasText(warnings, "colors.bad:"), "bad color warns: " + warnings);
    expect(!hasText(warnings, "colors.ok:"), "good color does not warn");
    expect(hasText(warnings, "themes.t:") && hasText(warnings, "'nocolor' is not a color"), "bad theme color warns");
    expect(hasText(warnings, "'ZZ' is not recognized"), "bad shape token warns");
    expect(hasText(warnings, "shapes.n:"), "non-array shape warns");

    const ColorList colors = buildColorList(bad);
    expect(colors.count("bad") == 0 && colors.count("ok") == 1, "invalid colors are dropped");
    const ThemeList themes = buildThemeList(bad, colors);
    expect(themes.count("t") && themes.at("t").size() == 1 && themes.at("t").entries()[0].second == 4,
           "item with a bad color is kept with its weight");
    if (themes.count("t") && themes.at("t").size() == 1) {
        expect(themes.at("t").entries()[0].first.color == Color(0, 0, 0), "bad color falls back to black");
    }

    std::string many;
    for (int i = 0; i < 40; ++i) many += "c" + std::to_string(100 + i) + " = \"nope\"\n";
    std::string capped;
    buildColorList(parseMetaConfig("[colors]\n" + many), &capped);
    expect(hasText(capped, "(more warnings omitted...)"), "warnings are capped");

    std::string sizeWarn;
    const MetaConfig hugeSize = parseMetaConfig("[global]\nsize = 1e999\n[shapes]\nS = [\"H\", \"FC\"]\n"
                                                "[[entry]]\nshapes = [\"S\"]\n", &sizeWarn);
    expect(hasText(sizeWarn, "global.size"), "infinite size is reported: " + sizeWarn);
    RNG sizeRng(8u);
    const SceneCfg sized = pickSceneCfg(hugeSize, sizeRng, 0u, SceneDefaults{}, &sizeWarn);
    expect(sized.tiling.kind == TilingKind::Hexagons, "shape S picks hexagons");
    expect(std::abs(sized.sizeTiling - SceneDefaults{}.size) < 1e-12, "infinite size falls back to the default");
    std::vector<Tile> sizedTiles;
    RNG tileRng(8u);
    expect(makeTiling(sized, tileRng, sizedTiles) && !sizedTiles.empty(), "fallback size still tiles the frame");

    MetaConfig direct = parseMetaConfig("[shapes]\nS = [\"H\"]\n[[entry]]\nshapes = [\"S\"]\n");
    direct.tilings = TilingsSection{};
    direct.tilings->sizeHex = std::numeric_limits<double>::infinity();
    std::string directWarn;
    RNG directRng(3u);
    const SceneCfg fixed = pickSceneCfg(direct, directRng, 0u, SceneDefaults{}, &directWarn);
    expect(fixed.tiling.kind == TilingKind::Hexagons, "shape S is hexagons only");
    expect(hasText(directWarn, "data.tilings"), "infinite tile size warns: " + directWarn);
    expect(std::abs(fixed.sizeTiling - SceneDefaults{}.size) < 1e-12, "infinite tile size resolves to the default");

    std::string varWarn;
    const SceneCfg wide = resolve("[data.patterns]\nvar_parallel_stripes = 90\nvar_crossed_stripes = 90\n"
                                  "[shapes]\nS = [\"H\", \"PS\"]\n[[entry]]\nshapes = [\"S\"]\n",
                                  5u, 0u, &varWarn);
    expect(wide.pattern == Pattern::ParallelStripes, "shape S picks parallel stripes");
    expect(wide.varStripes == MAX_STRIPE_VARIATION, "stripe variation is clamped");
    expect(hasText(varWarn, "data.patterns:"), "clamped stripe variation warns: " + varWarn);

    std::string frameWarn;
    const SceneCfg zero = resolve("[global]\nwidth = 0\n", 2u, 0u, &frameWarn);
    expect(zero.frame.w == 1000 && zero.frame.h == 600, "invalid frame falls back to defaults");
    expect(hasText(frameWarn, "global:"), "invalid frame warns");
}

void test_resolver_entries() {
    const std::string doc =
        "[themes]\n"
        "morning = \"#FF0000\"\n"
        "evening = \"#00FF00\"\n"
        "[[entry]]\n"
        "span = \"0-1200\"\n"
        "themes = [\"morning\"]\n"
        "[[entry]]\n"
        "span = \"1201-2400\"\n"
        "themes = [\"evening\"]\n"
        "line_color = \"#FF00FF\"\n";

    for (uint64_t seed = 0; seed < 20; ++seed) {
        const SceneCfg am = resolve(doc, seed, 800u);
        expect(am.theme.size() == 1 && am.theme.entries()[0].first.color == Color(255, 0, 0), "morning span");
        expect(am.lineColor == Color(0, 0, 0), "no line override in the morning");

        const SceneCfg pm = resolve(doc, seed, 1300u);
        expect(pm.theme.size() == 1 && pm.theme.entries()[0].first.color == Color(0, 255, 0), "evening span");
        expect(pm.lineColor == Color(255, 0, 255), "entry line color overrides");
    }

    std::string warnings;
    resolve("[[entry]]\nthemes = [\"ghost\"]\n", 3u, 0u, &warnings);
    expect(hasText(warnings, "Unknown theme 'ghost'"), "unknown theme warns: " + warnings);
}

void test_resolver_injected_defaults() {
    SceneDefaults d;
    d.deviation = 3;
    d.distance = 77;
    d.width = 300;
    d.height = 200;
    d.lineWidth = 0.0;
    d.lineColor = Color(9, 9, 9);
    d.nbFreeCircles = 4;

    const MetaConfig meta = parseMetaConfig("[shapes]\ns = [\"FC\", \"H\"]\n[[entry]]\nshapes = [\"s\"]\n");
    RNG rng(77u);
    const SceneCfg cfg = pickSceneCfg(meta, rng, 0u, d);
    expect(cfg.deviation == 3 && cfg.distance == 77, "injected deviation/distance");
    expect(cfg.frame.w == 300 && cfg.frame.h == 200, "injected frame");
    expect(cfg.lineWidth == 0.0 && cfg.lineColor == Color(9, 9, 9), "injected lines");
    expect(cfg.pattern == Pattern::FreeCircles && cfg.nbPattern == 4, "injected pattern count");
}

void test_shape_tokens() {
    const char* tilingTokens[] = {"H", "hex.", "hexagons", "T", "R", "D", "del.", "P", "P6", "pen.2", "pentagons-4"};
    for (const char* tok : tilingTokens) {
        std::optional<Tiling> t;
        std::optional<Pattern> p;
        expect(parseShapeToken(tok, t, p) && t && !p, std::string("tiling token ") + tok);
    }
    const char* patternTokens[] = {"FC", "f-tri.", "free-stripes", "FP", "CC", "PS", "c-str.", "PW", "parallel-sawteeth"};
    for (const char* tok : patternTokens) {
        std::optional<Tiling> t;
        std::optional<Pattern> p;
        expect(parseShapeToken(tok, t, p) && p && !t, std::string("pattern token ") + tok);
    }
    std::optional<Tiling> t;
    std::optional<Pattern> p;
    expect(!parseShapeToken("P7", t, p), "P7 is not a shape");
    expect(!parseShapeToken("", t, p), "empty token");
}

// Sample the frame on a grid offset by irrational fractions so no sample sits on a tile edge.
bool coversFrame(const Frame& f, const std::vector<Tile>& tiles, std::string& where) {
    const int nx = 23;
    const int ny = 14;
    for (int j = 0; j < ny; ++j) {
        for (int i = 0; i < nx; ++i) {
            const Pos p{f.x + (i + 0.5 * std::sqrt(2.0) - 0.2) * f.w / nx,
                        f.y + (j + 0.25 * std::sqrt(3.0)) * f.h / ny};
            bool inside = false;
            for (const Tile& t : tiles) {
                if (pointInPolygon(p, t.polygon)) {
                    inside = true;
                    break;
                }
            }
            if (!inside) {
                where = "(" + std::to_string(p.x) + ", " + std::to_string(p.y) + ")";
                return false;
            }
        }
    }
    return true;
}

void test_tiling_coverage() {
    SceneCfg cfg;
    cfg.frame = Frame{0, 0, 240, 150};
    cfg.sizeTiling = 17.0;
    cfg.nbDelaunay = 120;

    std::vector<Tiling> all;
    for (int k = 0; k < TILING_KIND_COUNT; ++k) {
        Tiling t;
        t.kind = static_cast<TilingKind>(k);
        if (t.kind == TilingKind::Pentagons) continue;
        all.push_back(t);
    }
    for (int type = 1; type <= 6; ++type) all.push_back(Tiling{TilingKind::Pentagons, type});

    for (const Tiling& t : all) {
        for (uint64_t seed = 1; seed <= 3; ++seed) {
            cfg.tiling = t;
            RNG rng(seed);
            std::vector<Tile> tiles;
            std::string err;
            const std::string name = std::string(tilingName(t)) + " #" + std::to_string(t.pentagonType)
                + " seed " + std::to_string(seed);
            expect(makeTiling(cfg, rng, tiles, &err), name + " failed: " + err);
            expect(!tiles.empty(), name + " produced no tiles");

            std::string where;
            expect(coversFrame(cfg.frame, tiles, where), name + " leaves a gap at " + where);

            for (const Tile& tile : tiles) {
                if (!pointInPolygon(tile.anchor, tile.polygon)) {
                    expect(false, name + " has an anchor outside its tile");
                    break;
                }
            }
        }
    }
}

void test_tiling_determinism_and_errors() {
    SceneCfg cfg;
    cfg.frame = Frame{0, 0, 200, 120};
    cfg.sizeTiling = 15.0;
    cfg.tiling = Tiling{TilingKind::Rhombus, 0};

    RNG a(99u);
    RNG b(99u);
    std::vector<Tile> ta;
    std::vector<Tile> tb;
    expect(makeTiling(cfg, a, ta) && makeTiling(cfg, b, tb), "rhombus tiling should build");
    expect(ta.size() == tb.size(), "same seed gives the same tile count");
    bool same = ta.size() == tb.size();
    for (size_t k = 0; same && k < ta.size(); ++k) same = ta[k].anchor == tb[k].anchor;
    expect(same, "same seed gives the same tiles");
    expect(a.state == b.state, "same seed consumes the same draws");

    cfg.tiling = Tiling{TilingKind::Hexagons, 0};
    cfg.sizeTiling = 0.0;
    std::vector<Tile> none;
    std::string err;
    RNG c(1u);
    expect(!makeTiling(cfg, c, none, &err), "zero tile size must fail");
    expect(none.empty() && !err.empty(), "failure leaves no tiles and a message");

    cfg.sizeTiling = 0.01;
    err.clear();
    RNG d(1u);
    expect(!makeTiling(cfg, d, none, &err), "absurdly small tiles must fail");
    expect(hasText(err, "too small"), "tile count limit error: " + err);

    Motif m;
    expect(!pentagonMotif(7, 10.0, m, &err), "pentagon type 7 does not exist");

    cfg.tiling = Tiling{TilingKind::Hexagons, 0};
    for (const double bad : {std::numeric_limits<double>::infinity(), std::numeric_limits<double>::quiet_NaN(), -4.0}) {
        cfg.sizeTiling = bad;
        err.clear();
        RNG e(1u);
        expect(!makeTiling(cfg, e, none, &err), "non-finite or negative tile size must fail");
        expect(none.empty() && hasText(err, "Tile size"), "tile size error: " + err);
    }

    cfg.sizeTiling = 15.0;
    cfg.frame = Frame{0, 0, 1000000000, 1000000000};
    err.clear();
    RNG g(1u);
    expect(!makeTiling(cfg, g, none, &err), "huge frame must fail");
    expect(hasText(err, "too small"), "huge frame error: " + err);

    cfg.frame = Frame{0, 0, 200, 120};
    cfg.tiling = Tiling{TilingKind::Delaunay, 0};
    cfg.sizeTiling = 0.0;
    cfg.nbDelaunay = 10;
    RNG h(1u);
    expect(makeTiling(cfg, h, none) && !none.empty(), "delaunay ignores the tile size");
}

void test_regions() {
    const Pos o{0, 0};
    expect(contains(Region{DiscRegion{o, 10.0}}, Pos(3, 4)), "disc contains");
    expect(!contains(Region{DiscRegion{o, 5.0}}, Pos(3, 4)), "disc boundary is outside");

    expect(contains(Region{TriangleRegion{{0, 0}, {10, 0}, {0, 10}}}, Pos(2, 2)), "triangle contains");
    expect(!contains(Region{TriangleRegion{{0, 0}, {10, 0}, {0, 10}}}, Pos(8, 8)), "triangle excludes");

    StripeRegion s;
    s.origin = o;
    s.normal = {1.0, 0.0};
    s.lo = -1.0;
    s.hi = 1.0;
    expect(contains(Region{s}, Pos(0.5, 1000.0)), "stripe is infinite along its direction");
    expect(!contains(Region{s}, Pos(1.0, 0.0)), "stripe upper bound is exclusive");

    expect(contains(Region{RingRegion{o, 2.0, 4.0}}, Pos(3, 0)), "ring contains");
    expect(!contains(Region{RingRegion{o, 2.0, 4.0}}, Pos(1, 0)), "ring hole");

    WaveRegion flat;
    flat.origin = o;
    flat.lo = -1.0;
    flat.hi = 1.0;
    flat.amplitude = 0.0;
    flat.wavelength = 10.0;
    expect(contains(Region{flat}, Pos(0.5, 3.0)) && !contains(Region{flat}, Pos(1.5, 3.0)),
           "flat wave behaves like a stripe");

    WaveRegion wave = flat;
    wave.amplitude = 5.0;
    // along = cross(normal) = -y; at y = -2.5 the shift is 5*sin(pi/2) = 5.
    expect(contains(Region{wave}, Pos(5.0, -2.5)), "wave band follows the sine");

    SpiralRegion sp;
    sp.center = o;
    sp.spacing = 10.0;
    sp.width = 0.5;
    sp.maxRadius = 100.0;
    expect(contains(Region{sp}, Pos(12.0, 0.0)), "spiral arm at angle 0");
    expect(!contains(Region{sp}, Pos(17.0, 0.0)), "gap between spiral arms");
    expect(!contains(Region{sp}, Pos(112.0, 0.0)), "spiral stops at its radius");
}

void test_patterns() {
    const Frame f{0, 0, 300, 200};
    RNG rng(21u);

    const std::vector<Region> circles = freeCircles(f, 12, rng);
    expect(circles.size() == 12, "free circles count");
    for (size_t k = 1; k < circles.size(); ++k) {
        expect(std::get<DiscRegion>(circles[k - 1]).radius <= std::get<DiscRegion>(circles[k]).radius,
               "free circles are ordered small to large");
    }

    expect(freeTriangles(f, 5, rng).size() == 5, "free triangles count");
    expect(freeStripes(f, 6, 0.1, rng).size() == 6, "free stripes count");
    expect(freeSpirals(f, 2, 0.3, 0.5, rng).size() == 2, "free spirals count");
    expect(crossedStripes(f, 4, 10, rng).size() == 8, "crossed stripes come in pairs");

    const std::vector<Region> rings = concentricCircles(f, 5, rng);
    expect(rings.size() == 5, "concentric circles count");
    for (size_t k = 1; k < rings.size(); ++k) {
        expect(std::get<RingRegion>(rings[k]).inner == std::get<RingRegion>(rings[k - 1]).outer,
               "rings are contiguous");
    }

    const std::vector<Region> stripes = parallelStripes(f, 10, 15, rng);
    expect(stripes.size() == 10, "parallel stripes count");
    const std::vector<Region> waves = parallelWaves(f, 8, 0.3, rng);
    const std::vector<Region> teeth = parallelSawteeth(f, 8, 0.3, rng);
    for (int j = 0; j < 10; ++j) {
        for (int i = 0; i < 15; ++i) {
            const Pos p{(i + 0.37) * 20.0, (j + 0.61) * 20.0};
            int hits = 0;
            for (const Region& r : stripes) hits += contains(r, p) ? 1 : 0;
            expect(hits == 1, "parallel stripes partition the frame");
            int waveHits = 0;
            for (const Region& r : waves) waveHits += contains(r, p) ? 1 : 0;
            expect(waveHits == 1, "parallel waves partition the frame");
            int toothHits = 0;
            for (const Region& r : teeth) toothHits += contains(r, p) ? 1 : 0;
            expect(toothHits == 1, "parallel sawteeth partition the frame");
        }
    }

    const std::vector<Region> loose = parallelStripes(f, 6, 90, rng);
    for (const Region& r : loose) {
        const StripeRegion& band = std::get<StripeRegion>(r);
        expect(band.hi > band.lo, "stripe variation never folds a band");
    }
    for (size_t k = 1; k < loose.size(); ++k) {
        expect(std::get<StripeRegion>(loose[k]).lo == std::get<StripeRegion>(loose[k - 1]).hi, "bands stay adjacent");
    }

    SceneCfg cfg;
    cfg.frame = f;
    cfg.pattern = Pattern::ConcentricCircles;
    cfg.nbPattern = 0;
    expect(createRegions(cfg, rng).empty(), "zero count yields no region");
    cfg.nbPattern = -3;
    expect(createRegions(cfg, rng).empty(), "negative count yields no region");
}

ColorItem solidItem(const Color& c) {
    ColorItem item;
    item.shade = Color(17, 34, 51);
    item.theme = c;
    item.distance = 100;
    item.deviation = 0;
    return item;
}

void test_scene_first_match() {
    Scene scene;
    scene.regions.push_back(DiscRegion{{0, 0}, 10.0});
    scene.regions.push_back(DiscRegion{{0, 0}, 20.0});
    scene.colors.push_back(solidItem(Color(255, 0, 0)));
    scene.colors.push_back(solidItem(Color(0, 255, 0)));
    scene.background = solidItem(Color(0, 0, 255));

    RNG rng(4u);
    expect(scene.color({1, 1}, rng) == Color(255, 0, 0), "first region wins where regions overlap");
    expect(scene.color({15, 0}, rng) == Color(0, 255, 0), "second region outside the first");
    expect(scene.color({50, 0}, rng) == Color(0, 0, 255), "background outside every region");

    ColorItem salted = solidItem(Color(255, 0, 0));
    salted.salt.items.push_back({Color(1, 1, 1), 1.0, 0});
    expect(salted.sample(rng) == Color(1, 1, 1), "salt overrides the shade");

    SceneCfg cfg;
    const ColorItem fromEmpty = chooseColor(cfg, rng);
    expect(fromEmpty.theme == Color(0, 0, 0), "empty theme falls back to black");
    expect(fromEmpty.deviation == cfg.deviation && fromEmpty.distance == cfg.distance, "scene-wide defaults");

    cfg.theme.push(ThemeItem{Color(5, 6, 7), 1, 2, Salt{}}, 10);
    const ColorItem fromTheme = chooseColor(cfg, rng);
    expect(fromTheme.theme == Color(5, 6, 7) && fromTheme.deviation == 1 && fromTheme.distance == 2,
           "per-item overrides");

    cfg.frame = Frame{0, 0, 100, 100};
    cfg.pattern = Pattern::FreeCircles;
    cfg.nbPattern = 6;
    const Scene built = Scene::build(cfg, rng);
    expect(built.regions.size() == 6 && built.colors.size() == 6, "one color item per region");
}

void test_svg_document() {
    Document doc;
    doc.frame = Frame{0, 0, 100, 50};
    doc.add(makeTilePath({{0, 0}, {10, 0}, {10, 10.5}, {0, 10}}, Color(255, 0, 0), Color(0, 0, 0), 0.0));
    doc.add(makeTilePath({{1, 1}, {2, 1}, {2, 2}}, Color(1, 2, 3), Color(4, 5, 6), 1.5));

    const std::string svg = doc.toSvg();
    expect(svg.rfind("<svg viewBox=\"0 0 100 50\" xmlns=\"http://www.w3.org/2000/svg\">", 0) == 0, "svg header");
    expect(hasText(svg, "<path d=\"M0,0 L10,0 L10,10.5 L0,10 z\" fill=\"rgb(255,0,0)\" stroke=\"rgb(255,0,0)\" stroke-width=\"0.1\"/>"),
           "zero-width lines take the fill color: " + svg);
    expect(hasText(svg, "fill=\"rgb(1,2,3)\" stroke=\"rgb(4,5,6)\" stroke-width=\"1.5\""), "explicit line settings");
    expect(hasText(svg, "</svg>"), "svg footer");
    expect(doc.toSvg() == svg, "serialization is deterministic");

    expect(formatNumber(12.5) == "12.5", "formatNumber 12.5");
    expect(formatNumber(3.0) == "3", "formatNumber 3");
    expect(formatNumber(-0.0001) == "0", "formatNumber -0");
    expect(formatNumber(-0.125) == "-0.125", "formatNumber -0.125");
    expect(formatNumber(1.23456) == "1.235", "formatNumber rounds to three decimals");

    std::string err;
    expect(!saveDocument(doc, "out.png", &err), "png is not supported");
    expect(hasText(err, "Unsupported"), "unsupported format message: " + err);
}

void test_rasterizer() {
    Document doc;
    doc.frame = Frame{0, 0, 20, 10};
    doc.add(makeTilePath({{0, 0}, {10, 0}, {10, 10}, {0, 10}}, Color(255, 0, 0), Color(0, 0, 0), 0.0));

    const RasterImage img = rasterizeDocument(doc);
    expect(img.w == 20 && img.h == 10 && img.px.size() == 200, "raster size follows the frame");
    expect(img.at(2, 5) == Rgba{255, 0, 0, 255}, "filled pixel");
    expect(img.at(9, 9) == Rgba{255, 0, 0, 255}, "pixel at the polygon corner");
    expect(img.at(15, 5) == Rgba{255, 255, 255, 255}, "background pixel");

    RasterImage small;
    small.w = 4;
    small.h = 4;
    small.px.assign(16, Rgba{0, 0, 0, 255});
    rasterTriangle(small, {{-10, -10}, {30, -10}, {-10, 30}, Rgba{9, 9, 9, 255}});
    expect(small.at(0, 0) == Rgba{9, 9, 9, 255} && small.at(3, 0) == Rgba{9, 9, 9, 255}, "triangles clip to the image");

    expect(toRgba(Color(-4, 512, 7)) == Rgba{0, 255, 7, 255}, "toRgba clamps");
}

void test_blurhash() {
    RasterImage red;
    red.w = 32;
    red.h = 24;
    red.px.assign(static_cast<size_t>(red.w * red.h), Rgba{255, 0, 0, 255});

    std::string hash;
    std::string err;
    expect(blurhash::encode(red, 4, 3, hash, &err), "encode solid red: " + err);
    expect(hash.size() == 28, "4x3 hash length");
    expect(!hash.empty() && hash[0] == 'L', "size flag for 4x3");
    expect(hash.size() >= 6 && hash.substr(2, 4) == "TI:j", "DC component encodes pure red");

    std::string again;
    blurhash::encode(red, 4, 3, again);
    expect(again == hash, "encoding is deterministic");

    expect(!blurhash::encode(red, 0, 3, again, &err), "zero components rejected");
    expect(!blurhash::encode(RasterImage{}, 4, 3, again, &err), "empty image rejected");

    // Every AC component at the neutral value ("fQ" is 9*19*19 + 9*19 + 9).
    std::string flat = "L0TI:j";
    for (int k = 0; k < 11; ++k) flat += "fQ";
    RasterImage out;
    expect(blurhash::decode(flat, 8, 6, 1.0, out, &err), "decode flat hash: " + err);
    expect(out.w == 8 && out.h == 6, "decoded size");
    bool allRed = !out.px.empty();
    for (const Rgba& p : out.px) allRed = allRed && p == Rgba{255, 0, 0, 255};
    expect(allRed, "flat hash decodes to a solid color");

    expect(!blurhash::decode("abc", 8, 6, 1.0, out, &err), "short hash rejected");
    expect(!blurhash::decode(flat + "00", 8, 6, 1.0, out, &err), "length mismatch rejected");
    expect(!blurhash::decode(flat, 0, 6, 1.0, out, &err), "zero width rejected");
}

GenImageRequest smallRequest(uint64_t seed) {
    GenImageRequest req;
    req.seed = seed;
    req.defaults.width = 160;
    req.defaults.height = 100;
    req.defaults.nbDelaunay = 150;
    req.defaults.size = 12.0;
    return req;
}

void test_gen_image_errors() {
    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / "backdrop_gen_errors_test";
    std::error_code ec;
    fs::create_directories(dir, ec);

    GenImageRequest req = smallRequest(1430u);
    req.imageDest = (dir / "a.png").string();
    GenImageResult res;
    expect(!generateImages(req, res), "png output must fail");
    expect(res.error == GenImageError::CantSaveGeneratedImage, "png output reports CantSaveGeneratedImage");
    expect(!fs::exists(dir / "a.png") && !fs::exists(dir / "a.png.tmp"), "failed run leaves nothing behind");

    req.imageDest = (dir / "a.svg").string();
    req.blurDest = (dir / "a.blur.svg").string();
    expect(!generateImages(req, res), "svg preview must fail");
    expect(res.error == GenImageError::CantSaveGeneratedImage, "svg preview reports CantSaveGeneratedImage");
    expect(!fs::exists(dir / "a.svg"), "nothing written when the preview path is rejected");

    req.blurDest.clear();
    req.imageDest = (dir / "missing_dir" / "a.svg").string();
    expect(!generateImages(req, res), "unwritable destination must fail");
    expect(res.error == GenImageError::CantSaveGeneratedImage, "unwritable destination reports CantSaveGeneratedImage");

    expect(std::string(genImageErrorName(GenImageError::MalformedGeometry)) == "malformed-geometry", "error names");

    fs::remove_all(dir, ec);
}

void test_gen_image_pipeline() {
    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / "backdrop_gen_pipeline_test";
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir, ec);

    GenImageRequest req = smallRequest(905u);
    req.imageDest = (dir / "one.svg").string();
    req.blurDest = (dir / "one.blur.bmp").string();
    GenImageResult first;
    expect(generateImages(req, first), "svg pipeline: " + first.message);
    expect(first.error == GenImageError::None, "no error on success");
    expect(first.blurhash.size() == 28, "4x3 blurhash");
    expect(first.tileCount > 0, "tiles were generated");
    expect(fs::exists(dir / "one.svg") && fs::exists(dir / "one.blur.bmp"), "both outputs written");
    expect(!fs::exists(dir / "one.svg.tmp") && !fs::exists(dir / "one.blur.bmp.tmp"), "temporary files cleaned up");

    RasterImage preview;
    std::string err;
    expect(loadBmp((dir / "one.blur.bmp").string(), preview, &err), "preview loads: " + err);
    expect(preview.w == 160 && preview.h == 100, "preview has the frame size");

    req.imageDest = (dir / "two.svg").string();
    req.blurDest.clear();
    GenImageResult second;
    expect(generateImages(req, second), "second svg run: " + second.message);
    expect(second.blurhash == first.blurhash, "same seed, same blurhash");
    expect(readFile(dir / "one.svg") == readFile(dir / "two.svg"), "same seed, byte-identical svg");
    expect(!fs::exists(dir / "two.blur.bmp"), "no preview when none requested");

    GenImageRequest other = smallRequest(906u);
    Document a;
    Document b;
    GenImageResult ra;
    GenImageResult rb;
    expect(composeDocument(req, a, ra) && composeDocument(other, b, rb), "compose in memory");
    expect(a.toSvg() != b.toSvg(), "different seeds give different documents");

    req.imageDest = (dir / "three.bmp").string();
    req.blurDest = (dir / "three.blur.bmp").string();
    GenImageResult bmp;
    expect(generateImages(req, bmp), "bmp pipeline: " + bmp.message);
    expect(bmp.blurhash.size() == 28, "bmp blurhash");
    RasterImage reloaded;
    expect(loadBmp((dir / "three.bmp").string(), reloaded, &err), "bmp output loads: " + err);
    expect(reloaded.w == 160 && reloaded.h == 100, "bmp output has the frame size");

    // Time selects entries independently of the seed.
    GenImageRequest timed = smallRequest(7u);
    timed.config = parseMetaConfig(
        "[themes]\nday = \"#FFFFFF\"\nnight = \"#000000\"\n"
        "[[entry]]\nspan = \"600-1800\"\nthemes = [\"day\"]\n"
        "[[entry]]\nspan = \"1801-2400\"\nthemes = [\"night\"]\n");
    timed.time = 2000u;
    Document night;
    GenImageResult rn;
    expect(composeDocument(timed, night, rn), "compose with an explicit time");
    expect(rn.cfg.theme.size() == 1 && rn.cfg.theme.entries()[0].first.color == Color(0, 0, 0), "time picks the night entry");

    fs::remove_all(dir, ec);
}

} // namespace

int main() {
    std::cout << "Running Backdrop tests...\n";

    test_rng_reproducible();
    test_seed_time_of_day();
    test_geometry_basics();
    test_chooser();
    test_color();
    test_salt();

    test_meta_doc_parse();
    test_meta_doc_errors();
    test_meta_config_typed();

    test_resolver_defaults();
    test_resolver_explicit_document();
    test_resolver_dictionaries();
    test_resolver_warnings();
    test_resolver_entries();
    test_resolver_injected_defaults();
    test_shape_tokens();

    test_tiling_coverage();
    test_tiling_determinism_and_errors();
    test_regions();
    test_patterns();
    test_scene_first_match();

    test_svg_document();
    test_rasterizer();
    test_blurhash();
    test_gen_image_errors();
    test_gen_image_pipeline();

    if (failures == 0) {
        std::cout << "All tests passed.\n";
        return 0;
    }

    std::cerr << failures << " test(s) failed.\n";
    return 1;
}
