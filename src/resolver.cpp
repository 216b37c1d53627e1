#include "scene_cfg.hpp"

#include "common.hpp"
#include "meta_config.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace {

struct WarnSink {
    std::string text;
    int count = 0;

    void add(const std::string& where, const std::string& msg) {
        appendWarning(text, where, msg, count);
    }
};

// Dictionary keys in sorted order: entries may only reference names that sort before them.
std::vector<std::string> sortedKeys(const MetaValue& table) {
    std::vector<std::string> keys = table.keys;
    std::sort(keys.begin(), keys.end());
    return keys;
}

template <typename Map>
std::vector<std::string> mapKeys(const Map& m) {
    std::vector<std::string> keys;
    keys.reserve(m.size());
    for (const auto& kv : m) keys.push_back(kv.first);
    return keys;
}

bool parseNonNegative(const std::string& s, int& out) {
    const std::string t = trim(s);
    if (t.empty()) return false;
    for (char c : t) {
        if (c < '0' || c > '9') return false;
    }
    try {
        out = std::stoi(t);
        return true;
    } catch (...) {
        return false;
    }
}

std::optional<Color> colorFromValue(const MetaValue& v, const ColorList& dict) {
    if (v.isString()) return parseColorString(v.str, dict);
    if (v.isArray() && v.arr.size() == 3) {
        int ch[3] = {0, 0, 0};
        for (int k = 0; k < 3; ++k) {
            const MetaValue& c = v.arr[static_cast<size_t>(k)];
            if (c.kind != MetaKind::Integer || c.i < 0 || c.i > 255) return std::nullopt;
            ch[k] = static_cast<int>(c.i);
        }
        return Color{ch[0], ch[1], ch[2]};
    }
    return std::nullopt;
}

std::optional<int> roundedNonNegative(const MetaValue* v) {
    if (!v || !v->isNumber() || !std::isfinite(v->asDouble())) return std::nullopt;
    return static_cast<int>(std::clamp(std::round(v->asDouble()), 0.0, 1e9));
}

Salt saltFromValue(const MetaValue& v, const ColorList& colors, const std::string& where, WarnSink& warn) {
    Salt salt;
    if (!v.isArray()) {
        warn.add(where, "salt should be an array of tables, got " + v.repr());
        return salt;
    }
    for (const MetaValue& entry : v.arr) {
        if (!entry.isTable()) {
            warn.add(where, "Ignoring salt entry " + entry.repr());
            continue;
        }
        SaltItem item;
        if (const MetaValue* c = entry.find("color")) {
            if (auto col = colorFromValue(*c, colors)) {
                item.color = *col;
            } else {
                warn.add(where, "Invalid salt color " + c->repr());
            }
        }
        if (const MetaValue* l = entry.find("likeliness")) {
            if (l->isNumber() && std::isfinite(l->asDouble())) item.likeliness = l->asDouble();
        }
        if (auto var = roundedNonNegative(entry.find("variability"))) item.variability = *var;
        salt.items.push_back(item);
    }
    return salt;
}

// "<color> x<weight> ~<deviation> !<distance>", tokens in any order.
bool themeItemFromString(const std::string& s, const ColorList& colors, int baseWeight,
                         const std::string& where, WarnSink& warn, ThemeItem& item, int& weight) {
    item = ThemeItem{};
    weight = baseWeight;
    for (const std::string& tok : splitChar(s, ' ')) {
        int n = 0;
        const std::string rest = tok.substr(1);
        if (tok[0] == 'x') {
            if (parseNonNegative(rest, n)) {
                weight = n;
            } else {
                warn.add(where, "Invalid weight '" + tok + "'");
            }
        } else if (tok[0] == '~') {
            if (parseNonNegative(rest, n)) {
                item.deviation = n;
            } else {
                warn.add(where, "Invalid deviation '" + tok + "'");
            }
        } else if (tok[0] == '!') {
            if (parseNonNegative(rest, n)) {
                item.distance = n;
            } else {
                warn.add(where, "Invalid distance '" + tok + "'");
            }
        } else if (auto c = parseColorString(tok, colors)) {
            item.color = *c;
        } else {
            warn.add(where, "'" + tok + "' is not a color (use \"#RRGGBB\" or a color name)");
        }
    }
    return true;
}

bool themeItemFromTable(const MetaValue& t, const ColorList& colors, int baseWeight,
                        const std::string& where, WarnSink& warn, ThemeItem& item, int& weight) {
    item = ThemeItem{};
    weight = baseWeight;
    if (const MetaValue* c = t.find("color")) {
        if (auto col = colorFromValue(*c, colors)) {
            item.color = *col;
        } else {
            warn.add(where, "Invalid color " + c->repr());
        }
    }
    item.deviation = roundedNonNegative(t.find("variability"));
    item.distance = roundedNonNegative(t.find("distance"));
    if (auto w = roundedNonNegative(t.find("weight"))) weight = *w;
    if (const MetaValue* s = t.find("salt")) item.salt = saltFromValue(*s, colors, where, warn);
    return true;
}

bool themeItemFromValue(const MetaValue& v, const ColorList& colors, int baseWeight,
                        const std::string& where, WarnSink& warn, ThemeItem& item, int& weight) {
    if (v.isString()) return themeItemFromString(v.str, colors, baseWeight, where, warn, item, weight);
    if (v.isTable()) return themeItemFromTable(v, colors, baseWeight, where, warn, item, weight);
    warn.add(where, "Ignoring theme item " + v.repr());
    return false;
}

void addShape(const std::string& token, int weight, ShapeCombo& combo, const std::string& where, WarnSink& warn) {
    std::optional<Tiling> tiling;
    std::optional<Pattern> pattern;
    if (!parseShapeToken(token, tiling, pattern)) {
        warn.add(where, "'" + token + "' is not recognized as a shape");
        return;
    }
    if (tiling) combo.tilings.push(*tiling, weight);
    if (pattern) combo.patterns.push(*pattern, weight);
}

struct EntryChoice {
    std::string theme;
    std::string shape;
    std::string lineColor;
};

// "start-end", either side may be missing.
void parseSpan(const std::optional<std::string>& span, int& start, int& end) {
    start = 0;
    end = 2400;
    if (!span) return;
    const std::string& s = *span;
    const size_t dash = s.find('-');
    int n = 0;
    if (parseNonNegative(s.substr(0, dash), n)) start = n;
    if (dash != std::string::npos && parseNonNegative(s.substr(dash + 1), n)) end = n;
}

EntryChoice chooseEntry(const std::vector<EntrySection>& entries, RNG& rng, uint64_t time, int baseWeight) {
    Chooser<size_t> valid;
    for (size_t k = 0; k < entries.size(); ++k) {
        int start = 0;
        int end = 0;
        parseSpan(entries[k].span, start, end);
        if (static_cast<uint64_t>(start) <= time && time <= static_cast<uint64_t>(end)) {
            valid.push(k, entries[k].distance.value_or(baseWeight));
        }
    }

    EntryChoice out;
    const std::optional<size_t> picked = valid.choose(rng);
    if (!picked) return out;

    const EntrySection& e = entries[*picked];
    if (!e.themes.empty()) {
        out.theme = e.themes[static_cast<size_t>(rng.range(0, static_cast<int>(e.themes.size()) - 1))];
    }
    if (!e.shapes.empty()) {
        out.shape = e.shapes[static_cast<size_t>(rng.range(0, static_cast<int>(e.shapes.size()) - 1))];
    }
    out.lineColor = e.lineColor.value_or("");
    return out;
}

const LineSettings& lineSettingsFor(const LinesSection& lines, const Tiling& t) {
    switch (t.kind) {
        case TilingKind::Hexagons: return lines.hex;
        case TilingKind::Triangles: return lines.tri;
        case TilingKind::HexagonsAndTriangles: return lines.hexAndTri;
        case TilingKind::SquaresAndTriangles: return lines.squAndTri;
        case TilingKind::Rhombus: return lines.rho;
        case TilingKind::Delaunay: return lines.del;
        case TilingKind::Pentagons: return lines.pen;
    }
    return lines.base;
}

std::optional<double> tilingSizeFor(const TilingsSection& t, const Tiling& tiling) {
    switch (tiling.kind) {
        case TilingKind::Hexagons: return t.sizeHex;
        case TilingKind::Triangles: return t.sizeTri;
        case TilingKind::HexagonsAndTriangles: return t.sizeHexAndTri;
        case TilingKind::SquaresAndTriangles: return t.sizeSquAndTri;
        case TilingKind::Rhombus: return t.sizeRho;
        case TilingKind::Pentagons: return t.sizePen;
        case TilingKind::Delaunay: return std::nullopt;
    }
    return std::nullopt;
}

void resolvePatternParams(SceneCfg& cfg, const PatternsSection& p, const SceneDefaults& d, WarnSink& warn) {
    switch (cfg.pattern) {
        case Pattern::FreeCircles:
            cfg.nbPattern = p.nbFreeCircles.value_or(d.nbFreeCircles);
            break;
        case Pattern::FreeTriangles:
            cfg.nbPattern = p.nbFreeTriangles.value_or(d.nbFreeTriangles);
            break;
        case Pattern::FreeStripes:
            cfg.nbPattern = p.nbFreeStripes.value_or(d.nbFreeStripes);
            cfg.widthPattern = p.widthStripe.value_or(d.widthStripe);
            break;
        case Pattern::FreeSpirals:
            cfg.nbPattern = p.nbFreeSpirals.value_or(d.nbFreeSpirals);
            cfg.widthPattern = p.widthSpiral.value_or(d.widthSpiral);
            cfg.tightnessSpiral = p.tightnessSpiral.value_or(d.tightnessSpiral);
            break;
        case Pattern::ConcentricCircles:
            cfg.nbPattern = p.nbConcentricCircles.value_or(d.nbConcentricCircles);
            break;
        case Pattern::ParallelStripes:
            cfg.nbPattern = p.nbParallelStripes.value_or(d.nbParallelStripes);
            cfg.varStripes = p.varParallelStripes.value_or(d.varParallelStripes);
            break;
        case Pattern::CrossedStripes:
            cfg.nbPattern = p.nbCrossedStripes.value_or(d.nbCrossedStripes);
            cfg.varStripes = p.varCrossedStripes.value_or(d.varCrossedStripes);
            break;
        case Pattern::ParallelWaves:
            cfg.nbPattern = p.nbParallelWaves.value_or(d.nbParallelWaves);
            cfg.widthPattern = p.widthWave.value_or(d.widthWave);
            break;
        case Pattern::ParallelSawteeth:
            cfg.nbPattern = p.nbParallelSawteeth.value_or(d.nbParallelSawteeth);
            cfg.widthPattern = p.widthSawtooth.value_or(d.widthSawtooth);
            break;
    }
    if (cfg.varStripes > MAX_STRIPE_VARIATION) {
        warn.add("data.patterns", "Stripe variation above " + std::to_string(MAX_STRIPE_VARIATION)
                                      + "% would fold bands, using " + std::to_string(MAX_STRIPE_VARIATION));
        cfg.varStripes = MAX_STRIPE_VARIATION;
    }
}

ColorList buildColors(const MetaConfig& meta, WarnSink& warn) {
    ColorList colors;
    if (!meta.colors) return colors;
    for (const std::string& name : sortedKeys(*meta.colors)) {
        const MetaValue* v = meta.colors->find(name);
        if (auto c = colorFromValue(*v, colors)) {
            colors[name] = *c;
        } else {
            warn.add("colors." + name, v->repr() + " is not a valid color (use [0, 0, 255] or \"#0000FF\")");
        }
    }
    return colors;
}

ThemeList buildThemes(const MetaConfig& meta, const ColorList& colors, int baseWeight, WarnSink& warn) {
    ThemeList themes;
    if (!meta.themes) return themes;
    for (const std::string& name : sortedKeys(*meta.themes)) {
        const std::string where = "themes." + name;
        const MetaValue* v = meta.themes->find(name);

        Theme theme;
        ThemeItem item;
        int weight = baseWeight;
        if (v->isArray()) {
            for (const MetaValue& elem : v->arr) {
                if (elem.isString()) {
                    auto ref = themes.find(elem.str);
                    if (ref != themes.end()) {
                        theme.append(ref->second.extract());
                        continue;
                    }
                }
                if (themeItemFromValue(elem, colors, baseWeight, where, warn, item, weight)) {
                    theme.push(item, weight);
                }
            }
        } else if (v->isString() && themes.count(v->str)) {
            theme = themes[v->str];
        } else if (v->isString() || v->isTable()) {
            if (themeItemFromValue(*v, colors, baseWeight, where, warn, item, weight)) theme.push(item, weight);
        } else {
            warn.add(where, v->repr() + " is not a valid theme (use a theme item or an array of theme items)");
            continue;
        }
        themes[name] = theme;
    }
    return themes;
}

ShapeList buildShapes(const MetaConfig& meta, int baseWeight, WarnSink& warn) {
    ShapeList shapes;
    if (!meta.shapes) return shapes;
    for (const std::string& name : sortedKeys(*meta.shapes)) {
        const std::string where = "shapes." + name;
        const MetaValue* v = meta.shapes->find(name);

        ShapeCombo combo;
        if (!v->isArray()) {
            warn.add(where, v->repr() + " is not an array of shapes");
            shapes[name] = combo;
            continue;
        }
        for (const MetaValue& elem : v->arr) {
            if (elem.isString()) {
                auto ref = shapes.find(elem.str);
                if (ref != shapes.end()) {
                    combo.tilings.append(ref->second.tilings.extract());
                    combo.patterns.append(ref->second.patterns.extract());
                } else {
                    addShape(elem.str, baseWeight, combo, where, warn);
                }
            } else if (elem.isArray() && elem.arr.size() == 2 && elem.arr[0].isString()
                       && elem.arr[1].kind == MetaKind::Integer && elem.arr[1].i > 0) {
                const int w = static_cast<int>(std::min<int64_t>(elem.arr[1].i, 1000000000));
                addShape(elem.arr[0].str, w, combo, where, warn);
            } else {
                warn.add(where, elem.repr() + " is not a valid shape");
            }
        }
        shapes[name] = combo;
    }
    return shapes;
}

void flush(const WarnSink& warn, std::string* outWarnings) {
    if (outWarnings) *outWarnings += warn.text;
}

} // namespace

uint64_t seedTimeOfDay(uint64_t seed) {
    return ((seed / 100) % 24) * 100 + (seed % 100) % 60;
}

ColorList buildColorList(const MetaConfig& meta, std::string* outWarnings) {
    WarnSink warn;
    ColorList colors = buildColors(meta, warn);
    flush(warn, outWarnings);
    return colors;
}

ThemeList buildThemeList(const MetaConfig& meta, const ColorList& colors, int baseWeight, std::string* outWarnings) {
    WarnSink warn;
    ThemeList themes = buildThemes(meta, colors, baseWeight, warn);
    flush(warn, outWarnings);
    return themes;
}

ShapeList buildShapeList(const MetaConfig& meta, int baseWeight, std::string* outWarnings) {
    WarnSink warn;
    ShapeList shapes = buildShapes(meta, baseWeight, warn);
    flush(warn, outWarnings);
    return shapes;
}

SceneCfg pickSceneCfg(const MetaConfig& meta, RNG& rng, uint64_t time, const SceneDefaults& d, std::string* outWarnings) {
    WarnSink warn;
    SceneCfg cfg;

    // Globals.
    const GlobalSection global = meta.global.value_or(GlobalSection{});
    cfg.deviation = resolveOption<int>(global.deviation, std::nullopt, d.deviation);
    cfg.distance = resolveOption<int>(global.distance, global.weight, d.distance);
    double size = resolveOption<double>(global.size, std::nullopt, d.size);
    int width = resolveOption<int>(global.width, std::nullopt, d.width);
    int height = resolveOption<int>(global.height, std::nullopt, d.height);
    if (width <= 0 || height <= 0) {
        warn.add("global", "Frame must have a positive width and height, using defaults");
        width = d.width;
        height = d.height;
    }
    cfg.frame = Frame{0, 0, width, height};

    // Dictionaries.
    const ColorList colors = buildColors(meta, warn);
    ThemeList themes = buildThemes(meta, colors, d.baseWeight, warn);
    const ShapeList shapes = buildShapes(meta, d.baseWeight, warn);

    const EntryChoice choice = chooseEntry(meta.entries, rng, time, d.baseWeight);

    // Tiling is always drawn before the pattern.
    auto combo = shapes.find(choice.shape);
    if (combo == shapes.end()) {
        cfg.tiling = Tiling::random(rng);
        cfg.pattern = randomPattern(rng);
    } else {
        if (auto t = combo->second.tilings.choose(rng)) {
            cfg.tiling = *t;
        } else {
            cfg.tiling = Tiling::random(rng);
        }
        if (auto p = combo->second.patterns.choose(rng)) {
            cfg.pattern = *p;
        } else {
            cfg.pattern = randomPattern(rng);
        }
    }

    resolvePatternParams(cfg, meta.patterns.value_or(PatternsSection{}), d, warn);

    const TilingsSection tilings = meta.tilings.value_or(TilingsSection{});
    if (cfg.tiling.kind == TilingKind::Delaunay) {
        cfg.sizeTiling = 0.0;
        cfg.nbDelaunay = tilings.nbDelaunay.value_or(d.nbDelaunay);
    } else {
        cfg.sizeTiling = resolveOption<double>(tilingSizeFor(tilings, cfg.tiling), size, d.size);
        if (!std::isfinite(cfg.sizeTiling) || !(cfg.sizeTiling > 0.0)) {
            warn.add("data.tilings", "Tile size must be a positive finite number, using " + std::to_string(d.size));
            cfg.sizeTiling = d.size;
        }
        cfg.nbDelaunay = 0;
    }

    if (themes.empty()) {
        Theme fallback;
        ThemeItem item;
        if (colors.empty()) {
            item.color = Color::random(rng);
        } else {
            const std::vector<std::string> names = mapKeys(colors);
            item.color = colors.at(names[static_cast<size_t>(rng.range(0, static_cast<int>(names.size()) - 1))]);
        }
        fallback.push(item, d.baseWeight);
        themes["-default-"] = fallback;
    }

    // Lines: per-tiling key, then the section-wide key, then the constant.
    const LinesSection lines = meta.lines.value_or(LinesSection{});
    const LineSettings& perTiling = lineSettingsFor(lines, cfg.tiling);
    cfg.lineWidth = resolveOption<double>(perTiling.width, lines.base.width, d.lineWidth);
    cfg.lineColor = d.lineColor;
    for (const std::optional<std::string>* name : {&perTiling.color, &lines.base.color}) {
        if (!*name) continue;
        if (auto c = parseColorString(**name, colors)) {
            cfg.lineColor = *c;
            break;
        }
        warn.add("lines", "'" + **name + "' is not a valid line color");
    }
    if (!choice.lineColor.empty()) {
        if (auto c = parseColorString(choice.lineColor, colors)) {
            cfg.lineColor = *c;
        } else {
            warn.add("entry", "'" + choice.lineColor + "' is not a valid line color");
        }
    }

    auto named = themes.find(choice.theme);
    if (named != themes.end()) {
        cfg.theme = named->second;
    } else {
        if (!choice.theme.empty()) warn.add("entry", "Unknown theme '" + choice.theme + "'");
        const std::vector<std::string> names = mapKeys(themes);
        cfg.theme = themes.at(names[static_cast<size_t>(rng.range(0, static_cast<int>(names.size()) - 1))]);
    }

    flush(warn, outWarnings);
    return cfg;
}
