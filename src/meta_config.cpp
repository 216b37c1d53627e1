#include "meta_config.hpp"
#include "common.hpp"

#include <algorithm>
#include <cmath>

namespace {

struct WarnSink {
    std::string text;
    int count = 0;

    void add(const std::string& where, const std::string& msg) {
        appendWarning(text, where, msg, count);
    }
};

// Non-negative counts. Floats are rounded.
void readInt(const MetaValue& tbl, const char* key, const std::string& section,
             std::optional<int>& out, WarnSink& warn) {
    const MetaValue* v = tbl.find(key);
    if (!v) return;
    if (!v->isNumber()) {
        warn.add(section + "." + key, "Expected a number, got " + v->repr());
        return;
    }
    if (!std::isfinite(v->asDouble())) {
        warn.add(section + "." + key, "Expected a finite number, got " + v->repr());
        return;
    }
    const double d = std::round(v->asDouble());
    if (d < 0.0) {
        warn.add(section + "." + key, "Expected a non-negative number, got " + v->repr());
        return;
    }
    out = static_cast<int>(std::min(d, 1e9));
}

void readDouble(const MetaValue& tbl, const char* key, const std::string& section,
                std::optional<double>& out, WarnSink& warn) {
    const MetaValue* v = tbl.find(key);
    if (!v) return;
    if (!v->isNumber()) {
        warn.add(section + "." + key, "Expected a number, got " + v->repr());
        return;
    }
    if (!std::isfinite(v->asDouble())) {
        warn.add(section + "." + key, "Expected a finite number, got " + v->repr());
        return;
    }
    out = v->asDouble();
}

void readString(const MetaValue& tbl, const char* key, const std::string& section,
                std::optional<std::string>& out, WarnSink& warn) {
    const MetaValue* v = tbl.find(key);
    if (!v) return;
    if (!v->isString()) {
        warn.add(section + "." + key, "Expected a string, got " + v->repr());
        return;
    }
    out = v->str;
}

void readStringList(const MetaValue& tbl, const char* key, const std::string& section,
                    std::vector<std::string>& out, WarnSink& warn) {
    const MetaValue* v = tbl.find(key);
    if (!v) return;
    if (!v->isArray()) {
        warn.add(section + "." + key, "Expected an array of strings, got " + v->repr());
        return;
    }
    for (const MetaValue& item : v->arr) {
        if (item.isString()) {
            out.push_back(item.str);
        } else {
            warn.add(section + "." + key, "Ignoring non-string " + item.repr());
        }
    }
}

const MetaValue* tableOrWarn(const MetaValue& parent, const char* key, const std::string& where, WarnSink& warn) {
    const MetaValue* v = parent.find(key);
    if (!v) return nullptr;
    if (!v->isTable()) {
        warn.add(where, "Expected a table, got " + v->repr());
        return nullptr;
    }
    return v;
}

void readLineSettings(const MetaValue& tbl, const std::string& prefix, LineSettings& out, WarnSink& warn) {
    const std::string w = prefix + "width";
    const std::string c = prefix + "color";
    readDouble(tbl, w.c_str(), "lines", out.width, warn);
    readString(tbl, c.c_str(), "lines", out.color, warn);
}

GlobalSection readGlobal(const MetaValue& t, WarnSink& warn) {
    GlobalSection g;
    readInt(t, "deviation", "global", g.deviation, warn);
    readInt(t, "weight", "global", g.weight, warn);
    readInt(t, "distance", "global", g.distance, warn);
    readDouble(t, "size", "global", g.size, warn);
    readInt(t, "width", "global", g.width, warn);
    readInt(t, "height", "global", g.height, warn);
    return g;
}

LinesSection readLines(const MetaValue& t, WarnSink& warn) {
    LinesSection l;
    readLineSettings(t, "", l.base, warn);
    readLineSettings(t, "del_", l.del, warn);
    readLineSettings(t, "hex_", l.hex, warn);
    readLineSettings(t, "tri_", l.tri, warn);
    readLineSettings(t, "rho_", l.rho, warn);
    readLineSettings(t, "hex_and_tri_", l.hexAndTri, warn);
    readLineSettings(t, "squ_and_tri_", l.squAndTri, warn);
    readLineSettings(t, "pen_", l.pen, warn);
    return l;
}

PatternsSection readPatterns(const MetaValue& t, WarnSink& warn) {
    const std::string s = "data.patterns";
    PatternsSection p;
    readInt(t, "nb_free_circles", s, p.nbFreeCircles, warn);
    readInt(t, "nb_free_spirals", s, p.nbFreeSpirals, warn);
    readInt(t, "nb_free_stripes", s, p.nbFreeStripes, warn);
    readInt(t, "nb_crossed_stripes", s, p.nbCrossedStripes, warn);
    readInt(t, "nb_parallel_stripes", s, p.nbParallelStripes, warn);
    readInt(t, "nb_concentric_circles", s, p.nbConcentricCircles, warn);
    readInt(t, "nb_free_triangles", s, p.nbFreeTriangles, warn);
    readInt(t, "nb_parallel_waves", s, p.nbParallelWaves, warn);
    readInt(t, "nb_parallel_sawteeth", s, p.nbParallelSawteeth, warn);
    readInt(t, "var_parallel_stripes", s, p.varParallelStripes, warn);
    readInt(t, "var_crossed_stripes", s, p.varCrossedStripes, warn);
    readDouble(t, "width_spiral", s, p.widthSpiral, warn);
    readDouble(t, "width_stripe", s, p.widthStripe, warn);
    readDouble(t, "width_wave", s, p.widthWave, warn);
    readDouble(t, "width_sawtooth", s, p.widthSawtooth, warn);
    readDouble(t, "tightness_spiral", s, p.tightnessSpiral, warn);
    return p;
}

TilingsSection readTilings(const MetaValue& t, WarnSink& warn) {
    const std::string s = "data.tilings";
    TilingsSection ti;
    readDouble(t, "size_hex", s, ti.sizeHex, warn);
    readDouble(t, "size_tri", s, ti.sizeTri, warn);
    readDouble(t, "size_hex_and_tri", s, ti.sizeHexAndTri, warn);
    readDouble(t, "size_squ_and_tri", s, ti.sizeSquAndTri, warn);
    readDouble(t, "size_rho", s, ti.sizeRho, warn);
    readDouble(t, "size_pen", s, ti.sizePen, warn);
    readInt(t, "nb_delaunay", s, ti.nbDelaunay, warn);
    return ti;
}

EntrySection readEntry(const MetaValue& t, const std::string& where, WarnSink& warn) {
    EntrySection e;
    readString(t, "span", where, e.span, warn);
    readInt(t, "distance", where, e.distance, warn);
    readStringList(t, "themes", where, e.themes, warn);
    readStringList(t, "shapes", where, e.shapes, warn);
    readString(t, "line_color", where, e.lineColor, warn);
    return e;
}

void flush(const WarnSink& warn, std::string* outWarnings) {
    if (outWarnings) *outWarnings += warn.text;
}

} // namespace

MetaConfig metaConfigFromDoc(const MetaValue& doc, std::string* outWarnings) {
    MetaConfig cfg;
    WarnSink warn;

    if (const MetaValue* t = tableOrWarn(doc, "global", "global", warn)) cfg.global = readGlobal(*t, warn);
    if (const MetaValue* t = tableOrWarn(doc, "lines", "lines", warn)) cfg.lines = readLines(*t, warn);

    if (const MetaValue* t = tableOrWarn(doc, "colors", "colors", warn)) cfg.colors = *t;
    if (const MetaValue* t = tableOrWarn(doc, "themes", "themes", warn)) cfg.themes = *t;
    if (const MetaValue* t = tableOrWarn(doc, "shapes", "shapes", warn)) cfg.shapes = *t;

    if (const MetaValue* data = tableOrWarn(doc, "data", "data", warn)) {
        if (const MetaValue* t = tableOrWarn(*data, "patterns", "data.patterns", warn)) cfg.patterns = readPatterns(*t, warn);
        if (const MetaValue* t = tableOrWarn(*data, "tilings", "data.tilings", warn)) cfg.tilings = readTilings(*t, warn);
    }

    if (const MetaValue* list = doc.find("entry")) {
        if (!list->isArray()) {
            warn.add("entry", "Expected [[entry]] tables, got " + list->repr());
        } else {
            for (size_t k = 0; k < list->arr.size(); ++k) {
                const std::string where = "entry[" + std::to_string(k) + "]";
                const MetaValue& e = list->arr[k];
                if (!e.isTable()) {
                    warn.add(where, "Expected a table, got " + e.repr());
                    continue;
                }
                cfg.entries.push_back(readEntry(e, where, warn));
            }
        }
    }

    flush(warn, outWarnings);
    return cfg;
}

MetaConfig parseMetaConfig(const std::string& text, std::string* outWarnings) {
    MetaValue doc;
    std::string err;
    if (!parseMetaDoc(text, doc, &err)) {
        if (outWarnings) *outWarnings += "config: " + err + " (using defaults)\n";
        return MetaConfig{};
    }
    return metaConfigFromDoc(doc, outWarnings);
}

MetaConfig loadMetaConfig(const std::string& path, std::string* outWarnings) {
    MetaValue doc;
    std::string err;
    if (!loadMetaDoc(path, doc, &err)) {
        if (outWarnings) *outWarnings += "config: " + err + " (using defaults)\n";
        return MetaConfig{};
    }
    return metaConfigFromDoc(doc, outWarnings);
}
