#pragma once
#include "meta_doc.hpp"

#include <optional>
#include <string>
#include <vector>

// Typed view of the configuration document. Everything is optional: a missing
// key falls through to the section default and then to the built-in constant
// when the scene is resolved (see pickSceneCfg).

struct GlobalSection {
    std::optional<int> deviation;
    std::optional<int> weight; // older name of `distance`
    std::optional<int> distance;
    std::optional<double> size;
    std::optional<int> width;
    std::optional<int> height;
};

struct LineSettings {
    std::optional<double> width;
    std::optional<std::string> color;
};

struct LinesSection {
    LineSettings base;
    LineSettings del;
    LineSettings hex;
    LineSettings tri;
    LineSettings rho;
    LineSettings hexAndTri;
    LineSettings squAndTri;
    LineSettings pen;
};

struct PatternsSection {
    std::optional<int> nbFreeCircles;
    std::optional<int> nbFreeSpirals;
    std::optional<int> nbFreeStripes;
    std::optional<int> nbCrossedStripes;
    std::optional<int> nbParallelStripes;
    std::optional<int> nbConcentricCircles;
    std::optional<int> nbFreeTriangles;
    std::optional<int> nbParallelWaves;
    std::optional<int> nbParallelSawteeth;
    std::optional<int> varParallelStripes;
    std::optional<int> varCrossedStripes;
    std::optional<double> widthSpiral;
    std::optional<double> widthStripe;
    std::optional<double> widthWave;
    std::optional<double> widthSawtooth;
    std::optional<double> tightnessSpiral;
};

struct TilingsSection {
    std::optional<double> sizeHex;
    std::optional<double> sizeTri;
    std::optional<double> sizeHexAndTri;
    std::optional<double> sizeSquAndTri;
    std::optional<double> sizeRho;
    std::optional<double> sizePen;
    std::optional<int> nbDelaunay;
};

// One [[entry]]: a time span and the theme/shape names allowed during it.
struct EntrySection {
    std::optional<std::string> span;
    std::optional<int> distance;
    std::vector<std::string> themes;
    std::vector<std::string> shapes;
    std::optional<std::string> lineColor;
};

struct MetaConfig {
    std::optional<GlobalSection> global;
    std::optional<LinesSection> lines;

    // Dictionaries are kept as raw tables; their entries reference each other
    // and are interpreted by the resolver.
    std::optional<MetaValue> colors;
    std::optional<MetaValue> themes;
    std::optional<MetaValue> shapes;

    std::optional<PatternsSection> patterns;
    std::optional<TilingsSection> tilings;

    std::vector<EntrySection> entries;
};

// Build the typed view. Values of the wrong type are skipped with a warning.
MetaConfig metaConfigFromDoc(const MetaValue& doc, std::string* outWarnings = nullptr);

// Parse a document. A document that does not parse yields an empty config and
// the parse error as a warning.
MetaConfig parseMetaConfig(const std::string& text, std::string* outWarnings = nullptr);

// Same, reading from a file. An unreadable file yields an empty config plus a warning.
MetaConfig loadMetaConfig(const std::string& path, std::string* outWarnings = nullptr);
