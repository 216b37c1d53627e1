#pragma once

#include "meta_config.hpp"
#include "scene_cfg.hpp"
#include "svg.hpp"

#include <cstdint>
#include <optional>
#include <string>

enum class GenImageError : uint8_t {
    None = 0,
    CantSaveGeneratedImage,
    CantOpenImage,
    MalformedGeometry,
};

const char* genImageErrorName(GenImageError e);

struct GenImageRequest {
    uint64_t seed = 0;
    // Time of day (hhmm) used to select a time-span entry; derived from the seed when unset.
    std::optional<uint64_t> time;

    MetaConfig config;
    SceneDefaults defaults;

    // Artifact A: ".svg" or ".bmp". Preview B: ".bmp". An empty preview path skips B.
    std::string imageDest;
    std::string blurDest;
};

struct GenImageResult {
    GenImageError error = GenImageError::None;
    std::string message;

    std::string blurhash;
    std::string warnings;

    SceneCfg cfg;
    size_t tileCount = 0;
};

// Resolve, compose and collect the document for one seed without touching disk.
// Fails (MalformedGeometry) when the tiling cannot be built.
bool composeDocument(const GenImageRequest& req, Document& out, GenImageResult& result);

// The full pipeline: compose, save A, compute its blurhash, save the decoded preview B.
// Outputs are written next to their destination as ".tmp" and renamed once both
// succeed, so a failed run leaves nothing behind.
bool generateImages(const GenImageRequest& req, GenImageResult& result);
