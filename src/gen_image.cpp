#include "gen_image.hpp"

#include "blurhash.hpp"
#include "common.hpp"
#include "raster.hpp"
#include "rng.hpp"
#include "scene.hpp"
#include "tessellate.hpp"

#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace {

bool isBmpPath(const std::string& path) {
    return endsWith(toLower(path), ".bmp");
}

// Move tmp over dest. Rename fails on some platforms when dest exists.
bool commitFile(const std::string& tmp, const std::string& dest, std::string* err) {
    std::error_code ec;
    fs::rename(tmp, dest, ec);
    if (ec) {
        std::error_code ec2;
        fs::remove(dest, ec2);
        ec.clear();
        fs::rename(tmp, dest, ec);
    }
    if (ec) {
        if (err) *err = "Could not move " + tmp + " to " + dest + ": " + ec.message();
        std::error_code ec2;
        fs::remove(tmp, ec2);
        return false;
    }
    return true;
}

void removeQuietly(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
}

bool fail(GenImageResult& result, GenImageError e, const std::string& msg) {
    result.error = e;
    result.message = msg;
    return false;
}

} // namespace

const char* genImageErrorName(GenImageError e) {
    switch (e) {
        case GenImageError::None: return "none";
        case GenImageError::CantSaveGeneratedImage: return "cant-save-generated-image";
        case GenImageError::CantOpenImage: return "cant-open-image";
        case GenImageError::MalformedGeometry: return "malformed-geometry";
    }
    return "unknown";
}

bool composeDocument(const GenImageRequest& req, Document& out, GenImageResult& result) {
    out = Document{};
    RNG rng(req.seed);

    const uint64_t time = req.time ? *req.time : seedTimeOfDay(req.seed);
    result.cfg = pickSceneCfg(req.config, rng, time, req.defaults, &result.warnings);

    const Scene scene = Scene::build(result.cfg, rng);

    std::vector<Tile> tiles;
    std::string err;
    if (!makeTiling(result.cfg, rng, tiles, &err)) {
        return fail(result, GenImageError::MalformedGeometry, err);
    }

    out.frame = result.cfg.frame;
    out.paths.reserve(tiles.size());
    for (const Tile& t : tiles) {
        const Color fill = scene.color(t.anchor, rng);
        out.add(makeTilePath(t.polygon, fill, result.cfg.lineColor, result.cfg.lineWidth));
    }
    result.tileCount = tiles.size();
    return true;
}

bool generateImages(const GenImageRequest& req, GenImageResult& result) {
    result = GenImageResult{};

    if (!req.blurDest.empty() && !isBmpPath(req.blurDest)) {
        return fail(result, GenImageError::CantSaveGeneratedImage,
                    "Unsupported preview format: " + req.blurDest + " (use .bmp)");
    }

    Document doc;
    if (!composeDocument(req, doc, result)) return false;

    const std::string tmpA = req.imageDest + ".tmp";
    std::string err;
    if (!saveDocument(doc, tmpA, &err)) {
        removeQuietly(tmpA);
        return fail(result, GenImageError::CantSaveGeneratedImage, err);
    }

    RasterImage pixels;
    if (isBmpPath(req.imageDest)) {
        if (!loadBmp(tmpA, pixels, &err)) {
            removeQuietly(tmpA);
            return fail(result, GenImageError::CantOpenImage, err);
        }
    } else {
        pixels = rasterizeDocument(doc);
    }

    if (!blurhash::encode(pixels, blurhash::DEFAULT_COMPONENTS_X, blurhash::DEFAULT_COMPONENTS_Y,
                          result.blurhash, &err)) {
        removeQuietly(tmpA);
        return fail(result, GenImageError::CantOpenImage, err);
    }

    std::string tmpB;
    if (!req.blurDest.empty()) {
        RasterImage preview;
        if (!blurhash::decode(result.blurhash, pixels.w, pixels.h, blurhash::DEFAULT_PUNCH, preview, &err)) {
            removeQuietly(tmpA);
            return fail(result, GenImageError::CantSaveGeneratedImage, err);
        }
        tmpB = req.blurDest + ".tmp";
        if (!saveBmp(preview, tmpB, &err)) {
            removeQuietly(tmpA);
            removeQuietly(tmpB);
            return fail(result, GenImageError::CantSaveGeneratedImage, err);
        }
    }

    if (!commitFile(tmpA, req.imageDest, &err)) {
        if (!tmpB.empty()) removeQuietly(tmpB);
        return fail(result, GenImageError::CantSaveGeneratedImage, err);
    }
    if (!tmpB.empty() && !commitFile(tmpB, req.blurDest, &err)) {
        return fail(result, GenImageError::CantSaveGeneratedImage, err);
    }
    return true;
}
