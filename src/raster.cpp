#include "raster.hpp"
#include "sdl.hpp"

#include <algorithm>
#include <cmath>

namespace {

inline uint8_t clamp8(int v) {
    if (v < 0) return 0;
    if (v > 255) return 255;
    return static_cast<uint8_t>(v);
}

inline double edgeFn(const Pos& a, const Pos& b, double x, double y) {
    return (x - a.x) * (b.y - a.y) - (y - a.y) * (b.x - a.x);
}

void fillPolygon(RasterImage& img, const Polygon& poly, const Pos& offset, const Rgba& c) {
    if (poly.size() < 3) return;
    const Pos center = polygonCentroid(poly) - offset;
    for (size_t k = 0; k < poly.size(); ++k) {
        const Pos a = poly[k] - offset;
        const Pos b = poly[(k + 1) % poly.size()] - offset;
        rasterTriangle(img, {center, a, b, c});
    }
}

void strokePolygon(RasterImage& img, const Polygon& poly, const Pos& offset, double width, const Rgba& c) {
    if (poly.size() < 2 || width <= 0.0) return;
    const double half = width / 2.0;
    for (size_t k = 0; k < poly.size(); ++k) {
        const Pos a = poly[k] - offset;
        const Pos b = poly[(k + 1) % poly.size()] - offset;
        const Pos dir = (b - a).unit();
        const Pos n = Pos(-dir.y, dir.x) * half;
        // Extend along the edge so corners close up.
        const Pos e = dir * half;
        const Pos a0 = a - e + n;
        const Pos a1 = a - e - n;
        const Pos b0 = b + e + n;
        const Pos b1 = b + e - n;
        rasterTriangle(img, {a0, b0, b1, c});
        rasterTriangle(img, {a0, b1, a1, c});
    }
}

} // namespace

Rgba toRgba(const Color& c) {
    const Color v = c.validated();
    return {clamp8(v.r), clamp8(v.g), clamp8(v.b), 255};
}

void rasterTriangle(RasterImage& img, const RasterTriangle& t) {
    if (img.empty()) return;

    const Pos& a = t.p0;
    const Pos& b = t.p1;
    const Pos& c = t.p2;

    int minX = static_cast<int>(std::floor(std::min({a.x, b.x, c.x})));
    int maxX = static_cast<int>(std::ceil(std::max({a.x, b.x, c.x})));
    int minY = static_cast<int>(std::floor(std::min({a.y, b.y, c.y})));
    int maxY = static_cast<int>(std::ceil(std::max({a.y, b.y, c.y})));

    if (maxX < 0 || maxY < 0 || minX > img.w - 1 || minY > img.h - 1) return;

    minX = std::clamp(minX, 0, img.w - 1);
    maxX = std::clamp(maxX, 0, img.w - 1);
    minY = std::clamp(minY, 0, img.h - 1);
    maxY = std::clamp(maxY, 0, img.h - 1);

    const double area = edgeFn(a, b, c.x, c.y);
    if (std::abs(area) < 1e-9) return;

    // Support either winding.
    const bool ccw = (area > 0.0);
    constexpr double eps = 1e-7;

    for (int y = minY; y <= maxY; ++y) {
        for (int x = minX; x <= maxX; ++x) {
            const double px = static_cast<double>(x) + 0.5;
            const double py = static_cast<double>(y) + 0.5;

            const double w0 = edgeFn(b, c, px, py);
            const double w1 = edgeFn(c, a, px, py);
            const double w2 = edgeFn(a, b, px, py);

            const bool inside = ccw
                ? (w0 >= -eps && w1 >= -eps && w2 >= -eps)
                : (w0 <= eps && w1 <= eps && w2 <= eps);
            if (!inside) continue;

            img.at(x, y) = t.c;
        }
    }
}

RasterImage rasterizeDocument(const Document& doc) {
    RasterImage img;
    img.w = std::max(1, doc.frame.w);
    img.h = std::max(1, doc.frame.h);
    img.px.assign(static_cast<size_t>(img.w) * static_cast<size_t>(img.h), Rgba{255, 255, 255, 255});

    const Pos offset{static_cast<double>(doc.frame.x), static_cast<double>(doc.frame.y)};
    for (const Path& p : doc.paths) {
        fillPolygon(img, p.points, offset, toRgba(p.fill));
        strokePolygon(img, p.points, offset, p.strokeWidth, toRgba(p.stroke));
    }
    return img;
}

bool saveBmp(const RasterImage& img, const std::string& path, std::string* err) {
    if (img.empty() || img.px.size() != static_cast<size_t>(img.w) * static_cast<size_t>(img.h)) {
        if (err) *err = "Refusing to save an empty image";
        return false;
    }

    SDL_Surface* surface = SDL_CreateRGBSurfaceWithFormat(0, img.w, img.h, 32, SDL_PIXELFORMAT_RGBA32);
    if (!surface) {
        if (err) *err = std::string("SDL_CreateRGBSurfaceWithFormat failed: ") + SDL_GetError();
        return false;
    }

    if (SDL_MUSTLOCK(surface)) SDL_LockSurface(surface);
    uint8_t* base = static_cast<uint8_t*>(surface->pixels);
    for (int y = 0; y < img.h; ++y) {
        uint8_t* row = base + static_cast<size_t>(y) * static_cast<size_t>(surface->pitch);
        for (int x = 0; x < img.w; ++x) {
            const Rgba& c = img.at(x, y);
            row[x * 4 + 0] = c.r;
            row[x * 4 + 1] = c.g;
            row[x * 4 + 2] = c.b;
            row[x * 4 + 3] = c.a;
        }
    }
    if (SDL_MUSTLOCK(surface)) SDL_UnlockSurface(surface);

    if (SDL_SaveBMP(surface, path.c_str()) != 0) {
        if (err) *err = "Could not write " + path + ": " + SDL_GetError();
        SDL_FreeSurface(surface);
        return false;
    }

    SDL_FreeSurface(surface);
    return true;
}

bool loadBmp(const std::string& path, RasterImage& out, std::string* err) {
    out = RasterImage{};

    SDL_Surface* loaded = SDL_LoadBMP(path.c_str());
    if (!loaded) {
        if (err) *err = "Could not open " + path + ": " + SDL_GetError();
        return false;
    }

    SDL_Surface* surface = SDL_ConvertSurfaceFormat(loaded, SDL_PIXELFORMAT_RGBA32, 0);
    SDL_FreeSurface(loaded);
    if (!surface) {
        if (err) *err = std::string("SDL_ConvertSurfaceFormat failed: ") + SDL_GetError();
        return false;
    }

    out.w = surface->w;
    out.h = surface->h;
    out.px.resize(static_cast<size_t>(out.w) * static_cast<size_t>(out.h));

    if (SDL_MUSTLOCK(surface)) SDL_LockSurface(surface);
    const uint8_t* base = static_cast<const uint8_t*>(surface->pixels);
    for (int y = 0; y < out.h; ++y) {
        const uint8_t* row = base + static_cast<size_t>(y) * static_cast<size_t>(surface->pitch);
        for (int x = 0; x < out.w; ++x) {
            Rgba& c = out.at(x, y);
            c.r = row[x * 4 + 0];
            c.g = row[x * 4 + 1];
            c.b = row[x * 4 + 2];
            // Files without an alpha channel come back transparent on some SDL versions.
            c.a = 255;
        }
    }
    if (SDL_MUSTLOCK(surface)) SDL_UnlockSurface(surface);

    SDL_FreeSurface(surface);
    return true;
}
