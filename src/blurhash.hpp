#pragma once
#include "raster.hpp"

#include <string>

// Blurhash: a short base83 string holding the low-frequency DCT components of
// an image. Standard format, so hashes interoperate with other implementations.
namespace blurhash {

constexpr int DEFAULT_COMPONENTS_X = 4;
constexpr int DEFAULT_COMPONENTS_Y = 3;
constexpr double DEFAULT_PUNCH = 1.2;

// Components must be within 1..9 on both axes.
bool encode(const RasterImage& img, int componentsX, int componentsY, std::string& out, std::string* err = nullptr);

// Render `hash` at w x h. `punch` scales the AC components (contrast).
bool decode(const std::string& hash, int w, int h, double punch, RasterImage& out, std::string* err = nullptr);

} // namespace blurhash
