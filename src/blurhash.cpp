#include "blurhash.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <vector>

namespace blurhash {

namespace {

constexpr const char* BASE83 =
    "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz#$%*+,-.:;=?@[]^_{|}~";

struct Rgbf {
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;
};

void encode83(int value, int length, std::string& out) {
    int divisor = 1;
    for (int k = 1; k < length; ++k) divisor *= 83;
    for (int k = 0; k < length; ++k) {
        const int digit = (value / divisor) % 83;
        out.push_back(BASE83[digit]);
        divisor /= 83;
    }
}

bool decode83(const std::string& s, size_t from, size_t length, int& value) {
    value = 0;
    for (size_t k = from; k < from + length; ++k) {
        const char* hit = std::strchr(BASE83, s[k]);
        if (!hit || s[k] == '\0') return false;
        value = value * 83 + static_cast<int>(hit - BASE83);
    }
    return true;
}

double srgbToLinear(uint8_t v) {
    const double x = v / 255.0;
    if (x <= 0.04045) return x / 12.92;
    return std::pow((x + 0.055) / 1.055, 2.4);
}

int linearToSrgb(double v) {
    const double x = std::clamp(v, 0.0, 1.0);
    if (x <= 0.0031308) return static_cast<int>(x * 12.92 * 255.0 + 0.5);
    return static_cast<int>((1.055 * std::pow(x, 1.0 / 2.4) - 0.055) * 255.0 + 0.5);
}

double signPow(double v, double e) {
    return std::copysign(std::pow(std::abs(v), e), v);
}

// cos(pi * k * x / n) for every x, per component k.
std::vector<double> cosTable(int n, int components) {
    std::vector<double> t(static_cast<size_t>(n) * static_cast<size_t>(components));
    for (int k = 0; k < components; ++k) {
        for (int x = 0; x < n; ++x) {
            t[static_cast<size_t>(k) * static_cast<size_t>(n) + static_cast<size_t>(x)] =
                std::cos(3.14159265358979323846 * k * x / n);
        }
    }
    return t;
}

} // namespace

bool encode(const RasterImage& img, int componentsX, int componentsY, std::string& out, std::string* err) {
    out.clear();
    if (componentsX < 1 || componentsX > 9 || componentsY < 1 || componentsY > 9) {
        if (err) *err = "Blurhash components must be within 1..9";
        return false;
    }
    if (img.empty() || img.px.size() != static_cast<size_t>(img.w) * static_cast<size_t>(img.h)) {
        if (err) *err = "Cannot hash an empty image";
        return false;
    }

    const std::vector<double> cx = cosTable(img.w, componentsX);
    const std::vector<double> cy = cosTable(img.h, componentsY);

    std::vector<Rgbf> linear(img.px.size());
    for (size_t k = 0; k < img.px.size(); ++k) {
        linear[k] = {srgbToLinear(img.px[k].r), srgbToLinear(img.px[k].g), srgbToLinear(img.px[k].b)};
    }

    std::vector<Rgbf> factors;
    factors.reserve(static_cast<size_t>(componentsX * componentsY));
    for (int j = 0; j < componentsY; ++j) {
        for (int i = 0; i < componentsX; ++i) {
            Rgbf f;
            for (int y = 0; y < img.h; ++y) {
                const double by = cy[static_cast<size_t>(j) * static_cast<size_t>(img.h) + static_cast<size_t>(y)];
                for (int x = 0; x < img.w; ++x) {
                    const double basis = by * cx[static_cast<size_t>(i) * static_cast<size_t>(img.w) + static_cast<size_t>(x)];
                    const Rgbf& p = linear[static_cast<size_t>(y) * static_cast<size_t>(img.w) + static_cast<size_t>(x)];
                    f.r += basis * p.r;
                    f.g += basis * p.g;
                    f.b += basis * p.b;
                }
            }
            const double norm = (i == 0 && j == 0) ? 1.0 : 2.0;
            const double scale = norm / (static_cast<double>(img.w) * img.h);
            f.r *= scale;
            f.g *= scale;
            f.b *= scale;
            factors.push_back(f);
        }
    }

    encode83((componentsX - 1) + (componentsY - 1) * 9, 1, out);

    double maximumValue = 1.0;
    if (factors.size() > 1) {
        double actualMax = 0.0;
        for (size_t k = 1; k < factors.size(); ++k) {
            actualMax = std::max({actualMax, std::abs(factors[k].r), std::abs(factors[k].g), std::abs(factors[k].b)});
        }
        const int quantisedMax = std::clamp(static_cast<int>(std::floor(actualMax * 166.0 - 0.5)), 0, 82);
        maximumValue = (quantisedMax + 1) / 166.0;
        encode83(quantisedMax, 1, out);
    } else {
        encode83(0, 1, out);
    }

    const Rgbf& dc = factors[0];
    encode83((linearToSrgb(dc.r) << 16) + (linearToSrgb(dc.g) << 8) + linearToSrgb(dc.b), 4, out);

    auto quantAc = [&](double v) {
        return std::clamp(static_cast<int>(std::floor(signPow(v / maximumValue, 0.5) * 9.0 + 9.5)), 0, 18);
    };
    for (size_t k = 1; k < factors.size(); ++k) {
        const Rgbf& f = factors[k];
        encode83(quantAc(f.r) * 19 * 19 + quantAc(f.g) * 19 + quantAc(f.b), 2, out);
    }
    return true;
}

bool decode(const std::string& hash, int w, int h, double punch, RasterImage& out, std::string* err) {
    out = RasterImage{};
    if (w <= 0 || h <= 0) {
        if (err) *err = "Blurhash output size must be positive";
        return false;
    }
    if (hash.size() < 6) {
        if (err) *err = "Blurhash too short";
        return false;
    }

    int sizeFlag = 0;
    if (!decode83(hash, 0, 1, sizeFlag)) {
        if (err) *err = "Invalid blurhash character";
        return false;
    }
    const int numY = sizeFlag / 9 + 1;
    const int numX = sizeFlag % 9 + 1;
    if (hash.size() != static_cast<size_t>(4 + 2 * numX * numY)) {
        if (err) *err = "Blurhash length does not match its component count";
        return false;
    }

    int quantisedMax = 0;
    int dcValue = 0;
    if (!decode83(hash, 1, 1, quantisedMax) || !decode83(hash, 2, 4, dcValue)) {
        if (err) *err = "Invalid blurhash character";
        return false;
    }
    const double maximumValue = (quantisedMax + 1) / 166.0 * punch;

    std::vector<Rgbf> colors(static_cast<size_t>(numX * numY));
    colors[0] = {srgbToLinear(static_cast<uint8_t>((dcValue >> 16) & 255)),
                 srgbToLinear(static_cast<uint8_t>((dcValue >> 8) & 255)),
                 srgbToLinear(static_cast<uint8_t>(dcValue & 255))};
    for (size_t k = 1; k < colors.size(); ++k) {
        int v = 0;
        if (!decode83(hash, 4 + k * 2, 2, v)) {
            if (err) *err = "Invalid blurhash character";
            return false;
        }
        const int qr = v / (19 * 19);
        const int qg = (v / 19) % 19;
        const int qb = v % 19;
        colors[k] = {signPow((qr - 9) / 9.0, 2.0) * maximumValue,
                     signPow((qg - 9) / 9.0, 2.0) * maximumValue,
                     signPow((qb - 9) / 9.0, 2.0) * maximumValue};
    }

    const std::vector<double> cx = cosTable(w, numX);
    const std::vector<double> cy = cosTable(h, numY);

    out.w = w;
    out.h = h;
    out.px.resize(static_cast<size_t>(w) * static_cast<size_t>(h));
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            Rgbf c;
            for (int j = 0; j < numY; ++j) {
                const double by = cy[static_cast<size_t>(j) * static_cast<size_t>(h) + static_cast<size_t>(y)];
                for (int i = 0; i < numX; ++i) {
                    const double basis = by * cx[static_cast<size_t>(i) * static_cast<size_t>(w) + static_cast<size_t>(x)];
                    const Rgbf& f = colors[static_cast<size_t>(j * numX + i)];
                    c.r += f.r * basis;
                    c.g += f.g * basis;
                    c.b += f.b * basis;
                }
            }
            Rgba& p = out.at(x, y);
            p.r = static_cast<uint8_t>(linearToSrgb(c.r));
            p.g = static_cast<uint8_t>(linearToSrgb(c.g));
            p.b = static_cast<uint8_t>(linearToSrgb(c.b));
            p.a = 255;
        }
    }
    return true;
}

} // namespace blurhash
