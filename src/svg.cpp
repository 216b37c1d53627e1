#include "svg.hpp"

#include "common.hpp"
#include "raster.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace {

std::string stripTmp(const std::string& path) {
    const std::string lower = toLower(path);
    if (endsWith(lower, ".tmp")) return lower.substr(0, lower.size() - 4);
    return lower;
}

bool writeTextFile(const std::string& path, const std::string& contents, std::string* err) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        if (err) *err = "Could not open " + path + " for writing";
        return false;
    }
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    out.flush();
    if (!out.good()) {
        if (err) *err = "Failed writing " + path;
        std::error_code ec;
        out.close();
        fs::remove(path, ec);
        return false;
    }
    return true;
}

} // namespace

Path makeTilePath(const Polygon& points, const Color& fill, const Color& lineColor, double lineWidth) {
    Path p;
    p.points = points;
    p.fill = fill;
    p.stroke = (lineWidth < 0.0001) ? fill : lineColor;
    p.strokeWidth = std::max(lineWidth, 0.1);
    return p;
}

std::string formatNumber(double v) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.3f", v);
    std::string s = buf;
    if (s.find('.') != std::string::npos) {
        while (!s.empty() && s.back() == '0') s.pop_back();
        if (!s.empty() && s.back() == '.') s.pop_back();
    }
    if (s == "-0") s = "0";
    return s;
}

std::string Document::toSvg() const {
    std::ostringstream ss;
    ss << "<svg viewBox=\"" << frame.x << " " << frame.y << " " << frame.w << " " << frame.h
       << "\" xmlns=\"http://www.w3.org/2000/svg\">\n";
    for (const Path& p : paths) {
        if (p.points.empty()) continue;
        ss << "<path d=\"";
        for (size_t k = 0; k < p.points.size(); ++k) {
            ss << (k == 0 ? "M" : " L") << formatNumber(p.points[k].x) << "," << formatNumber(p.points[k].y);
        }
        ss << " z\" fill=\"" << p.fill.svg() << "\" stroke=\"" << p.stroke.svg()
           << "\" stroke-width=\"" << formatNumber(p.strokeWidth) << "\"/>\n";
    }
    ss << "</svg>\n";
    return ss.str();
}

bool saveDocument(const Document& doc, const std::string& dest, std::string* err) {
    const std::string kind = stripTmp(dest);

    if (endsWith(kind, ".svg")) {
        return writeTextFile(dest, doc.toSvg(), err);
    }
    if (endsWith(kind, ".bmp")) {
        return saveBmp(rasterizeDocument(doc), dest, err);
    }

    if (err) *err = "Unsupported output format: " + dest + " (use .svg or .bmp)";
    return false;
}
