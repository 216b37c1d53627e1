#include "sdl.hpp"

#include "gen_image.hpp"
#include "meta_config.hpp"
#include "version.hpp"

#include <cstdint>
#include <ctime>
#include <iostream>
#include <optional>
#include <random>
#include <string>

namespace {

static void printUsage(const char* argv0) {
    std::cout
        << BACKDROP_APPNAME << " " << BACKDROP_VERSION << "\n"
        << "Usage: " << (argv0 ? argv0 : "backdrop") << " [options]\n\n"
        << "Options:\n"
        << "  --id <n>             Seed of the background. Default: local time as hhmm.\n"
        << "  --random             Use a random seed (printed on stdout).\n"
        << "  --time <hhmm>        Time of day used to pick a config entry. Default: derived from the seed.\n"
        << "  --config <path>      Configuration file. Default: built-in defaults.\n"
        << "  --output <prefix>    Output prefix. Default: output.\n"
        << "                       Writes <prefix>.output.<format> and <prefix>.blur.bmp.\n"
        << "  --format <svg|bmp>   Format of the generated image. Default: svg.\n"
        << "  --no-preview         Skip writing the blurred preview.\n"
        << "  --verbose            Print the resolved scene.\n"
        << "  --version, -v        Print version and exit.\n"
        << "  --help, -h           Show this help and exit.\n";
}

static bool argValue(int& i, int argc, char** argv, std::string& out) {
    if (i + 1 >= argc) return false;
    out = argv[++i];
    return true;
}

static bool parseU64(const std::string& s, uint64_t& out) {
    if (s.empty()) return false;
    uint64_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        const uint64_t d = static_cast<uint64_t>(c - '0');
        if (v > (UINT64_MAX - d) / 10) return false;
        v = v * 10 + d;
    }
    out = v;
    return true;
}

static uint64_t localClockId() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    tm = *std::localtime(&t);
#endif
    return static_cast<uint64_t>(tm.tm_hour) * 100u + static_cast<uint64_t>(tm.tm_min);
}

static uint64_t randomId() {
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd());
}

} // namespace

int main(int argc, char** argv) {
    std::optional<uint64_t> id;
    std::optional<uint64_t> time;
    std::string configPath;
    std::string prefix = "output";
    std::string format = "svg";
    bool random = false;
    bool preview = true;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--help" || a == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (a == "--version" || a == "-v") {
            std::cout << BACKDROP_APPNAME << " " << BACKDROP_VERSION << "\n";
            return 0;
        } else if (a == "--id") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--id requires a value\n";
                return 2;
            }
            uint64_t n = 0;
            if (!parseU64(v, n)) {
                std::cerr << "Invalid --id: " << v << "\n";
                return 2;
            }
            id = n;
        } else if (a == "--time") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--time requires a value\n";
                return 2;
            }
            uint64_t n = 0;
            if (!parseU64(v, n) || n % 100 >= 60 || n >= 2400) {
                std::cerr << "Invalid --time (expected hhmm): " << v << "\n";
                return 2;
            }
            time = n;
        } else if (a == "--config") {
            if (!argValue(i, argc, argv, configPath)) {
                std::cerr << "--config requires a path\n";
                return 2;
            }
        } else if (a == "--output") {
            if (!argValue(i, argc, argv, prefix) || prefix.empty()) {
                std::cerr << "--output requires a prefix\n";
                return 2;
            }
        } else if (a == "--format") {
            if (!argValue(i, argc, argv, format) || (format != "svg" && format != "bmp")) {
                std::cerr << "--format must be svg or bmp\n";
                return 2;
            }
        } else if (a == "--random") {
            random = true;
        } else if (a == "--no-preview") {
            preview = false;
        } else if (a == "--verbose") {
            verbose = true;
        } else {
            std::cerr << "Unknown option: " << a << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    if (random && id) {
        std::cerr << "--random and --id are mutually exclusive\n";
        return 2;
    }

    GenImageRequest req;
    req.seed = id ? *id : (random ? randomId() : localClockId());
    req.time = time;
    req.imageDest = prefix + ".output." + format;
    if (preview) req.blurDest = prefix + ".blur.bmp";

    std::string configWarnings;
    if (!configPath.empty()) {
        req.config = loadMetaConfig(configPath, &configWarnings);
    }
    if (!configWarnings.empty()) std::cerr << configWarnings;

    if (random) std::cout << "id is: " << req.seed << "\n";

    GenImageResult result;
    const bool ok = generateImages(req, result);
    if (!result.warnings.empty()) std::cerr << result.warnings;

    if (!ok) {
        std::cerr << "Generation failed (" << genImageErrorName(result.error) << "): " << result.message << "\n";
        return 1;
    }

    if (verbose) {
        const SceneCfg& cfg = result.cfg;
        std::cout << "tiling: " << tilingName(cfg.tiling) << " (" << result.tileCount << " tiles)\n"
                  << "pattern: " << patternName(cfg.pattern) << " x" << cfg.nbPattern << "\n"
                  << "frame: " << cfg.frame.w << "x" << cfg.frame.h << "\n"
                  << "deviation: " << cfg.deviation << ", distance: " << cfg.distance << "\n";
    }

    std::cout << "blurhash is: " << result.blurhash << "\n";
    return 0;
}
