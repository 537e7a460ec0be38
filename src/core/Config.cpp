#include "core/Config.hpp"

#include <sstream>
#include <stdexcept>
#include <vector>

namespace {
int ParseInt(const std::string& flag, const std::string& text, int minValue, int maxValue) {
    std::size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(text, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + " expects an integer, got '" + text + "'");
    }
    if (consumed != text.size()) {
        throw std::invalid_argument(flag + " expects an integer, got '" + text + "'");
    }
    if (value < minValue || value > maxValue) {
        std::ostringstream msg;
        msg << flag << " must be in [" << minValue << "," << maxValue << "], got " << value;
        throw std::invalid_argument(msg.str());
    }
    return value;
}

ImagePolarity ParsePolarity(const std::string& text) {
    if (text == "ink-black") return ImagePolarity::INK_BLACK;
    if (text == "ink-white") return ImagePolarity::INK_WHITE;
    throw std::invalid_argument("--polarity expects ink-black or ink-white, got '" + text + "'");
}

void RequireNoValue(const std::string& key, bool hasValue) {
    if (hasValue) {
        throw std::invalid_argument(key + " is a switch and takes no value");
    }
}

void SplitFlag(const std::string& arg, std::string& key, std::string& value, bool& hasValue) {
    const auto eq = arg.find('=');
    hasValue = eq != std::string::npos;
    key = hasValue ? arg.substr(0, eq) : arg;
    value = hasValue ? arg.substr(eq + 1) : std::string();
}
} // namespace

AppConfig GridMakerPreset() {
    AppConfig cfg;
    cfg.variant = "grid";
    cfg.gridSize = 8;
    cfg.labeled = false;
    cfg.clearAfterExport = true;
    cfg.polarity = ImagePolarity::INK_BLACK;
    cfg.rejectEmptyImage = false;
    cfg.announceReset = true;
    cfg.title = "Grid drawer - multiple samples";
    return cfg;
}

AppConfig SymbolsMakerPreset() {
    AppConfig cfg;
    cfg.variant = "symbols";
    cfg.gridSize = 5;
    cfg.labeled = true;
    cfg.clearAfterExport = false;
    cfg.polarity = ImagePolarity::INK_WHITE;
    cfg.rejectEmptyImage = true;
    cfg.announceReset = false;
    cfg.title = "Grid collector - circle / cross";
    return cfg;
}

AppConfig PresetByName(const std::string& name) {
    if (name == "grid") return GridMakerPreset();
    if (name == "symbols") return SymbolsMakerPreset();
    throw std::invalid_argument("Unknown variant '" + name + "' (expected grid or symbols)");
}

AppConfig ParseArgs(int argc, const char* const* argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

    // The preset goes first so individual flags override it regardless of order.
    AppConfig cfg = GridMakerPreset();
    for (const auto& arg : args) {
        std::string key, value;
        bool hasValue = false;
        SplitFlag(arg, key, value, hasValue);
        if (key == "--variant") {
            if (!hasValue) throw std::invalid_argument("--variant expects a value");
            cfg = PresetByName(value);
        }
    }

    for (const auto& arg : args) {
        std::string key, value;
        bool hasValue = false;
        SplitFlag(arg, key, value, hasValue);

        if (key == "--variant") {
            continue;
        } else if (key == "--help" || key == "-h") {
            RequireNoValue(key, hasValue);
            cfg.showHelp = true;
        } else if (key == "--size") {
            cfg.gridSize = ParseInt(key, value, kMinGridSize, kMaxGridSize);
        } else if (key == "--cell") {
            cfg.cellSize = ParseInt(key, value, kMinCellSize, kMaxCellSize);
        } else if (key == "--labeled") {
            RequireNoValue(key, hasValue);
            cfg.labeled = true;
        } else if (key == "--no-labeled") {
            RequireNoValue(key, hasValue);
            cfg.labeled = false;
        } else if (key == "--clear-after-export") {
            RequireNoValue(key, hasValue);
            cfg.clearAfterExport = true;
        } else if (key == "--keep-after-export") {
            RequireNoValue(key, hasValue);
            cfg.clearAfterExport = false;
        } else if (key == "--polarity") {
            cfg.polarity = ParsePolarity(value);
        } else if (key == "--reject-empty-image") {
            RequireNoValue(key, hasValue);
            cfg.rejectEmptyImage = true;
        } else if (key == "--allow-empty-image") {
            RequireNoValue(key, hasValue);
            cfg.rejectEmptyImage = false;
        } else if (key == "--font") {
            if (!hasValue || value.empty()) throw std::invalid_argument("--font expects a path");
            cfg.fontPath = value;
        } else {
            throw std::invalid_argument("Unknown option '" + arg + "'");
        }
    }
    return cfg;
}

std::string Usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "  --variant=grid|symbols       preset (default grid)\n"
        << "  --size=N                     grid side, " << kMinGridSize << ".." << kMaxGridSize << "\n"
        << "  --cell=PX                    cell size in pixels, " << kMinCellSize << ".." << kMaxCellSize << "\n"
        << "  --labeled | --no-labeled     append a circle(0)/cross(1) label to samples\n"
        << "  --clear-after-export | --keep-after-export\n"
        << "  --polarity=ink-black|ink-white\n"
        << "  --reject-empty-image | --allow-empty-image\n"
        << "  --font=PATH                  TrueType font for the panel\n"
        << "  --help\n";
    return out.str();
}
