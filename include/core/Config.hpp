#pragma once

#include <string>

#include "core/Exporter.hpp"

constexpr int kDefaultGridSize = 8;
constexpr int kDefaultCellSize = 50; // pixels per cell, on screen and in exported images
constexpr int kMinGridSize = 1;
constexpr int kMaxGridSize = 32;
constexpr int kMinCellSize = 8;
constexpr int kMaxCellSize = 200;

/**
 * Session and window settings.
 *
 * The two historical tools differ on several behaviors; each one is a switch
 * here and a preset selects them together.
 */
struct AppConfig {
    std::string variant = "grid";
    std::string title = "Grid drawer - multiple samples";
    int gridSize = kDefaultGridSize;
    int cellSize = kDefaultCellSize;
    bool labeled = false;          // append a circle/cross label to every sample
    bool clearAfterExport = true;  // empty the sample store after a successful CSV write
    ImagePolarity polarity = ImagePolarity::INK_BLACK;
    bool rejectEmptyImage = false; // warn instead of writing a blank image
    bool announceReset = true;     // show a notification after Reset
    std::string fontPath;          // empty = search the default locations
    std::string csvDefaultName = "samples.csv";
    std::string imageDefaultName = "drawing.png";
    bool showHelp = false;
};

/// 8x8, unlabeled, clears after export, black ink, blank images allowed.
AppConfig GridMakerPreset();
/// 5x5, circle/cross label, keeps samples after export, white ink, blank images rejected.
AppConfig SymbolsMakerPreset();
/// Throws std::invalid_argument for unknown names.
AppConfig PresetByName(const std::string& name);

/// Parses --key[=value] flags. Throws std::invalid_argument on bad input.
AppConfig ParseArgs(int argc, const char* const* argv);
std::string Usage(const std::string& program);
