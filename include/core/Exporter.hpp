#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/Grid.hpp"
#include "core/SampleStore.hpp"

// INK_BLACK: painted cells are black on white. INK_WHITE: white on black.
enum class ImagePolarity { INK_BLACK, INK_WHITE };

/// Single-channel 8-bit raster, row-major.
struct Raster {
    unsigned width{0};
    unsigned height{0};
    std::vector<std::uint8_t> pixels;

    std::uint8_t at(unsigned x, unsigned y) const { return pixels[y * width + x]; }
};

/**
 * Writes samples as CSV rows and grids as images.
 *
 * Write failures throw std::runtime_error carrying the path and the reason.
 */
class Exporter {
public:
    static void writeCsv(const std::vector<Sample>& samples, const std::string& path);

    /// One cellSize x cellSize block per cell, no interpolation.
    static Raster rasterize(const Grid& grid, int cellSize, ImagePolarity polarity);

    /// Always PNG, 8-bit single-channel grayscale, whatever the extension.
    static void writeImage(const Raster& raster, const std::string& path);
};
