#include "core/Exporter.hpp"

#include <png.h>

#include <cerrno>
#include <csetjmp>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <stdexcept>

namespace {
constexpr std::uint8_t kBlack = 0;
constexpr std::uint8_t kWhite = 255;

std::string IoReason() {
    return errno != 0 ? std::string(std::strerror(errno)) : std::string("unknown I/O error");
}
} // namespace

void Exporter::writeCsv(const std::vector<Sample>& samples, const std::string& path) {
    errno = 0;
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open " + path + ": " + IoReason());
    }

    for (const auto& s : samples) {
        const std::vector<int> row = s.values();
        for (size_t i = 0; i < row.size(); ++i) {
            out << row[i];
            if (i + 1 < row.size()) out << ",";
        }
        out << "\n";
    }

    out.flush();
    if (!out) {
        throw std::runtime_error("Failed writing " + path + ": " + IoReason());
    }
}

Raster Exporter::rasterize(const Grid& grid, int cellSize, ImagePolarity polarity) {
    if (cellSize <= 0) {
        throw std::invalid_argument("Cell size must be positive");
    }
    const std::uint8_t ink = (polarity == ImagePolarity::INK_BLACK) ? kBlack : kWhite;
    const std::uint8_t paper = (polarity == ImagePolarity::INK_BLACK) ? kWhite : kBlack;

    Raster raster;
    raster.width = static_cast<unsigned>(grid.N * cellSize);
    raster.height = raster.width;
    raster.pixels.assign(static_cast<size_t>(raster.width) * raster.height, paper);

    for (unsigned y = 0; y < raster.height; ++y) {
        const int r = static_cast<int>(y) / cellSize;
        for (unsigned x = 0; x < raster.width; ++x) {
            const int c = static_cast<int>(x) / cellSize;
            if (grid.cells[r][c]) {
                raster.pixels[y * raster.width + x] = ink;
            }
        }
    }
    return raster;
}

void Exporter::writeImage(const Raster& raster, const std::string& path) {
    if (raster.width == 0 || raster.height == 0) {
        throw std::invalid_argument("Cannot write an empty raster");
    }
    if (raster.pixels.size() != static_cast<size_t>(raster.width) * raster.height) {
        throw std::invalid_argument("Raster pixel count does not match its size");
    }

    errno = 0;
    std::FILE* fp = std::fopen(path.c_str(), "wb");
    if (fp == nullptr) {
        throw std::runtime_error("Cannot write image " + path + ": " + IoReason());
    }

    png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    png_infop info = (png != nullptr) ? png_create_info_struct(png) : nullptr;
    if (png == nullptr || info == nullptr) {
        png_destroy_write_struct(&png, nullptr);
        std::fclose(fp);
        throw std::runtime_error("Cannot write image " + path + ": libpng initialization failed");
    }

    // libpng reports encoder errors by longjmp'ing back here.
    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        std::fclose(fp);
        throw std::runtime_error("Failed writing image " + path + ": " + IoReason());
    }

    png_init_io(png, fp);
    png_set_IHDR(png, info, raster.width, raster.height, 8, PNG_COLOR_TYPE_GRAY,
                 PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png, info);
    for (unsigned y = 0; y < raster.height; ++y) {
        png_write_row(png, raster.pixels.data() + static_cast<size_t>(y) * raster.width);
    }
    png_write_end(png, nullptr);
    png_destroy_write_struct(&png, &info);

    if (std::fclose(fp) != 0) {
        throw std::runtime_error("Failed writing image " + path + ": " + IoReason());
    }
}
