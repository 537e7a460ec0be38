#include "core/Exporter.hpp"

#include <SFML/Graphics/Image.hpp>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace {
std::string ReadFile(const fs::path& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

Sample SampleFromCells(int n, std::initializer_list<std::pair<int, int>> painted, bool labeled, ShapeLabel label) {
    Grid grid(n);
    for (const auto& cell : painted) grid.Set(cell.first, cell.second, 1);
    return MakeSample(grid, labeled, label);
}
} // namespace

class ExporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("pixelgrid_exporter_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path dir_;
};

TEST_F(ExporterTest, WritesOneCommaSeparatedRowPerSample) {
    std::vector<Sample> samples;
    samples.push_back(SampleFromCells(2, {{0, 0}}, false, ShapeLabel::CIRCLE));
    samples.push_back(SampleFromCells(2, {{0, 1}, {1, 1}}, false, ShapeLabel::CIRCLE));

    const fs::path path = dir_ / "out.csv";
    Exporter::writeCsv(samples, path.string());
    EXPECT_EQ(ReadFile(path), "1,0,0,0\n0,1,0,1\n");
}

TEST_F(ExporterTest, AppendsLabelAsLastColumn) {
    std::vector<Sample> samples;
    samples.push_back(SampleFromCells(2, {{1, 0}}, true, ShapeLabel::CROSS));
    samples.push_back(SampleFromCells(2, {{0, 0}}, true, ShapeLabel::CIRCLE));

    const fs::path path = dir_ / "labeled.csv";
    Exporter::writeCsv(samples, path.string());
    EXPECT_EQ(ReadFile(path), "0,0,1,0,1\n1,0,0,0,0\n");
}

TEST_F(ExporterTest, OverwritesExistingFile) {
    const fs::path path = dir_ / "again.csv";
    {
        std::ofstream out(path);
        out << "stale\nstale\nstale\n";
    }
    Exporter::writeCsv({SampleFromCells(1, {{0, 0}}, false, ShapeLabel::CIRCLE)}, path.string());
    EXPECT_EQ(ReadFile(path), "1\n");
}

TEST_F(ExporterTest, UnwritableCsvPathThrowsWithPath) {
    const fs::path path = dir_ / "missing" / "out.csv";
    try {
        Exporter::writeCsv({SampleFromCells(2, {{0, 0}}, false, ShapeLabel::CIRCLE)}, path.string());
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find(path.string()), std::string::npos);
    }
}

TEST_F(ExporterTest, RasterScalesCellsWithoutInterpolation) {
    Grid grid(3);
    grid.Set(0, 1, 1);
    grid.Set(2, 2, 1);
    const int cell = 4;
    const Raster raster = Exporter::rasterize(grid, cell, ImagePolarity::INK_BLACK);
    ASSERT_EQ(raster.width, 12u);
    ASSERT_EQ(raster.height, 12u);
    for (unsigned y = 0; y < raster.height; ++y) {
        for (unsigned x = 0; x < raster.width; ++x) {
            const bool painted = grid.cells[y / cell][x / cell] != 0;
            EXPECT_EQ(raster.at(x, y), painted ? 0 : 255) << "pixel " << x << "," << y;
        }
    }
}

TEST_F(ExporterTest, InkWhitePolarityInvertsValues) {
    Grid grid(2);
    grid.Set(1, 0, 1);
    const Raster raster = Exporter::rasterize(grid, 2, ImagePolarity::INK_WHITE);
    EXPECT_EQ(raster.at(0, 2), 255);
    EXPECT_EQ(raster.at(1, 3), 255);
    EXPECT_EQ(raster.at(0, 0), 0);
    EXPECT_EQ(raster.at(3, 3), 0);
}

TEST_F(ExporterTest, WrittenPngReloadsWithSameValues) {
    Grid grid(5);
    grid.Set(4, 4, 1);
    const Raster raster = Exporter::rasterize(grid, 10, ImagePolarity::INK_BLACK);
    const fs::path path = dir_ / "drawing.png";
    Exporter::writeImage(raster, path.string());

    sf::Image loaded;
    ASSERT_TRUE(loaded.loadFromFile(path.string()));
    ASSERT_EQ(loaded.getSize().x, 50u);
    ASSERT_EQ(loaded.getSize().y, 50u);
    EXPECT_EQ(loaded.getPixel(45, 45), sf::Color::Black);
    EXPECT_EQ(loaded.getPixel(40, 40), sf::Color::Black);
    EXPECT_EQ(loaded.getPixel(39, 45), sf::Color::White);
    EXPECT_EQ(loaded.getPixel(0, 0), sf::Color::White);
}

TEST_F(ExporterTest, PngIsEightBitSingleChannelGrayscale) {
    Grid grid(2);
    grid.Set(0, 0, 1);
    const Raster raster = Exporter::rasterize(grid, 3, ImagePolarity::INK_WHITE);
    const fs::path path = dir_ / "gray.png";
    Exporter::writeImage(raster, path.string());

    std::ifstream in(path, std::ios::binary);
    std::vector<unsigned char> header(26);
    in.read(reinterpret_cast<char*>(header.data()), static_cast<std::streamsize>(header.size()));
    ASSERT_EQ(in.gcount(), 26);
    EXPECT_EQ(header[1], 'P');
    EXPECT_EQ(header[2], 'N');
    EXPECT_EQ(header[3], 'G');
    // IHDR: width and height big-endian at 16 and 20, bit depth at 24, colour type at 25.
    EXPECT_EQ(header[19], 6);
    EXPECT_EQ(header[23], 6);
    EXPECT_EQ(header[24], 8);
    EXPECT_EQ(header[25], 0);
}

TEST_F(ExporterTest, UnwritableImagePathThrows) {
    Grid grid(2);
    const Raster raster = Exporter::rasterize(grid, 8, ImagePolarity::INK_BLACK);
    const fs::path path = dir_ / "missing" / "drawing.png";
    EXPECT_THROW(Exporter::writeImage(raster, path.string()), std::runtime_error);
}
