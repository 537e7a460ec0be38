#include "core/SampleStore.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

TEST(SampleStoreTest, SampleOfEightByEightWithFirstCellSet) {
    Grid grid(8);
    grid.Set(0, 0, 1);
    const Sample s = MakeSample(grid, false, ShapeLabel::CIRCLE);
    const auto row = s.values();
    ASSERT_EQ(row.size(), 64u);
    EXPECT_EQ(row[0], 1);
    for (size_t i = 1; i < row.size(); ++i) {
        EXPECT_EQ(row[i], 0) << "index " << i;
    }
}

TEST(SampleStoreTest, LabeledFiveByFiveSampleHasTrailingLabel) {
    Grid grid(5);
    grid.Set(4, 4, 1);
    const Sample s = MakeSample(grid, true, ShapeLabel::CROSS);
    const auto row = s.values();
    ASSERT_EQ(row.size(), 26u);
    for (size_t i = 0; i < 24; ++i) {
        EXPECT_EQ(row[i], 0) << "index " << i;
    }
    EXPECT_EQ(row[24], 1);
    EXPECT_EQ(row[25], 1);
}

TEST(SampleStoreTest, PreservesInsertionOrder) {
    SampleStore store;
    Grid grid(3);
    for (int i = 0; i < 3; ++i) {
        grid.Clear();
        grid.Set(i, i, 1);
        store.append(MakeSample(grid, false, ShapeLabel::CIRCLE));
    }
    ASSERT_EQ(store.size(), 3u);
    EXPECT_EQ(store.samples()[0].pixels[0], 1);
    EXPECT_EQ(store.samples()[1].pixels[4], 1);
    EXPECT_EQ(store.samples()[2].pixels[8], 1);

    store.clear();
    EXPECT_TRUE(store.empty());
}

TEST(SampleStoreTest, SampleIsACopyOfTheGrid) {
    SampleStore store;
    Grid grid(4);
    grid.Set(1, 2, 1);
    store.append(MakeSample(grid, false, ShapeLabel::CIRCLE));
    grid.Clear();
    EXPECT_EQ(store.samples()[0].pixels[1 * 4 + 2], 1);
}

TEST(SampleStoreTest, RejectsMalformedSample) {
    SampleStore store;
    Sample bad;
    bad.N = 5;
    bad.pixels.assign(24, 0);
    EXPECT_THROW(store.append(bad), std::invalid_argument);
    EXPECT_TRUE(store.empty());
}
