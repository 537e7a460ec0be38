#include "core/Interaction.hpp"

#include <gtest/gtest.h>

namespace {
PointerEvent Press(int x, int y, PointerButton button = PointerButton::PRIMARY) {
    return PointerEvent{x, y, button, PointerAction::PRESS};
}

PointerEvent Drag(int x, int y, PointerButton button = PointerButton::PRIMARY) {
    return PointerEvent{x, y, button, PointerAction::DRAG};
}

PointerEvent Release(PointerButton button = PointerButton::PRIMARY) {
    return PointerEvent{0, 0, button, PointerAction::RELEASE};
}
} // namespace

class InteractionTest : public ::testing::Test {
protected:
    Grid grid{8};
    InteractionHandler handler{grid, 50};
};

TEST_F(InteractionTest, MapsCoordinatesByIntegerDivision) {
    int row = -1, col = -1;
    ASSERT_TRUE(handler.CellAt(0, 0, row, col));
    EXPECT_EQ(row, 0);
    EXPECT_EQ(col, 0);
    ASSERT_TRUE(handler.CellAt(149, 51, row, col));
    EXPECT_EQ(row, 1);
    EXPECT_EQ(col, 2);
    ASSERT_TRUE(handler.CellAt(399, 399, row, col));
    EXPECT_EQ(row, 7);
    EXPECT_EQ(col, 7);
}

TEST_F(InteractionTest, IgnoresOutOfBoundsCoordinates) {
    int row = -1, col = -1;
    EXPECT_FALSE(handler.CellAt(400, 10, row, col));
    EXPECT_FALSE(handler.CellAt(10, 400, row, col));
    EXPECT_FALSE(handler.CellAt(-1, 10, row, col));
    EXPECT_FALSE(handler.CellAt(-49, -49, row, col));

    EXPECT_FALSE(handler.Handle(Press(-10, 20)).changed);
    EXPECT_FALSE(handler.Handle(Drag(450, 20)).changed);
    EXPECT_FALSE(handler.Handle(Press(20, 1000, PointerButton::SECONDARY)).changed);
    EXPECT_TRUE(grid.IsEmpty());
}

TEST_F(InteractionTest, PrimaryClickTogglesAndSecondClickRestores) {
    CellUpdate first = handler.Handle(Press(75, 125));
    EXPECT_TRUE(first.changed);
    EXPECT_EQ(first.row, 2);
    EXPECT_EQ(first.col, 1);
    EXPECT_EQ(first.value, 1);
    handler.Handle(Release());

    CellUpdate second = handler.Handle(Press(75, 125));
    EXPECT_TRUE(second.changed);
    EXPECT_EQ(second.value, 0);
    EXPECT_TRUE(grid.IsEmpty());
}

TEST_F(InteractionTest, PaintDragNeverClearsCells) {
    grid.Set(0, 2, 1);
    handler.Handle(Press(10, 10));
    for (int x = 10; x < 400; x += 7) {
        handler.Handle(Drag(x, 10));
    }
    handler.Handle(Release());
    for (int c = 0; c < 8; ++c) {
        EXPECT_EQ(grid.Get(0, c), 1) << "col " << c;
    }
    EXPECT_EQ(grid.PaintedCount(), 8);
}

TEST_F(InteractionTest, DragInsidePressedCellDoesNotUndoToggle) {
    handler.Handle(Press(60, 60));
    EXPECT_EQ(grid.Get(1, 1), 1);
    handler.Handle(Press(60, 60));
    EXPECT_EQ(grid.Get(1, 1), 0);
    handler.Handle(Drag(62, 61));
    EXPECT_EQ(grid.Get(1, 1), 0);
    handler.Handle(Drag(110, 61));
    EXPECT_EQ(grid.Get(1, 2), 1);
    // Coming back into a cell after leaving it paints it.
    handler.Handle(Drag(60, 61));
    EXPECT_EQ(grid.Get(1, 1), 1);
}

TEST_F(InteractionTest, SecondaryClickAndDragErase) {
    for (int c = 0; c < 8; ++c) grid.Set(4, c, 1);

    CellUpdate erased = handler.Handle(Press(25, 225, PointerButton::SECONDARY));
    EXPECT_TRUE(erased.changed);
    EXPECT_EQ(erased.value, 0);

    CellUpdate again = handler.Handle(Press(25, 225, PointerButton::SECONDARY));
    EXPECT_FALSE(again.changed);
    EXPECT_EQ(grid.Get(4, 0), 0);

    for (int x = 25; x < 400; x += 10) {
        handler.Handle(Drag(x, 225, PointerButton::SECONDARY));
    }
    EXPECT_TRUE(grid.IsEmpty());
}

TEST_F(InteractionTest, EraseDragNeverPaints) {
    handler.Handle(Press(5, 5, PointerButton::SECONDARY));
    for (int y = 5; y < 400; y += 9) {
        handler.Handle(Drag(5, y, PointerButton::SECONDARY));
    }
    EXPECT_TRUE(grid.IsEmpty());
}

TEST(InteractionHandlerTest, RejectsNonPositiveCellSize) {
    Grid grid(5);
    EXPECT_THROW(InteractionHandler(grid, 0), std::invalid_argument);
}
