#pragma once

#include "core/Grid.hpp"

enum class PointerButton { PRIMARY, SECONDARY };
enum class PointerAction { PRESS, DRAG, RELEASE };

struct PointerEvent {
    int x{0}; // device coordinates relative to the grid origin
    int y{0};
    PointerButton button{PointerButton::PRIMARY};
    PointerAction action{PointerAction::PRESS};
};

struct CellUpdate {
    int row{-1};
    int col{-1};
    int value{0};
    bool changed{false};
};

/**
 * Translates pointer events into grid mutations.
 *
 * Primary press toggles, primary drag paints to 1, secondary press/drag
 * erases to 0. Events outside the grid are ignored.
 */
class InteractionHandler {
public:
    InteractionHandler(Grid& grid, int cellSize);

    /// Applies the event to the grid. changed is false when nothing was mutated.
    CellUpdate Handle(const PointerEvent& event);

    /// Maps device coordinates to (row, col). Returns false when outside the grid.
    bool CellAt(int x, int y, int& row, int& col) const;

private:
    CellUpdate paint(int row, int col, int value);

    Grid& grid_;
    int cellSize_;
    int strokeRow_ = -1; // last cell touched by the current stroke
    int strokeCol_ = -1;
};
