#include "core/Interaction.hpp"

#include <stdexcept>

InteractionHandler::InteractionHandler(Grid& grid, int cellSize)
    : grid_(grid), cellSize_(cellSize) {
    if (cellSize_ <= 0) {
        throw std::invalid_argument("Cell size must be positive");
    }
}

bool InteractionHandler::CellAt(int x, int y, int& row, int& col) const {
    // Integer division truncates toward zero, so negatives must be rejected first.
    if (x < 0 || y < 0) {
        return false;
    }
    const int c = x / cellSize_;
    const int r = y / cellSize_;
    if (!grid_.Contains(r, c)) {
        return false;
    }
    row = r;
    col = c;
    return true;
}

CellUpdate InteractionHandler::Handle(const PointerEvent& event) {
    if (event.action == PointerAction::RELEASE) {
        strokeRow_ = -1;
        strokeCol_ = -1;
        return CellUpdate{};
    }

    int row = -1;
    int col = -1;
    if (!CellAt(event.x, event.y, row, col)) {
        return CellUpdate{};
    }

    if (event.action == PointerAction::DRAG) {
        if (row == strokeRow_ && col == strokeCol_) {
            return CellUpdate{row, col, grid_.Get(row, col), false};
        }
        strokeRow_ = row;
        strokeCol_ = col;
        return paint(row, col, event.button == PointerButton::PRIMARY ? 1 : 0);
    }

    strokeRow_ = row;
    strokeCol_ = col;
    if (event.button == PointerButton::SECONDARY) {
        return paint(row, col, 0);
    }
    return CellUpdate{row, col, grid_.Toggle(row, col), true};
}

CellUpdate InteractionHandler::paint(int row, int col, int value) {
    if (grid_.Get(row, col) == value) {
        return CellUpdate{row, col, value, false};
    }
    grid_.Set(row, col, value);
    return CellUpdate{row, col, value, true};
}
