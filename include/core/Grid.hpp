#pragma once
#include <vector>

/**
 * N x N binary drawing surface.
 *
 * Cells hold 0 (unpainted) or 1 (painted). The size is fixed at construction.
 */
class Grid {
public:
    int N;
    std::vector<std::vector<int>> cells; // 0 = unpainted, 1 = painted
    Grid(int n = 8);
    Grid(const Grid& other);
    Grid& operator=(const Grid& other) = default;

    int Get(int r, int c) const;
    void Set(int r, int c, int value);
    /// Flips the cell and returns its new value.
    int Toggle(int r, int c);
    bool Contains(int r, int c) const;
    bool IsEmpty() const;
    int PaintedCount() const;
    void Clear();
    /// Returns the cells as a linear array (idx = r * N + c).
    std::vector<int> Flatten() const;
    void print() const;
};
