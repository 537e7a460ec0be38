#include "core/Grid.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <type_traits>

namespace {
int ValidateGridSize(int n) {
    if (n <= 0) {
        throw std::invalid_argument("Grid size must be positive");
    }
    return n;
}

template <typename T, typename = std::enable_if_t<std::is_integral<T>::value>>
bool InRange(T value, T minValue, T maxValue) {
    return value >= minValue && value < maxValue;
}
} // namespace

Grid::Grid(int n) : N(ValidateGridSize(n)), cells(N, std::vector<int>(N, 0)) {}
Grid::Grid(const Grid& other) : N(other.N), cells(other.cells) {}

bool Grid::Contains(int r, int c) const {
    return InRange(r, 0, N) && InRange(c, 0, N);
}

int Grid::Get(int r, int c) const {
    if (!Contains(r, c)) {
        throw std::out_of_range("Grid::Get row/column out of range");
    }
    return cells[r][c];
}

void Grid::Set(int r, int c, int value) {
    if (!Contains(r, c)) {
        throw std::out_of_range("Grid::Set row/column out of range");
    }
    cells[r][c] = value != 0 ? 1 : 0;
}

int Grid::Toggle(int r, int c) {
    if (!Contains(r, c)) {
        throw std::out_of_range("Grid::Toggle row/column out of range");
    }
    int& cell = cells[r][c];
    cell ^= 1;
    return cell;
}

bool Grid::IsEmpty() const {
    return PaintedCount() == 0;
}

int Grid::PaintedCount() const {
    int count = 0;
    for (const auto& row : cells) {
        count += static_cast<int>(std::count(row.begin(), row.end(), 1));
    }
    return count;
}

void Grid::Clear() {
    for (auto& row : cells) {
        std::fill(row.begin(), row.end(), 0);
    }
}

std::vector<int> Grid::Flatten() const {
    std::vector<int> flat;
    flat.reserve(static_cast<size_t>(N * N));
    for (int r = 0; r < N; ++r) {
        for (int c = 0; c < N; ++c) {
            flat.push_back(cells[r][c]);
        }
    }
    return flat;
}

void Grid::print() const {
    std::cout << "\nGRID " << N << "x" << N << "\n\n";
    for (int r = 0; r < N; ++r) {
        for (int c = 0; c < N; ++c) {
            std::cout << (cells[r][c] ? '#' : '.');
            if (c + 1 < N)
                std::cout << " ";
        }
        std::cout << "\n";
    }
}
