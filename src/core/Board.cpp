#include "core/Board.hpp"
#include <algorithm>
#include <cstddef>
#include <limits>
#include <stdexcept>

namespace blockfall::core {

namespace {
constexpr Color NeutralColor{90, 90, 95};

std::size_t checkedArea(int rows, int cols) {
    if (rows <= 0 || cols <= 0) {
        throw std::invalid_argument("Board dimensions must be positive");
    }
    // Cell indices are computed as int
    const std::size_t area = static_cast<std::size_t>(rows) * static_cast<std::size_t>(cols);
    if (area > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw std::invalid_argument("Board dimensions are too large");
    }
    return area;
}
} // namespace

Board::Board(int rows, int cols)
    : rows_{rows}
    , cols_{cols}
    , grid_(checkedArea(rows, cols), std::nullopt)
{
}

CellState Board::cell(int row, int col) const {
    if (!isInside(row, col)) {
        throw std::out_of_range("Board::cell out of range");
    }
    return grid_[index(row, col)] ? CellState::Filled : CellState::Empty;
}

std::optional<Color> Board::cellColor(int row, int col) const {
    if (!isInside(row, col)) {
        throw std::out_of_range("Board::cellColor out of range");
    }
    return grid_[index(row, col)];
}

void Board::setCell(int row, int col, CellState state) {
    if (!isInside(row, col)) {
        throw std::out_of_range("Board::setCell out of range");
    }
    if (state == CellState::Empty) {
        grid_[index(row, col)] = std::nullopt;
    } else {
        grid_[index(row, col)] = NeutralColor;
    }
}

void Board::setCell(int row, int col, Color color) {
    if (!isInside(row, col)) {
        throw std::out_of_range("Board::setCell out of range");
    }
    grid_[index(row, col)] = color;
}

bool Board::isOccupied(int row, int col) const noexcept {
    return isInside(row, col) && grid_[index(row, col)].has_value();
}

bool Board::canPlace(const Cells& cells) const noexcept {
    for (const auto& b : cells) {
        if (!isInside(b.row, b.col)) {
            return false; // out of board
        }
        if (grid_[index(b.row, b.col)]) {
            return false; // collision
        }
    }
    return true;
}

void Board::commit(const Cells& cells, Color color) {
    for (const auto& b : cells) {
        if (isInside(b.row, b.col)) {
            grid_[index(b.row, b.col)] = color;
        }
    }
}

bool Board::isRowFull(int row) const {
    if (row < 0 || row >= rows_) {
        throw std::out_of_range("Board::isRowFull out of range");
    }
    const auto first = grid_.begin() + index(row, 0);
    return std::all_of(first, first + cols_,
                       [](const std::optional<Color>& c) { return c.has_value(); });
}

int Board::clearFullLines() {
    // Compact surviving rows towards the bottom in one pass, then blank the top
    int write = rows_ - 1;
    for (int row = rows_ - 1; row >= 0; --row) {
        if (isRowFull(row)) {
            continue;
        }
        if (write != row) {
            std::copy_n(grid_.begin() + index(row, 0), cols_,
                        grid_.begin() + index(write, 0));
        }
        --write;
    }

    const int cleared = write + 1;
    std::fill(grid_.begin(), grid_.begin() + index(cleared, 0), std::nullopt);
    return cleared;
}

} // namespace blockfall::core
