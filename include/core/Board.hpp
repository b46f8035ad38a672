#pragma once

#include "Types.hpp"
#include <vector>
#include <optional>

namespace blockfall::core {

enum class CellState : std::uint8_t {
    Empty,
    Filled
};

// Fixed-size grid of locked cells. Row 0 is the top row.
// The board knows nothing about pieces; it works on plain cell coordinates.
class Board {
public:
    // Throws std::invalid_argument if rows or cols is not positive
    Board(int rows, int cols);

    int rows() const noexcept { return rows_; }
    int cols() const noexcept { return cols_; }

    CellState cell(int row, int col) const;

    // Color tag of a filled cell, std::nullopt for an empty one
    std::optional<Color> cellColor(int row, int col) const;

    // Filled cells set through this overload get a neutral gray tag
    void setCell(int row, int col, CellState state);
    void setCell(int row, int col, Color color);

    bool isInside(int row, int col) const noexcept {
        return row >= 0 && row < rows_ && col >= 0 && col < cols_;
    }

    // False for coordinates outside the grid
    bool isOccupied(int row, int col) const noexcept;

    // Every cell inside the grid and empty
    bool canPlace(const Cells& cells) const noexcept;

    // Write cells with the given color. Cells outside the grid (typically
    // above the top row) are skipped.
    void commit(const Cells& cells, Color color);

    bool isRowFull(int row) const;

    // Remove all full rows at once, shift the rest down and return the count
    int clearFullLines();

private:
    int rows_;
    int cols_;
    std::vector<std::optional<Color>> grid_; // rows_ * cols_

    int index(int row, int col) const noexcept {
        return row * cols_ + col;
    }
};

} // namespace blockfall::core
