#pragma once

#include "Types.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace blockfall::core {

struct PieceView {
    TetrominoType type{TetrominoType::I};
    Cells cells{};
    Color color{};
};

/// Read-only copy of everything a front end needs to draw one frame.
struct GameSnapshot {
    int rows{0};
    int cols{0};
    std::vector<std::optional<Color>> cells; // row-major, rows * cols

    std::optional<PieceView> active;
    std::optional<PieceView> ghost; // hard-drop landing preview
    std::optional<TetrominoType> held;
    std::vector<TetrominoType> next;

    std::uint64_t linesCleared{0};
    std::uint64_t lockedPieces{0};
    double elapsedSeconds{0.0};
    bool gameOver{false};

    const std::optional<Color>& cellAt(int row, int col) const {
        return cells[static_cast<std::size_t>(row * cols + col)];
    }
};

} // namespace blockfall::core
