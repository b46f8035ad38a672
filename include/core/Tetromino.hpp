#pragma once // Include guard

#include "Types.hpp" // For Position, Rotation, TetrominoType, Cells

// Namespace for Blockfall core types
namespace blockfall::core {

// Represents a falling piece: a shape kind placed at an anchor with a rotation.
// A Tetromino never checks its own validity; the caller decides whether a
// move or rotation is accepted and restores the previous state otherwise.
class Tetromino {
public:
    static constexpr int BlockCount = core::BlockCount;

    using Shape = Cells;

    Tetromino(TetrominoType type, Rotation rotation, Position origin);

    TetrominoType type() const noexcept { return type_; }
    Rotation rotation() const noexcept { return rotation_; }
    Position origin() const noexcept { return origin_; }
    Color color() const noexcept;

    void setOrigin(Position p) noexcept { origin_ = p; }
    void setRotation(Rotation r) noexcept { rotation_ = r; }

    void rotateClockwise() noexcept;
    void rotateCounterClockwise() noexcept;

    // direction: +1 clockwise, -1 counter-clockwise
    void rotate(int direction) noexcept;

    // Positions of the 4 blocks in board coordinates
    Shape blocks() const noexcept;

private:
    TetrominoType type_;
    Rotation rotation_;
    Position origin_; // anchor of the piece on the board
};

} // namespace blockfall::core
