#include "core/Tetromino.hpp"
#include "core/ShapeCatalog.hpp"

namespace blockfall::core {

Tetromino::Tetromino(TetrominoType type, Rotation rotation, Position origin)
    : type_{type}, rotation_{rotation}, origin_{origin}
{
}

Color Tetromino::color() const noexcept {
    return ShapeCatalog::color(type_);
}

void Tetromino::rotateClockwise() noexcept {
    rotation_ = nextRotation(rotation_);
}

void Tetromino::rotateCounterClockwise() noexcept {
    rotation_ = previousRotation(rotation_);
}

void Tetromino::rotate(int direction) noexcept {
    if (direction > 0) {
        rotateClockwise();
    } else if (direction < 0) {
        rotateCounterClockwise();
    }
}

Tetromino::Shape Tetromino::blocks() const noexcept {
    const Shape& rel = ShapeCatalog::offsets(type_, rotation_);
    Shape abs{};
    for (int i = 0; i < BlockCount; ++i) {
        abs[i].row = origin_.row + rel[i].row;
        abs[i].col = origin_.col + rel[i].col;
    }
    return abs;
}

} // namespace blockfall::core
