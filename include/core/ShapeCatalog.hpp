#pragma once

#include "Types.hpp"

namespace blockfall::core {

// Static description of the 7 piece kinds.
// Offsets are relative to the piece anchor (row 0 / col 0 is the top-left
// of the bounding box for most rotations).
class ShapeCatalog {
public:
    ShapeCatalog() = delete;

    // Block offsets for a given type + rotation
    static const Cells& offsets(TetrominoType type, Rotation rotation) noexcept;

    // Fixed color per kind
    static Color color(TetrominoType type) noexcept;

    // Single-letter name ('I', 'O', ...)
    static char name(TetrominoType type) noexcept;
};

} // namespace blockfall::core
