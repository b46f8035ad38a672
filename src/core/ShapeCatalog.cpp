#include "core/ShapeCatalog.hpp"

#include <cstddef>

namespace blockfall::core {

namespace {

using RotationSet = std::array<Cells, 4>;

// I:  [ ][ ][ ][ ]  and its vertical form
constexpr RotationSet IRotations{{
    Cells{{ {0, 0}, {0, 1}, {0, 2}, {0, 3} }},
    Cells{{ {0, 0}, {1, 0}, {2, 0}, {3, 0} }},
    Cells{{ {0, 0}, {0, 1}, {0, 2}, {0, 3} }},
    Cells{{ {0, 0}, {1, 0}, {2, 0}, {3, 0} }}
}};

// O is the same 2x2 block in all rotations
constexpr RotationSet ORotations{{
    Cells{{ {0, 0}, {0, 1}, {1, 0}, {1, 1} }},
    Cells{{ {0, 0}, {0, 1}, {1, 0}, {1, 1} }},
    Cells{{ {0, 0}, {0, 1}, {1, 0}, {1, 1} }},
    Cells{{ {0, 0}, {0, 1}, {1, 0}, {1, 1} }}
}};

constexpr RotationSet TRotations{{
    //   [ ]
    // [ ][ ][ ]
    Cells{{ {1, 0}, {1, 1}, {1, 2}, {0, 1} }},
    //   [ ]
    //   [ ][ ]
    //   [ ]
    Cells{{ {0, 1}, {1, 1}, {2, 1}, {1, 2} }},
    // [ ][ ][ ]
    //   [ ]
    Cells{{ {0, 0}, {0, 1}, {0, 2}, {1, 1} }},
    //   [ ]
    // [ ][ ]
    //   [ ]
    Cells{{ {1, 0}, {1, 1}, {0, 1}, {2, 1} }}
}};

constexpr RotationSet SRotations{{
    //   [ ][ ]
    // [ ][ ]
    Cells{{ {0, 1}, {0, 2}, {1, 0}, {1, 1} }},
    //   [ ]
    //   [ ][ ]
    //     [ ]
    Cells{{ {0, 1}, {1, 1}, {1, 2}, {2, 2} }},
    // (one row lower)
    //   [ ][ ]
    // [ ][ ]
    Cells{{ {1, 1}, {1, 2}, {2, 0}, {2, 1} }},
    // [ ]
    // [ ][ ]
    //   [ ]
    Cells{{ {0, 0}, {1, 0}, {1, 1}, {2, 1} }}
}};

constexpr RotationSet ZRotations{{
    // [ ][ ]
    //   [ ][ ]
    Cells{{ {0, 0}, {0, 1}, {1, 1}, {1, 2} }},
    //   [ ]      (row -1)
    // [ ][ ]
    // [ ]
    Cells{{ {-1, 1}, {0, 1}, {0, 0}, {1, 0} }},
    Cells{{ {0, 0}, {0, 1}, {1, 1}, {1, 2} }},
    Cells{{ {-1, 1}, {0, 1}, {0, 0}, {1, 0} }}
}};

constexpr RotationSet JRotations{{
    //   [ ]
    //   [ ]
    // [ ][ ]
    Cells{{ {0, 1}, {1, 1}, {2, 1}, {2, 0} }},
    // [ ]
    // [ ][ ][ ]
    Cells{{ {0, 0}, {1, 0}, {1, 1}, {1, 2} }},
    // [ ][ ]
    // [ ]
    // [ ]
    Cells{{ {0, 0}, {1, 0}, {2, 0}, {0, 1} }},
    // [ ][ ][ ]
    //       [ ]
    Cells{{ {0, 0}, {0, 1}, {0, 2}, {1, 2} }}
}};

constexpr RotationSet LRotations{{
    // [ ]
    // [ ]
    // [ ][ ]
    Cells{{ {0, 0}, {1, 0}, {2, 0}, {2, 1} }},
    // [ ][ ][ ]
    // [ ]
    Cells{{ {0, 0}, {0, 1}, {0, 2}, {1, 0} }},
    // [ ][ ]
    //   [ ]
    //   [ ]
    Cells{{ {0, 1}, {1, 1}, {2, 1}, {0, 0} }},
    //       [ ]
    // [ ][ ][ ]
    Cells{{ {1, 0}, {1, 1}, {1, 2}, {0, 2} }}
}};

const RotationSet& rotationsFor(TetrominoType type) noexcept {
    switch (type) {
    case TetrominoType::I: return IRotations;
    case TetrominoType::O: return ORotations;
    case TetrominoType::T: return TRotations;
    case TetrominoType::S: return SRotations;
    case TetrominoType::Z: return ZRotations;
    case TetrominoType::J: return JRotations;
    case TetrominoType::L: return LRotations;
    }

    // Fallback (should never happen)
    return ORotations;
}

} // namespace

const Cells& ShapeCatalog::offsets(TetrominoType type, Rotation rotation) noexcept {
    return rotationsFor(type)[static_cast<std::size_t>(rotation)];
}

Color ShapeCatalog::color(TetrominoType type) noexcept {
    switch (type) {
    case TetrominoType::I: return Color{  0, 255, 255}; // cyan
    case TetrominoType::O: return Color{255, 255,   0}; // yellow
    case TetrominoType::T: return Color{128,   0, 128}; // purple
    case TetrominoType::S: return Color{  0, 255,   0}; // green
    case TetrominoType::Z: return Color{255,   0,   0}; // red
    case TetrominoType::J: return Color{  0,   0, 255}; // blue
    case TetrominoType::L: return Color{255, 165,   0}; // orange
    }
    return Color{200, 200, 200};
}

char ShapeCatalog::name(TetrominoType type) noexcept {
    switch (type) {
    case TetrominoType::I: return 'I';
    case TetrominoType::O: return 'O';
    case TetrominoType::T: return 'T';
    case TetrominoType::S: return 'S';
    case TetrominoType::Z: return 'Z';
    case TetrominoType::J: return 'J';
    case TetrominoType::L: return 'L';
    }
    return '?';
}

} // namespace blockfall::core
