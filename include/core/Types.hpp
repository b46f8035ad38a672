#pragma once // Include guard

#include <cstdint> // For fixed-width integer types
#include <array> // For std::array

// Namespace for Blockfall core types
namespace blockfall::core {

// Position structure representing a cell in the grid (row 0 is the top)
struct Position {
    int row{};
    int col{};
};

inline bool operator==(const Position& a, const Position& b) noexcept {
    return a.row == b.row && a.col == b.col;
}

inline bool operator!=(const Position& a, const Position& b) noexcept {
    return !(a == b);
}

// Every piece covers exactly this many cells
constexpr int BlockCount = 4;

using Cells = std::array<Position, BlockCount>;

// Rotation states for Tetrominoes
enum class Rotation : std::uint8_t {
    R0   = 0,
    R90  = 1,
    R180 = 2,
    R270 = 3
};

// Function to get the next rotation state in a clockwise direction
inline Rotation nextRotation(Rotation r) {
    return static_cast<Rotation>((static_cast<std::uint8_t>(r) + 1U) % 4U);
}

// 3 clockwise steps = 1 counter-clockwise
inline Rotation previousRotation(Rotation r) {
    return static_cast<Rotation>((static_cast<std::uint8_t>(r) + 3U) % 4U);
}

// Tetromino types
enum class TetrominoType : std::uint8_t {
    I, O, T, S, Z, J, L
};

constexpr int TetrominoTypeCount = 7;

constexpr std::array<TetrominoType, TetrominoTypeCount> AllTetrominoTypes{{
    TetrominoType::I, TetrominoType::O, TetrominoType::T, TetrominoType::S,
    TetrominoType::Z, TetrominoType::J, TetrominoType::L
}};

// Color tag stored in locked board cells
struct Color {
    std::uint8_t r{};
    std::uint8_t g{};
    std::uint8_t b{};
};

inline bool operator==(const Color& a, const Color& b) noexcept {
    return a.r == b.r && a.g == b.g && a.b == b.b;
}

inline bool operator!=(const Color& a, const Color& b) noexcept {
    return !(a == b);
}

} // namespace blockfall::core
