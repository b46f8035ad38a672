#include <catch2/catch_test_macros.hpp>

#include "core/ShapeCatalog.hpp"
#include "core/Tetromino.hpp"
#include "core/Types.hpp"

#include <set>
#include <utility>

using namespace blockfall::core;

TEST_CASE("Tetromino blocks are the catalog offsets shifted by the origin", "[tetromino]") {
    Tetromino t{TetrominoType::T, Rotation::R0, Position{0, 3}};

    const auto blocks = t.blocks();
    const Cells& offsets = ShapeCatalog::offsets(TetrominoType::T, Rotation::R0);
    for (int i = 0; i < Tetromino::BlockCount; ++i) {
        CHECK(blocks[i].row == offsets[i].row);
        CHECK(blocks[i].col == offsets[i].col + 3);
    }

    t.setOrigin(Position{5, 1});
    const auto moved = t.blocks();
    for (int i = 0; i < Tetromino::BlockCount; ++i) {
        CHECK(moved[i].row == offsets[i].row + 5);
        CHECK(moved[i].col == offsets[i].col + 1);
    }
}

TEST_CASE("Tetromino rotate wraps around modulo 4", "[tetromino]") {
    Tetromino t{TetrominoType::L, Rotation::R0, Position{2, 2}};

    t.rotate(1);
    REQUIRE(t.rotation() == Rotation::R90);
    t.rotate(1);
    t.rotate(1);
    REQUIRE(t.rotation() == Rotation::R270);
    t.rotate(1);
    REQUIRE(t.rotation() == Rotation::R0);

    t.rotate(-1);
    REQUIRE(t.rotation() == Rotation::R270);

    // Rotation never moves the anchor
    REQUIRE(t.origin() == Position{2, 2});
}

TEST_CASE("Clockwise and counter-clockwise rotations cancel out", "[tetromino]") {
    Tetromino t{TetrominoType::S, Rotation::R180, Position{4, 4}};
    const auto before = t.blocks();

    t.rotateClockwise();
    t.rotateCounterClockwise();

    REQUIRE(t.rotation() == Rotation::R180);
    REQUIRE(t.blocks() == before);
}

TEST_CASE("Tetromino always occupies 4 distinct cells", "[tetromino]") {
    for (auto type : AllTetrominoTypes) {
        Tetromino t{type, Rotation::R0, Position{7, 3}};
        for (int r = 0; r < 4; ++r) {
            std::set<std::pair<int, int>> cells;
            for (const auto& b : t.blocks()) {
                cells.insert({b.row, b.col});
            }
            REQUIRE(cells.size() == 4);
            t.rotateClockwise();
        }
    }
}

TEST_CASE("Tetromino color is fixed by its kind", "[tetromino]") {
    Tetromino z{TetrominoType::Z, Rotation::R90, Position{0, 0}};
    REQUIRE(z.color() == ShapeCatalog::color(TetrominoType::Z));
}
