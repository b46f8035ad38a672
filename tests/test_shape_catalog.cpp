#include <catch2/catch_test_macros.hpp>

#include "core/ShapeCatalog.hpp"
#include "core/Types.hpp"

#include <set>
#include <tuple>
#include <utility>

using namespace blockfall::core;

namespace {
constexpr Rotation AllRotations[] = {Rotation::R0, Rotation::R90, Rotation::R180, Rotation::R270};
}

TEST_CASE("Every rotation of every kind has 4 distinct cells", "[shapes]") {
    for (auto type : AllTetrominoTypes) {
        for (auto rotation : AllRotations) {
            const Cells& offsets = ShapeCatalog::offsets(type, rotation);

            std::set<std::pair<int, int>> unique;
            for (const auto& o : offsets) {
                unique.insert({o.row, o.col});
            }
            INFO("kind " << ShapeCatalog::name(type) << " rotation " << static_cast<int>(rotation));
            REQUIRE(unique.size() == 4);
        }
    }
}

TEST_CASE("O piece looks the same in all rotations", "[shapes]") {
    const Cells& base = ShapeCatalog::offsets(TetrominoType::O, Rotation::R0);
    for (auto rotation : AllRotations) {
        REQUIRE(ShapeCatalog::offsets(TetrominoType::O, rotation) == base);
    }
}

TEST_CASE("Horizontal I spans four columns of one row", "[shapes]") {
    const Cells& i0 = ShapeCatalog::offsets(TetrominoType::I, Rotation::R0);
    for (int k = 0; k < 4; ++k) {
        CHECK(i0[k].row == 0);
        CHECK(i0[k].col == k);
    }

    const Cells& i1 = ShapeCatalog::offsets(TetrominoType::I, Rotation::R90);
    for (int k = 0; k < 4; ++k) {
        CHECK(i1[k].row == k);
        CHECK(i1[k].col == 0);
    }
}

TEST_CASE("Each kind has its own color and name", "[shapes]") {
    std::set<char> names;
    std::set<std::tuple<int, int, int>> colors;
    for (auto type : AllTetrominoTypes) {
        names.insert(ShapeCatalog::name(type));
        const Color c = ShapeCatalog::color(type);
        colors.insert({c.r, c.g, c.b});
    }
    REQUIRE(names.size() == 7);
    REQUIRE(colors.size() == 7);

    CHECK(ShapeCatalog::color(TetrominoType::I) == Color{0, 255, 255});
    CHECK(ShapeCatalog::color(TetrominoType::L) == Color{255, 165, 0});
}
