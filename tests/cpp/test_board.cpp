#include <catch2/catch.hpp>
#include "quadrillion/board.hpp"
#include "quadrillion/errors.hpp"

using namespace quadrillion;

namespace {

// 4×4 グリッドの最下行と右端列を閉じ、左上 3×3 を開ける
const CellSet kClosedL = {{3, 0}, {3, 1}, {3, 2}, {3, 3}, {0, 3}, {1, 3}, {2, 3}};
const CellSet kV = {{0, 0}, {1, 0}, {2, 0}, {2, 1}, {2, 2}};
const CellSet kSquare = {{0, 0}, {0, 1}, {1, 0}, {1, 1}};

struct SmallBoard {
    GridPtr grid = std::make_shared<Grid>("g", kClosedL, CellSet{}, Placement{});
    ShapePtr v = std::make_shared<Shape>("V", kV, Placement{0, 0, {0, 5}});
    ShapePtr o = std::make_shared<Shape>("O", kSquare, Placement{0, 0, {0, 9}});
    Board board{{4, 13}, {v, o}, {grid}};
};

}  // namespace

TEST_CASE("Board initial state", "[board]") {
    SmallBoard b;

    REQUIRE(!b.board.is_picked());
    REQUIRE(!b.board.is_won());
    REQUIRE(b.board.released_unplaced_shapes().size() == 2);
    REQUIRE(b.board.released_shapes().size() == 2);
    REQUIRE(b.board.released_grids().size() == 1);
    REQUIRE(b.board.released_empty_grids_dots() == Rect{0, 0, 3, 3}.cells());
}

TEST_CASE("Board pick and release", "[board]") {
    SmallBoard b;

    SECTION("shape placed on open cells") {
        b.board.pick({b.o});
        REQUIRE(b.board.is_picked());
        b.o->move({0, -9});
        b.board.release();

        REQUIRE(!b.board.is_picked());
        REQUIRE(b.board.released_unplaced_shapes().size() == 1);
        REQUIRE(b.board.released_empty_grids_dots().size() == 5);
        REQUIRE(b.board.get_at({0, 0}) == b.o);
    }

    SECTION("covering every open cell wins") {
        b.board.pick({b.v, b.o});
        b.v->move({0, -5});
        b.o->set_cells({{0, 1}, {0, 2}, {1, 1}, {1, 2}});
        REQUIRE(!b.board.is_won());
        b.board.release();

        REQUIRE(b.board.is_won());
        REQUIRE(b.board.released_unplaced_shapes().empty());
    }

    SECTION("overlapping shapes cannot be released") {
        b.board.pick({b.o});
        b.o->move({0, -9});
        b.board.release();

        b.board.pick({b.v});
        b.v->move({0, -5});
        REQUIRE_THROWS_AS(b.board.release(), IllegalReleaseError);
        REQUIRE(b.board.is_picked());

        b.board.unpick();
        REQUIRE(!b.board.is_picked());
        REQUIRE(b.v->placement() == Placement{0, 0, {0, 5}});
    }

    SECTION("picked shapes must not overlap each other") {
        b.board.pick({b.v, b.o});
        b.v->move({0, -5});
        b.o->move({0, -9});
        REQUIRE_THROWS_AS(b.board.release(), IllegalReleaseError);
        b.board.unpick();
    }

    SECTION("shape partly on closed cells cannot be released") {
        b.board.pick({b.o});
        b.o->set_placement(Placement{0, 0, {2, 2}});
        REQUIRE_THROWS_AS(b.board.release(), IllegalReleaseError);
        b.board.unpick();
        REQUIRE(b.o->placement() == Placement{0, 0, {0, 9}});
    }

    SECTION("shape outside the dot space cannot be released") {
        b.board.pick({b.o});
        b.o->move({0, 3});
        REQUIRE_THROWS_AS(b.board.release(), IllegalReleaseError);
        b.board.unpick();
    }
}

TEST_CASE("Board state errors", "[board]") {
    SmallBoard b;

    REQUIRE_THROWS_AS(b.board.release(), StateError);
    REQUIRE_THROWS_AS(b.board.unpick(), StateError);

    b.board.pick({b.v});
    REQUIRE_THROWS_AS(b.board.pick({b.o}), StateError);
    b.board.release();
}

TEST_CASE("Board grid picking", "[board]") {
    SmallBoard b;

    SECTION("grid without shapes can be moved") {
        b.board.pick({b.grid});
        REQUIRE(b.board.released_grids().empty());
        REQUIRE(b.board.released_empty_grids_dots().empty());
        b.grid->flip();
        b.board.release();
        REQUIRE(b.board.released_empty_grids_dots().size() == 16);
    }

    SECTION("grid under a shape cannot be picked") {
        b.board.pick({b.o});
        b.o->move({0, -9});
        b.board.release();

        REQUIRE_THROWS_AS(b.board.pick({b.grid, b.v}), IllegalPickError);
        REQUIRE(!b.board.is_picked());
        REQUIRE(b.board.released_shapes().size() == 2);
    }

    SECTION("grid cannot be released under a shape") {
        b.board.pick({b.grid});
        b.grid->move({0, 5});
        REQUIRE_THROWS_AS(b.board.release(), IllegalReleaseError);
        b.board.unpick();
        REQUIRE(b.grid->placement() == Placement{});
    }
}

TEST_CASE("Board get_at", "[board]") {
    SmallBoard b;

    REQUIRE(b.board.get_at({0, 5}) == b.v);
    REQUIRE(b.board.get_at({3, 3}) == b.grid);
    REQUIRE_THROWS_AS(b.board.get_at({3, 4}), NoItemError);
}

TEST_CASE("Board reset and initial configuration", "[board]") {
    SECTION("reset restores initial placements") {
        SmallBoard b;
        b.board.pick({b.o});
        b.o->move({0, -9});
        b.board.release();

        b.board.reset();
        REQUIRE(b.o->placement() == Placement{0, 0, {0, 9}});
        REQUIRE(b.board.released_unplaced_shapes().size() == 2);
    }

    SECTION("overlapping initial placements are rejected") {
        auto a = std::make_shared<Shape>("a", kSquare, Placement{0, 0, {0, 5}});
        auto c = std::make_shared<Shape>("c", kSquare, Placement{0, 0, {1, 6}});
        auto grid = std::make_shared<Grid>("g", kClosedL, CellSet{});
        REQUIRE_THROWS_AS(Board({4, 13}, {a, c}, {grid}), InitialConfigurationError);
    }
}
