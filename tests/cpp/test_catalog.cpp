#include <catch2/catch.hpp>
#include "quadrillion/catalog.hpp"
#include "quadrillion/puzzle_adapter.hpp"
#include "quadrillion/errors.hpp"
#include "placement_parser.hpp"
#include <stdexcept>

using namespace quadrillion;

TEST_CASE("Catalog shapes cover the open cells of every grid side", "[catalog]") {
    size_t shape_cells = 0;
    for (const auto& shape : catalog::make_shapes()) {
        shape_cells += shape->size();
    }
    REQUIRE(shape_cells == 57);

    for (int mask = 0; mask < 16; ++mask) {
        size_t open = 0;
        auto grids = catalog::make_grids();
        for (size_t i = 0; i < grids.size(); ++i) {
            if (mask & (1 << i)) grids[i]->flip();
            open += grids[i]->open_cells().size();
        }
        REQUIRE(open == 57);
    }
}

TEST_CASE("Catalog default board", "[catalog]") {
    auto board = catalog::make_board();

    REQUIRE(board->dot_space() == Cell{12, 26});
    REQUIRE(board->shapes().size() == 12);
    REQUIRE(board->grids().size() == 4);
    REQUIRE(board->released_unplaced_shapes().size() == 12);
    REQUIRE(board->released_empty_grids_dots().size() == 57);
    REQUIRE(!board->is_won());
    REQUIRE(board->get_at({0, 0})->name() == "A");
}

TEST_CASE("Catalog placement overrides", "[catalog]") {
    SECTION("grid flipped to its back side") {
        auto board = catalog::make_board({{"D", Placement{1, 0, {4, 4}}}});
        const auto& d = board->grids().back();
        REQUIRE(d->name() == "D");
        REQUIRE(!d->front_up());
        REQUIRE(d->closed_cells() == CellSet{{4, 4}});
    }

    SECTION("unknown item") {
        REQUIRE_THROWS_AS(catalog::make_board({{"Q", Placement{}}}), std::runtime_error);
    }

    SECTION("overlapping items") {
        REQUIRE_THROWS_AS(catalog::make_board({{"F", Placement{0, 0, {0, 14}}}}),
                          InitialConfigurationError);
    }
}

TEST_CASE("Catalog default board is solvable", "[catalog][adapter]") {
    auto board = catalog::make_board();
    PuzzleAdapter adapter(*board, FeasibilityRule::from_shapes(board->shapes()));

    adapter.solve();

    REQUIRE(board->is_won());
    REQUIRE(board->released_unplaced_shapes().empty());
}

TEST_CASE("parse_placement", "[catalog]") {
    auto [name, placement] = cli::parse_placement("A=1,3,0,4");
    REQUIRE(name == "A");
    REQUIRE(placement == Placement{1, 3, {0, 4}});

    auto [small, negative] = cli::parse_placement("v=0,-1,8,22");
    REQUIRE(small == "v");
    REQUIRE(negative.rotations == -1);

    REQUIRE_THROWS_AS(cli::parse_placement("A"), std::runtime_error);
    REQUIRE_THROWS_AS(cli::parse_placement("=0,0,0,0"), std::runtime_error);
    REQUIRE_THROWS_AS(cli::parse_placement("A=0,0,0"), std::runtime_error);
    REQUIRE_THROWS_AS(cli::parse_placement("A=0,x,0,0"), std::runtime_error);
    REQUIRE_THROWS_AS(cli::parse_placement("A=0,1x,0,0"), std::runtime_error);
}
