#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <vector>

#include "core/Board.hpp"
#include "core/ShapeFactory.hpp"
#include "core/Types.hpp"

using namespace stackfall::core;

TEST_CASE("Board basic cell operations", "[board]") {
    Board b{4, 4};

    REQUIRE(b.rows() == 4);
    REQUIRE(b.cols() == 4);
    REQUIRE(b.filledCount() == 0);

    for (int r = 0; r < b.rows(); ++r) {
        for (int c = 0; c < b.cols(); ++c) {
            REQUIRE_FALSE(b.occupant(Position{r, c}).has_value());
            REQUIRE_FALSE(b.colourAt(Position{r, c}).has_value());
        }
    }

    b.setCell(Position{1, 1}, NoShape, Colour::Red);
    REQUIRE(b.occupant(Position{1, 1}) == NoShape);
    REQUIRE(b.colourAt(Position{1, 1}) == Colour::Red);
    REQUIRE(b.filledCount() == 1);

    b.clearCell(Position{1, 1});
    REQUIRE_FALSE(b.occupant(Position{1, 1}).has_value());
    REQUIRE(b.filledCount() == 0);
}

TEST_CASE("Board rejects bad dimensions and out of range cells", "[board]") {
    REQUIRE_THROWS_AS(Board(0, 10), std::invalid_argument);
    REQUIRE_THROWS_AS(Board(20, -1), std::invalid_argument);

    Board b{4, 4};
    CHECK_FALSE(b.isInside(Position{-1, 0}));
    CHECK_FALSE(b.isInside(Position{0, 4}));
    CHECK(b.isInside(Position{3, 3}));

    CHECK_THROWS_AS(b.occupant(Position{4, 0}), std::out_of_range);
    CHECK_THROWS_AS(b.colourAt(Position{0, -1}), std::out_of_range);
    CHECK_THROWS_AS(b.setCell(Position{-1, 0}, NoShape, Colour::Red), std::out_of_range);
    CHECK_THROWS_AS(b.clearCell(Position{0, 4}), std::out_of_range);
}

TEST_CASE("Board distinguishes pile, own and foreign cells", "[board]") {
    Board b{4, 4};
    b.setCell(Position{0, 0}, NoShape, Colour::Grey);
    b.setCell(Position{0, 1}, 3, Colour::Grey);

    CHECK_FALSE(b.isFreeFor(Position{0, 0}, 3));
    CHECK(b.isFreeFor(Position{0, 1}, 3));
    CHECK_FALSE(b.isFreeFor(Position{0, 1}, 4));
    CHECK(b.isFreeFor(Position{0, 2}, 4));
    CHECK_FALSE(b.isFreeFor(Position{0, 4}, 4));

    // NoShape never counts as "self"
    CHECK_FALSE(b.isFreeFor(Position{0, 0}, NoShape));
}

TEST_CASE("Board absorbs cells into the pile and skips outside ones", "[board]") {
    Board b{4, 4};

    b.absorb({
        Cell{Position{3, 0}, Colour::Cyan},
        Cell{Position{3, 1}, Colour::Cyan},
        Cell{Position{-1, 1}, Colour::Cyan},
    });

    CHECK(b.filledCount() == 2);
    CHECK(b.occupant(Position{3, 0}) == NoShape);
    CHECK(b.colourAt(Position{3, 1}) == Colour::Cyan);
}

TEST_CASE("Board attached to a shape takes its cells when it locks", "[board][shape]") {
    Board b{6, 4};
    ShapeFactory factory{&b, 1};

    Shape o = factory.create(ShapeKind::O, Position{0, 1});
    b.attach(o);

    REQUIRE(o.drop() == 4);
    REQUIRE(o.state() == ShapeState::Joined);

    CHECK(b.filledCount() == 4);
    for (const auto& cell : o.cells()) {
        CHECK(b.occupant(cell.position) == NoShape);
        CHECK(b.colourAt(cell.position) == Colour::Yellow);
    }

    // The next piece lands on top of the first one
    Shape next = factory.create(ShapeKind::O, Position{0, 1});
    b.attach(next);
    REQUIRE(next.drop() == 2);
    CHECK(b.filledCount() == 8);
}

TEST_CASE("Board canPlace detects spawn collisions", "[board][shape]") {
    Board b{6, 6};
    ShapeFactory factory{&b, 1};

    Shape first = factory.create(ShapeKind::T, Position{0, 3});
    CHECK(b.canPlace(first));

    b.setCell(Position{1, 3}, NoShape, Colour::Red);
    CHECK_FALSE(b.canPlace(first));

    // Partly outside the grid
    Shape offGrid = factory.create(ShapeKind::I, Position{0, 4});
    CHECK_FALSE(b.canPlace(offGrid));
}
