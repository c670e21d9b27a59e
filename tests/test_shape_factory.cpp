#include <catch2/catch_test_macros.hpp>

#include <set>
#include <stdexcept>
#include <vector>

#include "core/Board.hpp"
#include "core/ShapeFactory.hpp"
#include "core/Types.hpp"

using namespace stackfall::core;

namespace {

const ShapeKind AllKinds[] = {
    ShapeKind::I, ShapeKind::O, ShapeKind::T, ShapeKind::L, ShapeKind::J,
    ShapeKind::S, ShapeKind::Z, ShapeKind::Mono, ShapeKind::Domino, ShapeKind::Tromino
};

std::vector<Position> positionsOf(const Shape& shape) {
    std::vector<Position> out;
    for (const auto& c : shape.cells()) {
        out.push_back(c.position);
    }
    return out;
}

} // namespace

TEST_CASE("ShapeFactory requires a board", "[factory]") {
    REQUIRE_THROWS_AS(ShapeFactory(nullptr), std::invalid_argument);
    REQUIRE_THROWS_AS(ShapeFactory(nullptr, 42u), std::invalid_argument);
}

TEST_CASE("ShapeFactory builds every kind with its size and colour", "[factory]") {
    Board board{20, 10};
    ShapeFactory factory{&board, 7};

    for (ShapeKind kind : AllKinds) {
        Shape shape = factory.create(kind, Position{5, 5});

        REQUIRE(shape.length() == ShapeFactory::blockCount(kind));
        CHECK(shape.state() == ShapeState::Active);
        CHECK(shape.currentRotation() == 0);

        for (int i = 0; i < shape.length(); ++i) {
            CHECK(shape[i].colour() == ShapeFactory::colourFor(kind));
            CHECK(shape[i].owner() == shape.id());
        }

        // No two blocks on the same cell
        std::set<std::pair<int, int>> distinct;
        for (const auto& p : positionsOf(shape)) {
            distinct.insert({p.row, p.col});
        }
        CHECK(distinct.size() == static_cast<std::size_t>(shape.length()));
    }
}

TEST_CASE("ShapeFactory gives each shape a fresh id", "[factory]") {
    Board board{20, 10};
    ShapeFactory factory{&board, 7};

    std::set<ShapeId> ids;
    for (int i = 0; i < 20; ++i) {
        Shape shape = factory.createRandom(Position{2, 5});
        CHECK(shape.id() != NoShape);
        ids.insert(shape.id());
    }
    CHECK(ids.size() == 20);
}

TEST_CASE("ShapeFactory places the pivot block on the origin", "[factory]") {
    Board board{20, 10};
    ShapeFactory factory{&board, 7};

    Shape mono = factory.create(ShapeKind::Mono, Position{3, 4});
    CHECK(mono[0].position() == Position{3, 4});

    Shape i = factory.create(ShapeKind::I, Position{0, 5});
    CHECK(positionsOf(i) == std::vector<Position>{{0, 4}, {0, 5}, {0, 6}, {0, 7}});
}

TEST_CASE("ShapeFactory rotation tables close after a full cycle", "[factory][rotate]") {
    Board board{20, 10};
    ShapeFactory factory{&board, 7};

    for (ShapeKind kind : AllKinds) {
        Shape shape = factory.create(kind, Position{8, 5});
        const auto start = positionsOf(shape);

        if (kind == ShapeKind::O || kind == ShapeKind::Mono) {
            CHECK_FALSE(shape.canRotate());
            CHECK_FALSE(shape.rotate());
            CHECK(positionsOf(shape) == start);
            continue;
        }

        REQUIRE(shape.canRotate());

        // Rotate until the index wraps back to zero
        int steps = 0;
        do {
            REQUIRE(shape.rotate());
            ++steps;
            if (shape.currentRotation() != 0) {
                CHECK(positionsOf(shape) != start);
            }
        } while (shape.currentRotation() != 0 && steps < 8);

        CHECK((steps == 2 || steps == 4));
        CHECK(positionsOf(shape) == start);
    }
}

TEST_CASE("ShapeFactory with the same seed yields the same pieces", "[factory]") {
    Board board{20, 10};
    ShapeFactory a{&board, 1234};
    ShapeFactory b{&board, 1234};

    for (int i = 0; i < 30; ++i) {
        Shape pa = a.createRandom(Position{2, 5});
        Shape pb = b.createRandom(Position{2, 5});
        REQUIRE(pa.length() == 4);
        CHECK(pa[0].colour() == pb[0].colour());
        CHECK(positionsOf(pa) == positionsOf(pb));
    }
}
