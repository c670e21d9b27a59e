#include "core/ShapeFactory.hpp"
#include <random>
#include <stdexcept>
#include <vector>

namespace stackfall::core {

namespace {

// Block offsets relative to the origin, one entry per block
using Layout = std::vector<Offset>;

// Distinct rotation states of a kind, in clockwise order.
// Block i keeps its index across states, so state[r+1][i] - state[r][i]
// is the move of block i for that rotation step.
const std::vector<Layout>& statesFor(ShapeKind kind) {
    switch (kind) {
    case ShapeKind::I: {
        // [ ][ ][ ][ ]  and its vertical form
        static const std::vector<Layout> states{
            {{0, -1}, {0, 0}, {0, 1}, {0, 2}},
            {{-1, 0}, {0, 0}, {1, 0}, {2, 0}},
        };
        return states;
    }
    case ShapeKind::O: {
        // Same in all rotations: 2x2 block
        static const std::vector<Layout> states{
            {{0, 0}, {0, 1}, {1, 0}, {1, 1}},
        };
        return states;
    }
    case ShapeKind::T: {
        static const std::vector<Layout> states{
            // [ ][T][ ]
            //    [ ]
            {{0, -1}, {0, 0}, {0, 1}, {1, 0}},
            //    [ ]
            // [ ][T]
            //    [ ]
            {{-1, 0}, {0, 0}, {1, 0}, {0, -1}},
            //    [ ]
            // [ ][T][ ]
            {{0, 1}, {0, 0}, {0, -1}, {-1, 0}},
            // [ ]
            // [T][ ]
            // [ ]
            {{1, 0}, {0, 0}, {-1, 0}, {0, 1}},
        };
        return states;
    }
    case ShapeKind::L: {
        static const std::vector<Layout> states{
            // [ ][L][ ]
            //       [ ]
            {{0, -1}, {0, 0}, {0, 1}, {1, 1}},
            //    [ ]
            //    [L]
            // [ ][ ]
            {{-1, 0}, {0, 0}, {1, 0}, {1, -1}},
            // [ ]
            // [ ][L][ ]
            {{0, 1}, {0, 0}, {0, -1}, {-1, -1}},
            // [ ][ ]
            // [L]
            // [ ]
            {{1, 0}, {0, 0}, {-1, 0}, {-1, 1}},
        };
        return states;
    }
    case ShapeKind::J: {
        static const std::vector<Layout> states{
            // [ ][J][ ]
            // [ ]
            {{0, -1}, {0, 0}, {0, 1}, {1, -1}},
            // [ ][ ]
            //    [J]
            //    [ ]
            {{-1, 0}, {0, 0}, {1, 0}, {-1, -1}},
            //       [ ]
            // [ ][J][ ]
            {{0, 1}, {0, 0}, {0, -1}, {-1, 1}},
            // [ ]
            // [J]
            // [ ][ ]
            {{1, 0}, {0, 0}, {-1, 0}, {1, 1}},
        };
        return states;
    }
    case ShapeKind::S: {
        static const std::vector<Layout> states{
            //    [S][ ]
            // [ ][S]
            {{0, 0}, {0, 1}, {1, -1}, {1, 0}},
            // [ ]
            // [S][ ]
            //    [S]
            {{0, 0}, {1, 0}, {-1, -1}, {0, -1}},
        };
        return states;
    }
    case ShapeKind::Z: {
        static const std::vector<Layout> states{
            // [Z][ ]
            //    [Z][ ]
            {{0, -1}, {0, 0}, {1, 0}, {1, 1}},
            //    [ ]
            // [Z][ ]
            // [ ]
            {{-1, 0}, {0, 0}, {0, -1}, {1, -1}},
        };
        return states;
    }
    case ShapeKind::Mono: {
        static const std::vector<Layout> states{
            {{0, 0}},
        };
        return states;
    }
    case ShapeKind::Domino: {
        static const std::vector<Layout> states{
            {{0, 0}, {0, 1}},
            {{0, 0}, {1, 0}},
        };
        return states;
    }
    case ShapeKind::Tromino: {
        static const std::vector<Layout> states{
            {{0, -1}, {0, 0}, {0, 1}},
            {{-1, 0}, {0, 0}, {1, 0}},
        };
        return states;
    }
    }

    throw std::invalid_argument("Unknown shape kind");
}

// One row per rotation state; the last row leads back to the first state.
// Kinds with a single state cannot rotate.
std::optional<Shape::RotationTable> rotationTableFor(const std::vector<Layout>& states) {
    if (states.size() < 2) {
        return std::nullopt;
    }

    Shape::RotationTable table(states.size());
    for (std::size_t r = 0; r < states.size(); ++r) {
        const Layout& from = states[r];
        const Layout& to = states[(r + 1) % states.size()];
        table[r].reserve(from.size());
        for (std::size_t i = 0; i < from.size(); ++i) {
            table[r].push_back(to[i] - from[i]);
        }
    }
    return table;
}

} // namespace

ShapeFactory::ShapeFactory(const IBoard* board)
    : ShapeFactory{board, std::random_device{}()}
{
}

ShapeFactory::ShapeFactory(const IBoard* board, std::uint32_t seed)
    : board_{board}
    , rng_{seed}
{
    if (board == nullptr) {
        throw std::invalid_argument("ShapeFactory requires a board");
    }
}

Shape ShapeFactory::create(ShapeKind kind, Position origin) {
    const auto& states = statesFor(kind);
    const Colour colour = colourFor(kind);
    const ShapeId id = nextId_++;

    std::vector<Shape::BlockPtr> blocks;
    blocks.reserve(states.front().size());
    for (const Offset& offset : states.front()) {
        blocks.push_back(std::make_unique<Block>(board_, colour, origin + offset, id));
    }

    return Shape{board_, std::move(blocks), rotationTableFor(states)};
}

Shape ShapeFactory::createRandom(Position origin) {
    std::uniform_int_distribution<int> dist(0, 6); // 7 tetrominoes
    ShapeKind kind = static_cast<ShapeKind>(dist(rng_));
    return create(kind, origin);
}

Colour ShapeFactory::colourFor(ShapeKind kind) noexcept {
    switch (kind) {
    case ShapeKind::I: return Colour::Cyan;
    case ShapeKind::O: return Colour::Yellow;
    case ShapeKind::T: return Colour::Purple;
    case ShapeKind::L: return Colour::Orange;
    case ShapeKind::J: return Colour::Blue;
    case ShapeKind::S: return Colour::Green;
    case ShapeKind::Z: return Colour::Red;
    case ShapeKind::Mono:
    case ShapeKind::Domino:
    case ShapeKind::Tromino:
        return Colour::Grey;
    }
    return Colour::Grey;
}

int ShapeFactory::blockCount(ShapeKind kind) noexcept {
    switch (kind) {
    case ShapeKind::Mono:    return 1;
    case ShapeKind::Domino:  return 2;
    case ShapeKind::Tromino: return 3;
    case ShapeKind::I:
    case ShapeKind::O:
    case ShapeKind::T:
    case ShapeKind::L:
    case ShapeKind::J:
    case ShapeKind::S:
    case ShapeKind::Z:
        return 4;
    }
    return 4;
}

} // namespace stackfall::core
