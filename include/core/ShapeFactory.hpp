#pragma once

#include "Types.hpp"
#include "Shape.hpp"
#include <cstdint>
#include <random>

namespace stackfall::core {

// Builds shapes from per-kind layout data. Every shape gets a fresh id.
class ShapeFactory {
public:
    explicit ShapeFactory(const IBoard* board);

    // Deterministic sequence, for tests and replays
    ShapeFactory(const IBoard* board, std::uint32_t seed);

    // Shape of the given kind in its spawn rotation, placed relative to origin
    Shape create(ShapeKind kind, Position origin);

    // Create next random tetromino (I, O, T, L, J, S, Z) with given origin
    Shape createRandom(Position origin);

    static Colour colourFor(ShapeKind kind) noexcept;
    static int blockCount(ShapeKind kind) noexcept;

private:
    const IBoard* board_;
    std::mt19937 rng_;
    ShapeId nextId_{1};
};

} // namespace stackfall::core
