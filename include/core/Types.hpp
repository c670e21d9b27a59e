#pragma once // Include guard

#include <cstdint> // For fixed-width integer types

// Namespace for Stackfall core types
namespace stackfall::core {

// Position structure representing a cell in the grid.
// Row 0 is the top of the board, rows grow downward.
struct Position {
    int row{};
    int col{};
};

// A Position used as a (dRow, dCol) delta
using Offset = Position;

inline bool operator==(Position a, Position b) noexcept {
    return a.row == b.row && a.col == b.col;
}

inline bool operator!=(Position a, Position b) noexcept {
    return !(a == b);
}

inline Position operator+(Position a, Offset d) noexcept {
    return Position{a.row + d.row, a.col + d.col};
}

inline Offset operator-(Position a, Position b) noexcept {
    return Offset{a.row - b.row, a.col - b.col};
}

// Visual tag carried by every block (renderers map it to real colours)
enum class Colour : std::uint8_t {
    Cyan,
    Yellow,
    Purple,
    Orange,
    Blue,
    Green,
    Red,
    Grey
};

// Identity of a live shape. Pile cells belong to NoShape.
using ShapeId = std::uint32_t;
inline constexpr ShapeId NoShape = 0;

// Shape variants the factory knows how to build
enum class ShapeKind : std::uint8_t {
    I, O, T, L, J, S, Z,
    Mono,    // 1 cell
    Domino,  // 2 cells
    Tromino  // 3 cells in a line
};

// Lifecycle of a shape: falling, then settled into the pile (terminal)
enum class ShapeState : std::uint8_t {
    Active,
    Joined
};

// Outcome of a single gravity step
enum class MoveResult : std::uint8_t {
    Moved,
    Locked
};

// Snapshot of one occupied cell
struct Cell {
    Position position{};
    Colour colour{Colour::Grey};
};

} // namespace stackfall::core
