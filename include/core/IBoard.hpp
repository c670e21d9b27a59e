#pragma once

#include "Types.hpp"

#include <optional>

namespace stackfall::core {

// Board capability consulted by blocks and shapes.
// Shapes and blocks keep a pointer to it but never own it.
class IBoard {
public:
    virtual ~IBoard() = default;

    /// True if the cell lies within the board bounds.
    virtual bool isInside(Position p) const noexcept = 0;

    /// Who occupies the cell: std::nullopt when empty, NoShape for settled
    /// pile cells, or the id of a live shape that marked the cell as its own.
    /// Throws std::out_of_range when the cell is outside the board.
    virtual std::optional<ShapeId> occupant(Position p) const = 0;

    /// True if a block owned by `owner` may stand on `p`: the cell is inside
    /// and either empty or held by that same shape. Pile cells always block.
    bool isFreeFor(Position p, ShapeId owner) const {
        if (!isInside(p)) {
            return false;
        }
        const auto who = occupant(p);
        if (!who) {
            return true;
        }
        return owner != NoShape && *who == owner;
    }
};

} // namespace stackfall::core
