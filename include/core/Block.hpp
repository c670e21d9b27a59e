#pragma once

#include "Types.hpp"
#include "IBoard.hpp"

namespace stackfall::core {

// One cell of a shape.
// Every move comes as a trial (pure query against the board) and a commit
// (unconditional update of the position). Callers validate before they commit.
class Block {
public:
    /// Throws std::invalid_argument if board is null.
    Block(const IBoard* board, Colour colour, Position position, ShapeId owner = NoShape);

    const IBoard& board() const noexcept { return *board_; }
    Colour colour() const noexcept { return colour_; }
    Position position() const noexcept { return position_; }
    ShapeId owner() const noexcept { return owner_; }

    Cell cell() const noexcept { return Cell{position_, colour_}; }

    bool tryMoveDown() const;
    bool tryMoveLeft() const;
    bool tryMoveRight() const;
    bool tryRotate(Offset offset) const;

    void moveDown() noexcept { ++position_.row; }
    void moveLeft() noexcept { --position_.col; }
    void moveRight() noexcept { ++position_.col; }
    void rotate(Offset offset) noexcept { position_ = position_ + offset; }

private:
    const IBoard* board_;
    Colour colour_;
    Position position_;
    ShapeId owner_;

    bool canOccupy(Position target) const {
        return board_->isFreeFor(target, owner_);
    }
};

} // namespace stackfall::core
