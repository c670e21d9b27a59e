#include "core/Block.hpp"
#include <stdexcept>

namespace stackfall::core {

Block::Block(const IBoard* board, Colour colour, Position position, ShapeId owner)
    : board_{board}
    , colour_{colour}
    , position_{position}
    , owner_{owner}
{
    if (board == nullptr) {
        throw std::invalid_argument("Block requires a board");
    }
}

bool Block::tryMoveDown() const {
    return canOccupy(Position{position_.row + 1, position_.col});
}

bool Block::tryMoveLeft() const {
    return canOccupy(Position{position_.row, position_.col - 1});
}

bool Block::tryMoveRight() const {
    return canOccupy(Position{position_.row, position_.col + 1});
}

bool Block::tryRotate(Offset offset) const {
    return canOccupy(position_ + offset);
}

} // namespace stackfall::core
