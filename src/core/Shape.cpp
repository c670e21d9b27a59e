#include "core/Shape.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace stackfall::core {

Shape::Shape(const IBoard* board,
             std::vector<BlockPtr> blocks,
             std::optional<RotationTable> rotationTable)
    : board_{board}
    , blocks_{std::move(blocks)}
    , rotationTable_{std::move(rotationTable)}
{
    if (board_ == nullptr) {
        throw std::invalid_argument("Shape requires a board");
    }
    if (blocks_.empty()) {
        throw std::invalid_argument("Shape requires at least one block");
    }

    for (const auto& block : blocks_) {
        if (!block) {
            throw std::invalid_argument("One of the blocks is null");
        }
        if (&block->board() != board_) {
            throw std::invalid_argument("Block belongs to a different board");
        }
        if (block->owner() != blocks_.front()->owner()) {
            throw std::invalid_argument("Blocks of one shape must share an owner id");
        }
    }

    if (rotationTable_) {
        if (rotationTable_->empty()) {
            throw std::invalid_argument("Rotation table has no states");
        }
        for (const auto& row : *rotationTable_) {
            if (row.size() < blocks_.size()) {
                throw std::invalid_argument(
                    "Rotation row length: " + std::to_string(row.size()) +
                    ". Blocks length: " + std::to_string(blocks_.size()));
            }
        }
    }
}

template <typename Trial, typename Commit>
bool Shape::moveAll(Trial trial, Commit commit) {
    // Check every block first, so a blocked move leaves the whole shape in place
    for (std::size_t i = 0; i < blocks_.size(); ++i) {
        if (!trial(*blocks_[i], i)) {
            return false;
        }
    }
    for (std::size_t i = 0; i < blocks_.size(); ++i) {
        commit(*blocks_[i], i);
    }
    return true;
}

Block Shape::operator[](int i) const {
    checkIndex(i);
    return *blocks_[static_cast<std::size_t>(i)];
}

std::vector<Cell> Shape::cells() const {
    std::vector<Cell> out;
    out.reserve(blocks_.size());
    for (const auto& block : blocks_) {
        out.push_back(block->cell());
    }
    return out;
}

void Shape::onJoinPile(JoinPileHandler handler) {
    if (handler) {
        joinPileHandlers_.push_back(std::move(handler));
    }
}

MoveResult Shape::moveDown() {
    requireActive("moveDown");

    if (!tryMoveDown()) {
        return MoveResult::Locked;
    }
    for (auto& block : blocks_) {
        block->moveDown();
    }
    return MoveResult::Moved;
}

int Shape::drop() {
    requireActive("drop");

    // Same path as repeated moveDown(): every row is checked before it is taken
    int rows = 0;
    while (tryMoveDown()) {
        for (auto& block : blocks_) {
            block->moveDown();
        }
        ++rows;
    }
    return rows;
}

bool Shape::moveLeft() {
    requireActive("moveLeft");
    return moveAll([](const Block& b, std::size_t) { return b.tryMoveLeft(); },
                   [](Block& b, std::size_t) { b.moveLeft(); });
}

bool Shape::moveRight() {
    requireActive("moveRight");
    return moveAll([](const Block& b, std::size_t) { return b.tryMoveRight(); },
                   [](Block& b, std::size_t) { b.moveRight(); });
}

bool Shape::rotate() {
    requireActive("rotate");

    if (!rotationTable_) {
        return false; // non-rotatable shape (O, single cell)
    }

    const auto& offsets = (*rotationTable_)[static_cast<std::size_t>(currentRotation_)];
    const bool rotated = moveAll(
        [&offsets](const Block& b, std::size_t i) { return b.tryRotate(offsets[i]); },
        [&offsets](Block& b, std::size_t i) { b.rotate(offsets[i]); });

    if (rotated) {
        currentRotation_ = (currentRotation_ + 1) % static_cast<int>(rotationTable_->size());
    }
    return rotated;
}

void Shape::checkIndex(int i) const {
    if (i < 0 || i >= length()) {
        throw std::out_of_range("Index: " + std::to_string(i) +
                                ". Size: " + std::to_string(length()));
    }
}

void Shape::requireActive(const char* operation) const {
    if (state_ == ShapeState::Joined) {
        throw std::logic_error(std::string{"Shape::"} + operation +
                               " called after the shape joined the pile");
    }
    if (blocks_.empty()) {
        throw std::logic_error(std::string{"Shape::"} + operation +
                               " called on a moved-from shape");
    }
}

bool Shape::tryMoveDown() {
    for (const auto& block : blocks_) {
        if (!block->tryMoveDown()) {
            joinPile();
            return false;
        }
    }
    return true;
}

void Shape::joinPile() {
    state_ = ShapeState::Joined;

    // A joined shape never notifies again; handlers may subscribe while we iterate
    const auto handlers = std::move(joinPileHandlers_);
    joinPileHandlers_.clear();

    const auto finalCells = cells();
    for (const auto& handler : handlers) {
        handler(finalCells);
    }
}

} // namespace stackfall::core
