#pragma once

#include "Types.hpp"
#include "Block.hpp"
#include "IBoard.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace stackfall::core {

// A falling piece: an ordered set of blocks moved together.
// Every move is all-or-nothing. A failed downward move locks the shape
// (Active -> Joined) and notifies the subscribers once.
class Shape {
public:
    using BlockPtr = std::unique_ptr<Block>;

    // rotationTable[r][i] is the offset applied to block i when leaving rotation state r
    using RotationTable = std::vector<std::vector<Offset>>;

    // Receives the final cells of the shape when it joins the pile
    using JoinPileHandler = std::function<void(const std::vector<Cell>&)>;

    /// Throws std::invalid_argument on a null board, an empty or null block,
    /// a block bound to another board or owner, or a malformed rotation table.
    /// Without a rotation table the shape cannot rotate.
    Shape(const IBoard* board,
          std::vector<BlockPtr> blocks,
          std::optional<RotationTable> rotationTable = std::nullopt);

    int length() const noexcept { return static_cast<int>(blocks_.size()); }

    /// Copy of block i; the shape's own blocks cannot be modified through it.
    /// Throws std::out_of_range if i is not in [0, length()).
    Block operator[](int i) const;

    std::vector<Cell> cells() const;

    // NoShape once the blocks have been moved out
    ShapeId id() const noexcept { return blocks_.empty() ? NoShape : blocks_.front()->owner(); }
    ShapeState state() const noexcept { return state_; }
    int currentRotation() const noexcept { return currentRotation_; }
    bool canRotate() const noexcept { return rotationTable_.has_value(); }

    void onJoinPile(JoinPileHandler handler);

    // Movement. All of these throw std::logic_error once the shape has joined
    // the pile, or when it has been moved from.

    /// One row down, or lock if any block is blocked.
    MoveResult moveDown();

    /// Falls until blocked, then locks. Returns the number of rows fallen.
    int drop();

    bool moveLeft();
    bool moveRight();

    /// Next rotation state. Returns false (and does nothing) when blocked
    /// or when the shape has no rotation table.
    bool rotate();

private:
    const IBoard* board_;
    std::vector<BlockPtr> blocks_;
    std::optional<RotationTable> rotationTable_;
    int currentRotation_{0};
    ShapeState state_{ShapeState::Active};
    std::vector<JoinPileHandler> joinPileHandlers_;

    void checkIndex(int i) const;
    void requireActive(const char* operation) const;

    // Downward trial for every block; on failure joins the pile
    bool tryMoveDown();
    void joinPile();

    template <typename Trial, typename Commit>
    bool moveAll(Trial trial, Commit commit);
};

} // namespace stackfall::core
