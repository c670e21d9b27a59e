#pragma once

#include "Types.hpp"
#include "IBoard.hpp"
#include "Shape.hpp"
#include <vector>
#include <optional>

namespace stackfall::core {

// Grid that holds the settled pile.
// Live shapes are not stored here; they consult it through IBoard and
// hand their cells over through absorb() when they lock.
class Board : public IBoard {
public:
    Board(int rows, int cols);

    int rows() const noexcept { return rows_; }
    int cols() const noexcept { return cols_; }

    bool isInside(Position p) const noexcept override {
        return p.row >= 0 && p.row < rows_ && p.col >= 0 && p.col < cols_;
    }

    std::optional<ShapeId> occupant(Position p) const override;

    // Colour of the block on the cell, if any. Used by renderers.
    std::optional<Colour> colourAt(Position p) const;

    void setCell(Position p, ShapeId owner, Colour colour);
    void clearCell(Position p);

    // Turn the cells into pile cells. Cells outside the grid are skipped.
    void absorb(const std::vector<Cell>& cells);

    // Absorb the shape's cells when it locks. The board must outlive the shape.
    void attach(Shape& shape);

    // Check if the shape fits where it stands (spawn check)
    bool canPlace(const Shape& shape) const;

    int filledCount() const noexcept;

private:
    struct Occupant {
        ShapeId owner;
        Colour colour;
    };

    int rows_;
    int cols_;
    std::vector<std::optional<Occupant>> grid_; // rows_ * cols_

    int index(Position p) const noexcept {
        return p.row * cols_ + p.col;
    }

    void checkInside(Position p, const char* what) const;
};

} // namespace stackfall::core
