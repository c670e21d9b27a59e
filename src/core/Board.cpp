#include "core/Board.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace stackfall::core {

Board::Board(int rows, int cols)
    : rows_{rows}
    , cols_{cols}
{
    if (rows <= 0 || cols <= 0) {
        throw std::invalid_argument("Board dimensions must be positive");
    }
    grid_.assign(static_cast<std::size_t>(rows) * static_cast<std::size_t>(cols), std::nullopt);
}

std::optional<ShapeId> Board::occupant(Position p) const {
    checkInside(p, "Board::occupant");
    const auto& cell = grid_[index(p)];
    if (!cell) {
        return std::nullopt;
    }
    return cell->owner;
}

std::optional<Colour> Board::colourAt(Position p) const {
    checkInside(p, "Board::colourAt");
    const auto& cell = grid_[index(p)];
    if (!cell) {
        return std::nullopt;
    }
    return cell->colour;
}

void Board::setCell(Position p, ShapeId owner, Colour colour) {
    checkInside(p, "Board::setCell");
    grid_[index(p)] = Occupant{owner, colour};
}

void Board::clearCell(Position p) {
    checkInside(p, "Board::clearCell");
    grid_[index(p)] = std::nullopt;
}

void Board::absorb(const std::vector<Cell>& cells) {
    for (const auto& c : cells) {
        if (isInside(c.position)) {
            grid_[index(c.position)] = Occupant{NoShape, c.colour};
        }
    }
}

void Board::attach(Shape& shape) {
    shape.onJoinPile([this](const std::vector<Cell>& cells) {
        absorb(cells);
    });
}

bool Board::canPlace(const Shape& shape) const {
    const ShapeId owner = shape.id();
    for (const auto& c : shape.cells()) {
        if (!isFreeFor(c.position, owner)) {
            return false; // out of board or collision
        }
    }
    return true;
}

int Board::filledCount() const noexcept {
    return static_cast<int>(std::count_if(grid_.begin(), grid_.end(),
        [](const std::optional<Occupant>& cell) { return cell.has_value(); }));
}

void Board::checkInside(Position p, const char* what) const {
    if (!isInside(p)) {
        throw std::out_of_range(std::string{what} + " out of range (" +
                                std::to_string(p.row) + ", " +
                                std::to_string(p.col) + ")");
    }
}

} // namespace stackfall::core
