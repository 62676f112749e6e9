#include "core/Board.hpp"
#include <algorithm>
#include <stdexcept>

namespace blockdrop::core {

Board::Board(int width, int height)
    : width_{width}
    , height_{height}
{
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("Board dimensions must be positive");
    }
    grid_.assign(static_cast<std::size_t>(width) * static_cast<std::size_t>(height),
                 Cell::empty());
}

std::optional<Cell> Board::get(Position pos) const {
    if (!isInBounds(pos)) {
        return std::nullopt;
    }
    return grid_[index(pos.x, pos.y)];
}

bool Board::isEmpty(Position pos) const noexcept {
    return isInBounds(pos) && grid_[index(pos.x, pos.y)].isEmpty();
}

Board Board::place(Position pos, Cell cell) const {
    if (!isInBounds(pos)) {
        return *this;
    }
    Board next = *this;
    next.grid_[index(pos.x, pos.y)] = cell;
    return next;
}

Board Board::placeTetromino(const Tetromino& tetromino) const {
    Board next = *this;
    const Cell cell = Cell::filled(tetromino.type());
    for (const auto& b : tetromino.blocks()) {
        if (isInBounds(b)) {
            next.grid_[index(b.x, b.y)] = cell;
        }
    }
    return next;
}

std::vector<int> Board::completedRows() const {
    std::vector<int> rows;
    for (int y = 0; y < height_; ++y) {
        bool full = true;
        for (int x = 0; x < width_; ++x) {
            if (grid_[index(x, y)].isEmpty()) {
                full = false;
                break;
            }
        }
        if (full) {
            rows.push_back(y);
        }
    }
    return rows;
}

Board Board::clearRows(const std::vector<int>& rowIndices) const {
    std::vector<bool> removed(static_cast<std::size_t>(height_), false);
    int removedCount = 0;
    for (int row : rowIndices) {
        if (row >= 0 && row < height_ && !removed[static_cast<std::size_t>(row)]) {
            removed[static_cast<std::size_t>(row)] = true;
            ++removedCount;
        }
    }
    if (removedCount == 0) {
        return *this;
    }

    // Copy surviving rows bottom-up; the top removedCount rows stay empty
    Board next{width_, height_};
    int target = height_ - 1;
    for (int y = height_ - 1; y >= 0; --y) {
        if (removed[static_cast<std::size_t>(y)]) {
            continue;
        }
        std::copy_n(grid_.begin() + static_cast<std::ptrdiff_t>(index(0, y)),
                    width_,
                    next.grid_.begin() + static_cast<std::ptrdiff_t>(index(0, target)));
        --target;
    }
    return next;
}

bool Board::operator==(const Board& other) const noexcept {
    return width_ == other.width_ && height_ == other.height_ && grid_ == other.grid_;
}

} // namespace blockdrop::core
