#pragma once

#include "Types.hpp"
#include "Tetromino.hpp"
#include <vector>
#include <optional>

namespace blockdrop::core {

// Empty, or Filled with the type of the tetromino that was locked there.
class Cell {
public:
    static Cell empty() noexcept { return Cell{}; }
    static Cell filled(TetrominoType type) noexcept { return Cell{type}; }

    bool isEmpty() const noexcept { return !type_.has_value(); }
    bool isFilled() const noexcept { return type_.has_value(); }
    std::optional<TetrominoType> type() const noexcept { return type_; }

    bool operator==(const Cell& other) const noexcept { return type_ == other.type_; }
    bool operator!=(const Cell& other) const noexcept { return !(*this == other); }

private:
    Cell() = default;
    explicit Cell(TetrominoType type) : type_{type} {}

    std::optional<TetrominoType> type_;
};

// Fixed-size grid. Every mutating operation returns a new Board and leaves
// this one untouched, so older game states stay valid.
class Board {
public:
    Board(int width, int height);

    static Board empty(int width, int height) { return Board{width, height}; }

    int width() const noexcept { return width_; }
    int height() const noexcept { return height_; }

    bool isInBounds(Position pos) const noexcept {
        return pos.x >= 0 && pos.x < width_ && pos.y >= 0 && pos.y < height_;
    }

    // std::nullopt when pos is outside the board
    std::optional<Cell> get(Position pos) const;

    // False outside the board
    bool isEmpty(Position pos) const noexcept;

    // Out-of-bounds positions leave the board unchanged
    Board place(Position pos, Cell cell) const;

    // Stamp the 4 blocks of the tetromino as Filled
    Board placeTetromino(const Tetromino& tetromino) const;

    // Indices of rows with no Empty cell, top to bottom
    std::vector<int> completedRows() const;

    // Remove the given rows, shift the rows above down and add empty rows on top
    Board clearRows(const std::vector<int>& rowIndices) const;

    bool operator==(const Board& other) const noexcept;
    bool operator!=(const Board& other) const noexcept { return !(*this == other); }

private:
    int width_;
    int height_;
    std::vector<Cell> grid_; // height_ * width_, row-major

    std::size_t index(int x, int y) const noexcept {
        return static_cast<std::size_t>(y) * static_cast<std::size_t>(width_)
             + static_cast<std::size_t>(x);
    }
};

} // namespace blockdrop::core
