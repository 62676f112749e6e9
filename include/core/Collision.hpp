#pragma once

#include "Board.hpp"
#include "Tetromino.hpp"
#include <optional>
#include <vector>

namespace blockdrop::core::collision {

enum class CollisionType {
    None,
    Wall,
    Floor,
    Ceiling,
    Block
};

// Every block inside the board (negative y included as outside) and on an Empty cell.
bool isValidPosition(const Tetromino& tetromino, const Board& board) noexcept;

// Valid now, but one row lower is not.
bool hasLanded(const Tetromino& tetromino, const Board& board) noexcept;

// Lowest position reachable by moving straight down.
Tetromino hardDropPosition(const Tetromino& tetromino, const Board& board) noexcept;

// Kick offsets tried, in order, after rotating a piece of this type.
const std::vector<Position>& wallKickOffsets(TetrominoType type);

// Rotate and try each kick offset; std::nullopt if none fits.
std::optional<Tetromino> tryRotate(const Tetromino& tetromino,
                                   const Board& board,
                                   bool clockwise);

// A freshly spawned piece that does not fit ends the game.
bool isGameOver(const Tetromino& spawned, const Board& board) noexcept;

// First reason the placement is invalid (walls before floor before ceiling before blocks).
CollisionType detectCollision(const Tetromino& tetromino, const Board& board) noexcept;

} // namespace blockdrop::core::collision
