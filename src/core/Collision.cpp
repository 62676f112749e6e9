#include "core/Collision.hpp"

namespace blockdrop::core::collision {

bool isValidPosition(const Tetromino& tetromino, const Board& board) noexcept {
    for (const auto& b : tetromino.blocks()) {
        if (!board.isEmpty(b)) {
            return false; // out of board or collision
        }
    }
    return true;
}

bool hasLanded(const Tetromino& tetromino, const Board& board) noexcept {
    return isValidPosition(tetromino, board)
        && !isValidPosition(tetromino.movedDown(), board);
}

Tetromino hardDropPosition(const Tetromino& tetromino, const Board& board) noexcept {
    Tetromino current = tetromino;
    // A piece can never descend more than the board height
    for (int step = 0; step <= board.height(); ++step) {
        Tetromino next = current.movedDown();
        if (!isValidPosition(next, board)) {
            break;
        }
        current = next;
    }
    return current;
}

const std::vector<Position>& wallKickOffsets(TetrominoType type) {
    static const std::vector<Position> iOffsets{
        {0, 0}, {-2, 0}, {2, 0}, {-2, 1}, {2, -1}
    };
    static const std::vector<Position> oOffsets{
        {0, 0}
    };
    static const std::vector<Position> defaultOffsets{
        {0, 0}, {-1, 0}, {1, 0}, {0, -1}, {-1, -1}, {1, -1}
    };

    switch (type) {
    case TetrominoType::I: return iOffsets;
    case TetrominoType::O: return oOffsets;
    default:               return defaultOffsets;
    }
}

std::optional<Tetromino> tryRotate(const Tetromino& tetromino,
                                   const Board& board,
                                   bool clockwise) {
    const Tetromino rotated = clockwise ? tetromino.rotatedClockwise()
                                        : tetromino.rotatedCounterClockwise();

    for (const auto& offset : wallKickOffsets(tetromino.type())) {
        Tetromino candidate = rotated.movedBy(offset);
        if (isValidPosition(candidate, board)) {
            return candidate;
        }
    }
    return std::nullopt;
}

bool isGameOver(const Tetromino& spawned, const Board& board) noexcept {
    return !isValidPosition(spawned, board);
}

CollisionType detectCollision(const Tetromino& tetromino, const Board& board) noexcept {
    const auto blocks = tetromino.blocks();

    for (const auto& b : blocks) {
        if (b.x < 0 || b.x >= board.width()) return CollisionType::Wall;
    }
    for (const auto& b : blocks) {
        if (b.y >= board.height()) return CollisionType::Floor;
    }
    for (const auto& b : blocks) {
        if (b.y < 0) return CollisionType::Ceiling;
    }
    for (const auto& b : blocks) {
        if (!board.isEmpty(b)) return CollisionType::Block;
    }
    return CollisionType::None;
}

} // namespace blockdrop::core::collision
