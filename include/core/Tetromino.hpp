#pragma once // Include guard

#include "Types.hpp" // For Position, Rotation, TetrominoType
#include <array> // For std::array

// Namespace for blockdrop core types
namespace blockdrop::core {

// The falling piece: a shape, a pivot on the board and a rotation state.
// Value type; every movement returns a new Tetromino.
class Tetromino {
public:
    static constexpr int BlockCount = 4;

    using Shape = std::array<Position, BlockCount>;

    Tetromino(TetrominoType type, Rotation rotation, Position origin);

    // Piece of the given type at its spawn point: pivot (boardWidth / 2, 1), R0.
    static Tetromino spawn(TetrominoType type, int boardWidth);

    TetrominoType type() const noexcept { return type_; }
    Rotation rotation() const noexcept { return rotation_; }
    Position origin() const noexcept { return origin_; }

    Tetromino movedBy(Position delta) const noexcept;
    Tetromino movedLeft() const noexcept { return movedBy({-1, 0}); }
    Tetromino movedRight() const noexcept { return movedBy({1, 0}); }
    Tetromino movedDown() const noexcept { return movedBy({0, 1}); }

    Tetromino rotatedClockwise() const noexcept;
    Tetromino rotatedCounterClockwise() const noexcept;

    // Positions of the 4 blocks in board coordinates
    Shape blocks() const noexcept;

    // Offsets of the shape at R0, relative to the pivot
    static Shape baseOffsets(TetrominoType type) noexcept;

private:
    TetrominoType type_;
    Rotation rotation_;
    Position origin_; // pivot of the piece on the board

    // For a given type + rotation, returns block offsets relative to origin (0,0)
    static Shape shapeFor(TetrominoType type, Rotation rotation) noexcept;
};

bool operator==(const Tetromino& a, const Tetromino& b) noexcept;
bool operator!=(const Tetromino& a, const Tetromino& b) noexcept;

} // namespace blockdrop::core
