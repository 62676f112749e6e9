#include "core/Tetromino.hpp"

namespace blockdrop::core {

Tetromino::Tetromino(TetrominoType type, Rotation rotation, Position origin)
    : type_{type}, rotation_{rotation}, origin_{origin}
{
}

Tetromino Tetromino::spawn(TetrominoType type, int boardWidth) {
    return Tetromino{type, Rotation::R0, Position{boardWidth / 2, 1}};
}

Tetromino Tetromino::movedBy(Position delta) const noexcept {
    return Tetromino{type_, rotation_, origin_ + delta};
}

Tetromino Tetromino::rotatedClockwise() const noexcept {
    return Tetromino{type_, nextRotation(rotation_), origin_};
}

Tetromino Tetromino::rotatedCounterClockwise() const noexcept {
    return Tetromino{type_, previousRotation(rotation_), origin_};
}

Tetromino::Shape Tetromino::blocks() const noexcept {
    Shape rel = shapeFor(type_, rotation_);
    Shape abs{};
    for (int i = 0; i < BlockCount; ++i) {
        abs[i] = origin_ + rel[i];
    }
    return abs;
}

Tetromino::Shape Tetromino::baseOffsets(TetrominoType type) noexcept {
    using S = Tetromino::Shape;

    switch (type) {
    case TetrominoType::I:
        // [ ][I][ ][ ]
        return S{{ {-1, 0}, {0, 0}, {1, 0}, {2, 0} }};
    case TetrominoType::O:
        // [O][ ]
        // [ ][ ]
        return S{{ {0, 0}, {1, 0}, {0, 1}, {1, 1} }};
    case TetrominoType::T:
        //    [ ]
        // [ ][T][ ]
        return S{{ {-1, 0}, {0, 0}, {1, 0}, {0, -1} }};
    case TetrominoType::S:
        //    [ ][ ]
        // [ ][S]
        return S{{ {-1, 0}, {0, 0}, {0, -1}, {1, -1} }};
    case TetrominoType::Z:
        // [ ][ ]
        //    [Z][ ]
        return S{{ {-1, -1}, {0, -1}, {0, 0}, {1, 0} }};
    case TetrominoType::J:
        // [ ]
        // [ ][J][ ]
        return S{{ {-1, -1}, {-1, 0}, {0, 0}, {1, 0} }};
    case TetrominoType::L:
        //       [ ]
        // [ ][L][ ]
        return S{{ {-1, 0}, {0, 0}, {1, 0}, {1, -1} }};
    }

    // Fallback (should never happen)
    return S{{ {0, 0}, {0, 0}, {0, 0}, {0, 0} }};
}

Tetromino::Shape Tetromino::shapeFor(TetrominoType type, Rotation rotation) noexcept {
    Shape offsets = baseOffsets(type);

    // O piece is the same 2x2 block in every rotation
    if (type == TetrominoType::O) {
        return offsets;
    }

    for (auto& p : offsets) {
        const Position src = p;
        switch (rotation) {
        case Rotation::R0:
            break;
        case Rotation::R90:
            p = Position{-src.y, src.x};
            break;
        case Rotation::R180:
            p = Position{-src.x, -src.y};
            break;
        case Rotation::R270:
            p = Position{src.y, -src.x};
            break;
        }
    }
    return offsets;
}

bool operator==(const Tetromino& a, const Tetromino& b) noexcept {
    return a.type() == b.type()
        && a.rotation() == b.rotation()
        && a.origin() == b.origin();
}

bool operator!=(const Tetromino& a, const Tetromino& b) noexcept {
    return !(a == b);
}

} // namespace blockdrop::core
