#pragma once // Include guard

#include <cstdint> // For fixed-width integer types
#include <array> // For std::array
#include <optional>
#include <string>

// Namespace for blockdrop core types
namespace blockdrop::core {

// Board-relative coordinate: x grows to the right, y grows downwards.
struct Position {
    int x{};
    int y{};
};

inline Position operator+(Position a, Position b) noexcept {
    return Position{a.x + b.x, a.y + b.y};
}

inline Position operator-(Position a, Position b) noexcept {
    return Position{a.x - b.x, a.y - b.y};
}

inline bool operator==(Position a, Position b) noexcept {
    return a.x == b.x && a.y == b.y;
}

inline bool operator!=(Position a, Position b) noexcept {
    return !(a == b);
}

// Rotation states for Tetrominoes
enum class Rotation : std::uint8_t {
    R0   = 0,
    R90  = 1,
    R180 = 2,
    R270 = 3
};

// Function to get the next rotation state in a clockwise direction
inline Rotation nextRotation(Rotation r) {
    return static_cast<Rotation>((static_cast<std::uint8_t>(r) + 1U) % 4U);
}

// 3 clockwise steps = 1 counter-clockwise step
inline Rotation previousRotation(Rotation r) {
    return static_cast<Rotation>((static_cast<std::uint8_t>(r) + 3U) % 4U);
}

// Tetromino types
enum class TetrominoType : std::uint8_t {
    I, O, T, S, Z, J, L
};

inline constexpr std::array<TetrominoType, 7> AllTetrominoTypes{
    TetrominoType::I, TetrominoType::O, TetrominoType::T, TetrominoType::S,
    TetrominoType::Z, TetrominoType::J, TetrominoType::L
};

// Single-letter name used by the replay codec ("I", "O", ...).
std::string toString(TetrominoType type);
std::optional<TetrominoType> tetrominoTypeFromString(const std::string& name);

} // namespace blockdrop::core
