#include "core/Types.hpp"

namespace blockdrop::core {

std::string toString(TetrominoType type) {
    switch (type) {
    case TetrominoType::I: return "I";
    case TetrominoType::O: return "O";
    case TetrominoType::T: return "T";
    case TetrominoType::S: return "S";
    case TetrominoType::Z: return "Z";
    case TetrominoType::J: return "J";
    case TetrominoType::L: return "L";
    }
    return "?";
}

std::optional<TetrominoType> tetrominoTypeFromString(const std::string& name) {
    for (TetrominoType t : AllTetrominoTypes) {
        if (toString(t) == name) {
            return t;
        }
    }
    return std::nullopt;
}

} // namespace blockdrop::core
