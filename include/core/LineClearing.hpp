#pragma once

#include <cstdint>

#include "Board.hpp"
#include "GameConfig.hpp"

namespace blockdrop::core {

struct ClearResult {
    Board board;
    int linesCleared{0};
    std::uint64_t scoreGained{0};
};

// Remove completed rows and score them. With nothing to clear the input
// board comes back unchanged with zero gain.
ClearResult clearLines(const Board& board, int level, const ScoreTable& table);

// table[lines] * level for 1..4 lines, 0 for any other count
std::uint64_t scoreForLines(int lines, int level, const ScoreTable& table) noexcept;

} // namespace blockdrop::core
