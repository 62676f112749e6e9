#include "core/LineClearing.hpp"

namespace blockdrop::core {

ClearResult clearLines(const Board& board, int level, const ScoreTable& table) {
    const auto rows = board.completedRows();
    if (rows.empty()) {
        return ClearResult{board, 0, 0};
    }

    const int lines = static_cast<int>(rows.size());
    return ClearResult{board.clearRows(rows), lines, scoreForLines(lines, level, table)};
}

std::uint64_t scoreForLines(int lines, int level, const ScoreTable& table) noexcept {
    if (level <= 0) return 0;

    int base = 0;
    switch (lines) {
    case 1: base = table.singleLine; break;
    case 2: base = table.doubleLine; break;
    case 3: base = table.tripleLine; break;
    case 4: base = table.tetris;     break;
    default:
        // a 4-block piece cannot complete more than 4 rows
        return 0;
    }

    if (base <= 0) return 0;
    return static_cast<std::uint64_t>(base) * static_cast<std::uint64_t>(level);
}

} // namespace blockdrop::core
