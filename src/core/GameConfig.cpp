#include "core/GameConfig.hpp"
#include <stdexcept>

namespace blockdrop::core {

void GameConfig::validate() const {
    if (board.width <= 0 || board.height <= 0) {
        throw std::invalid_argument("GameConfig: board dimensions must be positive");
    }
    if (score.singleLine < 0 || score.doubleLine < 0 ||
        score.tripleLine < 0 || score.tetris < 0) {
        throw std::invalid_argument("GameConfig: base scores must not be negative");
    }
    if (level.linesPerLevel <= 0) {
        throw std::invalid_argument("GameConfig: linesPerLevel must be positive");
    }
    if (level.startLevel < 1) {
        throw std::invalid_argument("GameConfig: startLevel must be at least 1");
    }
    if (speed.minDropIntervalMs <= 0 || speed.baseDropIntervalMs <= 0) {
        throw std::invalid_argument("GameConfig: drop intervals must be positive");
    }
    if (speed.minDropIntervalMs > speed.baseDropIntervalMs) {
        throw std::invalid_argument("GameConfig: minDropIntervalMs exceeds baseDropIntervalMs");
    }
    if (speed.decreasePerLevelMs < 0) {
        throw std::invalid_argument("GameConfig: decreasePerLevelMs must not be negative");
    }
    if (terminal.escapeSequenceWaitMs < 0 || terminal.escapeSequenceSecondWaitMs < 0 ||
        terminal.inputPollIntervalMs < 0) {
        throw std::invalid_argument("GameConfig: terminal waits must not be negative");
    }
}

} // namespace blockdrop::core
