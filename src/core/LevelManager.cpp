#include "core/LevelManager.hpp"
#include <algorithm>

namespace blockdrop::core {

int calculateLevel(int totalLinesCleared, int linesPerLevel, int startLevel) noexcept {
    if (linesPerLevel <= 0 || totalLinesCleared <= 0) {
        return startLevel;
    }
    return startLevel + totalLinesCleared / linesPerLevel;
}

int dropIntervalMs(int level, const SpeedConfig& config) noexcept {
    const long long decrease =
        static_cast<long long>(level - 1) * config.decreasePerLevelMs;
    const long long interval = config.baseDropIntervalMs - decrease;
    return static_cast<int>(std::max<long long>(config.minDropIntervalMs, interval));
}

} // namespace blockdrop::core
