#pragma once

#include "GameConfig.hpp"

namespace blockdrop::core {

// startLevel + totalLinesCleared / linesPerLevel
int calculateLevel(int totalLinesCleared, int linesPerLevel, int startLevel = 1) noexcept;

inline int calculateLevel(int totalLinesCleared, const LevelConfig& config) noexcept {
    return calculateLevel(totalLinesCleared, config.linesPerLevel, config.startLevel);
}

// Fall interval in milliseconds: linear decrease per level, clamped at the minimum.
int dropIntervalMs(int level, const SpeedConfig& config) noexcept;

} // namespace blockdrop::core
