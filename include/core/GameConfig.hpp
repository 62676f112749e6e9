#pragma once

#include <cstdint>

namespace blockdrop::core {

struct BoardConfig {
    int width{10};
    int height{20};
};

// Base score for 1/2/3/4 lines cleared at once, multiplied by the level.
struct ScoreTable {
    int singleLine{100};
    int doubleLine{300};
    int tripleLine{500};
    int tetris{800};
};

struct LevelConfig {
    int linesPerLevel{10};
    int startLevel{1};
};

struct SpeedConfig {
    int baseDropIntervalMs{1000};
    int minDropIntervalMs{100};
    int decreasePerLevelMs{50};
};

// Waits used by the keyboard reader while parsing ESC [ x sequences.
struct TerminalConfig {
    int escapeSequenceWaitMs{20};
    int escapeSequenceSecondWaitMs{5};
    int inputPollIntervalMs{20};
};

struct GameConfig {
    BoardConfig board;
    ScoreTable score;
    LevelConfig level;
    SpeedConfig speed;
    TerminalConfig terminal;

    /// Throws std::invalid_argument describing the first bad field.
    void validate() const;
};

} // namespace blockdrop::core
