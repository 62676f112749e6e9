#include <catch2/catch.hpp>

#include <stdexcept>

#include "core/Board.hpp"
#include "core/GameConfig.hpp"
#include "core/LevelManager.hpp"
#include "core/LineClearing.hpp"

using namespace blockdrop::core;

namespace {

Board fillRows(Board board, std::initializer_list<int> rows)
{
    for (int y : rows) {
        for (int x = 0; x < board.width(); ++x) {
            board = board.place({x, y}, Cell::filled(TetrominoType::J));
        }
    }
    return board;
}

} // namespace

TEST_CASE("Score table is base score times level", "[score]") {
    const ScoreTable table;

    CHECK(scoreForLines(0, 1, table) == 0);
    CHECK(scoreForLines(1, 1, table) == 100);
    CHECK(scoreForLines(2, 1, table) == 300);
    CHECK(scoreForLines(3, 1, table) == 500);
    CHECK(scoreForLines(4, 1, table) == 800);
    CHECK(scoreForLines(5, 1, table) == 0);

    CHECK(scoreForLines(1, 3, table) == 300);
    CHECK(scoreForLines(4, 2, table) == 1600);
}

TEST_CASE("Custom score tables are honoured", "[score]") {
    ScoreTable table;
    table.singleLine = 40;
    table.tetris = 1200;

    CHECK(scoreForLines(1, 2, table) == 80);
    CHECK(scoreForLines(4, 1, table) == 1200);
}

TEST_CASE("clearLines with no full rows is a no-op", "[score]") {
    const Board board = Board{4, 4}.place({0, 3}, Cell::filled(TetrominoType::T));
    const ClearResult result = clearLines(board, 1, ScoreTable{});

    REQUIRE(result.linesCleared == 0);
    REQUIRE(result.scoreGained == 0);
    REQUIRE(result.board == board);
}

TEST_CASE("clearLines removes rows and scores them at the given level", "[score]") {
    const Board board = fillRows(Board{4, 6}, {2, 4, 5});
    const ClearResult result = clearLines(board, 2, ScoreTable{});

    REQUIRE(result.linesCleared == 3);
    REQUIRE(result.scoreGained == 1000);
    REQUIRE(result.board.completedRows().empty());
    REQUIRE(result.board.width() == 4);
    REQUIRE(result.board.height() == 6);
}

TEST_CASE("Level follows total lines cleared", "[level]") {
    CHECK(calculateLevel(0, 10) == 1);
    CHECK(calculateLevel(9, 10) == 1);
    CHECK(calculateLevel(10, 10) == 2);
    CHECK(calculateLevel(25, 10) == 3);
    CHECK(calculateLevel(25, 10, 5) == 7);

    LevelConfig config;
    config.linesPerLevel = 4;
    config.startLevel = 2;
    CHECK(calculateLevel(8, config) == 4);
}

TEST_CASE("Drop interval shrinks per level down to the minimum", "[level]") {
    const SpeedConfig speed;

    CHECK(dropIntervalMs(1, speed) == 1000);
    CHECK(dropIntervalMs(2, speed) == 950);
    CHECK(dropIntervalMs(10, speed) == 550);
    CHECK(dropIntervalMs(19, speed) == 100);
    CHECK(dropIntervalMs(50, speed) == 100);

    // Non-increasing across levels
    for (int level = 1; level < 40; ++level) {
        REQUIRE(dropIntervalMs(level + 1, speed) <= dropIntervalMs(level, speed));
    }
}

TEST_CASE("GameConfig validation rejects bad values", "[config]") {
    GameConfig config;
    REQUIRE_NOTHROW(config.validate());

    SECTION("board size") {
        config.board.width = 0;
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }
    SECTION("lines per level") {
        config.level.linesPerLevel = 0;
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }
    SECTION("minimum above base interval") {
        config.speed.minDropIntervalMs = 2000;
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }
    SECTION("negative terminal wait") {
        config.terminal.escapeSequenceWaitMs = -1;
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }
}
