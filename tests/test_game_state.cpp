#include <catch2/catch.hpp>

#include <array>
#include <random>

#include "core/Board.hpp"
#include "core/GameConfig.hpp"
#include "core/GameState.hpp"
#include "core/Tetromino.hpp"
#include "core/TetrominoFactory.hpp"

using namespace blockdrop::core;

namespace {

PieceSupply constantSupply(TetrominoType type, int* calls = nullptr)
{
    return [type, calls]() {
        if (calls) {
            ++*calls;
        }
        return type;
    };
}

} // namespace

TEST_CASE("Initial state spawns the first piece and previews the second", "[gamestate]") {
    const GameState game = GameState::initial(TetrominoType::O, TetrominoType::T, 10, 20);

    REQUIRE(game.status() == GameStatus::Playing);
    REQUIRE(game.activeTetromino() == Tetromino::spawn(TetrominoType::O, 10));
    REQUIRE(game.nextTetromino() == TetrominoType::T);
    REQUIRE(game.score() == 0);
    REQUIRE(game.level() == 1);
    REQUIRE(game.linesCleared() == 0);
    REQUIRE(game.board().width() == 10);
    REQUIRE(game.board().height() == 20);
}

TEST_CASE("O piece locks on the floor after 18 ticks", "[gamestate]") {
    const GameConfig config;
    int supplyCalls = 0;
    const auto supply = constantSupply(TetrominoType::T, &supplyCalls);

    GameState game = GameState::initial(TetrominoType::O, TetrominoType::T, 10, 20);

    for (int i = 0; i < 17; ++i) {
        game = game.update(Input::Tick, supply, config);
    }
    REQUIRE(game.activeTetromino().type() == TetrominoType::O);
    REQUIRE(game.activeTetromino().origin() == Position{5, 18});
    REQUIRE(supplyCalls == 0);

    game = game.update(Input::Tick, supply, config);

    REQUIRE(game.activeTetromino() == Tetromino::spawn(TetrominoType::T, 10));
    REQUIRE(game.nextTetromino() == TetrominoType::T);
    REQUIRE(game.score() == 0);
    REQUIRE(game.linesCleared() == 0);
    REQUIRE(game.isPlaying());
    REQUIRE(supplyCalls == 1);

    for (Position p : {Position{5, 18}, Position{6, 18}, Position{5, 19}, Position{6, 19}}) {
        REQUIRE(game.board().get(p)->type() == TetrominoType::O);
    }
}

TEST_CASE("Hard-dropped I piece completes the bottom row", "[gamestate]") {
    const GameConfig config;

    Board board{10, 20};
    for (int x = 0; x < 10; ++x) {
        if (x != 5) {
            board = board.place({x, 19}, Cell::filled(TetrominoType::L));
        }
    }
    const GameState start{board, Tetromino::spawn(TetrominoType::I, 10), TetrominoType::T,
                          0, 1, 0, GameStatus::Playing};

    // Vertical I in column 5, pivot row 1
    const GameState rotated = start.update(Input::RotateClockwise, constantSupply(TetrominoType::T), config);
    REQUIRE(rotated.activeTetromino().rotation() == Rotation::R90);
    REQUIRE(rotated.activeTetromino().origin() == Position{5, 1});

    const GameState dropped = rotated.update(Input::HardDrop, constantSupply(TetrominoType::S), config);

    // Dropped 16 rows: 2 * 16 bonus plus a single line at level 1
    REQUIRE(dropped.linesCleared() == 1);
    REQUIRE(dropped.score() == 100 + 32);
    REQUIRE(dropped.level() == 1);
    REQUIRE(dropped.activeTetromino() == Tetromino::spawn(TetrominoType::T, 10));
    REQUIRE(dropped.nextTetromino() == TetrominoType::S);

    // Remaining three cells of the I shifted down one row
    for (int y = 17; y <= 19; ++y) {
        REQUIRE_FALSE(dropped.board().isEmpty({5, y}));
    }
    REQUIRE(dropped.board().isEmpty({0, 19}));
}

TEST_CASE("Pause, Tick, Pause leaves the piece where it was", "[gamestate]") {
    const GameConfig config;
    const auto supply = constantSupply(TetrominoType::Z);
    const GameState start = GameState::initial(TetrominoType::L, TetrominoType::J, 10, 20);

    const GameState paused = start.update(Input::Pause, supply, config);
    REQUIRE(paused.status() == GameStatus::Paused);

    const GameState ticked = paused.update(Input::Tick, supply, config);
    REQUIRE(ticked == paused);

    const GameState resumed = ticked.update(Input::Pause, supply, config);
    REQUIRE(resumed.status() == GameStatus::Playing);
    REQUIRE(resumed.activeTetromino() == start.activeTetromino());
    REQUIRE(resumed == start);
}

TEST_CASE("Rejected moves leave the state unchanged", "[gamestate]") {
    const GameConfig config;
    int supplyCalls = 0;
    const auto supply = constantSupply(TetrominoType::T, &supplyCalls);

    const GameState start{Board{10, 20}, Tetromino{TetrominoType::I, Rotation::R0, {1, 5}},
                          TetrominoType::T, 0, 1, 0, GameStatus::Playing};

    REQUIRE(start.update(Input::MoveLeft, supply, config) == start);
    REQUIRE(start.update(Input::Quit, supply, config) == start);
    REQUIRE(supplyCalls == 0);

    const GameState right = start.update(Input::MoveRight, supply, config);
    REQUIRE(right.activeTetromino().origin() == Position{2, 5});
}

TEST_CASE("Failed spawn ends the game and keeps the lock results", "[gamestate]") {
    const GameConfig config;
    int supplyCalls = 0;
    const auto supply = constantSupply(TetrominoType::S, &supplyCalls);

    const Board blocked = Board{10, 20}.place({5, 1}, Cell::filled(TetrominoType::Z));
    const GameState start{blocked, Tetromino{TetrominoType::O, Rotation::R0, {0, 18}},
                          TetrominoType::T, 40, 1, 0, GameStatus::Playing};

    const GameState over = start.update(Input::HardDrop, supply, config);

    REQUIRE(over.isGameOver());
    REQUIRE(supplyCalls == 1);
    REQUIRE(over.score() == 40);
    REQUIRE_FALSE(over.board().isEmpty({0, 19}));

    SECTION("no input resurrects it") {
        const std::array<Input, 9> inputs{
            Input::MoveLeft, Input::MoveRight, Input::MoveDown,
            Input::RotateClockwise, Input::RotateCounterClockwise,
            Input::HardDrop, Input::Pause, Input::Quit, Input::Tick
        };
        for (auto input : inputs) {
            REQUIRE(over.update(input, supply, config) == over);
        }
        REQUIRE(supplyCalls == 1);
    }
}

TEST_CASE("Random play keeps dimensions and never loses score", "[gamestate]") {
    const GameConfig config;
    TetrominoFactory factory{1234u, TetrominoFactory::Distribution::SevenBag};
    const auto supply = factory.supply();

    const std::array<Input, 7> inputs{
        Input::MoveLeft, Input::MoveRight, Input::MoveDown,
        Input::RotateClockwise, Input::RotateCounterClockwise,
        Input::HardDrop, Input::Tick
    };
    std::mt19937 rng{99u};
    std::uniform_int_distribution<std::size_t> pick{0, inputs.size() - 1};

    GameState game = GameState::initial(factory.nextShape(), factory.nextShape(), 10, 20);
    for (int i = 0; i < 2000 && !game.isGameOver(); ++i) {
        const GameState next = game.update(inputs[pick(rng)], supply, config);

        REQUIRE(next.board().width() == 10);
        REQUIRE(next.board().height() == 20);
        REQUIRE(next.score() >= game.score());
        REQUIRE(next.level() >= game.level());
        REQUIRE(next.linesCleared() >= game.linesCleared());
        game = next;
    }
}

TEST_CASE("Four rotations either way leave the game unchanged", "[gamestate]") {
    const GameConfig config;
    for (auto type : AllTetrominoTypes) {
        const GameState start{Board{10, 20}, Tetromino{type, Rotation::R0, {5, 10}},
                              TetrominoType::T, 0, 1, 0, GameStatus::Playing};

        int calls = 0;
        const auto supply = constantSupply(TetrominoType::O, &calls);
        GameState clockwise = start;
        GameState counterClockwise = start;
        for (int turn = 0; turn < 4; ++turn) {
            clockwise = clockwise.update(Input::RotateClockwise, supply, config);
            counterClockwise = counterClockwise.update(Input::RotateCounterClockwise, supply, config);
        }

        REQUIRE(clockwise == start);
        REQUIRE(counterClockwise == start);
        REQUIRE(calls == 0);
    }
}
