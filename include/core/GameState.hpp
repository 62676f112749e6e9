#pragma once

#include "Board.hpp"
#include "Tetromino.hpp"
#include "GameConfig.hpp"
#include "Input.hpp"
#include <cstdint>
#include <functional>

namespace blockdrop::core {

enum class GameStatus {
    Playing,
    Paused,
    GameOver
};

// Supplies the shape of the next preview piece. The only source of
// nondeterminism: live play passes a random generator, replays and tests
// pass a fixed sequence.
using PieceSupply = std::function<TetrominoType()>;

// Immutable snapshot of a game. update() never modifies the receiver; it
// returns the state that results from applying one input.
class GameState {
public:
    GameState(Board board,
              Tetromino active,
              TetrominoType next,
              std::uint64_t score,
              int level,
              int linesCleared,
              GameStatus status);

    // Fresh game: empty board, `first` at its spawn point, `next` as preview.
    static GameState initial(TetrominoType first,
                             TetrominoType next,
                             int boardWidth,
                             int boardHeight,
                             int startLevel = 1);

    const Board& board() const noexcept { return board_; }
    const Tetromino& activeTetromino() const noexcept { return active_; }
    TetrominoType nextTetromino() const noexcept { return next_; }

    std::uint64_t score() const noexcept { return score_; }
    int level() const noexcept { return level_; }
    int linesCleared() const noexcept { return linesCleared_; }
    GameStatus status() const noexcept { return status_; }

    bool isPlaying() const noexcept { return status_ == GameStatus::Playing; }
    bool isGameOver() const noexcept { return status_ == GameStatus::GameOver; }

    /// Apply one input. `supply` is called once per lock to draw the new
    /// preview, and never otherwise.
    GameState update(Input input,
                     const PieceSupply& supply,
                     const GameConfig& config) const;

    bool operator==(const GameState& other) const noexcept;
    bool operator!=(const GameState& other) const noexcept { return !(*this == other); }

private:
    Board board_;
    Tetromino active_;
    TetrominoType next_;
    std::uint64_t score_;
    int level_;
    int linesCleared_;
    GameStatus status_;

    GameState withActive(const Tetromino& t) const;
    GameState withStatus(GameStatus s) const;

    // Helper to try moving the active tetromino; unchanged state if it does not fit
    GameState tryMove(const Tetromino& moved) const;
    GameState moveDownOrLock(const PieceSupply& supply, const GameConfig& config) const;
    GameState tryRotate(bool clockwise) const;
    GameState hardDrop(const PieceSupply& supply, const GameConfig& config) const;
    GameState lockActiveTetrominoAndProcessLines(const PieceSupply& supply,
                                                 const GameConfig& config) const;
};

} // namespace blockdrop::core
