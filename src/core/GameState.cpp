#include "core/GameState.hpp"

#include "core/Collision.hpp"
#include "core/LevelManager.hpp"
#include "core/LineClearing.hpp"

#include <utility>

namespace blockdrop::core {

GameState::GameState(Board board,
                     Tetromino active,
                     TetrominoType next,
                     std::uint64_t score,
                     int level,
                     int linesCleared,
                     GameStatus status)
    : board_{std::move(board)}
    , active_{active}
    , next_{next}
    , score_{score}
    , level_{level}
    , linesCleared_{linesCleared}
    , status_{status}
{
}

GameState GameState::initial(TetrominoType first,
                             TetrominoType next,
                             int boardWidth,
                             int boardHeight,
                             int startLevel) {
    return GameState{
        Board::empty(boardWidth, boardHeight),
        Tetromino::spawn(first, boardWidth),
        next,
        0,
        startLevel,
        0,
        GameStatus::Playing
    };
}

GameState GameState::update(Input input,
                            const PieceSupply& supply,
                            const GameConfig& config) const {
    if (status_ != GameStatus::Playing) {
        // Only resuming is possible; GameOver is final
        if (input == Input::Pause && status_ == GameStatus::Paused) {
            return withStatus(GameStatus::Playing);
        }
        return *this;
    }

    switch (input) {
    case Input::MoveLeft:
        return tryMove(active_.movedLeft());
    case Input::MoveRight:
        return tryMove(active_.movedRight());
    case Input::MoveDown:
    case Input::Tick:
        return moveDownOrLock(supply, config);
    case Input::RotateClockwise:
        return tryRotate(true);
    case Input::RotateCounterClockwise:
        return tryRotate(false);
    case Input::HardDrop:
        return hardDrop(supply, config);
    case Input::Pause:
        return withStatus(GameStatus::Paused);
    case Input::Quit:
        // handled by the game loop
        return *this;
    }
    return *this;
}

GameState GameState::withActive(const Tetromino& t) const {
    GameState next = *this;
    next.active_ = t;
    return next;
}

GameState GameState::withStatus(GameStatus s) const {
    GameState next = *this;
    next.status_ = s;
    return next;
}

GameState GameState::tryMove(const Tetromino& moved) const {
    if (collision::isValidPosition(moved, board_)) {
        return withActive(moved);
    }
    return *this;
}

GameState GameState::moveDownOrLock(const PieceSupply& supply,
                                    const GameConfig& config) const {
    const Tetromino moved = active_.movedDown();
    if (collision::isValidPosition(moved, board_)) {
        return withActive(moved);
    }
    // Cannot move down => lock piece and spawn a new one
    return lockActiveTetrominoAndProcessLines(supply, config);
}

GameState GameState::tryRotate(bool clockwise) const {
    if (auto rotated = collision::tryRotate(active_, board_, clockwise)) {
        return withActive(*rotated);
    }
    return *this;
}

GameState GameState::hardDrop(const PieceSupply& supply,
                              const GameConfig& config) const {
    const Tetromino dropped = collision::hardDropPosition(active_, board_);
    const int distance = dropped.origin().y - active_.origin().y;

    GameState landed = withActive(dropped);
    landed.score_ += static_cast<std::uint64_t>(distance) * 2U;
    return landed.lockActiveTetrominoAndProcessLines(supply, config);
}

GameState GameState::lockActiveTetrominoAndProcessLines(const PieceSupply& supply,
                                                        const GameConfig& config) const {
    const Board stamped = board_.placeTetromino(active_);
    ClearResult cleared = clearLines(stamped, level_, config.score);

    GameState next = *this;
    next.board_ = std::move(cleared.board);
    next.score_ = score_ + cleared.scoreGained;
    next.linesCleared_ = linesCleared_ + cleared.linesCleared;
    next.level_ = calculateLevel(next.linesCleared_, config.level);

    const Tetromino spawned = Tetromino::spawn(next_, board_.width());
    const TetrominoType upcoming = supply();

    if (collision::isGameOver(spawned, next.board_)) {
        next.status_ = GameStatus::GameOver;
        return next;
    }

    next.active_ = spawned;
    next.next_ = upcoming;
    return next;
}

bool GameState::operator==(const GameState& other) const noexcept {
    return board_ == other.board_
        && active_ == other.active_
        && next_ == other.next_
        && score_ == other.score_
        && level_ == other.level_
        && linesCleared_ == other.linesCleared_
        && status_ == other.status_;
}

} // namespace blockdrop::core
