#pragma once

#include "core/GameState.hpp"
#include "core/GameConfig.hpp"
#include "controller/InputAction.hpp"
#include <optional>

namespace blockdrop::controller {

/// What one handled command did to the game.
struct StepOutcome {
    bool applied{false};                           // false only for Quit
    std::optional<core::Input> input;              // the input fed to the state machine
    std::optional<core::TetrominoType> drawnShape; // set when a lock drew a new preview
    bool levelChanged{false};
    int dropIntervalMs{0};                         // interval for the resulting level

    bool pieceLocked() const noexcept { return drawnShape.has_value(); }
};

/// Owns the current GameState and applies commands to it one at a time.
/// Not thread-safe: the game loop's consumer is its only caller.
class GameController {
public:
    GameController(core::GameConfig config,
                   core::PieceSupply supply,
                   core::GameState initial);

    const core::GameState& state() const noexcept { return state_; }
    const core::GameConfig& config() const noexcept { return config_; }

    /// Handle a single discrete command (key press or timer tick).
    StepOutcome handleAction(InputAction action);

    int dropIntervalMs() const noexcept;

private:
    core::GameConfig config_;
    core::PieceSupply supply_;
    core::GameState state_;
};

} // namespace blockdrop::controller
