#include "controller/GameController.hpp"

#include "core/LevelManager.hpp"

#include <utility>

namespace blockdrop::controller {

GameController::GameController(core::GameConfig config,
                               core::PieceSupply supply,
                               core::GameState initial)
    : config_{std::move(config)}
    , supply_{std::move(supply)}
    , state_{std::move(initial)}
{
}

StepOutcome GameController::handleAction(InputAction action) {
    StepOutcome outcome;
    outcome.dropIntervalMs = dropIntervalMs();

    const auto input = toInput(action);
    if (!input) {
        // Quit: the loop stops, the state stays as it is
        return outcome;
    }

    // Remember what the lock drew so the recorder can log it
    std::optional<core::TetrominoType> drawn;
    const core::PieceSupply recordingSupply = [this, &drawn]() {
        drawn = supply_();
        return *drawn;
    };

    const int previousLevel = state_.level();
    state_ = state_.update(*input, recordingSupply, config_);

    outcome.applied = true;
    outcome.input = input;
    outcome.drawnShape = drawn;
    outcome.levelChanged = state_.level() != previousLevel;
    outcome.dropIntervalMs = dropIntervalMs();
    return outcome;
}

int GameController::dropIntervalMs() const noexcept {
    return core::dropIntervalMs(state_.level(), config_.speed);
}

} // namespace blockdrop::controller
