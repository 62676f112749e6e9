#pragma once

#include <cstddef>
#include <deque>

#include "core/GameConfig.hpp"
#include "core/GameState.hpp"
#include "replay/ReplayTypes.hpp"

namespace blockdrop::replay {

/// Re-simulates a recorded session frame by frame. No randomness is
/// involved: new preview shapes come from the recorded PieceSpawn events.
class ReplayPlayer {
public:
    /// The start level comes from the replay metadata, not from `config`.
    ReplayPlayer(ReplayData data, core::GameConfig config);

    const core::GameState& state() const noexcept { return m_state; }
    const ReplayData& data() const noexcept { return m_data; }

    Frame currentFrame() const noexcept { return m_currentFrame; }
    std::size_t eventIndex() const noexcept { return m_eventIndex; }

    /// Set once every event is consumed or the game reached GameOver.
    bool isFinished() const noexcept { return m_finished; }

    /// Fraction of events consumed, in [0, 1].
    double progress() const noexcept;

    /// Apply every event of the current frame, then move to the next frame.
    /// No-op once finished.
    void advanceFrame();

    /// Advance until finished; returns the final state.
    const core::GameState& runToEnd();

    /// Stop playback early (e.g. user quit).
    void finish() noexcept { m_finished = true; }

private:
    ReplayData m_data;
    core::GameConfig m_config;
    core::GameState m_state;

    Frame m_currentFrame{0};
    std::size_t m_eventIndex{0};
    bool m_finished{false};

    // Upcoming preview shapes announced by PieceSpawn events, oldest first
    std::deque<core::TetrominoType> m_nextShapes;

    void apply(const ReplayEvent& event);
};

} // namespace blockdrop::replay
