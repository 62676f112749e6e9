#pragma once

#include <cstdint>
#include <vector>

#include "core/GameState.hpp"
#include "replay/ReplayTypes.hpp"

namespace blockdrop::replay {

/// Accumulates the events of a live session. Events are stamped with the
/// current frame; the frame only moves when the caller calls advanceFrame().
class ReplayRecorder {
public:
    ReplayRecorder(std::int64_t startTimestamp,
                   int boardWidth,
                   int boardHeight,
                   core::TetrominoType firstShape,
                   core::TetrominoType secondShape,
                   int startLevel = 1);

    /// Recorder for a session starting from `initial` (active piece, preview and level).
    static ReplayRecorder forGame(const core::GameState& initial, std::int64_t startTimestamp);

    void recordInput(core::Input input);
    void recordPieceSpawn(core::TetrominoType shape);
    void advanceFrame() noexcept { ++m_currentFrame; }

    Frame currentFrame() const noexcept { return m_currentFrame; }
    const std::vector<ReplayEvent>& events() const noexcept { return m_events; }

    /// Finalize the metadata from the last state of the session.
    ReplayData build(const core::GameState& finalState, std::int64_t endTimestamp) const;

private:
    std::int64_t m_startTimestamp;
    int m_boardWidth;
    int m_boardHeight;
    core::TetrominoType m_firstShape;
    core::TetrominoType m_secondShape;
    int m_startLevel;

    std::vector<ReplayEvent> m_events;
    Frame m_currentFrame{0};
};

} // namespace blockdrop::replay
