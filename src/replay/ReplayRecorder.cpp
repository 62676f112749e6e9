#include "replay/ReplayRecorder.hpp"

namespace blockdrop::replay {

ReplayRecorder::ReplayRecorder(std::int64_t startTimestamp,
                               int boardWidth,
                               int boardHeight,
                               core::TetrominoType firstShape,
                               core::TetrominoType secondShape,
                               int startLevel)
    : m_startTimestamp(startTimestamp)
    , m_boardWidth(boardWidth)
    , m_boardHeight(boardHeight)
    , m_firstShape(firstShape)
    , m_secondShape(secondShape)
    , m_startLevel(startLevel)
{
}

ReplayRecorder ReplayRecorder::forGame(const core::GameState& initial,
                                       std::int64_t startTimestamp)
{
    return ReplayRecorder(startTimestamp,
                          initial.board().width(),
                          initial.board().height(),
                          initial.activeTetromino().type(),
                          initial.nextTetromino(),
                          initial.level());
}

void ReplayRecorder::recordInput(core::Input input)
{
    m_events.emplace_back(PlayerInput{input, m_currentFrame});
}

void ReplayRecorder::recordPieceSpawn(core::TetrominoType shape)
{
    m_events.emplace_back(PieceSpawn{shape, m_currentFrame});
}

ReplayData ReplayRecorder::build(const core::GameState& finalState,
                                 std::int64_t endTimestamp) const
{
    ReplayData data;
    data.metadata.version        = CurrentReplayVersion;
    data.metadata.startTimestamp = m_startTimestamp;
    data.metadata.boardWidth     = m_boardWidth;
    data.metadata.boardHeight    = m_boardHeight;
    data.metadata.startLevel     = m_startLevel;
    data.metadata.firstShape     = m_firstShape;
    data.metadata.secondShape    = m_secondShape;
    data.metadata.finalScore     = finalState.score();
    data.metadata.finalLevel     = finalState.level();
    data.metadata.finalLines     = finalState.linesCleared();
    data.metadata.durationMs     = endTimestamp - m_startTimestamp;
    data.events = m_events;
    return data;
}

} // namespace blockdrop::replay
