#include "replay/ReplayPlayer.hpp"

#include <utility>

namespace blockdrop::replay {

namespace {
    // Levels are counted from the level the session was recorded at
    core::GameConfig withStartLevel(core::GameConfig config, int startLevel) {
        config.level.startLevel = startLevel;
        return config;
    }
}

ReplayPlayer::ReplayPlayer(ReplayData data, core::GameConfig config)
    : m_data(std::move(data))
    , m_config(withStartLevel(std::move(config), m_data.metadata.startLevel))
    , m_state(core::GameState::initial(m_data.metadata.firstShape,
                                       m_data.metadata.secondShape,
                                       m_data.metadata.boardWidth,
                                       m_data.metadata.boardHeight,
                                       m_config.level.startLevel))
{
    m_finished = m_data.events.empty();
}

double ReplayPlayer::progress() const noexcept
{
    if (m_data.events.empty()) {
        return 1.0;
    }
    return static_cast<double>(m_eventIndex) / static_cast<double>(m_data.events.size());
}

void ReplayPlayer::advanceFrame()
{
    if (m_finished) {
        return;
    }

    // Events of this frame (or, for out-of-order logs, any that are already late)
    const auto& events = m_data.events;
    while (m_eventIndex < events.size() && frameOf(events[m_eventIndex]) <= m_currentFrame) {
        apply(events[m_eventIndex]);
        ++m_eventIndex;
    }

    ++m_currentFrame;
    m_finished = m_eventIndex >= events.size() || m_state.isGameOver();
}

const core::GameState& ReplayPlayer::runToEnd()
{
    while (!m_finished) {
        advanceFrame();
    }
    return m_state;
}

void ReplayPlayer::apply(const ReplayEvent& event)
{
    if (const auto* spawn = std::get_if<PieceSpawn>(&event)) {
        m_nextShapes.push_back(spawn->shape);
        return;
    }

    const auto& playerInput = std::get<PlayerInput>(event);

    // A lock takes the oldest announced shape; fall back to the current preview
    const auto supply = [this]() {
        if (m_nextShapes.empty()) {
            return m_state.nextTetromino();
        }
        const core::TetrominoType shape = m_nextShapes.front();
        m_nextShapes.pop_front();
        return shape;
    };

    m_state = m_state.update(playerInput.input, supply, m_config);
}

} // namespace blockdrop::replay
