#include "runtime/GameLoop.hpp"

#include <utility>

#include "core/LevelManager.hpp"
#include "runtime/InputProducer.hpp"
#include "runtime/TickProducer.hpp"

namespace blockdrop::runtime {

GameLoop::GameLoop(core::GameConfig config, core::PieceSupply supply)
    : m_config(std::move(config))
    , m_supply(std::move(supply))
{
}

void GameLoop::setRenderHook(RenderHook hook)
{
    m_render = std::move(hook);
}

void GameLoop::render(const core::GameState& state) const
{
    if (m_render) {
        m_render(state);
    }
}

LoopResult GameLoop::run(const core::GameState& initial, IKeySource& keys, bool record)
{
    CommandQueue queue(CommandQueue::DefaultCapacity);
    std::atomic<int> intervalMs{core::dropIntervalMs(initial.level(), m_config.speed)};

    std::optional<replay::ReplayRecorder> recorder;
    if (record) {
        recorder.emplace(replay::ReplayRecorder::forGame(initial, replay::currentTimeMillis()));
    }

    InputProducer input(queue, keys, m_config.terminal);
    TickProducer ticker(queue, intervalMs);

    // Destroyed before the producers: a render hook that throws must not
    // leave a producer blocked on a full queue while its destructor joins.
    struct QueueCloser {
        CommandQueue& queue;
        ~QueueCloser() { queue.close(); }
    } closer{queue};

    input.start();
    ticker.start();

    LoopResult result = consume(queue, intervalMs, initial, recorder ? &*recorder : nullptr);

    // Unblock producers waiting on a full queue, then interrupt and join them.
    // Commands still queued are dropped; the result only holds applied ones.
    queue.close();
    input.stop();
    ticker.stop();

    if (recorder) {
        result.replay = recorder->build(result.finalState, replay::currentTimeMillis());
    }
    return result;
}

LoopResult GameLoop::consume(CommandQueue& queue,
                             std::atomic<int>& intervalMs,
                             const core::GameState& initial,
                             replay::ReplayRecorder* recorder)
{
    controller::GameController controller(m_config, m_supply, initial);
    LoopResult result{initial, std::nullopt, 0, false};

    render(controller.state());

    while (!controller.state().isGameOver()) {
        auto action = queue.pop();
        if (!action) {
            break; // queue closed
        }
        if (*action == controller::InputAction::Quit) {
            result.quitRequested = true;
            break;
        }

        const auto outcome = controller.handleAction(*action);
        ++result.commandsProcessed;

        if (outcome.levelChanged) {
            intervalMs.store(outcome.dropIntervalMs);
        }

        if (recorder && outcome.input) {
            // Announce the drawn preview before the input that consumed it
            if (outcome.drawnShape) {
                recorder->recordPieceSpawn(*outcome.drawnShape);
            }
            recorder->recordInput(*outcome.input);
            recorder->advanceFrame();
        }

        render(controller.state());
    }

    result.finalState = controller.state();
    return result;
}

} // namespace blockdrop::runtime
