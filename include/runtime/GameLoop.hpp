#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>

#include "controller/GameController.hpp"
#include "core/GameConfig.hpp"
#include "core/GameState.hpp"
#include "replay/ReplayRecorder.hpp"
#include "replay/ReplayTypes.hpp"
#include "runtime/CommandQueue.hpp"
#include "runtime/IKeySource.hpp"

namespace blockdrop::runtime {

struct LoopResult {
    core::GameState finalState;
    std::optional<replay::ReplayData> replay; // set when recording was requested
    std::uint64_t commandsProcessed{0};
    bool quitRequested{false};
};

/// Glues together:
/// - an input producer and a tick producer feeding one CommandQueue
/// - a single consumer applying commands through a GameController
/// - optional replay recording and a render hook
///
/// All game-state mutation happens on the thread that calls run()/consume().
class GameLoop {
public:
    using RenderHook = std::function<void(const core::GameState&)>;

    GameLoop(core::GameConfig config, core::PieceSupply supply);

    /// Called with the initial state and after every processed command.
    void setRenderHook(RenderHook hook);

    /// Live session: starts both producers, consumes until Quit or GameOver,
    /// then stops the producers. Throws nothing from the game itself.
    LoopResult run(const core::GameState& initial, IKeySource& keys, bool record);

    /// Consumer half of run(): pops commands until Quit, GameOver or a closed queue.
    /// `intervalMs` is updated whenever the level changes. `recorder` may be null.
    LoopResult consume(CommandQueue& queue,
                       std::atomic<int>& intervalMs,
                       const core::GameState& initial,
                       replay::ReplayRecorder* recorder);

private:
    core::GameConfig m_config;
    core::PieceSupply m_supply;
    RenderHook m_render;

    void render(const core::GameState& state) const;
};

} // namespace blockdrop::runtime
