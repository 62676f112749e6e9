#pragma once

#include <chrono>
#include <functional>

#include "core/GameConfig.hpp"
#include "core/GameState.hpp"
#include "replay/ReplayPlayer.hpp"
#include "replay/ReplayTypes.hpp"
#include "runtime/IKeySource.hpp"

namespace blockdrop::runtime {

struct PlaybackStatus {
    double speed{1.0};
    double progress{0.0}; // 0..1
    bool finished{false};
};

/// Plays a replay back in real time: one frame per 50 ms at 1x.
/// Keys: '+' faster, '-' slower (0.25x steps within 0.25x..4x), 'q' stop.
class ReplayRunner {
public:
    using RenderHook = std::function<void(const core::GameState&, const PlaybackStatus&)>;

    static constexpr double DefaultSpeed = 1.0;
    static constexpr double MinSpeed = 0.25;
    static constexpr double MaxSpeed = 4.0;
    static constexpr double SpeedStep = 0.25;
    static constexpr int BaseIntervalMs = 50;
    static constexpr int MinIntervalMs = 10;

    ReplayRunner(core::GameConfig config, IKeySource& keys);

    void setRenderHook(RenderHook hook);

    /// Blocks until the replay is finished or the user quits; returns the last state.
    core::GameState run(const replay::ReplayData& data);

    double speed() const noexcept { return m_speed; }

    /// Milliseconds between frames at the given speed.
    static std::chrono::milliseconds frameInterval(double speed) noexcept;

private:
    core::GameConfig m_config;
    IKeySource& m_keys;
    RenderHook m_render;
    double m_speed{DefaultSpeed};

    // True if the key stops playback
    bool handleKey(int key);
    void render(const replay::ReplayPlayer& player) const;
};

} // namespace blockdrop::runtime
