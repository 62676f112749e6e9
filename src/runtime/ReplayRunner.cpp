#include "runtime/ReplayRunner.hpp"

#include <algorithm>
#include <thread>
#include <utility>

#include "controller/KeyMapping.hpp"

namespace blockdrop::runtime {

ReplayRunner::ReplayRunner(core::GameConfig config, IKeySource& keys)
    : m_config(std::move(config))
    , m_keys(keys)
{
}

void ReplayRunner::setRenderHook(RenderHook hook)
{
    m_render = std::move(hook);
}

std::chrono::milliseconds ReplayRunner::frameInterval(double speed) noexcept
{
    if (speed <= 0.0) speed = MinSpeed;
    const auto ms = static_cast<int>(BaseIntervalMs / speed);
    return std::chrono::milliseconds{std::max(ms, MinIntervalMs)};
}

core::GameState ReplayRunner::run(const replay::ReplayData& data)
{
    using Clock = std::chrono::steady_clock;

    replay::ReplayPlayer player(data, m_config);
    m_speed = DefaultSpeed;
    render(player);

    constexpr std::chrono::milliseconds kPollStep{5};

    while (!player.isFinished()) {
        // Wait for the next frame while watching for keys
        const auto deadline = Clock::now() + frameInterval(m_speed);
        bool stop = false;
        while (Clock::now() < deadline) {
            if (m_keys.available() > 0) {
                const int key = m_keys.read();
                if (key >= 0 && handleKey(key)) {
                    stop = true;
                    break;
                }
                render(player);
                continue;
            }
            std::this_thread::sleep_for(kPollStep);
        }
        if (stop) {
            player.finish();
            break;
        }

        player.advanceFrame();
        render(player);
    }

    return player.state();
}

bool ReplayRunner::handleKey(int key)
{
    if (controller::isQuitKey(key)) {
        return true;
    }
    switch (key) {
    case '+':
        m_speed = std::min(m_speed + SpeedStep, MaxSpeed);
        return false;
    case '-':
        m_speed = std::max(m_speed - SpeedStep, MinSpeed);
        return false;
    default:
        return false;
    }
}

void ReplayRunner::render(const replay::ReplayPlayer& player) const
{
    if (m_render) {
        m_render(player.state(), PlaybackStatus{m_speed, player.progress(), player.isFinished()});
    }
}

} // namespace blockdrop::runtime
