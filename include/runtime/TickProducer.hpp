#pragma once

#include <atomic>
#include <thread>

#include "runtime/CommandQueue.hpp"
#include "runtime/StopSignal.hpp"

namespace blockdrop::runtime {

/// Background thread pushing a Tick command after every drop interval.
/// The interval is re-read before each sleep, so a change made by the
/// game loop applies from the next tick on.
class TickProducer {
public:
    TickProducer(CommandQueue& queue, const std::atomic<int>& intervalMs);
    ~TickProducer();

    TickProducer(const TickProducer&) = delete;
    TickProducer& operator=(const TickProducer&) = delete;

    void start();
    void stop();

private:
    CommandQueue& m_queue;
    const std::atomic<int>& m_intervalMs;

    StopSignal m_stop;
    std::thread m_thread;

    void run();
};

} // namespace blockdrop::runtime
