#include "runtime/TickProducer.hpp"

#include <algorithm>

namespace blockdrop::runtime {

TickProducer::TickProducer(CommandQueue& queue, const std::atomic<int>& intervalMs)
    : m_queue(queue)
    , m_intervalMs(intervalMs)
{
}

TickProducer::~TickProducer()
{
    stop();
}

void TickProducer::start()
{
    if (m_thread.joinable()) return;
    m_stop.reset();
    m_thread = std::thread(&TickProducer::run, this);
}

void TickProducer::stop()
{
    m_stop.requestStop();
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

void TickProducer::run()
{
    while (true) {
        const int interval = std::max(1, m_intervalMs.load());
        if (!m_stop.sleepFor(std::chrono::milliseconds{interval})) {
            break;
        }
        if (!m_queue.push(controller::InputAction::Tick)) {
            break;
        }
    }
}

} // namespace blockdrop::runtime
