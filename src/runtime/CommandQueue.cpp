#include "runtime/CommandQueue.hpp"

namespace blockdrop::runtime {

CommandQueue::CommandQueue(std::size_t capacity)
    : m_capacity(capacity == 0 ? 1 : capacity)
{
}

bool CommandQueue::push(controller::InputAction action)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    m_notFull.wait(lock, [this] { return m_closed || m_items.size() < m_capacity; });
    if (m_closed) {
        return false;
    }
    m_items.push_back(action);
    lock.unlock();
    m_notEmpty.notify_one();
    return true;
}

std::optional<controller::InputAction> CommandQueue::pop()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    m_notEmpty.wait(lock, [this] { return m_closed || !m_items.empty(); });
    if (m_items.empty()) {
        return std::nullopt; // closed and drained
    }
    auto action = m_items.front();
    m_items.pop_front();
    lock.unlock();
    m_notFull.notify_one();
    return action;
}

void CommandQueue::close()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
    }
    m_notEmpty.notify_all();
    m_notFull.notify_all();
}

std::size_t CommandQueue::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_items.size();
}

} // namespace blockdrop::runtime
