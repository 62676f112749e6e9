#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

#include "controller/InputAction.hpp"

namespace blockdrop::runtime {

/// Bounded FIFO shared by the input/tick producers and the game loop consumer.
/// A full queue blocks the producer instead of dropping the command.
class CommandQueue {
public:
    static constexpr std::size_t DefaultCapacity = 100;

    explicit CommandQueue(std::size_t capacity = DefaultCapacity);

    CommandQueue(const CommandQueue&) = delete;
    CommandQueue& operator=(const CommandQueue&) = delete;

    /// Blocks while full. Returns false (command discarded) once the queue is closed.
    bool push(controller::InputAction action);

    /// Blocks while empty. std::nullopt once the queue is closed and drained.
    std::optional<controller::InputAction> pop();

    /// Wake every waiter; later pushes fail, pops drain what is left.
    void close();

    std::size_t size() const;
    std::size_t capacity() const noexcept { return m_capacity; }

private:
    const std::size_t m_capacity;
    std::deque<controller::InputAction> m_items;
    bool m_closed{false};

    mutable std::mutex m_mutex;
    std::condition_variable m_notEmpty;
    std::condition_variable m_notFull;
};

} // namespace blockdrop::runtime
