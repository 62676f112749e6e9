#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace blockdrop::runtime {

/// Stop flag with an interruptible sleep, shared by the producer threads.
class StopSignal {
public:
    void requestStop()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_stopped = true;
        }
        m_cv.notify_all();
    }

    void reset()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopped = false;
    }

    bool stopRequested() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_stopped;
    }

    /// Sleep for `duration` unless stopped first. Returns false if a stop was requested.
    bool sleepFor(std::chrono::milliseconds duration)
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        return !m_cv.wait_for(lock, duration, [this] { return m_stopped; });
    }

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_stopped{false};
};

} // namespace blockdrop::runtime
