#pragma once

#include <deque>
#include <mutex>
#include <string>

#include "runtime/IKeySource.hpp"

// Scripted keyboard: bytes queued by the test are handed out in order.
// Safe to feed from the test thread while a producer thread reads.
class FakeKeySource : public blockdrop::runtime::IKeySource {
public:
    int available() override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return static_cast<int>(m_bytes.size());
    }

    int read() override {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_bytes.empty()) {
            return -1;
        }
        const int byte = m_bytes.front();
        m_bytes.pop_front();
        ++readCount;
        return byte;
    }

    /// Helper for tests: queue raw bytes as if typed.
    void type(const std::string& bytes) {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (unsigned char c : bytes) {
            m_bytes.push_back(c);
        }
    }

    int readCount{0};

private:
    std::mutex m_mutex;
    std::deque<int> m_bytes;
};
