#pragma once

#include <thread>

#include "controller/KeyMapping.hpp"
#include "core/GameConfig.hpp"
#include "runtime/CommandQueue.hpp"
#include "runtime/IKeySource.hpp"
#include "runtime/StopSignal.hpp"

namespace blockdrop::runtime {

/// Background thread that polls the key source, decodes keys (including
/// ESC [ x arrow sequences) and pushes the resulting commands.
/// The key source and queue must outlive the producer.
class InputProducer {
public:
    InputProducer(CommandQueue& queue, IKeySource& keys, core::TerminalConfig timings);
    ~InputProducer();

    InputProducer(const InputProducer&) = delete;
    InputProducer& operator=(const InputProducer&) = delete;

    void start();

    /// Interrupts any sleep and joins the thread. Safe to call twice.
    /// A push blocked on a full queue only returns once the queue is closed.
    void stop();

    /// One poll step: read at most one key (plus its escape continuation).
    /// Runs on the producer thread; public so tests can drive it directly.
    controller::KeyParseResult readKey();

private:
    CommandQueue& m_queue;
    IKeySource& m_keys;
    core::TerminalConfig m_timings;

    StopSignal m_stop;
    std::thread m_thread;

    void run();
    controller::KeyParseResult parseEscapeSequence();
};

} // namespace blockdrop::runtime
