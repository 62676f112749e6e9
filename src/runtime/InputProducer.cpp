#include "runtime/InputProducer.hpp"

namespace blockdrop::runtime {

using controller::KeyParseResult;

InputProducer::InputProducer(CommandQueue& queue, IKeySource& keys, core::TerminalConfig timings)
    : m_queue(queue)
    , m_keys(keys)
    , m_timings(timings)
{
}

InputProducer::~InputProducer()
{
    stop();
}

void InputProducer::start()
{
    if (m_thread.joinable()) return;
    m_stop.reset();
    m_thread = std::thread(&InputProducer::run, this);
}

void InputProducer::stop()
{
    m_stop.requestStop();
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

void InputProducer::run()
{
    const std::chrono::milliseconds pollInterval{m_timings.inputPollIntervalMs};

    while (!m_stop.stopRequested()) {
        const KeyParseResult result = readKey();

        if (result.kind == KeyParseResult::Kind::Timeout) {
            if (!m_stop.sleepFor(pollInterval)) break;
            continue;
        }

        auto action = controller::toAction(result);
        if (!action) {
            continue; // unmapped key or broken escape sequence
        }

        if (!m_queue.push(*action)) {
            break; // queue closed: the loop is shutting down
        }
    }
}

KeyParseResult InputProducer::readKey()
{
    if (m_keys.available() <= 0) {
        return KeyParseResult::timeout();
    }

    const int key = m_keys.read();
    if (key < 0) {
        return KeyParseResult::timeout();
    }
    if (key == controller::EscapeKeyCode) {
        return parseEscapeSequence();
    }
    return KeyParseResult::regular(key);
}

KeyParseResult InputProducer::parseEscapeSequence()
{
    // ESC alone, or ESC [ x: give the rest of the sequence a moment to arrive
    if (!m_stop.sleepFor(std::chrono::milliseconds{m_timings.escapeSequenceWaitMs})) {
        return KeyParseResult::unknown();
    }
    if (m_keys.available() <= 0) {
        return KeyParseResult::unknown();
    }
    if (m_keys.read() != '[') {
        return KeyParseResult::unknown();
    }

    if (!m_stop.sleepFor(std::chrono::milliseconds{m_timings.escapeSequenceSecondWaitMs})) {
        return KeyParseResult::unknown();
    }
    if (m_keys.available() <= 0) {
        return KeyParseResult::unknown();
    }

    auto action = controller::arrowToAction(m_keys.read());
    if (!action) {
        return KeyParseResult::unknown();
    }
    return KeyParseResult::arrowKey(*action);
}

} // namespace blockdrop::runtime
