#pragma once

#include <termios.h>

#include "runtime/IKeySource.hpp"

namespace blockdrop::runtime {

/// Reads keys from stdin with canonical mode and echo turned off.
/// The previous terminal settings are restored on destruction.
class TerminalKeySource : public IKeySource {
public:
    /// Throws std::runtime_error when stdin is not a terminal.
    TerminalKeySource();
    ~TerminalKeySource() override;

    // Non-copyable, non-movable
    TerminalKeySource(const TerminalKeySource&) = delete;
    TerminalKeySource& operator=(const TerminalKeySource&) = delete;

    int available() override;
    int read() override;

private:
    termios m_saved{};
    bool m_restore{false};
};

} // namespace blockdrop::runtime
