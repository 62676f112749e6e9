#include "runtime/TerminalKeySource.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

#include <sys/ioctl.h>
#include <unistd.h>

namespace blockdrop::runtime {

TerminalKeySource::TerminalKeySource()
{
    if (!::isatty(STDIN_FILENO)) {
        throw std::runtime_error("TerminalKeySource: stdin is not a terminal");
    }
    if (::tcgetattr(STDIN_FILENO, &m_saved) != 0) {
        throw std::runtime_error(std::string("TerminalKeySource: tcgetattr failed: ")
                                 + std::strerror(errno));
    }

    termios raw = m_saved;
    raw.c_lflag &= ~static_cast<tcflag_t>(ICANON | ECHO);
    raw.c_cc[VMIN]  = 1;
    raw.c_cc[VTIME] = 0;
    if (::tcsetattr(STDIN_FILENO, TCSANOW, &raw) != 0) {
        throw std::runtime_error(std::string("TerminalKeySource: tcsetattr failed: ")
                                 + std::strerror(errno));
    }
    m_restore = true;
}

TerminalKeySource::~TerminalKeySource()
{
    if (m_restore) {
        ::tcsetattr(STDIN_FILENO, TCSANOW, &m_saved);
    }
}

int TerminalKeySource::available()
{
    int bytesWaiting = 0;
    if (::ioctl(STDIN_FILENO, FIONREAD, &bytesWaiting) != 0) {
        return 0;
    }
    return bytesWaiting;
}

int TerminalKeySource::read()
{
    unsigned char c = 0;
    const ssize_t n = ::read(STDIN_FILENO, &c, 1);
    if (n != 1) {
        return -1;
    }
    return static_cast<int>(c);
}

} // namespace blockdrop::runtime
