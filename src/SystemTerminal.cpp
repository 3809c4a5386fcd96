#include "SystemTerminal.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

#if defined(_WIN32)
  #include <windows.h>
  #include <io.h>
#else
  #include <unistd.h>
#endif

namespace {
#if defined(_WIN32)
    HANDLE console_handle(int fd) {
        return reinterpret_cast<HANDLE>(_get_osfhandle(fd));
    }
#else
    std::runtime_error sys_error(const char* what) {
        return std::runtime_error(std::string(what) + " failed: " + std::strerror(errno));
    }
#endif
}

SystemTerminal::SystemTerminal(int fd)
    : m_fd(fd), m_interactive(isTerminal(fd))
{
}

SystemTerminal::~SystemTerminal() {
    // Only reachable with masked mode still on if a guard was bypassed.
    if (m_masked && !exitMaskedMode()) {
        std::cerr << "Warning: could not restore terminal echo\n";
    }
}

bool SystemTerminal::isTerminal(int fd) {
#if defined(_WIN32)
    DWORD mode = 0;
    return GetConsoleMode(console_handle(fd), &mode) != 0;
#else
    return isatty(fd) == 1;
#endif
}

void SystemTerminal::enterMaskedMode() {
    if (m_masked) {
        throw std::logic_error("enterMaskedMode: already in masked mode");
    }

#if defined(_WIN32)
    HANDLE h = console_handle(m_fd);
    DWORD mode = 0;
    if (!GetConsoleMode(h, &mode)) {
        throw std::runtime_error("GetConsoleMode failed: error " + std::to_string(GetLastError()));
    }
    m_savedMode = mode;
    mode &= ~ENABLE_ECHO_INPUT;
    mode |= ENABLE_LINE_INPUT | ENABLE_PROCESSED_INPUT;
    if (!SetConsoleMode(h, mode)) {
        throw std::runtime_error("SetConsoleMode failed: error " + std::to_string(GetLastError()));
    }
#else
    if (tcgetattr(m_fd, &m_savedAttrs) != 0) {
        throw sys_error("tcgetattr");
    }
    termios masked = m_savedAttrs;
    masked.c_lflag &= ~ECHO;
    // keep line editing and signals so Enter / Ctrl-C behave as usual
    masked.c_lflag |= ICANON | ISIG;
    masked.c_iflag |= ICRNL;
    if (tcsetattr(m_fd, TCSANOW, &masked) != 0) {
        throw sys_error("tcsetattr");
    }
#endif

    m_masked = true;
}

bool SystemTerminal::exitMaskedMode() noexcept {
    if (!m_masked) return true;
    m_masked = false;

#if defined(_WIN32)
    return SetConsoleMode(console_handle(m_fd), m_savedMode) != 0;
#else
    return tcsetattr(m_fd, TCSANOW, &m_savedAttrs) == 0;
#endif
}
