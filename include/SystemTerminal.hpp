#pragma once
#include "Terminal.hpp"

#if !defined(_WIN32)
  #include <termios.h>
#endif

// Terminal backed by a real file descriptor (standard input by default).
// Interactivity is resolved once, in the constructor.
class SystemTerminal final : public Terminal {
public:
    explicit SystemTerminal(int fd = 0);
    ~SystemTerminal() override;

    SystemTerminal(const SystemTerminal&) = delete;
    SystemTerminal& operator=(const SystemTerminal&) = delete;

    // Raw device check: is `fd` a character-mode terminal?
    static bool isTerminal(int fd);

    bool isInteractive() const override { return m_interactive; }
    void enterMaskedMode() override;
    bool exitMaskedMode() noexcept override;

private:
    int  m_fd;
    bool m_interactive;
    bool m_masked = false;

#if defined(_WIN32)
    unsigned long m_savedMode = 0; // DWORD console mode
#else
    termios m_savedAttrs{};
#endif
};
