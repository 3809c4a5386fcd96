#pragma once
#include <iostream>

// Terminal control as seen by the prompts: a device query and the echo flag.
// SystemTerminal is the real one; tests supply a fake.
class Terminal {
public:
    virtual ~Terminal() = default;

    // True only when input comes from an interactive terminal.
    // Must give the same answer for the lifetime of the object.
    virtual bool isInteractive() const = 0;

    // Disable local echo. Throws std::runtime_error if the mode can't be changed.
    virtual void enterMaskedMode() = 0;

    // Restore the mode saved by enterMaskedMode(). Returns false if that failed.
    virtual bool exitMaskedMode() noexcept = 0;
};

// Holds the terminal in masked mode for one scope; the exit always runs.
class MaskedModeGuard {
public:
    explicit MaskedModeGuard(Terminal& terminal) : m_terminal(terminal) {
        m_terminal.enterMaskedMode();
    }

    ~MaskedModeGuard() {
        if (!m_terminal.exitMaskedMode()) {
            std::cerr << "Warning: could not restore terminal echo\n";
        }
    }

    MaskedModeGuard(const MaskedModeGuard&) = delete;
    MaskedModeGuard& operator=(const MaskedModeGuard&) = delete;

private:
    Terminal& m_terminal;
};
