#include "MaskedReader.hpp"
#include "PromptErrors.hpp"

MaskedReader::MaskedReader(Terminal& terminal, LineReader& reader, std::ostream& status)
    : m_terminal(terminal), m_reader(reader), m_status(status)
{
}

std::optional<std::string> MaskedReader::readSecret() {
    if (!m_terminal.isInteractive()) {
        throw NotATerminal("hidden input needs an interactive terminal");
    }

    // the user's Enter is not echoed, so move the cursor ourselves,
    // also when the read fails
    std::optional<std::string> secret;
    try {
        MaskedModeGuard guard(m_terminal);
        secret = m_reader.readRawLine();
    } catch (...) {
        m_status << "\n" << std::flush;
        throw;
    }

    m_status << "\n" << std::flush;
    return secret;
}
