#pragma once
#include "LineReader.hpp"
#include "Terminal.hpp"

#include <optional>
#include <ostream>
#include <string>

// Reads one line with terminal echo turned off.
class MaskedReader {
public:
    MaskedReader(Terminal& terminal, LineReader& reader, std::ostream& status);

    // Throws NotATerminal (without reading) if input isn't interactive.
    // Echo is restored before this returns or throws. Returns std::nullopt
    // at end of input. The secret is not trimmed.
    std::optional<std::string> readSecret();

private:
    Terminal&     m_terminal;
    LineReader&   m_reader;
    std::ostream& m_status;
};
