#include "LineReader.hpp"
#include "console_io.hpp"

#include <stdexcept>

LineReader::LineReader(std::istream& in)
    : m_in(in)
{
}

std::optional<std::string> LineReader::readRawLine() {
    std::string line;
    if (!std::getline(m_in, line)) {
        if (m_in.bad()) {
            throw std::runtime_error("LineReader: read from input failed");
        }
        // failbit without badbit: end of stream before any character
        return std::nullopt;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

std::optional<std::string> LineReader::readLine() {
    auto raw = readRawLine();
    if (!raw) return std::nullopt;
    return trim_whitespace(*raw);
}
