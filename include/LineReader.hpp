#pragma once
#include <istream>
#include <optional>
#include <string>

// Line-at-a-time reader over an input stream.
// std::nullopt means end of input: nothing more will arrive. That is
// different from an empty line, which is returned as "".
class LineReader {
public:
    explicit LineReader(std::istream& in);

    // Next line with the terminator (LF, or CR LF) removed and
    // leading/trailing whitespace trimmed.
    std::optional<std::string> readLine();

    // Same, but without trimming. Used for secrets.
    std::optional<std::string> readRawLine();

private:
    std::istream& m_in;
};
