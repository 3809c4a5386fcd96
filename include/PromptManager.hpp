#pragma once
#include "LineReader.hpp"
#include "MaskedReader.hpp"
#include "PromptErrors.hpp"
#include "SelectionList.hpp"
#include "Terminal.hpp"

#include <cstddef>
#include <functional>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

struct TextPromptOptions {
    std::optional<std::string> defaultValue;             // returned on an empty line
    std::function<bool(const std::string&)> validator;   // false -> ask again
    std::string invalidMessage;                          // printed when validator says no
};

struct PasswordPromptOptions {
    std::function<bool(const std::string&)> validator;
    std::string invalidMessage;
};

struct MultiSelectOptions {
    std::vector<std::string> defaults;  // checked when the list opens
    std::size_t pageSize = 7;           // 0 means the default
};

// Single-field prompts over one input stream. Labels, hints and notices go to
// `status` (normally std::cerr) so the program's stdout stays machine-readable.
// Every call blocks until it has a valid answer or throws a PromptError.
class PromptManager {
public:
    PromptManager(Terminal& terminal,
                  std::istream& in,
                  std::ostream& status,
                  SelectionList& selector);

    // m_masked refers to m_reader, so a copy would point into the original
    PromptManager(const PromptManager&) = delete;
    PromptManager& operator=(const PromptManager&) = delete;

    // Non-empty line, trimmed. Throws InputExhausted at end of input.
    std::string promptText(const std::string& label,
                           const TextPromptOptions& opts = {});

    // Non-empty line read with echo off. Throws NotATerminal on piped input,
    // InputExhausted at end of input.
    std::string promptPassword(const std::string& label,
                               const PasswordPromptOptions& opts = {});

    // y/yes/n/no (any case); empty line gives defaultValue.
    bool promptConfirm(const std::string& label, bool defaultValue);

    // Checked subset of `options`, in the order of `options`.
    // Throws InvalidOptions, NotATerminal, or PromptInterrupted.
    std::vector<std::string> promptMultiSelect(const std::string& label,
                                               const std::vector<std::string>& options,
                                               const MultiSelectOptions& opts = {});

    void printLine(const std::string& text) const;

    bool isInteractive() const { return m_terminal.isInteractive(); }

private:
    void writeLabel(const std::string& text) const;

    Terminal&      m_terminal;
    std::ostream&  m_status;
    SelectionList& m_selector;
    LineReader     m_reader;
    MaskedReader   m_masked;
};
