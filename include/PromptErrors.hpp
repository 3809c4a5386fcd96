#pragma once
#include <stdexcept>
#include <string>

// Base for every failure a prompt call can end with.
// None of these is retried by PromptManager; callers propagate them.
class PromptError : public std::runtime_error {
public:
    explicit PromptError(const std::string& what) : std::runtime_error(what) {}
};

// End of input reached while still waiting for a valid answer.
class InputExhausted : public PromptError {
public:
    using PromptError::PromptError;
};

// A terminal-only prompt (password, multi-select) was used on piped input.
class NotATerminal : public PromptError {
public:
    using PromptError::PromptError;
};

// Empty or duplicate option list, or a default that is not an option.
class InvalidOptions : public PromptError {
public:
    using PromptError::PromptError;
};

// The user aborted an interactive list (Esc / Ctrl-C).
class PromptInterrupted : public PromptError {
public:
    using PromptError::PromptError;
};
