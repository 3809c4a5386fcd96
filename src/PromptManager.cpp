#include "PromptManager.hpp"
#include "console_io.hpp"

#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace {
    constexpr std::size_t kDefaultPageSize = 7;
}

PromptManager::PromptManager(Terminal& terminal,
                             std::istream& in,
                             std::ostream& status,
                             SelectionList& selector)
    : m_terminal(terminal),
      m_status(status),
      m_selector(selector),
      m_reader(in),
      m_masked(terminal, m_reader, status)
{
}

void PromptManager::writeLabel(const std::string& text) const {
    m_status << text << " " << std::flush;
}

void PromptManager::printLine(const std::string& text) const {
    m_status << text << "\n" << std::flush;
}

std::string PromptManager::promptText(const std::string& label,
                                      const TextPromptOptions& opts) {
    const std::string hint = opts.defaultValue
        ? label + " [" + *opts.defaultValue + "]"
        : label;

    for (;;) {
        writeLabel(hint);
        auto line = m_reader.readLine();
        if (!line) {
            throw InputExhausted("input ended while waiting for: " + label);
        }
        if (line->empty()) {
            if (opts.defaultValue) return *opts.defaultValue;
            continue;
        }
        if (opts.validator && !opts.validator(*line)) {
            if (!opts.invalidMessage.empty()) printLine(opts.invalidMessage);
            continue;
        }
        return *line;
    }
}

std::string PromptManager::promptPassword(const std::string& label,
                                          const PasswordPromptOptions& opts) {
    // checked before the label is written
    if (!m_terminal.isInteractive()) {
        throw NotATerminal("password prompt needs an interactive terminal: " + label);
    }

    for (;;) {
        writeLabel(label);
        auto secret = m_masked.readSecret();
        if (!secret) {
            throw InputExhausted("input ended while waiting for: " + label);
        }
        if (secret->empty()) continue;
        if (opts.validator && !opts.validator(*secret)) {
            secure_wipe(*secret);
            if (!opts.invalidMessage.empty()) printLine(opts.invalidMessage);
            continue;
        }
        return std::move(*secret);
    }
}

bool PromptManager::promptConfirm(const std::string& label, bool defaultValue) {
    const std::string hint = label + (defaultValue ? " [Y/n]" : " [y/N]");

    for (;;) {
        writeLabel(hint);
        auto line = m_reader.readLine();
        if (!line) {
            throw InputExhausted("input ended while waiting for: " + label);
        }
        if (line->empty()) return defaultValue;

        const std::string answer = to_lower_ascii(*line);
        if (answer == "y" || answer == "yes") return true;
        if (answer == "n" || answer == "no")  return false;
        printLine("Please answer y or n.");
    }
}

std::vector<std::string> PromptManager::promptMultiSelect(
    const std::string& label,
    const std::vector<std::string>& options,
    const MultiSelectOptions& opts
) {
    if (options.empty()) {
        throw InvalidOptions("multi-select needs at least one option");
    }

    std::unordered_map<std::string, std::size_t> position;
    position.reserve(options.size());
    for (std::size_t i = 0; i < options.size(); ++i) {
        if (!position.emplace(options[i], i).second) {
            throw InvalidOptions("duplicate option: " + options[i]);
        }
    }

    SelectionRequest request;
    request.label    = label;
    request.options  = options;
    request.pageSize = opts.pageSize == 0 ? kDefaultPageSize : opts.pageSize;
    for (const auto& d : opts.defaults) {
        auto it = position.find(d);
        if (it == position.end()) {
            throw InvalidOptions("default is not one of the options: " + d);
        }
        request.preselected.push_back(it->second);
    }

    if (!m_terminal.isInteractive()) {
        throw NotATerminal("multi-select needs an interactive terminal: " + label);
    }

    const auto picked = m_selector.select(request);

    // Re-order by option position: the list reports in toggle order.
    std::vector<bool> chosen(options.size(), false);
    for (std::size_t i : picked) {
        if (i >= options.size()) {
            throw std::out_of_range("selection list returned index " + std::to_string(i)
                                    + " for " + std::to_string(options.size()) + " options");
        }
        chosen[i] = true;
    }

    std::vector<std::string> result;
    for (std::size_t i = 0; i < options.size(); ++i) {
        if (chosen[i]) result.push_back(options[i]);
    }
    return result;
}
