#pragma once
#include "SelectionList.hpp"
#include "Terminal.hpp"

#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

// Terminal double: fixed interactivity, counts echo transitions.
class FakeTerminal : public Terminal {
public:
    explicit FakeTerminal(bool interactive) : m_interactive(interactive) {}

    bool isInteractive() const override { return m_interactive; }

    void enterMaskedMode() override {
        if (failEnter) throw std::runtime_error("tcgetattr failed: fake");
        ++enterCount;
        echo = false;
    }

    bool exitMaskedMode() noexcept override {
        ++exitCount;
        echo = true;
        return true;
    }

    bool echo = true;
    bool failEnter = false;
    int  enterCount = 0;
    int  exitCount = 0;

private:
    bool m_interactive;
};

// SelectionList double: replays a fixed list of checked indices.
class ScriptedSelectionList : public SelectionList {
public:
    explicit ScriptedSelectionList(std::vector<std::size_t> picks = {})
        : m_picks(std::move(picks)) {}

    std::vector<std::size_t> select(const SelectionRequest& request) override {
        ++calls;
        lastRequest = request;
        return m_picks;
    }

    int calls = 0;
    SelectionRequest lastRequest;

private:
    std::vector<std::size_t> m_picks;
};
