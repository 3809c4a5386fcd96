#pragma once
#include "SelectionList.hpp"

#include <cstdio>

// ncurses-backed checkbox list.
// Keys: Up/Down or k/j move, Space toggles, Right checks all, Left clears,
// Enter confirms, Esc or Ctrl-C aborts.
class CursesSelectionList : public SelectionList {
public:
    // Draws on `out` (stderr by default, so stdout stays clean) and reads keys from `in`.
    explicit CursesSelectionList(std::FILE* in = stdin, std::FILE* out = stderr);

    std::vector<std::size_t> select(const SelectionRequest& request) override;

private:
    std::FILE* m_in;
    std::FILE* m_out;
};
