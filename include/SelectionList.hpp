#pragma once
#include <cstddef>
#include <string>
#include <vector>

struct SelectionRequest {
    std::string label;
    std::vector<std::string> options;      // distinct, in display order
    std::vector<std::size_t> preselected;  // indices into options, checked on open
    std::size_t pageSize = 7;              // rows visible at once
};

// Interactive checkbox list. Implementations own rendering and key handling;
// PromptManager only sees the request and the indices that came back.
class SelectionList {
public:
    virtual ~SelectionList() = default;

    // Returns the indices of the checked options, in no particular order.
    // Throws PromptInterrupted if the user aborts.
    virtual std::vector<std::size_t> select(const SelectionRequest& request) = 0;
};
