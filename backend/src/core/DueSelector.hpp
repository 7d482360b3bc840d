#pragma once
#include <string>
#include <vector>
#include "CardMemory.hpp"
#include "Clock.hpp"

class DueSelector {
public:
    explicit DueSelector(const Clock& clock);

    // Items whose next review has passed; most overdue first, then lower ease (harder) first.
    std::vector<CardMemoryState> getCardsDueForReview(const MemorySnapshot& states, int limit = 20) const;

    // Items from the pool with no memory state yet, in pool order.
    std::vector<std::string> getNewCards(const std::vector<std::string>& allItemIds,
        const MemorySnapshot& states, int limit = 5) const;

private:
    const Clock& clk;
};

// Negative limits select nothing
std::size_t clampLimit(int limit);
