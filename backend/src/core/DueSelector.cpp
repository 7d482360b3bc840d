#include "DueSelector.hpp"
#include <algorithm>
#include <unordered_set>
#include <spdlog/spdlog.h>

std::size_t clampLimit(int limit) {
    if (limit < 0) {
        spdlog::warn("Negative limit {} treated as 0", limit);
        return 0;
    }
    return static_cast<std::size_t>(limit);
}

DueSelector::DueSelector(const Clock& clock)
    : clk(clock)
{
}

/*
  Due items sorted by:
    1. time overdue, descending (oldest due first),
    2. ease factor, ascending (harder items surface first).
*/
std::vector<CardMemoryState> DueSelector::getCardsDueForReview(const MemorySnapshot& states, int limit) const {
    const std::size_t max_items = clampLimit(limit);
    const TimePoint now = clk.now();

    std::vector<CardMemoryState> due;
    due.reserve(states.size() / 4 + 8);
    for (const auto& s : states) {
        if (s.next_review_date <= now) {
            due.push_back(s);
        }
    }

    std::stable_sort(due.begin(), due.end(),
        [now](const CardMemoryState& a, const CardMemoryState& b) {
            auto overdue_a = now - a.next_review_date;
            auto overdue_b = now - b.next_review_date;
            if (overdue_a != overdue_b) return overdue_a > overdue_b;
            return a.ease_factor < b.ease_factor;
        });

    if (due.size() > max_items) due.resize(max_items);

    spdlog::debug("getCardsDueForReview: {} of {} items selected", due.size(), states.size());
    return due;
}

std::vector<std::string> DueSelector::getNewCards(const std::vector<std::string>& allItemIds,
    const MemorySnapshot& states, int limit) const {
    const std::size_t max_items = clampLimit(limit);

    std::unordered_set<std::string> studied;
    studied.reserve(states.size());
    for (const auto& s : states) studied.insert(s.item_id);

    std::vector<std::string> fresh;
    for (const auto& id : allItemIds) {
        if (fresh.size() >= max_items) break;
        if (studied.find(id) == studied.end()) fresh.push_back(id);
    }

    spdlog::debug("getNewCards: {} new items from pool of {}", fresh.size(), allItemIds.size());
    return fresh;
}
