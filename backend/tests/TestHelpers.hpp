#pragma once
#include <string>
#include <spdlog/spdlog.h>
#include "core/CardMemory.hpp"
#include "core/Clock.hpp"
#include "utils/TimeUtils.hpp"

namespace testing_helpers {

// Mid-June noon: far from any DST switch, so day arithmetic is exact in every zone
inline TimePoint referenceNow() {
    return TimeUtils::makeLocal(2026, 6, 15, 12, 0, 0);
}

inline void quietLogs() {
    spdlog::set_level(spdlog::level::warn);
}

inline CardMemoryState makeState(const std::string& id, TimePoint nextReview,
    double ease = 2.5, int interval = 1) {
    CardMemoryState s;
    s.item_id = id;
    s.interval = interval;
    s.ease_factor = ease;
    s.next_review_date = nextReview;
    s.last_review_date = TimeUtils::addDays(nextReview, -interval);
    s.created = s.last_review_date;
    s.updated = s.last_review_date;
    return s;
}

}  // namespace testing_helpers
