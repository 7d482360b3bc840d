#pragma once
#include <optional>
#include <string>
#include "../utils/TimeUtils.hpp"

enum class PracticeFrequency {
    DAILY,
    EVERY_2_DAYS,
    WEEKLY,
    BI_WEEKLY,
    MONTHLY,
    CUSTOM
};

std::string frequencyToString(PracticeFrequency f);
// Unknown names fall back to WEEKLY
PracticeFrequency frequencyFromString(const std::string& name);

// Practice reminder cadence for a whole set of items; independent of per-item memory.
struct FlashcardSetSchedule {
    std::string set_id;
    PracticeFrequency practice_frequency = PracticeFrequency::WEEKLY;
    std::optional<int> custom_frequency_days; // only read when CUSTOM
    TimePoint next_practice_date{};
    std::optional<TimePoint> last_practiced;
    bool is_active = true;

    TimePoint created{};
    TimePoint updated{};
};
