#include "SetScheduler.hpp"
#include "CardMemory.hpp"
#include <algorithm>
#include <iterator>
#include <spdlog/spdlog.h>

static constexpr int DEFAULT_CUSTOM_DAYS = 7;

SetScheduler::SetScheduler(const Clock& clock, StudyRepository& repository, std::uint64_t seed)
    : clk(clock), repo(repository), rng(seed)
{
    spdlog::info("SetScheduler initialized");
}

SetScheduler::SetScheduler(const Clock& clock, StudyRepository& repository)
    : SetScheduler(clock, repository, std::random_device{}())
{
}

TimePoint SetScheduler::calculateNextPracticeDate(PracticeFrequency frequency, std::optional<int> customDays) const {
    const TimePoint now = clk.now();

    switch (frequency) {
    case PracticeFrequency::DAILY: return TimeUtils::addDays(now, 1);
    case PracticeFrequency::EVERY_2_DAYS: return TimeUtils::addDays(now, 2);
    case PracticeFrequency::WEEKLY: return TimeUtils::addDays(now, 7);
    case PracticeFrequency::BI_WEEKLY: return TimeUtils::addDays(now, 14);
    case PracticeFrequency::MONTHLY: return TimeUtils::addMonths(now, 1);
    case PracticeFrequency::CUSTOM: {
        int days = customDays.value_or(DEFAULT_CUSTOM_DAYS);
        if (days <= 0) {
            spdlog::warn("Custom frequency of {} days; using {}", days, DEFAULT_CUSTOM_DAYS);
            days = DEFAULT_CUSTOM_DAYS;
        }
        return TimeUtils::addDays(now, days);
    }
    }
    return TimeUtils::addDays(now, DEFAULT_CUSTOM_DAYS);
}

std::vector<FlashcardSetSchedule> SetScheduler::getFlashcardSetsDueForPractice(
    const std::vector<FlashcardSetSchedule>& sets) const {
    const TimePoint now = clk.now();
    std::vector<FlashcardSetSchedule> due;
    std::copy_if(sets.begin(), sets.end(), std::back_inserter(due),
        [now](const FlashcardSetSchedule& s) { return s.is_active && s.next_practice_date <= now; });
    return due;
}

std::vector<FlashcardSetSchedule> SetScheduler::getFlashcardSetsDueForPractice() {
    return getFlashcardSetsDueForPractice(repo.loadSetSchedules());
}

bool SetScheduler::updateFlashcardSetPracticeDate(const std::string& setId,
    TimePoint lastPracticed, TimePoint nextPracticeDate) {
    auto set = repo.getSetSchedule(setId);
    if (!set) {
        spdlog::warn("updateFlashcardSetPracticeDate: set {} not found", setId);
        return false;
    }

    set->last_practiced = lastPracticed;
    set->next_practice_date = nextPracticeDate;
    set->updated = clk.now();

    spdlog::info("Set {} practiced at {}, next practice {}", setId,
        TimeUtils::toIso(lastPracticed), TimeUtils::toIso(nextPracticeDate));
    return repo.saveSetSchedule(*set);
}

std::optional<FlashcardSetSchedule> SetScheduler::createSetSchedule(const std::string& setId,
    PracticeFrequency frequency, std::optional<int> customDays) {
    const TimePoint now = clk.now();

    FlashcardSetSchedule s;
    s.set_id = setId.empty() ? generateSetId() : setId;
    s.practice_frequency = frequency;
    if (frequency == PracticeFrequency::CUSTOM) s.custom_frequency_days = customDays;
    s.next_practice_date = calculateNextPracticeDate(frequency, customDays);
    s.is_active = true;
    s.created = now;
    s.updated = now;

    if (!repo.saveSetSchedule(s)) return std::nullopt;

    spdlog::info("Created {} schedule for set {}", frequencyToString(frequency), s.set_id);
    return s;
}

bool SetScheduler::markPracticed(const std::string& setId) {
    auto set = repo.getSetSchedule(setId);
    if (!set) {
        spdlog::warn("markPracticed: set {} not found", setId);
        return false;
    }
    TimePoint next = calculateNextPracticeDate(set->practice_frequency, set->custom_frequency_days);
    return updateFlashcardSetPracticeDate(setId, clk.now(), next);
}

std::string SetScheduler::generateSetId() {
    return generateId("set", clk.now(), rng);
}
