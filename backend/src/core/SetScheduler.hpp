#pragma once
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include "Clock.hpp"
#include "SetSchedule.hpp"
#include "../storage/StudyRepository.hpp"

/*
  Fixed-cadence practice reminders for whole sets.
    daily 1d, every_2_days 2d, weekly 7d, bi_weekly 14d,
    monthly +1 calendar month, custom N days (7 when not given).
  Day steps are calendar days in local time; monthly is month arithmetic, not 30 days.
*/
class SetScheduler {
public:
    SetScheduler(const Clock& clock, StudyRepository& repository, std::uint64_t seed);
    SetScheduler(const Clock& clock, StudyRepository& repository);

    TimePoint calculateNextPracticeDate(PracticeFrequency frequency,
        std::optional<int> customDays = std::nullopt) const;

    std::vector<FlashcardSetSchedule> getFlashcardSetsDueForPractice(
        const std::vector<FlashcardSetSchedule>& sets) const;
    std::vector<FlashcardSetSchedule> getFlashcardSetsDueForPractice();

    // false when the set is unknown or the write failed
    bool updateFlashcardSetPracticeDate(const std::string& setId,
        TimePoint lastPracticed, TimePoint nextPracticeDate);

    std::optional<FlashcardSetSchedule> createSetSchedule(const std::string& setId,
        PracticeFrequency frequency, std::optional<int> customDays = std::nullopt);

    // last practiced = now, next date from the set's own frequency
    bool markPracticed(const std::string& setId);

    std::string generateSetId();

private:
    const Clock& clk;
    StudyRepository& repo;
    std::mt19937_64 rng;
};
