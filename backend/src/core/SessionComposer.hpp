#pragma once
#include <cstdint>
#include <random>
#include <string>
#include <vector>
#include "CardMemory.hpp"
#include "DueSelector.hpp"
#include "MemoryModel.hpp"
#include "SchedulerConfig.hpp"

struct SessionPlan {
    std::vector<std::string> session_cards; // shuffled, review items win over new ones
    std::vector<std::string> new_cards;
    std::vector<std::string> review_cards;
    std::string session_id;
};

struct StudyStats {
    int total_cards = 0;
    int due_today = 0;
    int new_cards = 0;      // always 0: states alone cannot tell unseen items apart
    int learning = 0;       // interval < mature_interval
    int mature = 0;
    double average_ease_factor = 0.0;
    double average_interval = 0.0;
    int longest_streak = 0;
};

class SessionComposer {
public:
    // Seeded generator makes the shuffle and the session ids reproducible
    SessionComposer(const MemoryModel& model, const DueSelector& selector, std::uint64_t seed);
    SessionComposer(const MemoryModel& model, const DueSelector& selector);

    SessionPlan createStudySession(const std::vector<std::string>& allItemIds,
        const MemorySnapshot& states, const SessionOptions& options = {});

    // Replaces (or appends) exactly one entry; every other entry is copied untouched.
    MemorySnapshot processStudyResult(const StudyResult& result, const MemorySnapshot& states) const;

    StudyStats getStudyStats(const MemorySnapshot& states) const;

    // Session lifecycle
    StudySession startSession(const SessionPlan& plan) const;
    StudySession recordResult(const StudySession& session, const StudyResult& result) const;
    StudySession finishSession(const StudySession& session) const;

private:
    const MemoryModel& model;
    const DueSelector& selector;
    std::mt19937_64 rng;

    void shuffle(std::vector<std::string>& cards);
};
