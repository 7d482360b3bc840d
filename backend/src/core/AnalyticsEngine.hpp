#pragma once
#include <string>
#include <vector>
#include "CardMemory.hpp"
#include "Clock.hpp"
#include "SchedulerConfig.hpp"

struct StudyAnalytics {
    int sessions_count = 0;
    int total_cards_studied = 0;
    double average_accuracy = 0.0; // percent, rounded
    long long total_study_time = 0; // minutes, rounded
    int streak_days = 0;            // consecutive study days ending today
};

enum class StreakTrend {
    IMPROVING,
    STABLE,
    DECLINING
};

std::string trendToString(StreakTrend t);

struct RecentPerformance {
    double average_quality = 0.0;
    int cards_studied = 0;
    StreakTrend streak_trend = StreakTrend::STABLE;
};

// Reporting over memory states and finished sessions. Nothing here changes a schedule.
class AnalyticsEngine {
public:
    explicit AnalyticsEngine(const Clock& clock, SchedulerConfig config = {});

    StudyAnalytics getStudyAnalytics(const std::vector<StudySession>& sessions, int days = 30) const;

    std::vector<CardMemoryState> getStruggleCards(const MemorySnapshot& states, int limit = 10) const;
    std::vector<CardMemoryState> getMasteredCards(const MemorySnapshot& states, int limit = 10) const;

    RecentPerformance getRecentPerformance(const MemorySnapshot& states, int days = 7) const;
    std::vector<StudySession> getRecentSessions(const std::vector<StudySession>& sessions, int limit = 10) const;

private:
    const Clock& clk;
    SchedulerConfig cfg;

    int streakDays(const std::vector<const StudySession*>& sessions, int maxDays) const;
};
