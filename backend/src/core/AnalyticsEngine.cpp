#include "AnalyticsEngine.hpp"
#include "DueSelector.hpp"
#include <algorithm>
#include <cmath>
#include <unordered_set>
#include <spdlog/spdlog.h>

std::string trendToString(StreakTrend t) {
    switch (t) {
    case StreakTrend::IMPROVING: return "improving";
    case StreakTrend::DECLINING: return "declining";
    case StreakTrend::STABLE: return "stable";
    }
    return "stable";
}

AnalyticsEngine::AnalyticsEngine(const Clock& clock, SchedulerConfig config)
    : clk(clock), cfg(config)
{
}

StudyAnalytics AnalyticsEngine::getStudyAnalytics(const std::vector<StudySession>& sessions, int days) const {
    StudyAnalytics out;
    const int window = static_cast<int>(clampLimit(days));
    const TimePoint cutoff = TimeUtils::addDays(clk.now(), -window);

    std::vector<const StudySession*> recent;
    for (const auto& s : sessions) {
        if (s.start_time >= cutoff && s.end_time) recent.push_back(&s);
    }
    if (recent.empty()) return out;

    long long correct = 0;
    long long duration_ms = 0;
    for (const auto* s : recent) {
        out.total_cards_studied += static_cast<int>(s->cards_studied.size());
        correct += s->correct_cards;
        duration_ms += s->session_duration.value_or(0);
    }

    out.sessions_count = static_cast<int>(recent.size());
    if (out.total_cards_studied > 0) {
        out.average_accuracy = std::round(100.0 * static_cast<double>(correct) / out.total_cards_studied);
    }
    out.total_study_time = std::llround(static_cast<double>(duration_ms) / 60000.0);
    out.streak_days = streakDays(recent, window);

    spdlog::debug("Analytics over {} days: {} sessions, {} cards, {}% accuracy, streak {}",
        days, out.sessions_count, out.total_cards_studied, out.average_accuracy, out.streak_days);
    return out;
}

/*
  Consecutive calendar days with at least one session, counted backward from
  today. A day without a session (today included) ends the run, and the run
  never covers more than `maxDays` days.
*/
int AnalyticsEngine::streakDays(const std::vector<const StudySession*>& sessions, int maxDays) const {
    std::unordered_set<std::string> studied;
    for (const auto* s : sessions) studied.insert(TimeUtils::dateKey(s->start_time));

    int streak = 0;
    TimePoint day = clk.now();
    while (streak < maxDays && studied.count(TimeUtils::dateKey(day))) {
        ++streak;
        day = TimeUtils::addDays(day, -1);
    }
    return streak;
}

std::vector<CardMemoryState> AnalyticsEngine::getStruggleCards(const MemorySnapshot& states, int limit) const {
    std::vector<CardMemoryState> out;
    for (const auto& s : states) {
        if (s.average_quality < cfg.struggle_quality && s.total_reviews >= cfg.struggle_min_reviews) {
            out.push_back(s);
        }
    }

    std::stable_sort(out.begin(), out.end(),
        [](const CardMemoryState& a, const CardMemoryState& b) { return a.average_quality < b.average_quality; });

    const std::size_t max_items = clampLimit(limit);
    if (out.size() > max_items) out.resize(max_items);
    return out;
}

std::vector<CardMemoryState> AnalyticsEngine::getMasteredCards(const MemorySnapshot& states, int limit) const {
    std::vector<CardMemoryState> out;
    for (const auto& s : states) {
        if (s.average_quality >= cfg.mastered_quality && s.interval >= cfg.mastered_interval) {
            out.push_back(s);
        }
    }

    std::stable_sort(out.begin(), out.end(),
        [](const CardMemoryState& a, const CardMemoryState& b) { return a.interval > b.interval; });

    const std::size_t max_items = clampLimit(limit);
    if (out.size() > max_items) out.resize(max_items);
    return out;
}

RecentPerformance AnalyticsEngine::getRecentPerformance(const MemorySnapshot& states, int days) const {
    RecentPerformance perf;
    const TimePoint cutoff = TimeUtils::addDays(clk.now(), -static_cast<int>(clampLimit(days)));

    double quality_sum = 0.0;
    double recent_streaks = 0.0;
    double all_streaks = 0.0;
    for (const auto& s : states) {
        all_streaks += s.streak;
        if (s.last_review_date >= cutoff) {
            ++perf.cards_studied;
            quality_sum += s.average_quality;
            recent_streaks += s.streak;
        }
    }
    if (perf.cards_studied == 0) return perf;

    perf.average_quality = std::round(quality_sum / perf.cards_studied * 100.0) / 100.0;

    // recent mean streak against the mean over every item, with a 10% dead band
    const double recent_avg = recent_streaks / perf.cards_studied;
    const double overall_avg = all_streaks / static_cast<double>(states.size());
    if (recent_avg > overall_avg * 1.1) perf.streak_trend = StreakTrend::IMPROVING;
    else if (recent_avg < overall_avg * 0.9) perf.streak_trend = StreakTrend::DECLINING;

    return perf;
}

std::vector<StudySession> AnalyticsEngine::getRecentSessions(const std::vector<StudySession>& sessions, int limit) const {
    std::vector<StudySession> out = sessions;
    std::stable_sort(out.begin(), out.end(),
        [](const StudySession& a, const StudySession& b) { return a.start_time > b.start_time; });

    const std::size_t max_items = clampLimit(limit);
    if (out.size() > max_items) out.resize(max_items);
    return out;
}
