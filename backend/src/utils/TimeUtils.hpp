#pragma once
#include <chrono>
#include <optional>
#include <string>

using TimePoint = std::chrono::system_clock::time_point;

// Calendar helpers. All calendar arithmetic is done in local time, the same way
// a wall clock would move: adding days keeps the time of day, adding a month
// lets mktime normalise overflow (Jan 31 + 1 month -> early March).
namespace TimeUtils {

    TimePoint addDays(TimePoint tp, int days);
    TimePoint addMonths(TimePoint tp, int months);

    // 23:59:59.999 local on the same calendar day
    TimePoint endOfDay(TimePoint tp);

    // Local calendar date as "YYYY-MM-DD"
    std::string dateKey(TimePoint tp);

    // ISO-8601 UTC with milliseconds, e.g. 2026-10-19T08:30:00.123Z
    std::string toIso(TimePoint tp);
    std::optional<TimePoint> fromIso(const std::string& text);

    long long toEpochMillis(TimePoint tp);
    TimePoint fromEpochMillis(long long ms);

    // Local time constructor, mostly for tests and the CLI
    TimePoint makeLocal(int year, int month, int day, int hour = 0, int minute = 0, int second = 0);
}
