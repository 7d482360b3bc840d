#pragma once
#include <chrono>
#include "../utils/TimeUtils.hpp"

// Source of "now" for every service, so schedules can be computed against a fixed instant.
class Clock {
public:
    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
};

class SystemClock : public Clock {
public:
    TimePoint now() const override { return std::chrono::system_clock::now(); }
};

// Manually driven clock for replaying history and for tests
class ManualClock : public Clock {
public:
    explicit ManualClock(TimePoint start) : current(start) {}

    TimePoint now() const override { return current; }
    void set(TimePoint tp) { current = tp; }
    void advanceDays(int days) { current = TimeUtils::addDays(current, days); }

private:
    TimePoint current;
};
