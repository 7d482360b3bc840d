#pragma once
#include <string>
#include <spdlog/spdlog.h>
#include "CardMemory.hpp"
#include "Clock.hpp"
#include "SchedulerConfig.hpp"

/*
  SM-2 style memory model.
   - Ease factor always moves with the quality rating (both branches)
   - Interval follows the pre-update repetition count: 1, 6, then interval * EF
   - Failure (quality < 3) resets repetitions, interval and streak
   - Results are clamped to the configured ease and interval bounds
  Every call returns a new state; the input is never modified.
*/

class MemoryModel {
public:
    explicit MemoryModel(const Clock& clock, SchedulerConfig config = {});

    CardMemoryState initializeCardMemory(const std::string& itemId) const;
    CardMemoryState calculateNextReview(const CardMemoryState& state, int quality) const;

    // Out-of-range ratings are clamped into [min_quality, max_quality]
    int normalizeQuality(int quality) const;
    bool isSuccess(int quality) const { return quality >= cfg.success_quality; }

    const SchedulerConfig& config() const { return cfg; }
    const Clock& clock() const { return clk; }

private:
    const Clock& clk;
    SchedulerConfig cfg;

    int nextInterval(const CardMemoryState& state) const;
    double nextEaseFactor(double ease, int quality) const;
};
