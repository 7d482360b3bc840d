#include "MemoryModel.hpp"
#include <algorithm>
#include <cmath>

MemoryModel::MemoryModel(const Clock& clock, SchedulerConfig config)
    : clk(clock), cfg(config)
{
    spdlog::info("MemoryModel (SM-2) initialized: ease=[{}, {}], interval=[{}, {}]",
        cfg.min_ease_factor, cfg.max_ease_factor, cfg.min_interval, cfg.max_interval);
}

CardMemoryState MemoryModel::initializeCardMemory(const std::string& itemId) const {
    TimePoint now = clk.now();

    CardMemoryState s;
    s.item_id = itemId;
    s.interval = cfg.initial_interval;
    s.ease_factor = cfg.initial_ease_factor;
    s.repetitions = 0;
    s.next_review_date = TimeUtils::addDays(now, 1);
    s.last_review_date = now;
    s.total_reviews = 0;
    s.average_quality = 0.0;
    s.streak = 0;
    s.created = now;
    s.updated = now;

    spdlog::debug("Initialized memory for item {}", itemId);
    return s;
}

int MemoryModel::normalizeQuality(int quality) const {
    int q = std::clamp(quality, cfg.min_quality, cfg.max_quality);
    if (q != quality) {
        spdlog::warn("Quality {} outside [{}, {}]; clamped to {}",
            quality, cfg.min_quality, cfg.max_quality, q);
    }
    return q;
}

/*
  Successful recall: interval is chosen from the repetition count *before*
  this review (0 -> 1 day, 1 -> 6 days, otherwise interval * EF rounded).
*/
int MemoryModel::nextInterval(const CardMemoryState& state) const {
    if (state.repetitions == 0) return 1;
    if (state.repetitions == 1) return 6;
    return static_cast<int>(std::lround(state.interval * state.ease_factor));
}

double MemoryModel::nextEaseFactor(double ease, int quality) const {
    const int miss = 5 - quality;
    return ease + (0.1 - miss * (0.08 + miss * 0.02));
}

CardMemoryState MemoryModel::calculateNextReview(const CardMemoryState& state, int quality) const {
    const int q = normalizeQuality(quality);
    const TimePoint now = clk.now();

    CardMemoryState next = state;

    if (isSuccess(q)) {
        next.streak = state.streak + 1;
        next.interval = nextInterval(state);
        next.repetitions = state.repetitions + 1;
    }
    else {
        next.repetitions = 0;
        next.interval = 1;
        next.streak = 0;
    }

    // EF moves on every review, including failures
    next.ease_factor = std::clamp(nextEaseFactor(state.ease_factor, q),
        cfg.min_ease_factor, cfg.max_ease_factor);
    next.interval = std::clamp(next.interval, cfg.min_interval, cfg.max_interval);

    next.next_review_date = TimeUtils::addDays(now, next.interval);
    next.last_review_date = now;

    const double total_points = state.average_quality * state.total_reviews + q;
    next.total_reviews = state.total_reviews + 1;
    next.average_quality = total_points / next.total_reviews;
    next.updated = now;

    spdlog::debug("Review item={} q={} reps {}->{} interval {}->{}d ease {:.2f}->{:.2f}",
        state.item_id, q, state.repetitions, next.repetitions,
        state.interval, next.interval, state.ease_factor, next.ease_factor);

    return next;
}
