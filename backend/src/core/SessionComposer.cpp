#include "SessionComposer.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace {
    double roundTo(double value, int decimals) {
        const double scale = std::pow(10.0, decimals);
        return std::round(value * scale) / scale;
    }
}

SessionComposer::SessionComposer(const MemoryModel& m, const DueSelector& s, std::uint64_t seed)
    : model(m), selector(s), rng(seed)
{
    spdlog::info("SessionComposer initialized with seed {}", seed);
}

SessionComposer::SessionComposer(const MemoryModel& m, const DueSelector& s)
    : SessionComposer(m, s, std::random_device{}())
{
}

/*
  Review items are queued ahead of new items *before* the cap is applied, so a
  backlog larger than max_cards never lets new material in. The shuffle only
  reorders what was already selected.
*/
SessionPlan SessionComposer::createStudySession(const std::vector<std::string>& allItemIds,
    const MemorySnapshot& states, const SessionOptions& options) {
    SessionPlan plan;

    for (const auto& s : selector.getCardsDueForReview(states, options.review_card_limit)) {
        plan.review_cards.push_back(s.item_id);
    }
    if (options.include_new_cards) {
        plan.new_cards = selector.getNewCards(allItemIds, states, options.new_card_limit);
    }

    plan.session_cards = plan.review_cards;
    plan.session_cards.insert(plan.session_cards.end(), plan.new_cards.begin(), plan.new_cards.end());

    const std::size_t cap = clampLimit(options.max_cards);
    if (plan.session_cards.size() > cap) plan.session_cards.resize(cap);

    shuffle(plan.session_cards);
    plan.session_id = generateId("session", model.clock().now(), rng);

    spdlog::info("Session {} composed: {} cards ({} review, {} new available)",
        plan.session_id, plan.session_cards.size(), plan.review_cards.size(), plan.new_cards.size());
    return plan;
}

// Fisher-Yates
void SessionComposer::shuffle(std::vector<std::string>& cards) {
    if (cards.size() < 2) return;
    for (std::size_t i = cards.size() - 1; i > 0; --i) {
        std::uniform_int_distribution<std::size_t> dist(0, i);
        std::swap(cards[i], cards[dist(rng)]);
    }
}

MemorySnapshot SessionComposer::processStudyResult(const StudyResult& result, const MemorySnapshot& states) const {
    MemorySnapshot updated = states;

    auto it = std::find_if(updated.begin(), updated.end(),
        [&](const CardMemoryState& s) { return s.item_id == result.item_id; });

    if (it == updated.end()) {
        CardMemoryState fresh = model.initializeCardMemory(result.item_id);
        updated.push_back(model.calculateNextReview(fresh, result.quality));
    }
    else {
        *it = model.calculateNextReview(*it, result.quality);
    }
    return updated;
}

StudyStats SessionComposer::getStudyStats(const MemorySnapshot& states) const {
    StudyStats stats;
    stats.total_cards = static_cast<int>(states.size());
    if (states.empty()) return stats;

    const TimePoint today_end = TimeUtils::endOfDay(model.clock().now());
    const int mature_at = model.config().mature_interval;

    double ease_sum = 0.0;
    double interval_sum = 0.0;
    for (const auto& s : states) {
        if (s.next_review_date <= today_end) ++stats.due_today;
        if (s.interval < mature_at) ++stats.learning;
        else ++stats.mature;

        ease_sum += s.ease_factor;
        interval_sum += s.interval;
        stats.longest_streak = std::max(stats.longest_streak, s.streak);
    }

    const double n = static_cast<double>(states.size());
    stats.average_ease_factor = roundTo(ease_sum / n, 2);
    stats.average_interval = roundTo(interval_sum / n, 1);
    return stats;
}

StudySession SessionComposer::startSession(const SessionPlan& plan) const {
    StudySession session;
    session.session_id = plan.session_id;
    session.start_time = model.clock().now();
    session.total_cards = static_cast<int>(plan.session_cards.size());

    spdlog::info("Session {} started with {} cards", session.session_id, session.total_cards);
    return session;
}

StudySession SessionComposer::recordResult(const StudySession& session, const StudyResult& result) const {
    StudySession next = session;
    next.results.push_back(result);
    next.cards_studied.push_back(result.item_id);
    if (model.isSuccess(model.normalizeQuality(result.quality))) {
        ++next.correct_cards;
    }
    return next;
}

StudySession SessionComposer::finishSession(const StudySession& session) const {
    StudySession done = session;
    const TimePoint end = model.clock().now();
    done.end_time = end;
    done.session_duration = TimeUtils::toEpochMillis(end) - TimeUtils::toEpochMillis(session.start_time);

    long long total_ms = 0;
    int timed = 0;
    for (const auto& r : session.results) {
        if (r.response_time) {
            total_ms += *r.response_time;
            ++timed;
        }
    }
    if (timed > 0) {
        done.average_response_time = static_cast<double>(total_ms) / timed;
    }

    spdlog::info("Session {} finished: {}/{} correct in {} ms",
        done.session_id, done.correct_cards, done.cards_studied.size(), *done.session_duration);
    return done;
}
