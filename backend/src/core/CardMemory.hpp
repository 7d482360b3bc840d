#pragma once
#include <string>
#include <vector>
#include <optional>
#include <random>
#include "../utils/TimeUtils.hpp"

// Self-assessed recall quality, 0..5. Anything >= CORRECT_HARD counts as a success.
enum class QualityRating {
    BLACKOUT = 0,          // Complete blackout
    INCORRECT = 1,         // Incorrect, correct answer remembered
    INCORRECT_EASY = 2,    // Incorrect, correct answer seemed easy to recall
    CORRECT_HARD = 3,      // Correct, recalled with serious difficulty
    CORRECT_HESITANT = 4,  // Correct after hesitation
    CORRECT_EASY = 5       // Perfect response
};

std::string qualityDescription(int quality);

// Per-item memory state. Created lazily on the item's first study result.
struct CardMemoryState {
    std::string item_id;          // opaque, owned by the content side

    int interval = 1;             // days, [1, 365]
    double ease_factor = 2.5;     // [1.3, 2.5]
    int repetitions = 0;          // consecutive successful recalls
    TimePoint next_review_date{};
    TimePoint last_review_date{};

    int total_reviews = 0;
    double average_quality = 0.0; // exact running mean of every quality given
    int streak = 0;               // consecutive successes (quality >= 3)

    TimePoint created{};
    TimePoint updated{};
};

struct StudyResult {
    std::string item_id;
    int quality = 0;                       // 0..5
    std::optional<long long> response_time; // milliseconds
    TimePoint studied_at{};
};

struct StudySession {
    std::string session_id;
    TimePoint start_time{};
    std::optional<TimePoint> end_time;

    std::vector<std::string> cards_studied;
    std::vector<StudyResult> results;

    int total_cards = 0;
    int correct_cards = 0;

    std::optional<double> average_response_time; // milliseconds
    std::optional<long long> session_duration;   // milliseconds
};

// The whole memory collection, loaded once and passed by value through the pure functions.
using MemorySnapshot = std::vector<CardMemoryState>;

const CardMemoryState* findCard(const MemorySnapshot& states, const std::string& item_id);

// "<prefix>_<epoch-ms>_<9 base-36 chars>", random part drawn from the caller's generator
std::string generateId(const std::string& prefix, TimePoint now, std::mt19937_64& rng);
