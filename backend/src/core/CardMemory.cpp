#include "CardMemory.hpp"
#include <algorithm>

std::string qualityDescription(int quality) {
    switch (quality) {
    case static_cast<int>(QualityRating::BLACKOUT): return "Complete blackout - no memory";
    case static_cast<int>(QualityRating::INCORRECT): return "Incorrect, but correct answer remembered";
    case static_cast<int>(QualityRating::INCORRECT_EASY): return "Incorrect, but correct answer seemed easy";
    case static_cast<int>(QualityRating::CORRECT_HARD): return "Correct with serious difficulty";
    case static_cast<int>(QualityRating::CORRECT_HESITANT): return "Correct after hesitation";
    case static_cast<int>(QualityRating::CORRECT_EASY): return "Perfect response";
    default: return "Unknown rating";
    }
}

const CardMemoryState* findCard(const MemorySnapshot& states, const std::string& item_id) {
    auto it = std::find_if(states.begin(), states.end(),
        [&](const CardMemoryState& s) { return s.item_id == item_id; });
    return it == states.end() ? nullptr : &*it;
}

// Unique ID: prefix + timestamp + 9 random base-36 digits
std::string generateId(const std::string& prefix, TimePoint now, std::mt19937_64& rng) {
    static const char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::uniform_int_distribution<int> dist(0, 35);

    std::string rand_part;
    rand_part.reserve(9);
    for (int i = 0; i < 9; ++i) {
        rand_part.push_back(digits[dist(rng)]);
    }

    return prefix + "_" + std::to_string(TimeUtils::toEpochMillis(now)) + "_" + rand_part;
}
