#pragma once
#include <optional>
#include <string>
#include <vector>
#include "KeyValueStore.hpp"
#include "../core/CardMemory.hpp"
#include "../core/SetSchedule.hpp"

// Whole-collection persistence for memory states, study sessions and set schedules.
//
// Every load reads the full collection and every save writes it back in full.
// There is no merge: with two writers the later save wins.
//
// Loads never fail outward: a missing, unreadable or corrupt collection loads as empty.
// Saves return false when the store rejects the write; the caller decides how to report it.

class StudyRepository {
public:
    static constexpr const char* MEMORY_DATA_KEY = "spaced_repetition_memory_data";
    static constexpr const char* STUDY_SESSIONS_KEY = "study_sessions";
    static constexpr const char* FLASHCARD_SETS_KEY = "flashcard_sets";

    explicit StudyRepository(KeyValueStore& store);

    // Memory states
    MemorySnapshot loadMemoryStates();
    bool saveMemoryStates(const MemorySnapshot& states);
    bool clearMemoryStates();

    // Study sessions (upsert by session id)
    std::vector<StudySession> loadStudySessions();
    bool saveStudySession(const StudySession& session);
    bool clearStudySessions();

    // Set schedules (upsert by set id)
    std::vector<FlashcardSetSchedule> loadSetSchedules();
    std::optional<FlashcardSetSchedule> getSetSchedule(const std::string& setId);
    bool saveSetSchedule(const FlashcardSetSchedule& schedule);
    bool deleteSetSchedule(const std::string& setId);

private:
    KeyValueStore& store;
};
